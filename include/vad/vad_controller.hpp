#ifndef VAD_CONTROLLER_HPP
#define VAD_CONTROLLER_HPP

#include "call/call_services.hpp"
#include "vad/vad_backend.hpp"

#include <memory>

// Owns the single active backend. Mode changes and backend switches are
// stop-then-start, which also cancels any verification in flight.
class VadController : public VadService {
public:
    explicit VadController(std::unique_ptr<VadBackend> backend);
    ~VadController() override;

    void start(VadMode mode) override;
    void stop() override;

    bool isActive() const override;
    VadStatus status() const override;

    bool enabled() const { return backend_ != nullptr; }
    VadBackend* backend() { return backend_.get(); }

    // Replaces the backend; restarts it in the previous mode when one was running
    void setBackend(std::unique_ptr<VadBackend> backend);

private:
    std::unique_ptr<VadBackend> backend_;
};

#endif
