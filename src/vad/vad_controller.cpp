#include "vad/vad_controller.hpp"

#include <iostream>
#include <stdexcept>
#include <utility>

// Constructor
VadController::VadController(std::unique_ptr<VadBackend> backend) : backend_(std::move(backend)) {}

// Destructor
VadController::~VadController() { stop(); }

void VadController::start(VadMode mode) {
    if (!backend_) throw std::runtime_error("VAD disabled");

    if (backend_->isActive()) {
        if (backend_->mode() == mode) return;
        backend_->stop();
    }
    backend_->start(mode);
}

void VadController::stop() {
    if (backend_) backend_->stop();
}

bool VadController::isActive() const {
    return backend_ && backend_->isActive();
}

VadStatus VadController::status() const {
    return backend_ ? backend_->status() : VadStatus::Stopped;
}

void VadController::setBackend(std::unique_ptr<VadBackend> backend) {
    const bool wasActive = isActive();
    const VadMode mode = backend_ ? backend_->mode() : VadMode::Direct;

    stop();
    backend_ = std::move(backend);

    std::cout << "[VAD] Backend switched to " << (backend_ ? backend_->name() : std::string("none")) << std::endl;
    if (wasActive && backend_) backend_->start(mode);
}
