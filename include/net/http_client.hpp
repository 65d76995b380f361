#ifndef HTTP_CLIENT_HPP
#define HTTP_CLIENT_HPP

#include <atomic>
#include <cstddef>
#include <cstdint>
#include <functional>
#include <string>
#include <vector>

struct HttpResponse {
    long status = 0;
    std::string body;
    std::string contentType;
    bool aborted = false;

    bool ok() const { return status >= 200 && status < 300; }
};

// Blocking libcurl client, one easy handle per request. Transport failures
// throw std::runtime_error; HTTP error statuses are returned to the caller.
class HttpClient {
public:
    struct Config {
        long connectTimeoutMs = 5000;
        long timeoutMs = 60000;     // 0 disables, used for streams
    };

    using ChunkCallback = std::function<void(const char* data, size_t size)>;

    explicit HttpClient(Config config);
    HttpClient();

    HttpResponse get(const std::string& url) const;

    HttpResponse postJson(const std::string& url, const std::string& json) const;

    HttpResponse postMultipart(const std::string& url,
                               const std::string& field,
                               const std::string& filename,
                               const std::string& mimeType,
                               const std::vector<uint8_t>& data) const;

    // Hands the body to onChunk as it arrives. When abort becomes true the
    // transfer is cut and the response comes back with aborted set.
    HttpResponse postStream(const std::string& url,
                            const std::string& json,
                            const ChunkCallback& onChunk,
                            const std::atomic<bool>* abort) const;

    const Config& config() const { return config_; }

private:
    Config config_;
};

#endif
