#include "net/http_client.hpp"

#include <curl/curl.h>

#include <mutex>
#include <stdexcept>

namespace {

std::once_flag g_curlInit;

void ensureCurl() {
    std::call_once(g_curlInit, [] {
        if (curl_global_init(CURL_GLOBAL_DEFAULT) != CURLE_OK) {
            throw std::runtime_error("curl_global_init failed");
        }
    });
}

void curl_check(CURLcode rc, const char* what) {
    if (rc != CURLE_OK) throw std::runtime_error(std::string(what) + ": " + curl_easy_strerror(rc));
}

struct Transfer {
    std::string* body = nullptr;
    const HttpClient::ChunkCallback* onChunk = nullptr;
    const std::atomic<bool>* abort = nullptr;
};

size_t writeBody(char* ptr, size_t size, size_t nmemb, void* userdata) {
    auto* t = static_cast<Transfer*>(userdata);
    const size_t n = size * nmemb;
    if (t->abort && t->abort->load()) return 0;
    if (t->onChunk && *t->onChunk) (*t->onChunk)(ptr, n);
    else if (t->body) t->body->append(ptr, n);
    return n;
}

int onProgress(void* userdata, curl_off_t, curl_off_t, curl_off_t, curl_off_t) {
    auto* t = static_cast<Transfer*>(userdata);
    return (t->abort && t->abort->load()) ? 1 : 0;
}

// Owns the easy handle and header list for one request
class Request {
public:
    Request(const std::string& url, const HttpClient::Config& config) {
        ensureCurl();
        curl_ = curl_easy_init();
        if (!curl_) throw std::runtime_error("curl_easy_init failed");

        curl_easy_setopt(curl_, CURLOPT_URL, url.c_str());
        curl_easy_setopt(curl_, CURLOPT_NOSIGNAL, 1L);
        curl_easy_setopt(curl_, CURLOPT_CONNECTTIMEOUT_MS, config.connectTimeoutMs);
        if (config.timeoutMs > 0) curl_easy_setopt(curl_, CURLOPT_TIMEOUT_MS, config.timeoutMs);
    }

    ~Request() {
        if (mime_) curl_mime_free(mime_);
        if (headers_) curl_slist_free_all(headers_);
        if (curl_) curl_easy_cleanup(curl_);
    }

    Request(const Request&) = delete;
    Request& operator=(const Request&) = delete;

    CURL* handle() { return curl_; }

    void addHeader(const char* header) { headers_ = curl_slist_append(headers_, header); }

    curl_mime* mime() {
        if (!mime_) mime_ = curl_mime_init(curl_);
        return mime_;
    }

    HttpResponse perform(Transfer& transfer) {
        HttpResponse out;
        if (!transfer.onChunk) transfer.body = &out.body;

        if (headers_) curl_easy_setopt(curl_, CURLOPT_HTTPHEADER, headers_);
        curl_easy_setopt(curl_, CURLOPT_WRITEFUNCTION, writeBody);
        curl_easy_setopt(curl_, CURLOPT_WRITEDATA, &transfer);
        if (transfer.abort) {
            curl_easy_setopt(curl_, CURLOPT_NOPROGRESS, 0L);
            curl_easy_setopt(curl_, CURLOPT_XFERINFOFUNCTION, onProgress);
            curl_easy_setopt(curl_, CURLOPT_XFERINFODATA, &transfer);
        }

        const CURLcode rc = curl_easy_perform(curl_);
        if (transfer.abort && transfer.abort->load()) {
            out.aborted = true;
            return out;
        }
        curl_check(rc, "HTTP request failed");

        curl_easy_getinfo(curl_, CURLINFO_RESPONSE_CODE, &out.status);
        char* ct = nullptr;
        if (curl_easy_getinfo(curl_, CURLINFO_CONTENT_TYPE, &ct) == CURLE_OK && ct) out.contentType = ct;
        return out;
    }

private:
    CURL* curl_ = nullptr;
    struct curl_slist* headers_ = nullptr;
    curl_mime* mime_ = nullptr;
};

}  // namespace

// Constructor
HttpClient::HttpClient(Config config) : config_(config) {}

HttpClient::HttpClient() : HttpClient(Config{}) {}

HttpResponse HttpClient::get(const std::string& url) const {
    Request req(url, config_);
    Transfer transfer;
    return req.perform(transfer);
}

HttpResponse HttpClient::postJson(const std::string& url, const std::string& json) const {
    Request req(url, config_);
    req.addHeader("Content-Type: application/json");
    curl_easy_setopt(req.handle(), CURLOPT_POSTFIELDSIZE, (long)json.size());
    curl_easy_setopt(req.handle(), CURLOPT_COPYPOSTFIELDS, json.c_str());

    Transfer transfer;
    return req.perform(transfer);
}

HttpResponse HttpClient::postMultipart(const std::string& url,
                                       const std::string& field,
                                       const std::string& filename,
                                       const std::string& mimeType,
                                       const std::vector<uint8_t>& data) const {
    Request req(url, config_);

    curl_mimepart* part = curl_mime_addpart(req.mime());
    curl_mime_name(part, field.c_str());
    curl_mime_filename(part, filename.c_str());
    curl_mime_type(part, mimeType.c_str());
    curl_check(curl_mime_data(part, reinterpret_cast<const char*>(data.data()), data.size()), "curl_mime_data");
    curl_easy_setopt(req.handle(), CURLOPT_MIMEPOST, req.mime());

    Transfer transfer;
    return req.perform(transfer);
}

HttpResponse HttpClient::postStream(const std::string& url,
                                    const std::string& json,
                                    const ChunkCallback& onChunk,
                                    const std::atomic<bool>* abort) const {
    Config streamConfig = config_;
    streamConfig.timeoutMs = 0;

    Request req(url, streamConfig);
    req.addHeader("Content-Type: application/json");
    req.addHeader("Accept: text/event-stream");
    curl_easy_setopt(req.handle(), CURLOPT_POSTFIELDSIZE, (long)json.size());
    curl_easy_setopt(req.handle(), CURLOPT_COPYPOSTFIELDS, json.c_str());

    Transfer transfer;
    transfer.onChunk = &onChunk;
    transfer.abort = abort;
    return req.perform(transfer);
}
