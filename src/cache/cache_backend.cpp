#include "cache/cache_backend.h"
#include "logger.h"
#include <curl/curl.h>
#include <nlohmann/json.hpp>

using json = nlohmann::json;

namespace coop_assist {
namespace cache {

namespace {

constexpr const char* KEY_NAMESPACE = "coop_assist:";

size_t write_callback(void* contents, size_t size, size_t nmemb, void* userp) {
    size_t total_size = size * nmemb;
    std::string* buffer = static_cast<std::string*>(userp);
    buffer->append(static_cast<char*>(contents), total_size);
    return total_size;
}

} // namespace

class HttpCacheBackend::Impl {
public:
    explicit Impl(const config::BackendConfig& config) : config_(config) {
        curl_global_init(CURL_GLOBAL_DEFAULT);
        while (!config_.url.empty() && config_.url.back() == '/') {
            config_.url.pop_back();
        }
    }

    ~Impl() {
        curl_global_cleanup();
    }

    Result<std::optional<std::string>> get(const std::string& key) {
        auto body = request("GET", "/GET/" + escape(KEY_NAMESPACE + key), "");
        if (body.is_error()) {
            return body.error();
        }
        try {
            json response = json::parse(body.value());
            if (!response.contains("GET")) {
                return make_parse_error("Unexpected backend reply: " + body.value());
            }
            if (response["GET"].is_null()) {
                return std::optional<std::string>();
            }
            return std::optional<std::string>(response["GET"].get<std::string>());
        } catch (const json::exception& e) {
            return make_parse_error(std::string("Backend JSON parse error: ") + e.what());
        }
    }

    VoidResult set(const std::string& key, const std::string& value, int ttl_s) {
        auto body = request("PUT", "/SETEX/" + escape(KEY_NAMESPACE + key) + "/" + std::to_string(ttl_s), value);
        if (body.is_error()) {
            return body.error();
        }
        return VoidResult();
    }

    VoidResult remove(const std::string& key) {
        auto body = request("GET", "/DEL/" + escape(KEY_NAMESPACE + key), "");
        if (body.is_error()) {
            return body.error();
        }
        return VoidResult();
    }

private:
    std::string escape(const std::string& text) {
        CURL* curl = curl_easy_init();
        if (!curl) {
            return text;
        }
        char* escaped = curl_easy_escape(curl, text.c_str(), static_cast<int>(text.size()));
        std::string out = escaped ? escaped : text;
        curl_free(escaped);
        curl_easy_cleanup(curl);
        return out;
    }

    Result<std::string> request(const std::string& method, const std::string& path, const std::string& payload) {
        CURL* curl = curl_easy_init();
        if (!curl) {
            return make_network_error("Failed to initialize CURL");
        }

        std::string url = config_.url + path;
        std::string response_buffer;
        curl_easy_setopt(curl, CURLOPT_URL, url.c_str());
        curl_easy_setopt(curl, CURLOPT_WRITEFUNCTION, write_callback);
        curl_easy_setopt(curl, CURLOPT_WRITEDATA, &response_buffer);
        curl_easy_setopt(curl, CURLOPT_TIMEOUT_MS, static_cast<long>(config_.timeout_ms));
        curl_easy_setopt(curl, CURLOPT_CONNECTTIMEOUT_MS, static_cast<long>(config_.timeout_ms));
        curl_easy_setopt(curl, CURLOPT_NOSIGNAL, 1L);
        if (method == "PUT") {
            curl_easy_setopt(curl, CURLOPT_CUSTOMREQUEST, "PUT");
            curl_easy_setopt(curl, CURLOPT_POSTFIELDS, payload.c_str());
            curl_easy_setopt(curl, CURLOPT_POSTFIELDSIZE, static_cast<long>(payload.size()));
        }

        CURLcode res = curl_easy_perform(curl);
        long status = 0;
        curl_easy_getinfo(curl, CURLINFO_RESPONSE_CODE, &status);
        curl_easy_cleanup(curl);

        if (res == CURLE_OPERATION_TIMEDOUT) {
            return make_timeout_error("Cache backend timed out: " + url);
        }
        if (res != CURLE_OK) {
            return make_network_error(std::string("Cache backend: ") + curl_easy_strerror(res));
        }
        if (status < 200 || status >= 300) {
            return make_network_error("Cache backend HTTP " + std::to_string(status));
        }
        return response_buffer;
    }

    config::BackendConfig config_;
};

HttpCacheBackend::HttpCacheBackend(const config::BackendConfig& config)
    : pimpl_(std::make_unique<Impl>(config)) {
}

HttpCacheBackend::~HttpCacheBackend() = default;

Result<std::optional<std::string>> HttpCacheBackend::get(const std::string& key) {
    return pimpl_->get(key);
}

VoidResult HttpCacheBackend::set(const std::string& key, const std::string& value, int ttl_s) {
    return pimpl_->set(key, value, ttl_s);
}

VoidResult HttpCacheBackend::remove(const std::string& key) {
    return pimpl_->remove(key);
}

std::shared_ptr<CacheBackend> make_backend(const config::BackendConfig& config) {
    if (!config.enabled) {
        return nullptr;
    }
    Logger::info("[Cache] Secondary backend at " + config.url + " (timeout " +
                 std::to_string(config.timeout_ms) + "ms)");
    return std::make_shared<HttpCacheBackend>(config);
}

} // namespace cache
} // namespace coop_assist
