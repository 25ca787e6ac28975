#include "llm_client.h"
#include "logger.h"
#include "utils.h"
#include <curl/curl.h>
#include <nlohmann/json.hpp>
#include <atomic>
#include <chrono>
#include <mutex>
#include <sstream>
#include <thread>

using json = nlohmann::json;

namespace coop_assist {

namespace {

size_t write_callback(void* contents, size_t size, size_t nmemb, void* userp) {
    size_t total_size = size * nmemb;
    std::string* buffer = static_cast<std::string*>(userp);
    buffer->append(static_cast<char*>(contents), total_size);
    return total_size;
}

// Request state shared with the worker thread, which may outlive the call
struct PendingRequest {
    std::atomic<bool> complete{false};
    std::mutex mutex;
    std::string body;
    std::string response_text;
    std::string error_msg;
    bool connect_failed = false;
};

} // namespace

class LLMClient::Impl {
public:
    explicit Impl(const config::LLMConfig& config) : config_(config), ready_(true) {
        curl_global_init(CURL_GLOBAL_DEFAULT);
        is_ollama_ = config.endpoint.find("/api/chat") != std::string::npos;
    }

    ~Impl() {
        curl_global_cleanup();
    }

    Result<std::string> generate(const std::string& prompt, const std::string& context, int timeout_ms) {
        if (timeout_ms == 0) timeout_ms = config_.timeout_ms;

        auto request = std::make_shared<PendingRequest>();
        request->body = is_ollama_ ? build_ollama_request(prompt, context)
                                   : build_completion_request(prompt, context);
        const bool is_ollama = is_ollama_;
        const std::string endpoint = config_.endpoint;

        std::thread request_thread([request, endpoint, timeout_ms, is_ollama]() {
            CURL* curl = curl_easy_init();
            if (!curl) {
                std::lock_guard<std::mutex> lock(request->mutex);
                request->error_msg = "Failed to initialize CURL";
                request->complete = true;
                return;
            }

            struct curl_slist* headers = nullptr;
            headers = curl_slist_append(headers, "Content-Type: application/json");

            std::string response_buffer;
            curl_easy_setopt(curl, CURLOPT_URL, endpoint.c_str());
            curl_easy_setopt(curl, CURLOPT_POSTFIELDS, request->body.c_str());
            curl_easy_setopt(curl, CURLOPT_HTTPHEADER, headers);
            curl_easy_setopt(curl, CURLOPT_WRITEFUNCTION, write_callback);
            curl_easy_setopt(curl, CURLOPT_WRITEDATA, &response_buffer);
            curl_easy_setopt(curl, CURLOPT_TIMEOUT_MS, static_cast<long>(timeout_ms));
            curl_easy_setopt(curl, CURLOPT_CONNECTTIMEOUT_MS,
                             static_cast<long>(constants::llm::CONNECT_TIMEOUT_MS));
            curl_easy_setopt(curl, CURLOPT_NOSIGNAL, 1L);

            CURLcode res = curl_easy_perform(curl);

            std::string text;
            std::string error;
            bool connect_failed = false;
            if (res != CURLE_OK) {
                error = curl_easy_strerror(res);
                connect_failed = res == CURLE_COULDNT_CONNECT || res == CURLE_COULDNT_RESOLVE_HOST;
            } else {
                try {
                    json response_json = json::parse(response_buffer);
                    if (is_ollama && response_json.contains("message") &&
                        response_json["message"].contains("content") &&
                        response_json["message"]["content"].is_string()) {
                        text = response_json["message"]["content"].get<std::string>();
                    } else if (!is_ollama && response_json.contains("content") &&
                               response_json["content"].is_string()) {
                        text = response_json["content"].get<std::string>();
                    } else {
                        error = "No content in response";
                    }
                } catch (const json::exception& e) {
                    error = "JSON parse error: " + std::string(e.what());
                }
            }

            curl_slist_free_all(headers);
            curl_easy_cleanup(curl);

            std::lock_guard<std::mutex> lock(request->mutex);
            request->response_text = std::move(text);
            request->error_msg = std::move(error);
            request->connect_failed = connect_failed;
            request->complete = true;
        });

        LOG_LLM(std::string("Request to ") + config_.endpoint + " (timeout " + std::to_string(timeout_ms) + "ms)");

        // Wait with timeout
        auto start = std::chrono::steady_clock::now();
        while (!request->complete) {
            std::this_thread::sleep_for(std::chrono::milliseconds(10));
            auto elapsed = std::chrono::steady_clock::now() - start;
            if (std::chrono::duration_cast<std::chrono::milliseconds>(elapsed).count() > timeout_ms) {
                Logger::warn("[LLM] Timeout reached, detaching request thread");
                request_thread.detach();  // Let it finish in background
                return make_timeout_error("Generative model timed out after " + std::to_string(timeout_ms) + "ms");
            }
        }
        request_thread.join();

        std::lock_guard<std::mutex> lock(request->mutex);
        if (!request->error_msg.empty()) {
            Logger::warn("[LLM] Error: " + request->error_msg);
            if (request->connect_failed) {
                return make_unavailable_error("Generative model offline: " + request->error_msg);
            }
            return make_network_error(request->error_msg);
        }

        std::string cleaned = clean_response(request->response_text);
        if (cleaned.empty()) {
            return make_invalid_data_error("Generative model returned an empty answer");
        }
        LOG_LLM("Answer in " + std::to_string(ms_since(start)) + "ms: " + cleaned);
        return cleaned;
    }

    bool is_ready() const {
        return ready_;
    }

private:
    std::string user_content(const std::string& prompt, const std::string& context) const {
        std::ostringstream oss;
        if (!context.empty()) {
            oss << "参考资料:\n" << context << "\n\n";
        }
        oss << "用户问题: " << prompt;
        return oss.str();
    }

    std::string build_ollama_request(const std::string& prompt, const std::string& context) const {
        json messages = json::array();
        messages.push_back({{"role", "system"}, {"content", config_.system_prompt}});
        messages.push_back({{"role", "user"}, {"content", user_content(prompt, context)}});

        json request;
        request["model"] = config_.model_name;
        request["messages"] = messages;
        request["stream"] = false;
        request["options"] = {
            {"temperature", config_.temperature},
            {"num_predict", config_.max_tokens}
        };
        return request.dump();
    }

    std::string build_completion_request(const std::string& prompt, const std::string& context) const {
        std::ostringstream full_prompt;
        full_prompt << config_.system_prompt << "\n\n" << user_content(prompt, context) << "\n助手:";

        json request;
        request["prompt"] = full_prompt.str();
        request["n_predict"] = config_.max_tokens;
        request["temperature"] = config_.temperature;
        request["stream"] = false;
        return request.dump();
    }

    static std::string clean_response(const std::string& response) {
        std::string cleaned = response;

        // Reasoning models may emit a <think> block before the answer
        size_t think_end = cleaned.find("</think>");
        if (think_end != std::string::npos) {
            cleaned.erase(0, think_end + std::string("</think>").size());
        }
        for (const std::string prefix : {"助手:", "助手：", "Assistant:"}) {
            utils::trim(cleaned);
            if (utils::starts_with(cleaned, prefix)) {
                cleaned.erase(0, prefix.size());
            }
        }
        return utils::trim(cleaned);
    }

    config::LLMConfig config_;
    bool ready_;
    bool is_ollama_ = false;
};

LLMClient::LLMClient(const config::LLMConfig& config)
    : pimpl_(std::make_unique<Impl>(config)) {
}

LLMClient::~LLMClient() = default;

Result<std::string> LLMClient::generate(const std::string& prompt, const std::string& context, int timeout_ms) {
    return pimpl_->generate(prompt, context, timeout_ms);
}

bool LLMClient::is_ready() const {
    return pimpl_->is_ready();
}

} // namespace coop_assist
