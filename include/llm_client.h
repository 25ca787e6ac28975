#pragma once

#include "core/config.h"
#include "errors.h"
#include <memory>
#include <string>

namespace coop_assist {

/**
 * @brief Last-resort answer source
 *
 * Called by the Router only when no tier produced an answer. Implementations
 * must return within timeout_ms.
 */
class GenerativeModel {
public:
    virtual ~GenerativeModel() = default;

    /**
     * @param prompt Raw user message
     * @param context Retrieval hints and corpus text (may be empty)
     * @param timeout_ms 0 = implementation default
     */
    virtual Result<std::string> generate(const std::string& prompt,
                                         const std::string& context,
                                         int timeout_ms = 0) = 0;
};

/**
 * @brief HTTP client for a local chat model
 *
 * Speaks Ollama's /api/chat when the endpoint contains it, otherwise the
 * llama.cpp server /completion body.
 */
class LLMClient : public GenerativeModel {
public:
    explicit LLMClient(const config::LLMConfig& config);
    ~LLMClient() override;

    // Non-copyable
    LLMClient(const LLMClient&) = delete;
    LLMClient& operator=(const LLMClient&) = delete;

    Result<std::string> generate(const std::string& prompt,
                                 const std::string& context,
                                 int timeout_ms = 0) override;

    // Check if client is ready
    bool is_ready() const;

private:
    class Impl;
    std::unique_ptr<Impl> pimpl_;
};

} // namespace coop_assist
