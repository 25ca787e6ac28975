#pragma once

/**
 * @file cache_backend.h
 * @brief Optional shared key-value store behind the local cache
 */

#include "core/config.h"
#include "errors.h"
#include <memory>
#include <optional>
#include <string>

namespace coop_assist {
namespace cache {

/**
 * @brief Secondary storage interface
 *
 * Calls may block; AdaptiveCache always invokes them with a timeout and
 * treats any error as "backend unavailable".
 */
class CacheBackend {
public:
    virtual ~CacheBackend() = default;

    /// Value for key, empty optional on a clean miss
    virtual Result<std::optional<std::string>> get(const std::string& key) = 0;

    virtual VoidResult set(const std::string& key, const std::string& value, int ttl_s) = 0;

    virtual VoidResult remove(const std::string& key) = 0;

    virtual std::string name() const = 0;
};

/**
 * @brief Webdis-style HTTP front of a Redis server
 *
 * GET {url}/GET/{key}, PUT {url}/SETEX/{key}/{ttl} with the value as body,
 * GET {url}/DEL/{key}. Keys are namespaced with "coop_assist:".
 */
class HttpCacheBackend : public CacheBackend {
public:
    explicit HttpCacheBackend(const config::BackendConfig& config);
    ~HttpCacheBackend() override;

    // Non-copyable
    HttpCacheBackend(const HttpCacheBackend&) = delete;
    HttpCacheBackend& operator=(const HttpCacheBackend&) = delete;

    Result<std::optional<std::string>> get(const std::string& key) override;
    VoidResult set(const std::string& key, const std::string& value, int ttl_s) override;
    VoidResult remove(const std::string& key) override;
    std::string name() const override { return "webdis"; }

private:
    class Impl;
    std::unique_ptr<Impl> pimpl_;
};

/// Backend for the configuration, nullptr when disabled
std::shared_ptr<CacheBackend> make_backend(const config::BackendConfig& config);

} // namespace cache
} // namespace coop_assist
