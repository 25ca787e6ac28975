#pragma once

/**
 * @file session_manager.h
 * @brief Per-user dialogue state: pending clarification and last context
 */

#include "core/config.h"
#include "core/types.h"
#include <memory>
#include <optional>
#include <string>
#include <vector>

namespace coop_assist {
namespace session {

enum class SessionState {
    Idle,
    AwaitingSelection
};

const char* session_state_to_string(SessionState state);

enum class PendingKind {
    Product,         ///< Options are catalog candidates
    PolicyCategory   ///< Options are policy categories
};

/**
 * @brief Options offered to a user, waiting for a pick
 */
struct PendingClarification {
    PendingKind kind = PendingKind::Product;
    std::vector<ResponseOption> options;
    std::string query;  ///< Message that triggered the clarification
    TimePoint created;
    TimePoint expires;

    /// Option whose payload equals the given text, if any
    const ResponseOption* find_payload(const std::string& payload) const;
};

/**
 * @brief Last resolved entity, kept for elliptical follow-ups
 */
struct LastContext {
    std::string product_key;
    std::string product_name;
    Intent intent = Intent::Unknown;
    std::string query;
    TimePoint updated;
};

/**
 * @brief Keyed store of fixed-shape session records
 *
 * At most one pending clarification per user; setting a new one replaces
 * the old. Pending entries and contexts expire on their own timeouts, and
 * expired records are dropped on access, by purge_expired(), or by the
 * background sweeper. Users map to
 * lock stripes, so concurrent requests of different users rarely contend.
 */
class SessionManager {
public:
    explicit SessionManager(const config::SessionConfig& config = {}, ClockFn clock = steady_now);
    ~SessionManager();

    // Non-copyable
    SessionManager(const SessionManager&) = delete;
    SessionManager& operator=(const SessionManager&) = delete;

    std::optional<PendingClarification> get_pending(const std::string& user_id);

    void set_pending(const std::string& user_id, PendingKind kind,
                     std::vector<ResponseOption> options, const std::string& query = "");

    /// @return true if a live pending entry was removed
    bool clear_pending(const std::string& user_id);

    std::optional<LastContext> get_last_context(const std::string& user_id);

    void set_last_context(const std::string& user_id, LastContext context);

    SessionState state(const std::string& user_id);

    /// Drop expired pending entries and contexts of all users
    size_t purge_expired();

    /**
     * @brief Purge now and then every sweep interval on a background thread
     *
     * Bounds memory for users who never send another message.
     */
    void start_sweeper();

    /// Stop the sweeper (idempotent); joins the thread
    void stop_sweeper();

    /// Users with any live state
    size_t size() const;

private:
    class Impl;
    std::unique_ptr<Impl> pimpl_;
};

} // namespace session
} // namespace coop_assist
