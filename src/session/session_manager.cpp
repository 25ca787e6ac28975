#include "session/session_manager.h"
#include "logger.h"
#include <algorithm>
#include <condition_variable>
#include <mutex>
#include <thread>
#include <unordered_map>

namespace coop_assist {
namespace session {

const char* session_state_to_string(SessionState state) {
    switch (state) {
        case SessionState::Idle:              return "idle";
        case SessionState::AwaitingSelection: return "awaiting_selection";
    }
    return "unknown";
}

const ResponseOption* PendingClarification::find_payload(const std::string& payload) const {
    for (const auto& option : options) {
        if (option.payload == payload) {
            return &option;
        }
    }
    return nullptr;
}

namespace {

struct SessionRecord {
    std::optional<PendingClarification> pending;
    std::optional<LastContext> context;
};

struct Stripe {
    mutable std::mutex mutex;
    std::unordered_map<std::string, SessionRecord> records;
};

} // namespace

class SessionManager::Impl {
public:
    Impl(const config::SessionConfig& config, ClockFn clock)
        : config_(config),
          clock_(clock ? std::move(clock) : ClockFn(steady_now)),
          stripes_(std::max<size_t>(1, config.stripes)) {
    }

    ~Impl() {
        stop_sweeper();
    }

    std::optional<PendingClarification> get_pending(const std::string& user_id) {
        Stripe& stripe = stripe_for(user_id);
        std::lock_guard<std::mutex> lock(stripe.mutex);
        auto it = stripe.records.find(user_id);
        if (it == stripe.records.end() || !it->second.pending) {
            return std::nullopt;
        }
        if (!(clock_() < it->second.pending->expires)) {
            LOG_SESSION("Pending clarification of " + user_id + " expired");
            it->second.pending.reset();
            drop_if_empty(stripe, it);
            return std::nullopt;
        }
        return it->second.pending;
    }

    void set_pending(const std::string& user_id, PendingKind kind,
                     std::vector<ResponseOption> options, const std::string& query) {
        PendingClarification pending;
        pending.kind = kind;
        pending.options = std::move(options);
        pending.query = query;
        pending.created = clock_();
        pending.expires = pending.created + Seconds(config_.pending_ttl_s);

        Stripe& stripe = stripe_for(user_id);
        std::lock_guard<std::mutex> lock(stripe.mutex);
        LOG_SESSION(user_id + " -> awaiting_selection (" + std::to_string(pending.options.size()) + " options)");
        stripe.records[user_id].pending = std::move(pending);
    }

    bool clear_pending(const std::string& user_id) {
        Stripe& stripe = stripe_for(user_id);
        std::lock_guard<std::mutex> lock(stripe.mutex);
        auto it = stripe.records.find(user_id);
        if (it == stripe.records.end() || !it->second.pending) {
            return false;
        }
        bool live = clock_() < it->second.pending->expires;
        it->second.pending.reset();
        drop_if_empty(stripe, it);
        LOG_SESSION(user_id + " -> idle");
        return live;
    }

    std::optional<LastContext> get_last_context(const std::string& user_id) {
        Stripe& stripe = stripe_for(user_id);
        std::lock_guard<std::mutex> lock(stripe.mutex);
        auto it = stripe.records.find(user_id);
        if (it == stripe.records.end() || !it->second.context) {
            return std::nullopt;
        }
        if (context_expired(*it->second.context)) {
            it->second.context.reset();
            drop_if_empty(stripe, it);
            return std::nullopt;
        }
        return it->second.context;
    }

    void set_last_context(const std::string& user_id, LastContext context) {
        context.updated = clock_();
        Stripe& stripe = stripe_for(user_id);
        std::lock_guard<std::mutex> lock(stripe.mutex);
        stripe.records[user_id].context = std::move(context);
    }

    size_t purge_expired() {
        size_t purged = 0;
        for (auto& stripe : stripes_) {
            std::lock_guard<std::mutex> lock(stripe.mutex);
            const TimePoint now = clock_();
            for (auto it = stripe.records.begin(); it != stripe.records.end();) {
                SessionRecord& rec = it->second;
                if (rec.pending && !(now < rec.pending->expires)) {
                    rec.pending.reset();
                    purged++;
                }
                if (rec.context && context_expired(*rec.context)) {
                    rec.context.reset();
                    purged++;
                }
                if (!rec.pending && !rec.context) {
                    it = stripe.records.erase(it);
                } else {
                    ++it;
                }
            }
        }
        if (purged > 0) {
            LOG_SESSION("Purged " + std::to_string(purged) + " expired session items");
        }
        return purged;
    }

    void start_sweeper() {
        std::lock_guard<std::mutex> lock(sweeper_mutex_);
        if (sweeper_.joinable()) {
            return;
        }
        stop_requested_ = false;
        sweeper_ = std::thread(&Impl::sweep_loop, this);
        Logger::info("[Session] Sweeping expired sessions every " +
                     std::to_string(config_.sweep_interval_s) + "s");
    }

    void stop_sweeper() {
        {
            std::lock_guard<std::mutex> lock(sweeper_mutex_);
            if (!sweeper_.joinable()) {
                return;
            }
            stop_requested_ = true;
        }
        sweeper_cv_.notify_all();
        sweeper_.join();
    }

    size_t size() const {
        size_t total = 0;
        for (const auto& stripe : stripes_) {
            std::lock_guard<std::mutex> lock(stripe.mutex);
            total += stripe.records.size();
        }
        return total;
    }

private:
    using RecordIt = std::unordered_map<std::string, SessionRecord>::iterator;

    Stripe& stripe_for(const std::string& user_id) {
        return stripes_[std::hash<std::string>{}(user_id) % stripes_.size()];
    }

    bool context_expired(const LastContext& context) const {
        return !(clock_() < context.updated + Seconds(config_.context_ttl_s));
    }

    void sweep_loop() {
        purge_expired();
        std::unique_lock<std::mutex> lock(sweeper_mutex_);
        while (!stop_requested_) {
            sweeper_cv_.wait_for(lock, Seconds(std::max(1, config_.sweep_interval_s)),
                                 [this] { return stop_requested_; });
            if (stop_requested_) {
                break;
            }
            lock.unlock();
            purge_expired();
            lock.lock();
        }
    }

    static void drop_if_empty(Stripe& stripe, RecordIt it) {
        if (!it->second.pending && !it->second.context) {
            stripe.records.erase(it);
        }
    }

    config::SessionConfig config_;
    ClockFn clock_;
    std::vector<Stripe> stripes_;

    std::mutex sweeper_mutex_;
    std::condition_variable sweeper_cv_;
    std::thread sweeper_;
    bool stop_requested_ = false;
};

SessionManager::SessionManager(const config::SessionConfig& config, ClockFn clock)
    : pimpl_(std::make_unique<Impl>(config, std::move(clock))) {
}

SessionManager::~SessionManager() = default;

std::optional<PendingClarification> SessionManager::get_pending(const std::string& user_id) {
    return pimpl_->get_pending(user_id);
}

void SessionManager::set_pending(const std::string& user_id, PendingKind kind,
                                 std::vector<ResponseOption> options, const std::string& query) {
    pimpl_->set_pending(user_id, kind, std::move(options), query);
}

bool SessionManager::clear_pending(const std::string& user_id) {
    return pimpl_->clear_pending(user_id);
}

std::optional<LastContext> SessionManager::get_last_context(const std::string& user_id) {
    return pimpl_->get_last_context(user_id);
}

void SessionManager::set_last_context(const std::string& user_id, LastContext context) {
    pimpl_->set_last_context(user_id, std::move(context));
}

SessionState SessionManager::state(const std::string& user_id) {
    return pimpl_->get_pending(user_id) ? SessionState::AwaitingSelection : SessionState::Idle;
}

size_t SessionManager::purge_expired() {
    return pimpl_->purge_expired();
}

void SessionManager::start_sweeper() {
    pimpl_->start_sweeper();
}

void SessionManager::stop_sweeper() {
    pimpl_->stop_sweeper();
}

size_t SessionManager::size() const {
    return pimpl_->size();
}

} // namespace session
} // namespace coop_assist
