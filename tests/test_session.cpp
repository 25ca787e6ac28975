/**
 * Session manager tests with an injected clock.
 * Asserts:
 * - idle -> awaiting_selection -> idle, one pending entry per user.
 * - A new clarification replaces the old one.
 * - Pending entries and last contexts expire on their own timeouts.
 * - purge_expired() drops expired records of all users.
 * - The background sweeper purges users who never write again.
 *
 * Run from build dir: ./test_session
 */

#include "logger.h"
#include "session/session_manager.h"
#include <iostream>
#include <string>
#include <thread>
#include <vector>

using namespace coop_assist;
using namespace coop_assist::session;

static int failed = 0;

#define ASSERT(cond) do { if (!(cond)) { std::cerr << "FAIL: " << #cond << " (line " << __LINE__ << ")\n"; failed++; } } while(0)

static std::vector<ResponseOption> egg_options() {
    return {
        {"土鸡蛋 (30个)", "product_selection:free_range_egg"},
        {"有机鸡蛋 (12个)", "product_selection:organic_egg"},
    };
}

int main() {
    Logger::initialize(LogLevel::WARN);

    TimePoint now = steady_now();
    ClockFn clock = [&now]() { return now; };
    SessionManager sessions(config::SessionConfig(), clock);

    // --- state machine ---
    ASSERT(sessions.state("alice") == SessionState::Idle);
    ASSERT(!sessions.get_pending("alice").has_value());
    ASSERT(!sessions.clear_pending("alice"));
    ASSERT(sessions.size() == 0);

    sessions.set_pending("alice", PendingKind::Product, egg_options(), "鸡蛋有吗");
    ASSERT(sessions.state("alice") == SessionState::AwaitingSelection);
    ASSERT(std::string(session_state_to_string(sessions.state("alice"))) == "awaiting_selection");
    ASSERT(sessions.state("bob") == SessionState::Idle);
    ASSERT(sessions.size() == 1);

    auto pending = sessions.get_pending("alice");
    ASSERT(pending.has_value());
    if (pending) {
        ASSERT(pending->kind == PendingKind::Product);
        ASSERT(pending->options.size() == 2);
        ASSERT(pending->query == "鸡蛋有吗");
        ASSERT(pending->find_payload("product_selection:organic_egg") != nullptr);
        ASSERT(pending->find_payload("product_selection:organic_egg")->display_text == "有机鸡蛋 (12个)");
        ASSERT(pending->find_payload("product_selection:mango") == nullptr);
    }

    // Replacing keeps one entry per user
    sessions.set_pending("alice", PendingKind::PolicyCategory,
                         {{"配送", "policy_category:delivery"}}, "有什么政策");
    pending = sessions.get_pending("alice");
    ASSERT(pending.has_value());
    ASSERT(pending && pending->kind == PendingKind::PolicyCategory);
    ASSERT(pending && pending->options.size() == 1);
    ASSERT(sessions.size() == 1);

    ASSERT(sessions.clear_pending("alice"));
    ASSERT(sessions.state("alice") == SessionState::Idle);
    ASSERT(!sessions.clear_pending("alice"));
    ASSERT(sessions.size() == 0);

    // --- pending expiry ---
    sessions.set_pending("alice", PendingKind::Product, egg_options());
    now += Seconds(299);
    ASSERT(sessions.get_pending("alice").has_value());
    now += Seconds(1);
    ASSERT(!sessions.get_pending("alice").has_value());
    ASSERT(sessions.state("alice") == SessionState::Idle);
    ASSERT(sessions.size() == 0);

    // Clearing an expired entry reports nothing live
    sessions.set_pending("alice", PendingKind::Product, egg_options());
    now += Seconds(400);
    ASSERT(!sessions.clear_pending("alice"));

    // --- last context ---
    ASSERT(!sessions.get_last_context("alice").has_value());
    LastContext ctx;
    ctx.product_key = "strawberry";
    ctx.product_name = "草莓";
    ctx.intent = Intent::Availability;
    ctx.query = "草莓卖不?";
    sessions.set_last_context("alice", ctx);

    auto last = sessions.get_last_context("alice");
    ASSERT(last.has_value());
    if (last) {
        ASSERT(last->product_key == "strawberry");
        ASSERT(last->intent == Intent::Availability);
        ASSERT(last->updated == now);
    }
    ASSERT(!sessions.get_last_context("bob").has_value());

    // Context outlives a pending entry
    sessions.set_pending("alice", PendingKind::Product, egg_options());
    now += Seconds(600);
    ASSERT(sessions.state("alice") == SessionState::Idle);
    ASSERT(sessions.get_last_context("alice").has_value());
    ASSERT(sessions.size() == 1);

    now += Seconds(1200);
    ASSERT(!sessions.get_last_context("alice").has_value());
    ASSERT(sessions.size() == 0);

    // --- purge ---
    sessions.set_pending("u1", PendingKind::Product, egg_options());
    sessions.set_pending("u2", PendingKind::Product, egg_options());
    sessions.set_last_context("u3", ctx);
    ASSERT(sessions.size() == 3);
    ASSERT(sessions.purge_expired() == 0);

    now += Seconds(301);
    ASSERT(sessions.purge_expired() == 2);
    ASSERT(sessions.size() == 1);
    now += Seconds(1800);
    ASSERT(sessions.purge_expired() == 1);
    ASSERT(sessions.size() == 0);

    // --- background sweeper ---
    SessionManager swept(config::SessionConfig(), clock);
    swept.set_pending("gone", PendingKind::Product, egg_options());
    swept.set_last_context("gone", ctx);
    now += Seconds(1801);
    swept.set_pending("active", PendingKind::Product, egg_options());
    ASSERT(swept.size() == 2);

    // First pass runs as the thread starts; stop joins after it
    swept.start_sweeper();
    swept.start_sweeper();
    swept.stop_sweeper();
    ASSERT(swept.size() == 1);
    ASSERT(swept.state("active") == SessionState::AwaitingSelection);
    swept.stop_sweeper();

    // --- configurable timeouts ---
    config::SessionConfig short_cfg;
    short_cfg.pending_ttl_s = 10;
    short_cfg.context_ttl_s = 20;
    short_cfg.stripes = 1;
    SessionManager short_sessions(short_cfg, clock);
    short_sessions.set_pending("alice", PendingKind::Product, egg_options());
    short_sessions.set_last_context("alice", ctx);
    now += Seconds(10);
    ASSERT(!short_sessions.get_pending("alice").has_value());
    ASSERT(short_sessions.get_last_context("alice").has_value());
    now += Seconds(10);
    ASSERT(!short_sessions.get_last_context("alice").has_value());

    // --- concurrent users ---
    SessionManager shared;
    std::vector<std::thread> workers;
    for (int t = 0; t < 4; ++t) {
        workers.emplace_back([&shared, t]() {
            for (int i = 0; i < 50; ++i) {
                std::string user = "user" + std::to_string(t) + "_" + std::to_string(i);
                shared.set_pending(user, PendingKind::Product, egg_options());
                shared.get_pending(user);
            }
        });
    }
    for (auto& w : workers) {
        w.join();
    }
    ASSERT(shared.size() == 200);

    Logger::shutdown();

    if (failed) {
        std::cerr << failed << " assertion(s) failed.\n";
        return 1;
    }
    std::cout << "All session tests passed.\n";
    return 0;
}
