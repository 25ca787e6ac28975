/**
 * Configuration loading tests.
 * Asserts:
 * - The shipped config loads and its data paths resolve next to the file.
 * - Missing keys keep the compiled-in defaults.
 * - Invalid values, bad JSON and missing files come back as typed errors.
 * - save() writes a file that loads back to the same settings.
 *
 * Run from build dir: ./test_config
 */

#include "core/config.h"
#include "logger.h"
#include <filesystem>
#include <fstream>
#include <iostream>
#include <string>

using namespace coop_assist;
namespace fs = std::filesystem;

static int failed = 0;

#define ASSERT(cond) do { if (!(cond)) { std::cerr << "FAIL: " << #cond << " (line " << __LINE__ << ")\n"; failed++; } } while(0)

static std::string write_file(const fs::path& dir, const std::string& name, const std::string& text) {
    fs::path p = dir / name;
    std::ofstream out(p);
    out << text;
    return p.string();
}

int main() {
    Logger::initialize(LogLevel::WARN);

    fs::path tmp = fs::temp_directory_path() / "coop_assist_test_config";
    fs::create_directories(tmp);
    const std::string tmp_dir = tmp.string();

    // --- defaults ---
    Config defaults = Config::defaults();
    ASSERT(defaults.validate().empty());
    ASSERT(defaults.session.pending_ttl_s == 300);
    ASSERT(defaults.session.context_ttl_s == 1800);
    ASSERT(defaults.session.sweep_interval_s == 60);
    ASSERT(defaults.resolver.max_options == 5);
    ASSERT(defaults.policy.top_k == 3);
    ASSERT(!defaults.cache.backend.enabled);

    // --- shipped config ---
    const std::string shipped_dir = std::string(COOP_ASSIST_DATA_DIR) + "/../config";
    auto shipped = Config::load(shipped_dir + "/config.json");
    ASSERT(shipped.is_ok());
    if (shipped.is_ok()) {
        const Config& c = shipped.value();
        ASSERT(c.data.catalog_path == shipped_dir + "/../data/catalog.json");
        ASSERT(c.data.policy_path == shipped_dir + "/../data/policy.json");
        ASSERT(c.logging.file.empty());
        ASSERT(c.llm.timeout_ms == 8000);
        ASSERT(c.cache.preheat_policy.size() == 12);
    }

    // --- partial config keeps defaults ---
    std::string partial = write_file(tmp, "partial.json",
        R"({"resolver": {"threshold": 0.7},
            "data": {"policy_path": "/srv/coop/policy.json"},
            "session": {"pending_ttl_s": 120}})");
    auto loaded = Config::load(partial);
    ASSERT(loaded.is_ok());
    if (loaded.is_ok()) {
        const Config& c = loaded.value();
        ASSERT(c.resolver.threshold == 0.7);
        ASSERT(c.resolver.max_options == 5);
        ASSERT(c.session.pending_ttl_s == 120);
        ASSERT(c.session.context_ttl_s == 1800);
        ASSERT(c.policy.refund_category == "refund");
        // Relative defaults resolve against the config directory, absolute paths stay
        ASSERT(c.data.catalog_path == tmp_dir + "/data/catalog.json");
        ASSERT(c.data.policy_path == "/srv/coop/policy.json");
    }

    // --- errors ---
    auto invalid = Config::load(write_file(tmp, "invalid.json", R"({"resolver": {"max_options": 1}})"));
    ASSERT(invalid.is_error());
    ASSERT(invalid.is_error() && invalid.error().type == ErrorType::InvalidData);
    ASSERT(invalid.is_error() && invalid.error().message.find("max_options") != std::string::npos);

    auto garbage = Config::load(write_file(tmp, "garbage.json", "{not json"));
    ASSERT(garbage.is_error());
    ASSERT(garbage.is_error() && garbage.error().type == ErrorType::ParseError);

    auto missing = Config::load(tmp_dir + "/no_such_config.json");
    ASSERT(missing.is_error());
    ASSERT(missing.is_error() && missing.error().type == ErrorType::IOError);

    Config bad = Config::defaults();
    bad.cache.warm_threshold = 200;
    bad.session.context_ttl_s = 0;
    bad.session.sweep_interval_s = 0;
    std::string problems = bad.validate();
    ASSERT(problems.find("warm_threshold") != std::string::npos);
    ASSERT(problems.find("session TTLs") != std::string::npos);
    ASSERT(problems.find("sweep_interval_s") != std::string::npos);

    // --- save and reload ---
    Config saved = Config::defaults();
    saved.session.pending_ttl_s = 90;
    saved.session.sweep_interval_s = 15;
    saved.llm.model_name = "qwen2.5:3b";
    saved.cache.backend.enabled = true;
    const std::string saved_path = tmp_dir + "/saved.json";
    ASSERT(saved.save(saved_path).is_ok());
    auto reloaded = Config::load(saved_path);
    ASSERT(reloaded.is_ok());
    if (reloaded.is_ok()) {
        ASSERT(reloaded.value().session.pending_ttl_s == 90);
        ASSERT(reloaded.value().session.sweep_interval_s == 15);
        ASSERT(reloaded.value().llm.model_name == "qwen2.5:3b");
        ASSERT(reloaded.value().cache.backend.enabled);
        ASSERT(reloaded.value().cache.preheat_product == saved.cache.preheat_product);
    }

    std::error_code ec;
    fs::remove_all(tmp, ec);

    Logger::shutdown();

    if (failed) {
        std::cerr << failed << " assertion(s) failed.\n";
        return 1;
    }
    std::cout << "All config tests passed.\n";
    return 0;
}
