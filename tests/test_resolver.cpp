/**
 * Catalog, affix stripper and entity resolver tests.
 * Asserts:
 * - Filler affixes are stripped as whole units and never to an empty string.
 * - Affix lists that would let a short affix shadow a longer one are rejected.
 * - Resolution is deterministic: descending score, ties in catalog order.
 * - Unique, ambiguous and not-found fragments get the matching status.
 * - Popularity ranks most requested products first and keeps catalog order on ties.
 *
 * Run from build dir: ./test_resolver
 */

#include "catalog/popularity.h"
#include "catalog/product_catalog.h"
#include "logger.h"
#include "resolver/affix_stripper.h"
#include "resolver/entity_resolver.h"
#include <nlohmann/json.hpp>
#include <cmath>
#include <iostream>
#include <stdexcept>
#include <string>
#include <vector>

using namespace coop_assist;
using namespace coop_assist::resolver;
using json = nlohmann::json;

static int failed = 0;

#define ASSERT(cond) do { if (!(cond)) { std::cerr << "FAIL: " << #cond << " (line " << __LINE__ << ")\n"; failed++; } } while(0)

static bool near(double a, double b) {
    return std::fabs(a - b) < 1e-3;
}

static bool catalog_rejects(const std::string& text) {
    try {
        catalog::ProductCatalog::from_json(json::parse(text));
    } catch (const std::runtime_error&) {
        return true;
    }
    return false;
}

int main() {
    Logger::initialize(LogLevel::WARN);

    // --- catalog ---
    auto loaded = catalog::ProductCatalog::load(std::string(COOP_ASSIST_DATA_DIR) + "/catalog.json");
    ASSERT(loaded.is_ok());
    if (!loaded.is_ok()) {
        std::cerr << loaded.error().message << "\n";
        return 1;
    }
    const catalog::ProductCatalog& table = loaded.value();
    ASSERT(table.size() == 18);
    ASSERT(table.find("STRAWBERRY") != nullptr);
    ASSERT(table.find(" organic_egg ") != nullptr);
    ASSERT(table.find("durian") == nullptr);
    ASSERT(table.categories().front() == "水果");
    ASSERT(table.in_category("蛋类").size() == 3);
    ASSERT(table.featured().size() == 4);
    ASSERT(table.find("free_range_egg")->display_name() == "土鸡蛋 (30个)");
    ASSERT(table.category_in("有什么蔬菜？").value_or("") == "蔬菜");
    ASSERT(table.category_in("  海鲜  ").value_or("") == "海鲜");
    ASSERT(!table.category_in("鸡蛋有吗").has_value());

    // --- popularity ---
    catalog::PopularityTracker popularity;
    ASSERT(popularity.count("mango") == 0);
    popularity.record("mango");
    popularity.record("mango");
    popularity.record("pear");
    ASSERT(popularity.count("mango") == 2);
    ASSERT(popularity.count("pear") == 1);
    // Most requested first, untouched products stay in catalog order
    std::vector<const catalog::Product*> fruit = popularity.rank(table.in_category("水果"));
    ASSERT(fruit.size() == 6);
    if (fruit.size() == 6) {
        ASSERT(fruit[0]->key == "mango");
        ASSERT(fruit[1]->key == "pear");
        ASSERT(fruit[2]->key == "strawberry");
        ASSERT(fruit[5]->key == "watermelon");
    }
    ASSERT(popularity.rank({}).empty());

    ASSERT(catalog_rejects(R"([{"key": "a", "name": "甲"}, {"key": "A", "name": "乙"}])"));
    ASSERT(catalog_rejects(R"([{"key": "a"}])"));
    ASSERT(catalog_rejects(R"([{"key": "a", "name": "甲", "price": "cheap"}])"));
    ASSERT(catalog_rejects(R"({"items": []})"));
    ASSERT(!catalog_rejects(R"({"products": [{"key": "a", "name": "甲"}]})"));

    auto missing = catalog::ProductCatalog::load(std::string(COOP_ASSIST_DATA_DIR) + "/no_such_catalog.json");
    ASSERT(missing.is_error());
    ASSERT(missing.error().type == ErrorType::IOError);

    // --- affix stripper ---
    AffixStripper stripper = AffixStripper::default_fillers();
    ASSERT(stripper.strip("草莓卖不?") == "草莓");
    ASSERT(stripper.strip("草莓卖不？") == "草莓");
    ASSERT(stripper.strip("请问有没有草莓") == "草莓");
    ASSERT(stripper.strip("鸡蛋有吗") == "鸡蛋");
    ASSERT(stripper.strip("芒果一斤多少钱") == "芒果");
    ASSERT(stripper.strip("你们 有没有 活虾!") == "活虾");
    // Never strips to nothing
    ASSERT(stripper.strip("吗") == "吗");
    ASSERT(stripper.strip("有吗") == "有");
    ASSERT(stripper.strip("").empty());

    // Idempotent
    for (const std::string fragment : {"土鸡蛋有吗", "你们有没有活虾卖吗", "请问韭菜怎么卖啊"}) {
        std::string once = stripper.strip(fragment);
        ASSERT(stripper.strip(once) == once);
    }

    bool rejected = false;
    try {
        AffixStripper bad({"有", "有没有"}, {});
    } catch (const std::invalid_argument&) {
        rejected = true;
    }
    ASSERT(rejected);

    rejected = false;
    try {
        AffixStripper bad({}, {"吗", "有吗"});
    } catch (const std::invalid_argument&) {
        rejected = true;
    }
    ASSERT(rejected);

    rejected = false;
    try {
        AffixStripper bad({""}, {});
    } catch (const std::invalid_argument&) {
        rejected = true;
    }
    ASSERT(rejected);

    AffixStripper longest_first({"有没有", "有"}, {"有吗", "吗"});
    ASSERT(longest_first.strip("有没有草莓") == "草莓");

    // --- resolver ---
    EntityResolver resolver(table);

    ResolveResult r = resolver.resolve("草莓卖不?");
    ASSERT(r.status == ResolutionStatus::Resolved);
    ASSERT(r.cleaned == "草莓");
    ASSERT(r.candidates.size() == 1);
    ASSERT(r.candidates[0].key == "strawberry");
    ASSERT(r.candidates[0].score == 1.0);

    r = resolver.resolve("鸡蛋有吗");
    ASSERT(r.status == ResolutionStatus::Ambiguous);
    ASSERT(r.candidates.size() == 2);
    if (r.candidates.size() == 2) {
        ASSERT(r.candidates[0].key == "free_range_egg");
        ASSERT(r.candidates[1].key == "organic_egg");
        ASSERT(near(r.candidates[0].score, 0.6 + 0.4 * 2.0 / 3.0));
        ASSERT(near(r.candidates[1].score, 0.8));
        ASSERT(r.candidates[0].score > r.candidates[1].score);
    }

    // Alias match scaled by 0.9 beats the containment score of the name
    r = resolver.resolve("苹果");
    ASSERT(r.status == ResolutionStatus::Resolved);
    ASSERT(r.candidates[0].key == "fuji_apple");
    ASSERT(near(r.candidates[0].score, 0.9));

    r = resolver.resolve("有机鸡蛋有吗");
    ASSERT(r.status == ResolutionStatus::Resolved);
    ASSERT(r.candidates[0].key == "organic_egg");

    // Equal scores keep catalog order
    r = resolver.resolve("鸡");
    ASSERT(r.status == ResolutionStatus::Ambiguous);
    ASSERT(r.candidates.size() == 4);
    if (r.candidates.size() == 4) {
        ASSERT(r.candidates[0].key == "chicken_wing");
        ASSERT(r.candidates[1].key == "free_range_egg");
        ASSERT(r.candidates[2].key == "old_hen");
        ASSERT(r.candidates[3].key == "organic_egg");
        ASSERT(r.candidates[1].score == r.candidates[2].score);
    }

    r = resolver.resolve("榴莲有吗");
    ASSERT(r.status == ResolutionStatus::NotFound);
    ASSERT(r.cleaned == "榴莲");
    ASSERT(r.candidates.empty());
    ASSERT(r.near_misses.empty());

    // Typo: below threshold, offered as a near miss
    r = resolver.resolve("草梅有吗");
    ASSERT(r.status == ResolutionStatus::NotFound);
    ASSERT(!r.near_misses.empty());
    ASSERT(r.near_misses[0].key == "strawberry");
    ASSERT(r.near_misses.size() <= 3);

    r = resolver.resolve("?!");
    ASSERT(r.status == ResolutionStatus::NotFound);
    ASSERT(r.cleaned.empty());

    // Deterministic across calls
    ResolveResult again = resolver.resolve("鸡蛋有吗");
    ASSERT(again.candidates.size() == 2 && again.candidates[0].key == "free_range_egg");

    // Alias matches rank just below name matches
    r = resolver.resolve("土鸡蛋");
    ASSERT(!r.candidates.empty() && r.candidates[0].key == "free_range_egg");
    ASSERT(!r.candidates.empty() && near(r.candidates[0].score, 1.0));
    r = resolver.resolve("草鸡蛋");
    ASSERT(!r.candidates.empty() && r.candidates[0].key == "free_range_egg");
    ASSERT(!r.candidates.empty() && near(r.candidates[0].score, 0.9));

    // Tie order follows declaration order of the catalog
    auto forward = catalog::ProductCatalog::from_json(json::parse(
        R"([{"key": "red", "name": "红苹果"}, {"key": "green", "name": "青苹果"}])"));
    auto backward = catalog::ProductCatalog::from_json(json::parse(
        R"([{"key": "green", "name": "青苹果"}, {"key": "red", "name": "红苹果"}])"));
    EntityResolver forward_resolver(forward);
    EntityResolver backward_resolver(backward);
    ResolveResult f = forward_resolver.resolve("苹果");
    ResolveResult b = backward_resolver.resolve("苹果");
    ASSERT(f.candidates.size() == 2 && b.candidates.size() == 2);
    if (f.candidates.size() == 2 && b.candidates.size() == 2) {
        ASSERT(f.candidates[0].key == "red");
        ASSERT(b.candidates[0].key == "green");
    }

    // Threshold is configurable
    config::ResolverConfig strict;
    strict.threshold = 0.85;
    EntityResolver strict_resolver(table, strict);
    r = strict_resolver.resolve("鸡蛋有吗");
    ASSERT(r.status == ResolutionStatus::Resolved);
    ASSERT(r.candidates[0].key == "free_range_egg");

    Logger::shutdown();

    if (failed) {
        std::cerr << failed << " assertion(s) failed.\n";
        return 1;
    }
    std::cout << "All resolver tests passed.\n";
    return 0;
}
