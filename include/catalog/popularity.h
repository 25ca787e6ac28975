#pragma once

/**
 * @file popularity.h
 * @brief Runtime request counts per product
 */

#include "catalog/product_catalog.h"
#include <mutex>
#include <string>
#include <unordered_map>
#include <vector>

namespace coop_assist {
namespace catalog {

/**
 * @brief Counts how often each product was shown to a user
 *
 * The catalog itself is immutable; this is the only product state that
 * changes while serving. Thread-safe.
 */
class PopularityTracker {
public:
    PopularityTracker() = default;

    // Non-copyable
    PopularityTracker(const PopularityTracker&) = delete;
    PopularityTracker& operator=(const PopularityTracker&) = delete;

    void record(const std::string& key);

    unsigned count(const std::string& key) const;

    /// Most requested first; equal counts keep the given order
    std::vector<const Product*> rank(std::vector<const Product*> products) const;

private:
    mutable std::mutex mutex_;
    std::unordered_map<std::string, unsigned> counts_;
};

} // namespace catalog
} // namespace coop_assist
