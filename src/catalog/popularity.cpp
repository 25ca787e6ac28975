#include "catalog/popularity.h"
#include <algorithm>

namespace coop_assist {
namespace catalog {

void PopularityTracker::record(const std::string& key) {
    std::lock_guard<std::mutex> lock(mutex_);
    counts_[key]++;
}

unsigned PopularityTracker::count(const std::string& key) const {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = counts_.find(key);
    return it == counts_.end() ? 0 : it->second;
}

std::vector<const Product*> PopularityTracker::rank(std::vector<const Product*> products) const {
    std::vector<std::pair<unsigned, const Product*>> counted;
    counted.reserve(products.size());
    {
        std::lock_guard<std::mutex> lock(mutex_);
        for (const Product* p : products) {
            auto it = counts_.find(p->key);
            counted.emplace_back(it == counts_.end() ? 0 : it->second, p);
        }
    }
    std::stable_sort(counted.begin(), counted.end(),
                     [](const std::pair<unsigned, const Product*>& a,
                        const std::pair<unsigned, const Product*>& b) { return a.first > b.first; });
    for (size_t i = 0; i < counted.size(); ++i) {
        products[i] = counted[i].second;
    }
    return products;
}

} // namespace catalog
} // namespace coop_assist
