#pragma once

/**
 * @file product_catalog.h
 * @brief Read-only product table loaded at startup
 */

#include "errors.h"
#include <nlohmann/json.hpp>
#include <optional>
#include <string>
#include <unordered_map>
#include <vector>

namespace coop_assist {
namespace catalog {

/**
 * @brief One sellable item
 *
 * The key is the stable identifier used in option payloads and the cache;
 * the name is what users type and what replies show.
 */
struct Product {
    std::string key;
    std::string name;
    std::string specification;  ///< e.g. "1斤装", may be empty
    std::string category;
    double price = 0.0;
    std::vector<std::string> keywords;  ///< Aliases considered by the resolver
    std::string description;
    std::string origin;
    bool featured = false;

    /// "name (specification)" or just the name
    std::string display_name() const;
};

/**
 * @brief Ordered product table
 *
 * Declaration order is significant: the resolver breaks score ties by it.
 */
class ProductCatalog {
public:
    ProductCatalog() = default;

    /**
     * @brief Build from the parsed catalog file
     * @throws std::runtime_error on missing fields or duplicate keys
     */
    static ProductCatalog from_json(const nlohmann::json& j);

    /**
     * @brief Load and validate the catalog file
     */
    static Result<ProductCatalog> load(const std::string& path);

    const std::vector<Product>& products() const { return products_; }

    /// Lookup by key (case-insensitive); nullptr when unknown
    const Product* find(const std::string& key) const;

    /// Category names in first-seen order
    const std::vector<std::string>& categories() const { return categories_; }

    /// First category whose name appears in the text
    std::optional<std::string> category_in(const std::string& text) const;

    /// Products of one category, in catalog order
    std::vector<const Product*> in_category(const std::string& category) const;

    /// Featured products in catalog order
    std::vector<const Product*> featured() const;

    size_t size() const { return products_.size(); }
    bool empty() const { return products_.empty(); }

private:
    std::vector<Product> products_;
    std::vector<std::string> categories_;
    std::unordered_map<std::string, size_t> index_;
};

} // namespace catalog
} // namespace coop_assist
