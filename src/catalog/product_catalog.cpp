#include "catalog/product_catalog.h"
#include "logger.h"
#include "utils.h"
#include <algorithm>
#include <fstream>
#include <stdexcept>

using json = nlohmann::json;

namespace coop_assist {
namespace catalog {

std::string Product::display_name() const {
    if (specification.empty()) {
        return name;
    }
    return name + " (" + specification + ")";
}

ProductCatalog ProductCatalog::from_json(const json& j) {
    const json* items = &j;
    if (j.is_object()) {
        if (!j.contains("products") || !j["products"].is_array()) {
            throw std::runtime_error("Catalog object has no 'products' array");
        }
        items = &j["products"];
    } else if (!j.is_array()) {
        throw std::runtime_error("Catalog must be an array or an object with 'products'");
    }

    ProductCatalog catalog;
    for (const auto& item : *items) {
        if (!item.is_object()) {
            throw std::runtime_error("Catalog entry is not an object");
        }
        Product p;
        p.key = utils::to_lower_ascii(utils::trim_copy(item.value("key", "")));
        p.name = utils::trim_copy(item.value("name", ""));
        if (p.key.empty() || p.name.empty()) {
            throw std::runtime_error("Catalog entry without key or name: " + item.dump());
        }
        if (catalog.index_.count(p.key)) {
            throw std::runtime_error("Duplicate catalog key '" + p.key + "'");
        }
        p.specification = item.value("specification", "");
        p.category = item.value("category", "");
        if (item.contains("price")) {
            if (!item["price"].is_number()) {
                throw std::runtime_error("Non-numeric price for '" + p.key + "'");
            }
            p.price = item["price"].get<double>();
        }
        if (item.contains("keywords")) {
            if (!item["keywords"].is_array()) {
                throw std::runtime_error("'keywords' of '" + p.key + "' must be an array");
            }
            for (const auto& kw : item["keywords"]) {
                if (kw.is_string() && !kw.get<std::string>().empty()) {
                    p.keywords.push_back(kw.get<std::string>());
                }
            }
        }
        p.description = item.value("description", "");
        p.origin = item.value("origin", "");
        p.featured = item.value("featured", false);

        if (!p.category.empty() &&
            std::find(catalog.categories_.begin(), catalog.categories_.end(), p.category) ==
                catalog.categories_.end()) {
            catalog.categories_.push_back(p.category);
        }
        catalog.index_[p.key] = catalog.products_.size();
        catalog.products_.push_back(std::move(p));
    }
    return catalog;
}

Result<ProductCatalog> ProductCatalog::load(const std::string& path) {
    std::ifstream file(path);
    if (!file.is_open()) {
        return make_io_error("Cannot open catalog: " + path);
    }

    json j;
    try {
        file >> j;
    } catch (const json::exception& e) {
        return make_parse_error("Failed to parse " + path + ": " + e.what());
    }

    try {
        ProductCatalog catalog = from_json(j);
        Logger::info("[Catalog] Loaded " + std::to_string(catalog.size()) + " products in " +
                     std::to_string(catalog.categories().size()) + " categories from " + path);
        return catalog;
    } catch (const std::exception& e) {
        return make_invalid_data_error("Malformed catalog " + path + ": " + e.what());
    }
}

const Product* ProductCatalog::find(const std::string& key) const {
    auto it = index_.find(utils::to_lower_ascii(utils::trim_copy(key)));
    if (it == index_.end()) {
        return nullptr;
    }
    return &products_[it->second];
}

std::optional<std::string> ProductCatalog::category_in(const std::string& text) const {
    const std::string normalized = utils::normalize_utterance(text);
    for (const auto& category : categories_) {
        if (utils::contains(normalized, utils::normalize_utterance(category))) {
            return category;
        }
    }
    return std::nullopt;
}

std::vector<const Product*> ProductCatalog::in_category(const std::string& category) const {
    std::vector<const Product*> out;
    for (const auto& p : products_) {
        if (p.category == category) {
            out.push_back(&p);
        }
    }
    return out;
}

std::vector<const Product*> ProductCatalog::featured() const {
    std::vector<const Product*> out;
    for (const auto& p : products_) {
        if (p.featured) {
            out.push_back(&p);
        }
    }
    return out;
}

} // namespace catalog
} // namespace coop_assist
