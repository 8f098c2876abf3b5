/**
 * @file product_catalog.hpp
 * @brief Product id to model lookup.
 *
 * The catalog is the vendor product list stored as a local JSON file. It
 * maps the `pid` a device reports to a model name, a device type code and
 * the data points the product supports.
 *
 * @copyright Copyright (c) 2024 cozyd Contributors
 * @license MIT License
 */

#pragma once

#include "cozyd/core/export.hpp"

#include <cstdint>
#include <optional>
#include <string>
#include <unordered_map>
#include <vector>

namespace cozyd {
namespace core {

/**
 * @brief Parse a decimal type code such as "01".
 * @return The code, or -1 if the text is not a decimal number.
 */
COZYD_CORE_API int32_t parseTypeCode(const std::string& text);

/**
 * @struct ProductInfo
 * @brief Catalog entry for one product id.
 */
struct COZYD_CORE_API ProductInfo {
    std::string product_id;
    std::string model_name;
    std::string icon;
    int32_t type_code{-1};
    std::vector<int32_t> data_point_ids;
};

/**
 * @class ProductCatalog
 * @brief Immutable after loading; safe to share between threads.
 */
class COZYD_CORE_API ProductCatalog {
public:
    ProductCatalog() = default;

    /**
     * @brief Load a catalog from a file.
     * @return False if the file cannot be read or parsed.
     */
    bool loadFromFile(const std::string& path);

    /**
     * @brief Load a catalog from JSON text.
     */
    bool loadFromJson(const std::string& json);

    std::optional<ProductInfo> lookup(const std::string& productId) const;

    size_t size() const { return products_.size(); }
    bool empty() const { return products_.empty(); }

private:
    std::unordered_map<std::string, ProductInfo> products_;
};

}  // namespace core
}  // namespace cozyd
