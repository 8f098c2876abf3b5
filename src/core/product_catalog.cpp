/**
 * @file product_catalog.cpp
 * @brief ProductCatalog implementation.
 *
 * @copyright Copyright (c) 2024 cozyd Contributors
 * @license MIT License
 */

#include "cozyd/core/product_catalog.hpp"
#include "cozyd/utils/logger.hpp"

#include "cozyd/proto/product_catalog.pb.h"

#include <google/protobuf/util/json_util.h>

#include <fstream>
#include <sstream>

namespace cozyd {
namespace core {

int32_t parseTypeCode(const std::string& text) {
    if (text.empty() || text.size() > 9) {
        return -1;
    }
    int32_t value = 0;
    for (char c : text) {
        if (c < '0' || c > '9') {
            return -1;
        }
        value = value * 10 + (c - '0');
    }
    return value;
}

bool ProductCatalog::loadFromFile(const std::string& path) {
    std::ifstream in(path, std::ios::binary);
    if (!in) {
        LOG_ERROR("ProductCatalog", "Cannot open catalog file {}", path);
        return false;
    }

    std::ostringstream contents;
    contents << in.rdbuf();
    if (!loadFromJson(contents.str())) {
        LOG_ERROR("ProductCatalog", "Catalog file {} is not a valid product list", path);
        return false;
    }

    LOG_INFO("ProductCatalog", "Loaded {} products from {}", products_.size(), path);
    return true;
}

bool ProductCatalog::loadFromJson(const std::string& json) {
    catalog::ProductListResponse response;
    google::protobuf::util::JsonParseOptions options;
    options.ignore_unknown_fields = true;

    auto status = google::protobuf::util::JsonStringToMessage(json, &response, options);
    if (!status.ok()) {
        LOG_WARN("ProductCatalog", "Parse error: {}", status.ToString());
        return false;
    }

    std::unordered_map<std::string, ProductInfo> products;
    for (const auto& category : response.info().list()) {
        for (const auto& model : category.m()) {
            if (model.pid().empty()) {
                continue;
            }
            ProductInfo info;
            info.product_id = model.pid();
            info.model_name = model.n();
            info.icon = model.i();
            info.type_code = parseTypeCode(category.c());
            info.data_point_ids.assign(model.dpid().begin(), model.dpid().end());
            products[info.product_id] = std::move(info);
        }
    }

    products_ = std::move(products);
    return true;
}

std::optional<ProductInfo> ProductCatalog::lookup(const std::string& productId) const {
    auto it = products_.find(productId);
    if (it == products_.end()) {
        return std::nullopt;
    }
    return it->second;
}

}  // namespace core
}  // namespace cozyd
