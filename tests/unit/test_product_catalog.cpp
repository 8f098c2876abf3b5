/**
 * @file test_product_catalog.cpp
 * @brief Unit tests for the product catalog
 */

#include <gtest/gtest.h>
#include <gmock/gmock.h>
#include <cozyd/core/product_catalog.hpp>

#include <cstdio>
#include <fstream>
#include <string>

using namespace cozyd::core;
using ::testing::ElementsAre;

namespace {

const char* kCatalogJson = R"({
  "ret": "1",
  "desc": "ok",
  "info": {
    "list": [
      {
        "c": "00",
        "m": [
          {"pid": "s1", "n": "Smart Plug", "i": "plug.png", "dpid": [1, 2, 11]}
        ]
      },
      {
        "c": "01",
        "m": [
          {"pid": "p93sfg", "n": "Bulb RGBCW", "i": "bulb.png", "dpid": [1, 2, 3, 4, 5, 7]},
          {"pid": "", "n": "Placeholder"}
        ]
      }
    ]
  }
})";

}  // namespace

class ProductCatalogTest : public ::testing::Test {
protected:
    ProductCatalog catalog_;
};

TEST_F(ProductCatalogTest, ParseTypeCode) {
    EXPECT_EQ(parseTypeCode("00"), 0);
    EXPECT_EQ(parseTypeCode("01"), 1);
    EXPECT_EQ(parseTypeCode("12"), 12);
    EXPECT_EQ(parseTypeCode(""), -1);
    EXPECT_EQ(parseTypeCode("0x1"), -1);
    EXPECT_EQ(parseTypeCode("-1"), -1);
}

TEST_F(ProductCatalogTest, LoadFromJson) {
    ASSERT_TRUE(catalog_.loadFromJson(kCatalogJson));
    EXPECT_EQ(catalog_.size(), 2u);

    auto bulb = catalog_.lookup("p93sfg");
    ASSERT_TRUE(bulb.has_value());
    EXPECT_EQ(bulb->model_name, "Bulb RGBCW");
    EXPECT_EQ(bulb->icon, "bulb.png");
    EXPECT_EQ(bulb->type_code, 1);
    EXPECT_THAT(bulb->data_point_ids, ElementsAre(1, 2, 3, 4, 5, 7));

    auto plug = catalog_.lookup("s1");
    ASSERT_TRUE(plug.has_value());
    EXPECT_EQ(plug->type_code, 0);
}

TEST_F(ProductCatalogTest, UnknownProduct) {
    ASSERT_TRUE(catalog_.loadFromJson(kCatalogJson));
    EXPECT_FALSE(catalog_.lookup("nope").has_value());
}

TEST_F(ProductCatalogTest, InvalidJsonKeepsPreviousContents) {
    ASSERT_TRUE(catalog_.loadFromJson(kCatalogJson));
    EXPECT_FALSE(catalog_.loadFromJson("{\"info\": [broken"));
    EXPECT_EQ(catalog_.size(), 2u);
}

TEST_F(ProductCatalogTest, LoadFromFile) {
    std::string path = ::testing::TempDir() + "cozyd_catalog_test.json";
    {
        std::ofstream out(path);
        out << kCatalogJson;
    }

    EXPECT_TRUE(catalog_.loadFromFile(path));
    EXPECT_TRUE(catalog_.lookup("s1").has_value());
    std::remove(path.c_str());
}

TEST_F(ProductCatalogTest, MissingFile) {
    EXPECT_FALSE(catalog_.loadFromFile("/nonexistent/cozyd/catalog.json"));
    EXPECT_TRUE(catalog_.empty());
}
