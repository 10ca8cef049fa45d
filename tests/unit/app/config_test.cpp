#include <packslip/app/config.hpp>
#include <gtest/gtest.h>
#include <filesystem>
#include <fstream>

namespace pa = packslip::app;
namespace pc = packslip::core;

TEST(Config, Defaults) {
  const auto c = pa::default_config();
  EXPECT_EQ(c.two_up_categories, (std::set<std::string>{"singles"}));
  EXPECT_EQ(c.image_timeout_ms, 10000);
  EXPECT_EQ(c.image_fetch_parallelism, 4u);
  EXPECT_EQ(c.barcode_print_scale, 4);
  EXPECT_FALSE(c.sort_by_zone);
  EXPECT_TRUE(c.catalog_path.empty());
}

TEST(Config, ParsesKeysCommentsAndWhitespace) {
  auto c = pa::parse_config(
      "# packing station 2\n"
      "catalog_path = /etc/packslip/box_sizes.json\n"
      "\n"
      "two_up_categories = singles, 2pack ,\n"
      "image_timeout_ms=2500\r\n"
      "image_fetch_parallelism = 0\n"
      "sort_by_zone = yes\n"
      "printed_store_path = printed.json\n"
      "not a key value line\n");
  ASSERT_TRUE(c.has_value()) << c.error().message;
  EXPECT_EQ(c->catalog_path, "/etc/packslip/box_sizes.json");
  EXPECT_EQ(c->two_up_categories, (std::set<std::string>{"2pack", "singles"}));
  EXPECT_EQ(c->image_timeout_ms, 2500);
  EXPECT_EQ(c->image_fetch_parallelism, 0u);
  EXPECT_TRUE(c->sort_by_zone);
  EXPECT_EQ(c->printed_store_path, "printed.json");
}

TEST(Config, UnknownKeysAreIgnored) {
  auto c = pa::parse_config("printer = zebra\nbarcode_print_scale = 3\n");
  ASSERT_TRUE(c.has_value());
  EXPECT_EQ(c->barcode_print_scale, 3);
}

TEST(Config, MalformedValuesAreConfigErrors) {
  for (const char* text : {"image_timeout_ms = soon", "image_timeout_ms = 0",
                           "barcode_print_scale = -1", "sort_by_zone = maybe",
                           "two_up_categories = ,", "image_fetch_parallelism = 4x"}) {
    auto c = pa::parse_config(text);
    ASSERT_FALSE(c.has_value()) << text;
    EXPECT_EQ(c.error().code, pc::ErrorCode::ConfigError) << text;
  }
}

TEST(Config, MissingFileYieldsDefaults) {
  auto c = pa::load_config("/nonexistent/packslip.conf");
  ASSERT_TRUE(c.has_value());
  EXPECT_EQ(c->barcode_print_scale, 4);
}

TEST(Config, LoadsFromFile) {
  const auto path = std::filesystem::temp_directory_path() / "packslip_config_test.conf";
  {
    std::ofstream out(path);
    out << "barcode_print_scale = 2\nsort_by_zone = false\n";
  }
  auto c = pa::load_config(path.string());
  std::filesystem::remove(path);
  ASSERT_TRUE(c.has_value());
  EXPECT_EQ(c->barcode_print_scale, 2);
  EXPECT_FALSE(c->sort_by_zone);
}
