#include <gtest/gtest.h>

#include <fstream>
#include <stdexcept>
#include <string>

#include "core/config.hpp"
#include "temp_dir.hpp"

namespace {

using ledger_test::TempDir;

class ConfigTest : public ::testing::Test {
protected:
  std::string write(const std::string &text) {
    std::string path = dir_.file("config.json");
    std::ofstream(path) << text;
    return path;
  }

  TempDir dir_;
};

TEST_F(ConfigTest, LoadsRequiredFieldsAndDefaults) {
  auto config = Config::load(write(R"({"db_path": "x.duckdb", "api_port": 9000})"));
  EXPECT_EQ(config.db_path, "x.duckdb");
  EXPECT_EQ(config.api_port, 9000);
  EXPECT_EQ(config.custody, "0x0000000000000000000000000000000000000001");
  EXPECT_TRUE(config.collateral.empty());
}

TEST_F(ConfigTest, CollateralGenesis) {
  auto config = Config::load(write(R"({
    "db_path": "x.duckdb",
    "api_port": 9000,
    "custody": "0x00000000000000000000000000000000000000ff",
    "collateral": [
      {"address": "0x00000000000000000000000000000000000000c0",
       "balances": {"0x00000000000000000000000000000000000000a1": "0x10",
                    "0x00000000000000000000000000000000000000a2": 500}}
    ]
  })"));
  EXPECT_EQ(config.custody, "0x00000000000000000000000000000000000000ff");
  ASSERT_EQ(config.collateral.size(), 1u);
  const auto &c = config.collateral[0];
  EXPECT_EQ(c.address, "0x00000000000000000000000000000000000000c0");
  EXPECT_EQ(c.balances.at("0x00000000000000000000000000000000000000a1"), "0x10");
  EXPECT_EQ(c.balances.at("0x00000000000000000000000000000000000000a2"), "500");
}

TEST_F(ConfigTest, NegativeCollateralAmountIsRejected) {
  EXPECT_THROW(Config::load(write(R"({
    "db_path": "x.duckdb",
    "api_port": 9000,
    "collateral": [
      {"address": "0x00000000000000000000000000000000000000c0",
       "balances": {"0x00000000000000000000000000000000000000a1": -1}}
    ]
  })")),
               std::runtime_error);
}

TEST_F(ConfigTest, MissingFieldOrFileThrows) {
  EXPECT_THROW(Config::load(write(R"({"api_port": 9000})")), std::runtime_error);
  EXPECT_THROW(Config::load(dir_.file("missing.json")), std::runtime_error);
}

} // namespace
