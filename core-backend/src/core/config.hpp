#pragma once

#include <fstream>
#include <map>
#include <nlohmann/json.hpp>
#include <stdexcept>
#include <string>
#include <vector>

using json = nlohmann::json;

// 内置抵押品的创世分配
struct CollateralGenesis {
  std::string address;
  std::map<std::string, std::string> balances; // holder -> amount (hex 或十进制)
};

struct Config {
  std::string db_path;
  int api_port;
  std::string custody = "0x0000000000000000000000000000000000000001";
  std::vector<CollateralGenesis> collateral;

  static Config load(const std::string &path) {
    std::ifstream f(path);
    if (!f.is_open())
      throw std::runtime_error("无法打开配置文件: " + path);

    json j;
    f >> j;
    return from_json(j);
  }

  static Config from_json(const json &j) {
    auto require = [&](const char *key) -> const json & {
      if (!j.contains(key))
        throw std::runtime_error(std::string("配置文件缺少必填字段: ") + key);
      return j.at(key);
    };

    Config config;
    config.db_path = require("db_path").get<std::string>();
    config.api_port = require("api_port").get<int>();
    if (j.contains("custody"))
      config.custody = j["custody"].get<std::string>();

    if (j.contains("collateral")) {
      for (const auto &c : j["collateral"]) {
        CollateralGenesis g;
        g.address = c.at("address").get<std::string>();
        if (c.contains("balances")) {
          for (auto &[holder, amount] : c["balances"].items()) {
            if (amount.is_string())
              g.balances[holder] = amount.get<std::string>();
            else if (amount.is_number_unsigned())
              g.balances[holder] = std::to_string(amount.get<uint64_t>());
            else
              throw std::runtime_error("抵押品余额必须是非负整数或数字字符串: " + holder);
          }
        }
        config.collateral.push_back(std::move(g));
      }
    }
    return config;
  }
};
