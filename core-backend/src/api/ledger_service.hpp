#pragma once

// ============================================================================
// LedgerService - HTTP 路由 → 账本操作
//
// 与 socket 无关: ApiSession 只负责读写, 这里把 (method, target, body)
// 变成 (status, json). 写请求与落盘在同一个外层 Transaction 里:
// save 失败时账本回滚, 不会出现内存已改而库里没有的状态.
//
// 错误映射:
//   LedgerError                    → 409 {"error": <Errc 名>, "message"}
//   参数错误 (logic_error) / json  → 400
//   其他 std::exception            → 500
// ============================================================================

#include <iostream>
#include <stdexcept>
#include <map>
#include <string>
#include <string_view>
#include <vector>

#include <boost/beast/http/status.hpp>
#include <boost/beast/http/verb.hpp>
#include <nlohmann/json.hpp>

#include "../core/database.hpp"
#include "../ledger/ledger.hpp"
#include "../store/event_log.hpp"
#include "../store/ledger_store.hpp"

namespace http = boost::beast::http;
using json = nlohmann::json;

struct Reply {
  http::status status = http::status::ok;
  json body;
};

class LedgerService {
public:
  LedgerService(ledger::Ledger &engine, ledger::CollateralBank &bank, Database &db,
                LedgerStore &store, EventLog &log)
      : ledger_(engine), bank_(bank), db_(db), store_(store), log_(log) {}

  Reply handle(http::verb method, std::string_view target, const std::string &body) {
    std::string path(target.substr(0, target.find('?')));
    Reply r;

    try {
      if (method == http::verb::get) {
        r = handle_get(path, parse_query(target));
      } else if (method == http::verb::post) {
        json req = body.empty() ? json::object() : json::parse(body);
        r = handle_post(path, req);
      } else {
        r = {http::status::method_not_allowed, {{"error", "Method not allowed"}}};
      }
    } catch (const ledger::LedgerError &e) {
      std::cerr << "[Ledger] " << path << " 拒绝: " << e.what() << std::endl;
      r = {http::status::conflict, {{"error", e.name()}, {"message", e.what()}}};
    } catch (const std::logic_error &e) {
      r = {http::status::bad_request, {{"error", "BadRequest"}, {"message", e.what()}}};
    } catch (const json::exception &e) {
      r = {http::status::bad_request, {{"error", "BadRequest"}, {"message", e.what()}}};
    } catch (const std::exception &e) {
      std::cerr << "[HTTP] " << path << " 失败: " << e.what() << std::endl;
      r = {http::status::internal_server_error, {{"error", "Internal"}, {"message", e.what()}}};
    }
    return r;
  }

private:
  using Params = std::map<std::string, std::string>;

  // ==========================================================================
  // GET
  // ==========================================================================
  Reply handle_get(const std::string &path, const Params &p) {
    if (path == "/api/health")
      return {http::status::ok, {{"status", "ok"}}};

    if (path == "/api/tables") {
      json tables_info = json::array();
      for (const auto &t : db_.get_tables()) {
        std::string name = t["table_name"].get<std::string>();
        tables_info.push_back({{"name", name}, {"count", db_.get_table_count(name)}});
      }
      return {http::status::ok, tables_info};
    }

    if (path == "/api/query")
      return handle_query(param(p, "q"));

    if (path.starts_with("/api/conditions/"))
      return condition_info(ledger::Bytes32::from_hex(path.substr(16)));

    if (path == "/api/assets/balance")
      return {http::status::ok,
              {{"balance", ledger::word_dec(ledger_.balance_of(address(param(p, "owner")),
                                                               ledger::parse_word(param(p, "id"))))}}};

    if (path == "/api/assets/allowance")
      return {http::status::ok,
              {{"allowance",
                ledger::word_dec(ledger_.allowance_of(address(param(p, "owner")),
                                                      address(param(p, "spender")),
                                                      ledger::parse_word(param(p, "id"))))}}};

    if (path == "/api/ids/condition") {
      auto id = ledger::Ledger::get_condition_id(
          address(param(p, "oracle")), ledger::Bytes32::from_hex(param(p, "question_id")),
          std::stoull(param(p, "outcome_slot_count")));
      return {http::status::ok, {{"condition_id", id.hex()}}};
    }

    // steps=<conditionId>:<index>,<conditionId>:<index>...
    if (path == "/api/ids/slot") {
      ledger::U256 parent = p.count("parent") ? ledger::parse_word(p.at("parent")) : ledger::ROOT_SLOT;
      auto slot = ledger::Ledger::get_nested_slot_id(parent, parse_steps(param(p, "steps")));
      return {http::status::ok, {{"slot_id", ledger::word_hex(slot)}}};
    }

    if (path == "/api/ids/position") {
      auto key = ledger::Ledger::get_position_key(address(param(p, "collateral")),
                                                  ledger::parse_word(param(p, "slot")));
      return {http::status::ok, {{"position_id", ledger::word_hex(key)}}};
    }

    if (path == "/api/collateral/balance") {
      auto *token = bank_.find(address(param(p, "token")));
      ledger::U256 bal = token ? token->balance_of(address(param(p, "holder"))) : ledger::U256(0);
      return {http::status::ok, {{"balance", ledger::word_dec(bal)}}};
    }

    return not_found();
  }

  Reply handle_query(const std::string &query) {
    if (!db_.is_single_select(query))
      return {http::status::bad_request, {{"error", "Only a single SELECT query allowed"}}};
    return {http::status::ok, db_.query_json(query)};
  }

  Reply condition_info(const ledger::Bytes32 &id) {
    const auto *rec = ledger_.conditions().find(id);
    if (!rec)
      return not_found();
    json nums = json::array();
    for (const auto &n : ledger_.conditions().payout_numerators(id))
      nums.push_back(ledger::word_dec(n));
    return {http::status::ok,
            {{"condition_id", id.hex()},
             {"oracle", rec->oracle.hex()},
             {"question_id", rec->question_id.hex()},
             {"outcome_slot_count", ledger_.outcome_slot_count(id)},
             {"payout_numerators", nums},
             {"payout_denominator", ledger::word_dec(ledger_.payout_denominator(id))}}};
  }

  // ==========================================================================
  // POST - 每个分支都是一次完整的账本事务
  // ==========================================================================
  Reply handle_post(const std::string &path, const json &req) {
    json out = json::object();
    ledger::Transaction tx(ledger_.journal());

    if (path == "/api/conditions/prepare") {
      auto id = ledger_.prepare_condition(address(req.at("oracle")),
                                          bytes32(req.at("question_id")),
                                          req.at("outcome_slot_count").get<uint64_t>());
      out["condition_id"] = id.hex();
    } else if (path == "/api/conditions/resolve") {
      // result: 原始字节 (hex) 或 payouts 数组
      ledger::Bytes result;
      if (req.contains("payouts")) {
        std::vector<ledger::U256> payouts;
        for (const auto &v : req["payouts"])
          payouts.push_back(word(v));
        result = ledger::pack_result(payouts);
      } else {
        result = ledger::bytes_from_hex(req.at("result").get<std::string>());
      }
      auto id = ledger_.receive_result(address(req.at("oracle")), bytes32(req.at("question_id")),
                                       result);
      out["condition_id"] = id.hex();
    } else if (path == "/api/positions/split") {
      ledger_.split_position(address(req.at("caller")), address(req.at("collateral")),
                             parent_slot(req), bytes32(req.at("condition_id")),
                             word(req.at("amount")));
    } else if (path == "/api/positions/merge") {
      ledger_.merge_position(address(req.at("caller")), address(req.at("collateral")),
                             parent_slot(req), bytes32(req.at("condition_id")),
                             word(req.at("amount")));
    } else if (path == "/api/positions/redeem") {
      auto payout = ledger_.redeem_payout(address(req.at("caller")),
                                          address(req.at("collateral")), parent_slot(req),
                                          bytes32(req.at("condition_id")));
      out["payout"] = ledger::word_dec(payout);
    } else if (path == "/api/assets/transfer") {
      auto data = req.contains("data") ? ledger::bytes_from_hex(req["data"].get<std::string>())
                                       : ledger::Bytes{};
      if (req.value("safe", true))
        ledger_.safe_transfer(address(req.at("caller")), address(req.at("from")),
                              address(req.at("to")), word(req.at("id")), word(req.at("value")),
                              data);
      else
        ledger_.transfer(address(req.at("caller")), address(req.at("from")),
                         address(req.at("to")), word(req.at("id")), word(req.at("value")));
    } else if (path == "/api/assets/batch-transfer") {
      auto data = req.contains("data") ? ledger::bytes_from_hex(req["data"].get<std::string>())
                                       : ledger::Bytes{};
      ledger_.safe_batch_transfer(address(req.at("caller")), address(req.at("from")),
                                  address(req.at("to")), words(req.at("ids")),
                                  words(req.at("values")), data);
    } else if (path == "/api/assets/approve") {
      ledger_.approve(address(req.at("caller")), address(req.at("spender")), word(req.at("id")),
                      word(req.at("current_value")), word(req.at("new_value")));
    } else if (path == "/api/assets/balance-batch") {
      std::vector<ledger::Address> owners;
      for (const auto &o : req.at("owners"))
        owners.push_back(address(o));
      json balances = json::array();
      for (const auto &b : ledger_.balance_of_batch(owners, words(req.at("ids"))))
        balances.push_back(ledger::word_dec(b));
      return {http::status::ok, {{"balances", balances}}};
    } else if (path == "/api/collateral/approve") {
      auto token_addr = address(req.at("token"));
      auto *token = bank_.find(token_addr);
      if (!token)
        throw std::invalid_argument("unknown collateral " + token_addr.hex());
      ledger::Address spender =
          req.contains("spender") ? address(req["spender"]) : ledger_.custody();
      token->approve(address(req.at("owner")), spender, word(req.at("amount")));
    } else {
      return not_found();
    }

    store_.save(ledger_, bank_, log_, ledger_.journal().pending());
    tx.commit();
    out["status"] = "ok";
    return {http::status::ok, out};
  }

  // ==========================================================================
  // 参数解析
  // ==========================================================================
  static Reply not_found() { return {http::status::not_found, {{"error", "Not found"}}}; }

  static ledger::Address address(const std::string &s) { return ledger::Address::from_hex(s); }
  static ledger::Address address(const json &v) { return address(v.get<std::string>()); }
  static ledger::Bytes32 bytes32(const json &v) {
    return ledger::Bytes32::from_hex(v.get<std::string>());
  }

  // 字符串 (hex/十进制) 或非负整数
  static ledger::U256 word(const json &v) {
    if (v.is_string())
      return ledger::parse_word(v.get<std::string>());
    if (v.is_number_unsigned())
      return ledger::U256(v.get<uint64_t>());
    if (v.is_number_integer() && v.get<int64_t>() >= 0)
      return ledger::U256(v.get<int64_t>());
    throw std::invalid_argument("expected a non-negative integer or numeric string");
  }

  static std::vector<ledger::U256> words(const json &arr) {
    std::vector<ledger::U256> out;
    for (const auto &v : arr)
      out.push_back(word(v));
    return out;
  }

  static ledger::U256 parent_slot(const json &req) {
    return req.contains("parent_slot_id") ? word(req["parent_slot_id"]) : ledger::ROOT_SLOT;
  }

  static std::vector<ledger::SlotStep> parse_steps(const std::string &s) {
    std::vector<ledger::SlotStep> steps;
    size_t pos = 0;
    while (pos < s.size()) {
      size_t comma = s.find(',', pos);
      if (comma == std::string::npos)
        comma = s.size();
      std::string step = s.substr(pos, comma - pos);
      size_t colon = step.find(':');
      if (colon == std::string::npos)
        throw std::invalid_argument("step must be <conditionId>:<index>");
      steps.push_back({ledger::Bytes32::from_hex(step.substr(0, colon)),
                       std::stoull(step.substr(colon + 1))});
      pos = comma + 1;
    }
    return steps;
  }

  static std::string param(const Params &p, const char *name) {
    auto it = p.find(name);
    if (it == p.end() || it->second.empty())
      throw std::invalid_argument(std::string("missing query parameter '") + name + "'");
    return it->second;
  }

  static Params parse_query(std::string_view target) {
    Params out;
    auto q = target.find('?');
    if (q == std::string_view::npos)
      return out;
    std::string_view rest = target.substr(q + 1);
    while (!rest.empty()) {
      auto amp = rest.find('&');
      auto pair = rest.substr(0, amp);
      auto eq = pair.find('=');
      if (eq != std::string_view::npos)
        out[url_decode(pair.substr(0, eq))] = url_decode(pair.substr(eq + 1));
      if (amp == std::string_view::npos)
        break;
      rest = rest.substr(amp + 1);
    }
    return out;
  }

  static std::string url_decode(std::string_view str) {
    std::string result;
    for (size_t i = 0; i < str.size(); ++i) {
      if (str[i] == '%' && i + 2 < str.size()) {
        int hex = std::stoi(std::string(str.substr(i + 1, 2)), nullptr, 16);
        result += static_cast<char>(hex);
        i += 2;
      } else if (str[i] == '+') {
        result += ' ';
      } else {
        result += str[i];
      }
    }
    return result;
  }

  ledger::Ledger &ledger_;
  ledger::CollateralBank &bank_;
  Database &db_;
  LedgerStore &store_;
  EventLog &log_;
};
