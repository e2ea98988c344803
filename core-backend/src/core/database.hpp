#pragma once

#include <duckdb.hpp>
#include <fcntl.h>
#include <iostream>
#include <memory>
#include <mutex>
#include <nlohmann/json.hpp>
#include <stdexcept>
#include <string>
#include <sys/file.h>
#include <unistd.h>
#include <vector>

using json = nlohmann::json;

class Database {
public:
  explicit Database(const std::string &path) : db_path_(path) {
    db_ = std::make_unique<duckdb::DuckDB>(path);
    read_conn_ = std::make_unique<duckdb::Connection>(*db_);
    write_conn_ = std::make_unique<duckdb::Connection>(*db_);

    lock_path_ = path + ".lock";
    lock_fd_ = open(lock_path_.c_str(), O_CREAT | O_RDWR, 0666);
    if (lock_fd_ < 0)
      throw std::runtime_error("无法创建锁文件: " + lock_path_);
  }

  ~Database() {
    if (has_write_lock_)
      flock(lock_fd_, LOCK_UN);
    if (lock_fd_ >= 0)
      close(lock_fd_);
  }

  Database(const Database &) = delete;
  Database &operator=(const Database &) = delete;

  // 同一个库只允许一个账本进程写
  bool try_write_lock() {
    if (has_write_lock_)
      return true;
    int ret = flock(lock_fd_, LOCK_EX | LOCK_NB);
    if (ret == 0) {
      has_write_lock_ = true;
      return true;
    }
    return false;
  }

  void execute(const std::string &sql) {
    std::lock_guard<std::mutex> lock(write_mutex_);
    auto result = write_conn_->Query(sql);
    if (result->HasError())
      throw std::runtime_error("execute failed: " + result->GetError());
  }

  // 多条语句在同一事务内执行, 任一失败则 ROLLBACK
  void atomic_execute(const std::vector<std::string> &statements) {
    std::lock_guard<std::mutex> lock(write_mutex_);

    auto r1 = write_conn_->Query("BEGIN TRANSACTION");
    if (r1->HasError())
      throw std::runtime_error("BEGIN failed: " + r1->GetError());

    for (const auto &sql : statements) {
      auto r = write_conn_->Query(sql);
      if (r->HasError()) {
        std::string err = r->GetError();
        auto rb = write_conn_->Query("ROLLBACK");
        if (rb->HasError())
          std::cerr << "[Store] ROLLBACK failed: " << rb->GetError() << std::endl;
        throw std::runtime_error("atomic_execute failed: " + err);
      }
    }

    auto r2 = write_conn_->Query("COMMIT");
    if (r2->HasError())
      throw std::runtime_error("COMMIT failed: " + r2->GetError());
  }

  json query_json(const std::string &sql) {
    std::lock_guard<std::mutex> lock(read_mutex_);
    auto result = read_conn_->Query(sql);
    if (result->HasError())
      throw std::runtime_error("query_json failed: " + result->GetError());

    json rows = json::array();
    auto &types = result->types;
    auto names = result->names;

    for (size_t row = 0; row < result->RowCount(); ++row) {
      json obj = json::object();
      for (size_t col = 0; col < result->ColumnCount(); ++col) {
        auto value = result->GetValue(col, row);
        if (value.IsNull()) {
          obj[names[col]] = nullptr;
        } else {
          switch (types[col].id()) {
          case duckdb::LogicalTypeId::BOOLEAN:
            obj[names[col]] = value.GetValue<bool>();
            break;
          case duckdb::LogicalTypeId::TINYINT:
          case duckdb::LogicalTypeId::SMALLINT:
          case duckdb::LogicalTypeId::INTEGER:
            obj[names[col]] = value.GetValue<int32_t>();
            break;
          case duckdb::LogicalTypeId::BIGINT:
            obj[names[col]] = value.GetValue<int64_t>();
            break;
          case duckdb::LogicalTypeId::FLOAT:
          case duckdb::LogicalTypeId::DOUBLE:
            obj[names[col]] = value.GetValue<double>();
            break;
          default:
            obj[names[col]] = value.ToString();
            break;
          }
        }
      }
      rows.push_back(std::move(obj));
    }
    return rows;
  }

  // 只放行恰好一条 SELECT; Query() 会执行字符串里的每一条语句
  bool is_single_select(const std::string &sql) {
    std::lock_guard<std::mutex> lock(read_mutex_);
    try {
      auto statements = read_conn_->ExtractStatements(sql);
      return statements.size() == 1 &&
             statements[0]->type == duckdb::StatementType::SELECT_STATEMENT;
    } catch (const duckdb::Exception &e) {
      std::cerr << "[Store] 无法解析查询: " << e.what() << std::endl;
      return false;
    }
  }

  int64_t query_single_int(const std::string &sql) {
    std::lock_guard<std::mutex> lock(read_mutex_);
    auto result = read_conn_->Query(sql);
    if (result->HasError() || result->RowCount() == 0)
      return 0;
    auto val = result->GetValue(0, 0);
    return val.IsNull() ? 0 : val.GetValue<int64_t>();
  }

  json get_tables() {
    return query_json(
        "SELECT table_name FROM information_schema.tables "
        "WHERE table_schema='main' ORDER BY table_name");
  }

  int64_t get_table_count(const std::string &table) {
    return query_single_int("SELECT COUNT(*) FROM " + table);
  }

  void init_schema() {
    execute(R"(
      CREATE TABLE IF NOT EXISTS ledger_meta (
        key TEXT PRIMARY KEY,
        value TEXT
      )
    )");

    // 账本状态: 每次提交按 key 重写改动过的行
    execute(R"(
      CREATE TABLE IF NOT EXISTS condition (
        condition_id TEXT PRIMARY KEY,
        oracle TEXT NOT NULL,
        question_id TEXT NOT NULL,
        outcome_slot_count INTEGER NOT NULL
      )
    )");

    execute(R"(
      CREATE TABLE IF NOT EXISTS payout_numerator (
        condition_id TEXT NOT NULL,
        outcome_index INTEGER NOT NULL,
        numerator TEXT NOT NULL,
        PRIMARY KEY (condition_id, outcome_index)
      )
    )");

    execute(R"(
      CREATE TABLE IF NOT EXISTS payout_denominator (
        condition_id TEXT PRIMARY KEY,
        denominator TEXT NOT NULL
      )
    )");

    execute(R"(
      CREATE TABLE IF NOT EXISTS position_balance (
        owner TEXT NOT NULL,
        position_id TEXT NOT NULL,
        amount TEXT NOT NULL,
        PRIMARY KEY (owner, position_id)
      )
    )");

    execute(R"(
      CREATE TABLE IF NOT EXISTS allowance (
        position_id TEXT NOT NULL,
        owner TEXT NOT NULL,
        spender TEXT NOT NULL,
        amount TEXT NOT NULL,
        PRIMARY KEY (position_id, owner, spender)
      )
    )");

    // 内置抵押品
    execute(R"(
      CREATE TABLE IF NOT EXISTS collateral_balance (
        token TEXT NOT NULL,
        holder TEXT NOT NULL,
        amount TEXT NOT NULL,
        PRIMARY KEY (token, holder)
      )
    )");

    execute(R"(
      CREATE TABLE IF NOT EXISTS collateral_allowance (
        token TEXT NOT NULL,
        owner TEXT NOT NULL,
        spender TEXT NOT NULL,
        amount TEXT NOT NULL,
        PRIMARY KEY (token, owner, spender)
      )
    )");

    // 事件日志: 只追加
    execute(R"(
      CREATE TABLE IF NOT EXISTS condition_preparation (
        seq BIGINT PRIMARY KEY,
        condition_id TEXT NOT NULL,
        oracle TEXT NOT NULL,
        question_id TEXT NOT NULL,
        outcome_slot_count INTEGER NOT NULL
      )
    )");

    execute(R"(
      CREATE TABLE IF NOT EXISTS condition_resolution (
        seq BIGINT PRIMARY KEY,
        condition_id TEXT NOT NULL,
        oracle TEXT NOT NULL,
        question_id TEXT NOT NULL,
        outcome_slot_count INTEGER NOT NULL,
        result TEXT NOT NULL
      )
    )");

    execute(R"(
      CREATE TABLE IF NOT EXISTS position_split (
        seq BIGINT PRIMARY KEY,
        stakeholder TEXT NOT NULL,
        collateral_token TEXT NOT NULL,
        parent_slot_id TEXT NOT NULL,
        condition_id TEXT NOT NULL,
        amount TEXT NOT NULL
      )
    )");

    execute(R"(
      CREATE TABLE IF NOT EXISTS position_merge (
        seq BIGINT PRIMARY KEY,
        stakeholder TEXT NOT NULL,
        collateral_token TEXT NOT NULL,
        parent_slot_id TEXT NOT NULL,
        condition_id TEXT NOT NULL,
        amount TEXT NOT NULL
      )
    )");

    execute(R"(
      CREATE TABLE IF NOT EXISTS payout_redemption (
        seq BIGINT PRIMARY KEY,
        redeemer TEXT NOT NULL,
        collateral_token TEXT NOT NULL,
        parent_slot_id TEXT NOT NULL,
        condition_id TEXT NOT NULL,
        payout TEXT NOT NULL
      )
    )");

    // batch 转账按 id 展开, 同一批共享 seq
    execute(R"(
      CREATE TABLE IF NOT EXISTS transfer (
        seq BIGINT NOT NULL,
        batch_index INTEGER NOT NULL,
        operator TEXT NOT NULL,
        from_addr TEXT NOT NULL,
        to_addr TEXT NOT NULL,
        token_id TEXT NOT NULL,
        amount TEXT NOT NULL,
        PRIMARY KEY (seq, batch_index)
      )
    )");

    execute(R"(
      CREATE TABLE IF NOT EXISTS approval (
        seq BIGINT PRIMARY KEY,
        owner TEXT NOT NULL,
        spender TEXT NOT NULL,
        token_id TEXT NOT NULL,
        amount TEXT NOT NULL
      )
    )");

    execute("CREATE INDEX IF NOT EXISTS idx_transfer_from ON transfer(from_addr)");
    execute("CREATE INDEX IF NOT EXISTS idx_transfer_to ON transfer(to_addr)");
    execute("CREATE INDEX IF NOT EXISTS idx_split_stakeholder ON position_split(stakeholder)");
    execute("CREATE INDEX IF NOT EXISTS idx_merge_stakeholder ON position_merge(stakeholder)");
    execute("CREATE INDEX IF NOT EXISTS idx_redemption_redeemer ON payout_redemption(redeemer)");
    execute("CREATE INDEX IF NOT EXISTS idx_resolution_condition_id ON condition_resolution(condition_id)");
  }

  std::string get_meta(const std::string &key) {
    auto rows = query_json("SELECT value FROM ledger_meta WHERE key='" + key + "'");
    if (rows.empty() || rows[0]["value"].is_null())
      return "";
    return rows[0]["value"].get<std::string>();
  }

private:
  // 路径
  std::string db_path_;
  std::string lock_path_;
  // 文件锁
  int lock_fd_ = -1;
  bool has_write_lock_ = false;
  // DuckDB
  std::unique_ptr<duckdb::DuckDB> db_;
  std::unique_ptr<duckdb::Connection> read_conn_;
  std::unique_ptr<duckdb::Connection> write_conn_;
  std::mutex read_mutex_;
  std::mutex write_mutex_;
};
