#include <csignal>
#include <cstring>
#include <iostream>
#include <string>

#include "api/api_server.hpp"
#include "api/ledger_service.hpp"
#include "core/config.hpp"
#include "core/database.hpp"
#include "ledger/ledger.hpp"
#include "store/event_log.hpp"
#include "store/ledger_store.hpp"

void print_usage(const char *prog) {
  std::cout << "用法: " << prog << " --config <config.json>" << std::endl;
}

// 空库: 按配置给内置抵押品注资
static void apply_genesis(const Config &config, ledger::CollateralBank &bank) {
  for (const auto &c : config.collateral) {
    auto &token = bank.get_or_create(ledger::Address::from_hex(c.address));
    for (const auto &[holder, amount] : c.balances)
      token.mint(ledger::Address::from_hex(holder), ledger::parse_word(amount));
    std::cout << "[Main] 创世抵押品 " << c.address << ": " << c.balances.size() << " 个持有人"
              << std::endl;
  }
}

int main(int argc, char *argv[]) {
  std::string config_path = "config.json";

  for (int i = 1; i < argc; ++i) {
    if (std::strcmp(argv[i], "--config") == 0 && i + 1 < argc) {
      config_path = argv[++i];
    } else if (std::strcmp(argv[i], "--help") == 0 || std::strcmp(argv[i], "-h") == 0) {
      print_usage(argv[0]);
      return 0;
    }
  }

  std::cout << "========================================" << std::endl;
  std::cout << "    Conditional Payment Ledger" << std::endl;
  std::cout << "========================================" << std::endl;

  try {
    Config config = Config::load(config_path);

    std::cout << "[Main] DB Path: " << config.db_path << std::endl;
    std::cout << "[Main] API Port: " << config.api_port << std::endl;
    std::cout << "[Main] Custody: " << config.custody << std::endl;

    Database db(config.db_path);
    if (!db.try_write_lock()) {
      std::cerr << "[Main] 数据库已被其他进程占用: " << config.db_path << std::endl;
      return 1;
    }
    db.init_schema();

    EventLog log;
    ledger::Ledger engine(ledger::Address::from_hex(config.custody), &log);
    ledger::CollateralBank bank(engine.journal());
    LedgerStore store(db);

    bool restored = store.load(engine, bank, log);
    if (!restored)
      apply_genesis(config, bank);

    // 配置里的抵押品即使余额为 0 也要登记
    for (const auto &c : config.collateral)
      bank.get_or_create(ledger::Address::from_hex(c.address));
    for (const auto &[addr, token] : bank.tokens())
      engine.add_collateral(addr, token.get());

    if (!restored)
      store.save(engine, bank, log);

    LedgerService service(engine, bank, db, store, log);

    boost::asio::io_context api_ioc;
    ApiServer api_server(api_ioc, service, static_cast<unsigned short>(config.api_port));

    boost::asio::signal_set signals(api_ioc, SIGINT, SIGTERM);
    signals.async_wait([&](const boost::system::error_code &, int) {
      std::cout << "\n[Main] 正在关闭..." << std::endl;
      api_ioc.stop();
    });

    std::cout << "[Main] 服务已启动" << std::endl;
    api_ioc.run();
  } catch (const std::exception &e) {
    std::cerr << "[Main] 启动失败: " << e.what() << std::endl;
    return 1;
  }

  std::cout << "[Main] 已退出" << std::endl;
  return 0;
}
