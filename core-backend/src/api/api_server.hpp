#pragma once

// ============================================================================
// API Server - HTTP 服务器
// ============================================================================

#include <iostream>
#include <memory>

#include <boost/asio.hpp>
#include <boost/beast.hpp>

#include "api_session.hpp"
#include "ledger_service.hpp"

namespace asio = boost::asio;
namespace beast = boost::beast;
using tcp = asio::ip::tcp;

// ============================================================================
// ApiServer - 单 io_context, 请求串行处理
// ============================================================================
class ApiServer {
public:
  ApiServer(asio::io_context &ioc, LedgerService &service, unsigned short port)
      : ioc_(ioc), acceptor_(ioc, tcp::endpoint(tcp::v4(), port)), service_(service) {
    std::cout << "[HTTP] 监听端口 " << port << std::endl;
    do_accept();
  }

private:
  void do_accept() {
    acceptor_.async_accept(
        [this](beast::error_code ec, tcp::socket socket) {
          if (!ec) {
            std::make_shared<ApiSession>(std::move(socket), service_)->run();
          } else {
            std::cerr << "[HTTP] accept 失败: " << ec.message() << std::endl;
          }
          do_accept();
        });
  }

  asio::io_context &ioc_;
  tcp::acceptor acceptor_;
  LedgerService &service_;
};
