#pragma once

#include "../app/Config.h"
#include "../gateway/ConnectionGateway.h"
#include <boost/asio/io_context.hpp>
#include <boost/asio/ip/tcp.hpp>
#include <boost/beast/core/error.hpp>
#include <memory>
#include <string>

// Accepts TCP connections, upgrades WebSocket requests and hands every
// connection to the gateway. Plain HTTP requests get the status snapshot.
class WebSocketServer : public std::enable_shared_from_this<WebSocketServer> {
public:
  WebSocketServer(boost::asio::io_context &ioc, ConnectionGateway &gateway,
                  const ServerSettings &settings);

  bool start();
  void stop();

  // Value of one query parameter of a request target, empty when absent.
  static std::string queryParam(const std::string &target, const std::string &key);

private:
  void doAccept();
  void onAccept(boost::beast::error_code ec, boost::asio::ip::tcp::socket socket);

  boost::asio::io_context &ioc_;
  boost::asio::ip::tcp::acceptor acceptor_;
  ConnectionGateway &gateway_;
  ServerSettings settings_;
};
