#include "WebSocketServer.h"
#include "../app/Logger.h"
#include "../gateway/Transport.h"
#include "OutboundQueue.h"
#include <boost/asio/dispatch.hpp>
#include <boost/asio/post.hpp>
#include <boost/asio/strand.hpp>
#include <boost/beast/core.hpp>
#include <boost/beast/http.hpp>
#include <boost/beast/websocket.hpp>

namespace beast = boost::beast;
namespace http = beast::http;
namespace websocket = beast::websocket;
namespace net = boost::asio;
using tcp = net::ip::tcp;

namespace {

const char *kServerName = "transcribe-bridge";

// One upgraded client connection. Reads and writes run on the socket's strand;
// Transport calls from other threads are posted onto it.
class WebSocketSession : public Transport,
                         public std::enable_shared_from_this<WebSocketSession> {
public:
  WebSocketSession(tcp::socket &&socket, ConnectionGateway &gateway,
                   const ServerSettings &settings)
      : ws_(std::move(socket)), gateway_(gateway), settings_(settings),
        queue_(settings.maxPendingMessages) {}

  void run(http::request<http::string_body> req) {
    std::string target(req.target());
    clientId_ = WebSocketServer::queryParam(target, "client_id");
    LOG_DEBUG("WebSocket upgrade for " << target);

    ws_.set_option(
        websocket::stream_base::timeout::suggested(beast::role_type::server));
    ws_.set_option(websocket::stream_base::decorator(
        [](websocket::response_type &res) {
          res.set(http::field::server, kServerName);
        }));
    ws_.read_message_max(settings_.maxMessageSizeBytes);
    ws_.async_accept(req, beast::bind_front_handler(&WebSocketSession::onAccept,
                                                    shared_from_this()));
  }

  void sendText(const std::string &text) override {
    auto msg = std::make_shared<const std::string>(text);
    net::post(ws_.get_executor(),
              [self = shared_from_this(), msg]() { self->queueWrite(msg); });
  }

  void close(const std::string &reason) override {
    net::post(ws_.get_executor(), [self = shared_from_this(), reason]() {
      self->closePending_ = true;
      self->closeReason_ = reason;
      if (self->queue_.empty())
        self->doClose();
    });
  }

private:
  void onAccept(beast::error_code ec) {
    if (ec) {
      LOG_WARN("WebSocket handshake failed: " << ec.message());
      return;
    }
    id_ = gateway_.onOpen(shared_from_this(), clientId_);
    if (id_.empty())
      return;
    doRead();
  }

  void doRead() {
    ws_.async_read(buffer_, beast::bind_front_handler(&WebSocketSession::onRead,
                                                      shared_from_this()));
  }

  void onRead(beast::error_code ec, std::size_t bytes) {
    if (ec) {
      if (ec != websocket::error::closed)
        LOG_DEBUG("[conn " << id_ << "] read ended: " << ec.message());
      finish();
      return;
    }

    if (ws_.got_text()) {
      gateway_.onText(id_, beast::buffers_to_string(buffer_.data()));
    } else {
      std::vector<char> pcm(bytes);
      net::buffer_copy(net::buffer(pcm), buffer_.data());
      gateway_.onBinary(id_, std::move(pcm));
    }
    buffer_.consume(buffer_.size());
    doRead();
  }

  void queueWrite(std::shared_ptr<const std::string> msg) {
    if (closing_ || closePending_)
      return;
    if (!queue_.push(std::move(msg))) {
      LOG_WARN("[conn " << id_ << "] client is not reading, " << queue_.size()
               << " messages pending; closing");
      queue_.dropPending();
      closePending_ = true;
      closeReason_ = "outbound queue overflow";
      return;
    }
    if (queue_.size() > 1)
      return;
    doWrite();
  }

  void doWrite() {
    ws_.text(true);
    ws_.async_write(net::buffer(queue_.front()),
                    beast::bind_front_handler(&WebSocketSession::onWrite,
                                              shared_from_this()));
  }

  void onWrite(beast::error_code ec, std::size_t) {
    if (ec) {
      LOG_DEBUG("[conn " << id_ << "] write failed: " << ec.message());
      queue_.clear();
      return;
    }
    queue_.pop();
    if (!queue_.empty())
      doWrite();
    else if (closePending_)
      doClose();
  }

  void doClose() {
    if (closing_)
      return;
    closing_ = true;
    ws_.async_close(websocket::close_reason(websocket::close_code::normal,
                                            closeReason_),
                    [self = shared_from_this()](beast::error_code ec) {
                      if (ec)
                        LOG_DEBUG("[conn " << self->id_ << "] close: " << ec.message());
                    });
  }

  // The gateway forgets the connection; a no-op when it already closed it.
  void finish() {
    if (finished_ || id_.empty())
      return;
    finished_ = true;
    gateway_.onClose(id_);
  }

  websocket::stream<beast::tcp_stream> ws_;
  beast::flat_buffer buffer_;
  ConnectionGateway &gateway_;
  ServerSettings settings_;

  std::string id_;
  std::string clientId_;
  OutboundQueue queue_;
  bool closePending_ = false;
  bool closing_ = false;
  bool finished_ = false;
  std::string closeReason_;
};

// First request on a fresh socket: either a WebSocket upgrade or a status
// query.
class HttpSession : public std::enable_shared_from_this<HttpSession> {
public:
  HttpSession(tcp::socket &&socket, ConnectionGateway &gateway,
              const ServerSettings &settings)
      : stream_(std::move(socket)), gateway_(gateway), settings_(settings) {}

  void run() {
    net::dispatch(stream_.get_executor(),
                  beast::bind_front_handler(&HttpSession::doRead,
                                            shared_from_this()));
  }

private:
  void doRead() {
    stream_.expires_after(std::chrono::seconds(30));
    http::async_read(stream_, buffer_, req_,
                     beast::bind_front_handler(&HttpSession::onRead,
                                               shared_from_this()));
  }

  void onRead(beast::error_code ec, std::size_t) {
    if (ec == http::error::end_of_stream) {
      stream_.socket().shutdown(tcp::socket::shutdown_send, ec);
      return;
    }
    if (ec) {
      LOG_DEBUG("HTTP read failed: " << ec.message());
      return;
    }

    if (websocket::is_upgrade(req_)) {
      stream_.expires_never();
      std::make_shared<WebSocketSession>(stream_.release_socket(), gateway_,
                                         settings_)
          ->run(std::move(req_));
      return;
    }

    respond();
  }

  void respond() {
    std::string target(req_.target());
    std::string path = target.substr(0, target.find('?'));

    auto res = std::make_shared<http::response<http::string_body>>();
    res->version(req_.version());
    res->keep_alive(false);
    res->set(http::field::server, kServerName);

    if (req_.method() == http::verb::get &&
        (path == "/ws/status" || path == "/health")) {
      res->result(http::status::ok);
      res->set(http::field::content_type, "application/json");
      res->body() = gateway_.statusJson();
    } else {
      res->result(http::status::not_found);
      res->set(http::field::content_type, "text/plain");
      res->body() = "Not Found\n";
    }
    res->prepare_payload();

    http::async_write(stream_, *res,
                      [self = shared_from_this(), res](beast::error_code ec,
                                                       std::size_t) {
                        if (ec)
                          LOG_DEBUG("HTTP write failed: " << ec.message());
                        beast::error_code ignored;
                        self->stream_.socket().shutdown(tcp::socket::shutdown_send,
                                                        ignored);
                      });
  }

  beast::tcp_stream stream_;
  beast::flat_buffer buffer_;
  http::request<http::string_body> req_;
  ConnectionGateway &gateway_;
  ServerSettings settings_;
};

} // namespace

WebSocketServer::WebSocketServer(net::io_context &ioc, ConnectionGateway &gateway,
                                 const ServerSettings &settings)
    : ioc_(ioc), acceptor_(net::make_strand(ioc)), gateway_(gateway),
      settings_(settings) {}

bool WebSocketServer::start() {
  beast::error_code ec;
  auto address = net::ip::make_address(settings_.bindIp, ec);
  if (ec) {
    LOG_ERROR("Invalid bind address " << settings_.bindIp << ": " << ec.message());
    return false;
  }
  tcp::endpoint endpoint(address, static_cast<unsigned short>(settings_.port));

  acceptor_.open(endpoint.protocol(), ec);
  if (!ec)
    acceptor_.set_option(net::socket_base::reuse_address(true), ec);
  if (!ec)
    acceptor_.bind(endpoint, ec);
  if (!ec)
    acceptor_.listen(net::socket_base::max_listen_connections, ec);
  if (ec) {
    LOG_ERROR("Failed to listen on " << settings_.bindIp << ":" << settings_.port
              << ": " << ec.message());
    return false;
  }

  LOG_INFO("Listening on ws://" << settings_.bindIp << ":" << settings_.port
           << "/ws/transcribe");
  doAccept();
  return true;
}

void WebSocketServer::stop() {
  net::post(acceptor_.get_executor(), [self = shared_from_this()]() {
    beast::error_code ec;
    self->acceptor_.close(ec);
  });
}

void WebSocketServer::doAccept() {
  acceptor_.async_accept(net::make_strand(ioc_),
                         beast::bind_front_handler(&WebSocketServer::onAccept,
                                                   shared_from_this()));
}

void WebSocketServer::onAccept(beast::error_code ec, tcp::socket socket) {
  if (ec) {
    if (ec == net::error::operation_aborted)
      return;
    LOG_WARN("Accept failed: " << ec.message());
  } else {
    std::make_shared<HttpSession>(std::move(socket), gateway_, settings_)->run();
  }
  if (acceptor_.is_open())
    doAccept();
}

std::string WebSocketServer::queryParam(const std::string &target,
                                        const std::string &key) {
  auto q = target.find('?');
  if (q == std::string::npos)
    return "";

  size_t pos = q + 1;
  while (pos < target.size()) {
    size_t amp = target.find('&', pos);
    std::string pair = target.substr(pos, amp == std::string::npos ? std::string::npos
                                                                    : amp - pos);
    size_t eq = pair.find('=');
    if (pair.substr(0, eq) == key)
      return eq == std::string::npos ? "" : pair.substr(eq + 1);
    if (amp == std::string::npos)
      break;
    pos = amp + 1;
  }
  return "";
}
