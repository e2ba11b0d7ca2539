#pragma once

#include "broadcast_hub.hpp"
#include "utils/log.hpp"
#include "viewer_session.hpp"
#include <atomic>
#include <boost/asio/ip/tcp.hpp>
#include <boost/asio/post.hpp>
#include <boost/beast/core.hpp>
#include <boost/beast/websocket.hpp>
#include <deque>
#include <iostream>
#include <memory>
#include <stdexcept>
#include <string>
#include <thread>

namespace beast = boost::beast;
namespace websocket = beast::websocket;
namespace net = boost::asio;
using tcp = net::ip::tcp;

class WebSocketSession : public ViewerSession,
                         public std::enable_shared_from_this<WebSocketSession> {
public:
  WebSocketSession(tcp::socket socket, BroadcastHub *hub)
      : ws_(std::move(socket)), hub_(hub) {
    beast::error_code ec;
    auto endpoint = ws_.next_layer().remote_endpoint(ec);
    remote_ = ec ? "unknown"
                 : endpoint.address().to_string() + ":" +
                       std::to_string(endpoint.port());
  }

  void run() {
    ws_.set_option(
        websocket::stream_base::timeout::suggested(beast::role_type::server));
    ws_.set_option(
        websocket::stream_base::decorator([](websocket::response_type &res) {
          res.set(beast::http::field::server, "pagecast");
        }));

    ws_.async_accept(beast::bind_front_handler(&WebSocketSession::on_accept,
                                               shared_from_this()));
  }

  void deliver(std::shared_ptr<const FrameBatch> batch,
               DeliveryHandler on_done) override {
    net::post(ws_.get_executor(), [self = shared_from_this(),
                                   batch = std::move(batch),
                                   on_done = std::move(on_done)]() mutable {
      if (self->closed_) {
        on_done(net::error::not_connected);
        return;
      }
      if (batch->empty()) {
        on_done({});
        return;
      }

      self->queue_.push_back({std::move(batch), 0, std::move(on_done)});
      if (self->queue_.size() == 1) {
        self->do_write();
      }
    });
  }

  void close() override {
    net::post(ws_.get_executor(), [self = shared_from_this()]() {
      beast::error_code ec;
      self->ws_.next_layer().close(ec);
      self->closed_ = true;
    });
  }

  std::string remote_address() const override { return remote_; }

private:
  struct Outgoing {
    std::shared_ptr<const FrameBatch> batch;
    std::size_t next = 0;
    DeliveryHandler on_done;
  };

  void on_accept(beast::error_code ec) {
    if (ec) {
      std::cerr << termcolor::bright_red
                << "✗ WebSocket handshake error: " << termcolor::reset
                << termcolor::bright_white << ec.message() << termcolor::reset
                << "\n";
      return;
    }

    log_time(std::cout) << termcolor::bright_green << "🔌 WebSocket"
                        << termcolor::reset << " Viewer connected from "
                        << termcolor::bright_white << remote_
                        << termcolor::reset << "\n";

    hub_->add(shared_from_this());
    do_read();
  }

  // Viewers do not talk back; reading only notices when they leave.
  void do_read() {
    ws_.async_read(buffer_,
                   beast::bind_front_handler(&WebSocketSession::on_read,
                                             shared_from_this()));
  }

  void on_read(beast::error_code ec, std::size_t) {
    if (ec) {
      if (ec == websocket::error::closed) {
        log_time(std::cout) << termcolor::bright_blue << "🔌 WebSocket"
                            << termcolor::reset << " Connection closed by "
                            << termcolor::bright_white << remote_
                            << termcolor::reset << "\n";
      } else if (ec != net::error::operation_aborted) {
        std::cerr << termcolor::bright_red
                  << "✗ WebSocket read error: " << termcolor::reset
                  << termcolor::bright_white << ec.message()
                  << termcolor::reset << "\n";
      }

      closed_ = true;
      hub_->remove(shared_from_this());
      return;
    }

    buffer_.clear();
    do_read();
  }

  void do_write() {
    Outgoing &front = queue_.front();
    const WireFrame &frame = (*front.batch)[front.next];
    ws_.binary(frame.binary);
    ws_.async_write(net::buffer(frame.payload),
                    beast::bind_front_handler(&WebSocketSession::on_write,
                                              shared_from_this()));
  }

  void on_write(beast::error_code ec, std::size_t) {
    if (ec) {
      closed_ = true;
      std::deque<Outgoing> failed;
      failed.swap(queue_);
      for (auto &outgoing : failed) {
        outgoing.on_done(ec);
      }
      return;
    }

    Outgoing &front = queue_.front();
    if (++front.next == front.batch->size()) {
      auto on_done = std::move(front.on_done);
      queue_.pop_front();
      on_done({});
    }

    if (!queue_.empty()) {
      do_write();
    }
  }

  websocket::stream<tcp::socket> ws_;
  beast::flat_buffer buffer_;
  std::deque<Outgoing> queue_;
  BroadcastHub *hub_;
  std::string remote_;
  bool closed_ = false;
};

// Accepts viewer connections on its own io_context thread and registers each
// completed handshake with the hub.
class WebSocketServer {
public:
  explicit WebSocketServer(BroadcastHub &hub) : hub_(hub) {}

  WebSocketServer(const WebSocketServer &) = delete;
  WebSocketServer &operator=(const WebSocketServer &) = delete;

  // Binds synchronously so a taken port fails here rather than on the thread.
  void start(const std::string &address, unsigned short port) {
    auto endpoint = tcp::endpoint(net::ip::make_address(address), port);

    acceptor_.open(endpoint.protocol());
    acceptor_.set_option(net::socket_base::reuse_address(true));
    acceptor_.bind(endpoint);
    acceptor_.listen(net::socket_base::max_listen_connections);

    running_ = true;
    do_accept();

    thread_ = std::thread([this]() {
      try {
        ioc_.run();
      } catch (const std::exception &e) {
        if (running_.load()) {
          std::cerr << termcolor::bright_red
                    << "✗ WebSocket server error: " << termcolor::reset
                    << termcolor::bright_white << e.what() << termcolor::reset
                    << "\n";
        }
      }
    });
  }

  // The bound port; differs from the requested one when that was 0.
  unsigned short port() const { return acceptor_.local_endpoint().port(); }

  void stop() {
    if (!running_.exchange(false)) {
      return;
    }

    std::cout << termcolor::bright_yellow << "⏳ Stopping WebSocket server..."
              << termcolor::reset << "\n";

    ioc_.stop();
    if (thread_.joinable()) {
      thread_.join();
    }

    // Sessions hold sockets on ioc_; release them while it still exists.
    hub_.shutdown();

    std::cout << termcolor::bright_green << "✓ " << termcolor::reset
              << "WebSocket server stopped\n";
  }

  ~WebSocketServer() { stop(); }

private:
  void do_accept() {
    acceptor_.async_accept([this](beast::error_code ec, tcp::socket socket) {
      if (!ec) {
        std::make_shared<WebSocketSession>(std::move(socket), &hub_)->run();
      } else if (ec != net::error::operation_aborted) {
        std::cerr << termcolor::bright_red
                  << "✗ WebSocket accept error: " << termcolor::reset
                  << termcolor::bright_white << ec.message()
                  << termcolor::reset << "\n";
      }

      if (running_.load()) {
        do_accept();
      }
    });
  }

  BroadcastHub &hub_;
  net::io_context ioc_;
  tcp::acceptor acceptor_{ioc_};
  std::thread thread_;
  std::atomic<bool> running_{false};
};
