#include "server/broadcast_hub.hpp"
#include "server/websocket_server.hpp"
#include "server/wire_protocol.hpp"
#include <boost/asio/error.hpp>
#include <gtest/gtest.h>
#include <chrono>
#include <future>
#include <thread>

using namespace std::chrono_literals;

namespace {

// Blocking viewer connected over loopback.
class TestViewer {
public:
  explicit TestViewer(unsigned short port) : ws_(ioc_) {
    ws_.next_layer().connect(
        tcp::endpoint(net::ip::make_address("127.0.0.1"), port));
    ws_.handshake("127.0.0.1", "/");
  }

  // Reads frames until one complete page set is decoded.
  std::vector<Pixmap> next_pages() {
    while (true) {
      beast::flat_buffer buffer;
      ws_.read(buffer);
      WireFrame frame{ws_.got_binary(),
                      beast::buffers_to_string(buffer.data())};
      if (auto pages = decoder_.feed(frame)) {
        return std::move(*pages);
      }
    }
  }

  void drop() {
    beast::error_code ec;
    ws_.next_layer().shutdown(tcp::socket::shutdown_both, ec);
    ws_.next_layer().close(ec);
  }

private:
  net::io_context ioc_;
  websocket::stream<tcp::socket> ws_;
  FrameDecoder decoder_;
};

template <typename Predicate>
bool eventually(Predicate predicate) {
  auto deadline = std::chrono::steady_clock::now() + 5s;
  while (std::chrono::steady_clock::now() < deadline) {
    if (predicate()) {
      return true;
    }
    std::this_thread::sleep_for(10ms);
  }
  return predicate();
}

Pixmap solid(std::uint32_t size, std::uint8_t grey) {
  Pixmap pixmap(size, size);
  pixmap.fill(grey, grey, grey, 255);
  return pixmap;
}

boost::system::error_code deliver_and_wait(ViewerSession &session,
                                           std::shared_ptr<const FrameBatch> batch) {
  auto done = std::make_shared<std::promise<boost::system::error_code>>();
  auto result = done->get_future();
  session.deliver(std::move(batch),
                  [done](boost::system::error_code ec) { done->set_value(ec); });
  EXPECT_EQ(result.wait_for(5s), std::future_status::ready);
  return result.get();
}

} // namespace

class WebSocketServerTest : public ::testing::Test {
protected:
  void SetUp() override { server.start("127.0.0.1", 0); }

  BroadcastHub hub{2s};
  WebSocketServer server{hub};
};

TEST_F(WebSocketServerTest, ViewerReceivesBatchesInOrder) {
  TestViewer viewer(server.port());
  ASSERT_TRUE(eventually([&] { return hub.session_count() == 1; }));

  auto first = hub.broadcast({solid(1, 10)});
  auto second = hub.broadcast({solid(2, 20), solid(2, 30)});

  std::vector<Pixmap> pages = viewer.next_pages();
  ASSERT_EQ(pages.size(), 1u);
  EXPECT_EQ(pages[0].width(), 1u);
  EXPECT_EQ(pages[0].data(), solid(1, 10).data());

  pages = viewer.next_pages();
  ASSERT_EQ(pages.size(), 2u);
  EXPECT_EQ(pages[0].width(), 2u);
  EXPECT_EQ(pages[0].data(), solid(2, 20).data());
  EXPECT_EQ(pages[1].data(), solid(2, 30).data());

  EXPECT_EQ(first.get().delivered, 1u);
  EXPECT_EQ(second.get().delivered, 1u);
}

TEST_F(WebSocketServerTest, DroppedViewerLeavesTheHub) {
  TestViewer staying(server.port());
  TestViewer leaving(server.port());
  ASSERT_TRUE(eventually([&] { return hub.session_count() == 2; }));

  leaving.drop();

  // Either the read loop notices first or the next broadcast fails to write.
  ASSERT_TRUE(eventually([&] {
    hub.broadcast({solid(1, 0)}).get();
    return hub.session_count() == 1;
  }));
  EXPECT_EQ(staying.next_pages().size(), 1u);
}

TEST_F(WebSocketServerTest, ClosedSessionRejectsDeliveries) {
  TestViewer viewer(server.port());
  ASSERT_TRUE(eventually([&] { return hub.session_count() == 1; }));

  std::shared_ptr<ViewerSession> session = hub.sessions().front();
  auto batch = encode_pages({solid(1, 0)});
  EXPECT_FALSE(deliver_and_wait(*session, batch));

  session->close();
  EXPECT_EQ(deliver_and_wait(*session, batch),
            boost::system::error_code(net::error::not_connected));
}
