#ifndef BROADCAST_HUB_HPP
#define BROADCAST_HUB_HPP

#include "viewer_session.hpp"
#include "wire_protocol.hpp"
#include <boost/asio/thread_pool.hpp>
#include <chrono>
#include <cstddef>
#include <future>
#include <memory>
#include <mutex>
#include <vector>

struct BroadcastReport {
  std::size_t delivered = 0;
  std::size_t dropped = 0;
};

// The set of connected viewers. Sessions are added by the accept loop and
// pruned when a delivery to them fails or times out.
class BroadcastHub {
public:
  explicit BroadcastHub(
      std::chrono::milliseconds write_timeout = std::chrono::seconds(5));
  ~BroadcastHub();

  BroadcastHub(const BroadcastHub &) = delete;
  BroadcastHub &operator=(const BroadcastHub &) = delete;

  void add(std::shared_ptr<ViewerSession> session);
  void remove(const std::shared_ptr<ViewerSession> &session);

  std::size_t session_count() const;
  std::vector<std::shared_ptr<ViewerSession>> sessions() const;

  // Hands `batch` to every session connected right now, in call order, then
  // waits for the deliveries on a worker thread so the caller never blocks on
  // a slow viewer. The future resolves after failed sessions were pruned.
  std::future<BroadcastReport>
  broadcast(std::shared_ptr<const FrameBatch> batch);

  std::future<BroadcastReport> broadcast(const std::vector<Pixmap> &pages);

  // Waits for in-flight broadcasts and drops every session. Call before the
  // transports' io_context goes away.
  void shutdown();

private:
  void prune(const std::vector<std::shared_ptr<ViewerSession>> &failed);

  std::chrono::milliseconds write_timeout_;
  mutable std::mutex mutex_;
  std::vector<std::shared_ptr<ViewerSession>> sessions_;
  boost::asio::thread_pool waiters_{2};
};

#endif // BROADCAST_HUB_HPP
