#include "broadcast_hub.hpp"
#include "utils/log.hpp"
#include <algorithm>
#include <boost/asio/post.hpp>
#include <iostream>

namespace net = boost::asio;

BroadcastHub::BroadcastHub(std::chrono::milliseconds write_timeout)
    : write_timeout_(write_timeout) {}

BroadcastHub::~BroadcastHub() { waiters_.join(); }

void BroadcastHub::shutdown() {
  waiters_.join();

  std::lock_guard<std::mutex> lock(mutex_);
  if (!sessions_.empty()) {
    std::cout << termcolor::bright_blue << "→ " << termcolor::reset
              << "Closing " << termcolor::bright_white << sessions_.size()
              << termcolor::reset << " viewer connections\n";
  }
  sessions_.clear();
}

void BroadcastHub::add(std::shared_ptr<ViewerSession> session) {
  std::lock_guard<std::mutex> lock(mutex_);
  sessions_.push_back(std::move(session));

  std::cout << termcolor::bright_green << "✓ " << termcolor::reset
            << "Viewer connected " << termcolor::bright_blue
            << "(total: " << sessions_.size() << ")" << termcolor::reset
            << "\n";
}

void BroadcastHub::remove(const std::shared_ptr<ViewerSession> &session) {
  std::lock_guard<std::mutex> lock(mutex_);
  auto it = std::find(sessions_.begin(), sessions_.end(), session);
  if (it == sessions_.end()) {
    return;
  }
  sessions_.erase(it);

  std::cout << termcolor::bright_blue << "→ " << termcolor::reset
            << "Viewer disconnected " << termcolor::bright_blue
            << "(total: " << sessions_.size() << ")" << termcolor::reset
            << "\n";
}

std::size_t BroadcastHub::session_count() const {
  std::lock_guard<std::mutex> lock(mutex_);
  return sessions_.size();
}

std::vector<std::shared_ptr<ViewerSession>> BroadcastHub::sessions() const {
  std::lock_guard<std::mutex> lock(mutex_);
  return sessions_;
}

std::future<BroadcastReport>
BroadcastHub::broadcast(const std::vector<Pixmap> &pages) {
  return broadcast(encode_pages(pages));
}

std::future<BroadcastReport>
BroadcastHub::broadcast(std::shared_ptr<const FrameBatch> batch) {
  struct Pending {
    std::shared_ptr<ViewerSession> session;
    std::future<boost::system::error_code> done;
  };

  // Sessions that connect from here on only see later broadcasts.
  auto targets = sessions();

  auto pending = std::make_shared<std::vector<Pending>>();
  pending->reserve(targets.size());
  for (auto &session : targets) {
    auto promise = std::make_shared<std::promise<boost::system::error_code>>();
    pending->push_back({session, promise->get_future()});
    session->deliver(batch, [promise](boost::system::error_code ec) {
      promise->set_value(ec);
    });
  }

  auto report = std::make_shared<std::promise<BroadcastReport>>();
  auto result = report->get_future();

  std::size_t pages = batch->empty() ? 0 : batch->size() - 1;
  net::post(waiters_, [this, pending, report, pages] {
    auto deadline = std::chrono::steady_clock::now() + write_timeout_;
    std::vector<std::shared_ptr<ViewerSession>> failed;

    for (auto &entry : *pending) {
      if (entry.done.wait_until(deadline) != std::future_status::ready) {
        std::cerr << termcolor::bright_red << "✗ " << termcolor::reset
                  << "Timed out sending to " << termcolor::bright_white
                  << entry.session->remote_address() << termcolor::reset
                  << "\n";
        entry.session->close();
        failed.push_back(entry.session);
        continue;
      }

      auto ec = entry.done.get();
      if (ec) {
        std::cerr << termcolor::bright_red << "✗ " << termcolor::reset
                  << "Failed to send to " << termcolor::bright_white
                  << entry.session->remote_address() << termcolor::reset
                  << ": " << ec.message() << "\n";
        entry.session->close();
        failed.push_back(entry.session);
      }
    }

    prune(failed);

    BroadcastReport summary{pending->size() - failed.size(), failed.size()};
    if (!pending->empty()) {
      log_time(std::cout) << termcolor::bright_magenta << "📡 Broadcast"
                          << termcolor::reset << " " << pages
                          << (pages == 1 ? " page" : " pages") << " to "
                          << termcolor::bright_white << summary.delivered
                          << termcolor::reset
                          << (summary.delivered == 1 ? " client" : " clients");
      if (summary.dropped > 0) {
        std::cout << termcolor::bright_red << " (" << summary.dropped
                  << " dropped)" << termcolor::reset;
      }
      std::cout << "\n";
    }

    report->set_value(summary);
  });

  return result;
}

void BroadcastHub::prune(
    const std::vector<std::shared_ptr<ViewerSession>> &failed) {
  if (failed.empty()) {
    return;
  }

  std::lock_guard<std::mutex> lock(mutex_);
  // Some may already have been removed by their own read loop.
  auto erased = std::erase_if(sessions_, [&failed](const auto &session) {
    return std::find(failed.begin(), failed.end(), session) != failed.end();
  });
  if (erased == 0) {
    return;
  }

  std::cout << termcolor::bright_blue << "→ " << termcolor::reset << "Dropped "
            << erased << (erased == 1 ? " viewer " : " viewers ")
            << termcolor::bright_blue << "(total: " << sessions_.size() << ")"
            << termcolor::reset << "\n";
}
