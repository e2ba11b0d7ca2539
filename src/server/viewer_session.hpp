#pragma once

#include "wire_protocol.hpp"
#include <boost/system/error_code.hpp>
#include <functional>
#include <memory>
#include <string>

// A connected viewer as seen by the broadcast hub.
class ViewerSession {
public:
  using DeliveryHandler = std::function<void(boost::system::error_code)>;

  virtual ~ViewerSession() = default;

  // Queues every frame of `batch` behind earlier batches. `on_done` is called
  // exactly once, after the last frame was written or on the first failure.
  virtual void deliver(std::shared_ptr<const FrameBatch> batch,
                       DeliveryHandler on_done) = 0;

  // Tears down the transport. Pending deliveries fail.
  virtual void close() = 0;

  virtual std::string remote_address() const = 0;
};
