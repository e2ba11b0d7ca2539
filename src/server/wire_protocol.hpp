#pragma once

#include "core/pixmap.hpp"
#include <cstddef>
#include <cstdint>
#include <memory>
#include <optional>
#include <string>
#include <vector>

// One websocket message.
struct WireFrame {
  bool binary = false;
  std::string payload;
};

// Every frame of one broadcast, in send order. Shared read-only between the
// sessions it is delivered to.
using FrameBatch = std::vector<WireFrame>;

// Binary variant of the viewer protocol: a text header
// {"page_num":N,"width":W,"height":H} followed by N binary frames of raw
// premultiplied RGBA, W*H*4 bytes each. All pages must share the first page's
// size; throws std::invalid_argument otherwise or when `pages` is empty.
std::shared_ptr<const FrameBatch>
encode_pages(const std::vector<Pixmap> &pages);

// Client side of the binary variant. Feed frames in arrival order; a complete
// page set is returned once its last page arrives. Throws
// std::runtime_error on a protocol violation.
class FrameDecoder {
public:
  std::optional<std::vector<Pixmap>> feed(const WireFrame &frame);

  bool expecting_header() const { return !header_; }

private:
  struct Header {
    std::size_t page_num = 0;
    std::uint32_t width = 0;
    std::uint32_t height = 0;
  };

  std::optional<Header> header_;
  std::vector<Pixmap> pages_;
};
