#include "wire_protocol.hpp"
#include <format>
#include <limits>
#include <nlohmann/json.hpp>
#include <stdexcept>

using json = nlohmann::json;

std::shared_ptr<const FrameBatch>
encode_pages(const std::vector<Pixmap> &pages) {
  if (pages.empty()) {
    throw std::invalid_argument("cannot encode an empty page set");
  }

  const Pixmap &first = pages.front();
  json header = {{"page_num", pages.size()},
                 {"width", first.width()},
                 {"height", first.height()}};

  auto batch = std::make_shared<FrameBatch>();
  batch->reserve(pages.size() + 1);
  batch->push_back({false, header.dump()});

  for (std::size_t i = 0; i < pages.size(); ++i) {
    const Pixmap &page = pages[i];
    if (page.width() != first.width() || page.height() != first.height()) {
      throw std::invalid_argument(
          std::format("page {} is {}x{}, expected {}x{}", i + 1, page.width(),
                      page.height(), first.width(), first.height()));
    }
    batch->push_back(
        {true, std::string(page.data().begin(), page.data().end())});
  }

  return batch;
}

std::optional<std::vector<Pixmap>> FrameDecoder::feed(const WireFrame &frame) {
  if (!header_) {
    if (frame.binary) {
      throw std::runtime_error("expected a header frame, got binary data");
    }

    json parsed = json::parse(frame.payload, nullptr, false);
    if (parsed.is_discarded() || !parsed.is_object()) {
      throw std::runtime_error("malformed header frame: " + frame.payload);
    }
    for (const char *field : {"page_num", "width", "height"}) {
      if (!parsed.contains(field) || !parsed[field].is_number_unsigned()) {
        throw std::runtime_error(std::format(
            "header field `{}` must be an unsigned integer: {}", field,
            frame.payload));
      }
    }
    if (parsed["width"].get<std::uint64_t>() >
            std::numeric_limits<std::uint32_t>::max() ||
        parsed["height"].get<std::uint64_t>() >
            std::numeric_limits<std::uint32_t>::max()) {
      throw std::runtime_error("page dimensions out of range: " +
                               frame.payload);
    }

    Header header;
    header.page_num = parsed["page_num"].get<std::size_t>();
    header.width = parsed["width"].get<std::uint32_t>();
    header.height = parsed["height"].get<std::uint32_t>();
    if (header.page_num == 0) {
      throw std::runtime_error("header announces zero pages");
    }

    header_ = header;
    pages_.clear();
    return std::nullopt;
  }

  if (!frame.binary) {
    throw std::runtime_error(std::format(
        "expected page {} of {}, got a text frame", pages_.size() + 1,
        header_->page_num));
  }

  std::size_t expected =
      static_cast<std::size_t>(header_->width) * header_->height * 4;
  if (frame.payload.size() != expected) {
    throw std::runtime_error(std::format(
        "page {} has {} bytes, expected {}", pages_.size() + 1,
        frame.payload.size(), expected));
  }

  pages_.emplace_back(
      header_->width, header_->height,
      std::vector<std::uint8_t>(frame.payload.begin(), frame.payload.end()));

  if (pages_.size() < header_->page_num) {
    return std::nullopt;
  }

  header_.reset();
  return std::move(pages_);
}
