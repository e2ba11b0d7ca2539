#pragma once

#include <cstddef>
#include <cstdint>
#include <vector>

// Premultiplied RGBA raster, row-major, four bytes per pixel.
class Pixmap {
public:
  Pixmap() = default;
  Pixmap(std::uint32_t width, std::uint32_t height)
      : width_(width), height_(height),
        data_(static_cast<std::size_t>(width) * height * 4, 0) {}
  Pixmap(std::uint32_t width, std::uint32_t height,
         std::vector<std::uint8_t> data)
      : width_(width), height_(height), data_(std::move(data)) {}

  std::uint32_t width() const { return width_; }
  std::uint32_t height() const { return height_; }

  const std::vector<std::uint8_t> &data() const { return data_; }
  std::uint8_t *pixel(std::uint32_t x, std::uint32_t y) {
    return data_.data() + (static_cast<std::size_t>(y) * width_ + x) * 4;
  }

  void fill(std::uint8_t r, std::uint8_t g, std::uint8_t b, std::uint8_t a) {
    for (std::size_t i = 0; i + 3 < data_.size(); i += 4) {
      data_[i] = static_cast<std::uint8_t>(r * a / 255);
      data_[i + 1] = static_cast<std::uint8_t>(g * a / 255);
      data_[i + 2] = static_cast<std::uint8_t>(b * a / 255);
      data_[i + 3] = a;
    }
  }

private:
  std::uint32_t width_ = 0;
  std::uint32_t height_ = 0;
  std::vector<std::uint8_t> data_;
};
