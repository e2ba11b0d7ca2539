#pragma once

#include "pixmap.hpp"
#include "source_error.hpp"
#include "world.hpp"
#include <cstddef>
#include <expected>
#include <string>
#include <vector>

// A line of text placed on a page, in points from the top-left corner.
struct TextRun {
  std::size_t font = 0;
  double size = 11.0;
  double x = 0.0;
  double baseline = 0.0;
  std::string text;
};

struct Page {
  double width = 0.0;
  double height = 0.0;
  std::vector<TextRun> runs;
};

struct Document {
  std::vector<Page> pages;
};

// Turns the world's main source into pages, or into errors.
class DocumentEngine {
public:
  virtual ~DocumentEngine() = default;

  virtual std::expected<Document, std::vector<SourceError>>
  compile(const World &world) = 0;

  virtual Pixmap render(const World &world, const Page &page,
                        float scale) = 0;

  // Drops memoized results not used within the last `max_age` compilations.
  virtual void evict(std::size_t max_age) = 0;
};
