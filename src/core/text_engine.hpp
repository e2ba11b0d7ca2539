#ifndef TEXT_ENGINE_HPP
#define TEXT_ENGINE_HPP

#include "document_engine.hpp"
#include "freetype.hpp"
#include <cstddef>
#include <memory>
#include <optional>
#include <string>
#include <string_view>
#include <unordered_map>
#include <vector>

// One line of a plain-text document after parsing. Byte offsets are relative
// to the source text so parses can be shared between sources with equal text.
struct Directive {
  enum class Kind { Text, Include, PageBreak, Font, Size, Error };

  Kind kind = Kind::Text;
  std::string argument;
  double number = 0.0;
  std::size_t start = 0;
  std::size_t end = 0;
};

std::vector<Directive> parse_directives(std::string_view text);

// Paginates plain text with a handful of line directives:
//
//   #include "path"   splice another file, relative to this one ("/x" is
//                     relative to the world root)
//   #pagebreak        start a new page
//   #font "Family"    switch font family
//   #size 12          switch font size in points
//   \#...             a literal line starting with '#'
class TextEngine : public DocumentEngine {
public:
  static constexpr double page_width = 595.28;
  static constexpr double page_height = 841.89;
  static constexpr double margin = 70.87;
  static constexpr double default_size = 11.0;

  TextEngine();

  std::expected<Document, std::vector<SourceError>>
  compile(const World &world) override;

  Pixmap render(const World &world, const Page &page, float scale) override;

  void evict(std::size_t max_age) override;

  std::size_t memo_size() const { return memo_.size(); }

private:
  struct Block {
    enum class Kind { Line, PageBreak };
    Kind kind = Kind::Line;
    std::string text;
    std::optional<std::size_t> font;
    double size = default_size;
    Span span;
  };

  struct EvalState {
    std::optional<std::size_t> font;
    double size = default_size;
    std::vector<SourceId> stack;
    std::vector<Block> blocks;
    std::vector<SourceError> errors;
  };

  struct MemoEntry {
    std::shared_ptr<const std::vector<Directive>> directives;
    std::size_t age = 0;
  };

  struct LoadedFace {
    Buffer data;
    FreeTypeFace face;
  };

  std::shared_ptr<const std::vector<Directive>>
  parsed(const std::string &text);
  void evaluate(const World &world, SourceId id, EvalState &state);
  std::optional<std::size_t> default_font(const World &world) const;

  FT_Face face(const World &world, std::size_t font);
  double measure(FT_Face face, double size, std::string_view text);

  FreeTypeLibrary library_;
  std::unordered_map<std::string, MemoEntry> memo_;
  std::unordered_map<std::size_t, LoadedFace> faces_;
};

#endif // TEXT_ENGINE_HPP
