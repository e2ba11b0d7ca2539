#include "text_engine.hpp"
#include "utf8.hpp"
#include <algorithm>
#include <cctype>
#include <charconv>
#include <cmath>
#include <format>

static std::string_view trim(std::string_view s) {
  while (!s.empty() && (s.front() == ' ' || s.front() == '\t')) {
    s.remove_prefix(1);
  }
  while (!s.empty() &&
         (s.back() == ' ' || s.back() == '\t' || s.back() == '\r')) {
    s.remove_suffix(1);
  }
  return s;
}

static std::optional<std::string> parse_quoted(std::string_view s) {
  if (s.size() < 2 || s.front() != '"' || s.back() != '"') {
    return std::nullopt;
  }
  return std::string(s.substr(1, s.size() - 2));
}

// Keeps point sizes within what FreeType's 26.6 fixed point can hold.
static constexpr double max_size = 1000.0;

static Directive parse_line(std::string_view line) {
  Directive directive;

  if (line.starts_with("\\#")) {
    directive.argument = std::string(line.substr(1));
    return directive;
  }
  if (!line.starts_with("#")) {
    directive.argument = std::string(line);
    return directive;
  }

  std::size_t name_end = 1;
  while (name_end < line.size() && std::isalpha(static_cast<unsigned char>(
                                       line[name_end]))) {
    ++name_end;
  }
  std::string_view name = line.substr(1, name_end - 1);
  std::string_view rest = trim(line.substr(name_end));

  auto fail = [&](std::string message) {
    directive.kind = Directive::Kind::Error;
    directive.argument = std::move(message);
    return directive;
  };

  if (name == "include" || name == "font") {
    auto value = parse_quoted(rest);
    if (!value || value->empty()) {
      return fail(std::format("expected a quoted string after `#{}`", name));
    }
    directive.kind =
        name == "include" ? Directive::Kind::Include : Directive::Kind::Font;
    directive.argument = std::move(*value);
    return directive;
  }

  if (name == "pagebreak") {
    if (!rest.empty()) {
      return fail("`#pagebreak` takes no arguments");
    }
    directive.kind = Directive::Kind::PageBreak;
    return directive;
  }

  if (name == "size") {
    double value = 0.0;
    auto [ptr, ec] =
        std::from_chars(rest.data(), rest.data() + rest.size(), value);
    if (ec != std::errc() || ptr != rest.data() + rest.size() ||
        !std::isfinite(value) || !(value > 0.0) || value > max_size) {
      return fail("expected a positive font size after `#size`");
    }
    directive.kind = Directive::Kind::Size;
    directive.number = value;
    return directive;
  }

  return fail(std::format("unknown directive `#{}`", name));
}

std::vector<Directive> parse_directives(std::string_view text) {
  std::vector<Directive> directives;

  std::size_t start = 0;
  while (start <= text.size()) {
    std::size_t end = text.find('\n', start);
    if (end == std::string_view::npos) {
      end = text.size();
    }

    std::string_view line = text.substr(start, end - start);
    if (!line.empty() && line.back() == '\r') {
      line.remove_suffix(1);
    }

    // No line for the empty tail after a final newline.
    if (!(end == text.size() && line.empty() && start > 0)) {
      Directive directive = parse_line(line);
      directive.start = start;
      directive.end = start + line.size();
      directives.push_back(std::move(directive));
    }

    start = end + 1;
  }

  return directives;
}

TextEngine::TextEngine() : library_(make_freetype_library()) {}

std::shared_ptr<const std::vector<Directive>>
TextEngine::parsed(const std::string &text) {
  auto it = memo_.find(text);
  if (it != memo_.end()) {
    it->second.age = 0;
    return it->second.directives;
  }

  auto directives =
      std::make_shared<const std::vector<Directive>>(parse_directives(text));
  memo_.emplace(text, MemoEntry{directives, 0});
  return directives;
}

void TextEngine::evict(std::size_t max_age) {
  for (auto it = memo_.begin(); it != memo_.end();) {
    if (++it->second.age > max_age) {
      it = memo_.erase(it);
    } else {
      ++it;
    }
  }
}

std::optional<std::size_t> TextEngine::default_font(const World &world) const {
  for (const char *family : {"Linux Libertine", "DejaVu Sans",
                             "Liberation Serif", "Noto Sans"}) {
    if (auto index = world.book().select(family)) {
      return index;
    }
  }
  if (!world.book().empty()) {
    return std::size_t{0};
  }
  return std::nullopt;
}

void TextEngine::evaluate(const World &world, SourceId id, EvalState &state) {
  const Source &source = world.source(id);
  auto directives = parsed(source.text());

  state.stack.push_back(id);

  for (const Directive &directive : *directives) {
    Span span{id, directive.start, directive.end};

    switch (directive.kind) {
    case Directive::Kind::Text:
      state.blocks.push_back(
          {Block::Kind::Line, directive.argument, state.font, state.size, span});
      break;

    case Directive::Kind::PageBreak:
      state.blocks.push_back(
          {Block::Kind::PageBreak, {}, state.font, state.size, span});
      break;

    case Directive::Kind::Size:
      state.size = directive.number;
      break;

    case Directive::Kind::Font:
      if (auto index = world.book().select(directive.argument)) {
        state.font = index;
      } else {
        state.errors.push_back(
            {span, std::format("unknown font family `{}`", directive.argument),
             {}});
      }
      break;

    case Directive::Kind::Error:
      state.errors.push_back({span, directive.argument, {}});
      break;

    case Directive::Kind::Include: {
      fs::path target = directive.argument.starts_with('/')
                            ? world.root() / directive.argument.substr(1)
                            : source.path().parent_path() / directive.argument;

      auto included = world.resolve(target);
      if (!included) {
        state.errors.push_back({span, included.error().message(), {}});
        break;
      }

      if (std::find(state.stack.begin(), state.stack.end(), *included) !=
          state.stack.end()) {
        state.errors.push_back(
            {span, std::format("cyclic include of {}", target.string()), {}});
        break;
      }

      std::size_t first_new = state.errors.size();
      evaluate(world, *included, state);
      for (std::size_t i = first_new; i < state.errors.size(); ++i) {
        state.errors[i].trace.push_back(
            {"error occurred in this include", span});
      }
      break;
    }
    }
  }

  state.stack.pop_back();
}

FT_Face TextEngine::face(const World &world, std::size_t font) {
  auto it = faces_.find(font);
  if (it != faces_.end()) {
    return it->second.face.get();
  }

  auto loaded = world.font(font);
  if (!loaded || !loaded->data) {
    return nullptr;
  }

  FT_Face raw = nullptr;
  if (FT_New_Memory_Face(library_.get(), loaded->data->data(),
                         static_cast<FT_Long>(loaded->data->size()),
                         static_cast<FT_Long>(loaded->index), &raw) != 0) {
    return nullptr;
  }

  auto &entry = faces_[font];
  entry.data = loaded->data;
  entry.face.reset(raw);
  return raw;
}

double TextEngine::measure(FT_Face face, double size, std::string_view text) {
  FT_Set_Char_Size(face, 0, static_cast<FT_F26Dot6>(size * 64), 72, 72);

  double width = 0.0;
  std::size_t pos = 0;
  while (pos < text.size()) {
    auto cp = utf8::decode(text, pos);
    if (!cp) {
      ++pos;
      continue;
    }
    if (FT_Load_Char(face, *cp, FT_LOAD_DEFAULT) == 0) {
      width += face->glyph->advance.x / 64.0;
    }
  }
  return width;
}

std::expected<Document, std::vector<SourceError>>
TextEngine::compile(const World &world) {
  EvalState state;
  state.font = default_font(world);
  evaluate(world, world.main().id(), state);

  if (!state.errors.empty()) {
    return std::unexpected(std::move(state.errors));
  }

  Document document;
  document.pages.push_back({page_width, page_height, {}});

  const double usable = page_width - 2 * margin;
  double y = margin;

  auto new_page = [&] {
    document.pages.push_back({page_width, page_height, {}});
    y = margin;
  };

  for (const Block &block : state.blocks) {
    if (block.kind == Block::Kind::PageBreak) {
      new_page();
      continue;
    }

    double line_height = block.size * 1.25;
    if (block.text.empty()) {
      y += line_height;
      continue;
    }

    if (!block.font) {
      state.errors.push_back(
          {block.span, "no fonts available (pass --font-path)", {}});
      break;
    }

    FT_Face ft = face(world, *block.font);
    if (!ft) {
      state.errors.push_back(
          {block.span,
           std::format("failed to load font `{}`",
                       world.book().info(*block.font).family),
           {}});
      break;
    }

    // Greedy word wrap.
    std::vector<std::string> lines;
    std::string current;
    std::size_t pos = 0;
    std::string_view text = block.text;
    while (pos < text.size()) {
      std::size_t next = text.find(' ', pos);
      if (next == std::string_view::npos) {
        next = text.size();
      }
      std::string_view word = text.substr(pos, next - pos);
      std::string candidate =
          current.empty() ? std::string(word)
                          : current + " " + std::string(word);
      if (!current.empty() && measure(ft, block.size, candidate) > usable) {
        lines.push_back(std::move(current));
        current = std::string(word);
      } else {
        current = std::move(candidate);
      }
      pos = next + 1;
    }
    lines.push_back(std::move(current));

    for (auto &line : lines) {
      if (y + line_height > page_height - margin &&
          !document.pages.back().runs.empty()) {
        new_page();
      }
      document.pages.back().runs.push_back(
          {*block.font, block.size, margin, y + block.size, std::move(line)});
      y += line_height;
    }
  }

  if (!state.errors.empty()) {
    return std::unexpected(std::move(state.errors));
  }
  return document;
}

Pixmap TextEngine::render(const World &world, const Page &page, float scale) {
  auto width = static_cast<std::uint32_t>(std::ceil(page.width * scale));
  auto height = static_cast<std::uint32_t>(std::ceil(page.height * scale));

  Pixmap pixmap(width, height);
  pixmap.fill(255, 255, 255, 255);

  for (const TextRun &run : page.runs) {
    FT_Face ft = face(world, run.font);
    if (!ft) {
      continue;
    }
    FT_Set_Char_Size(ft, 0, static_cast<FT_F26Dot6>(run.size * scale * 64), 72,
                     72);

    double pen_x = run.x * scale;
    auto baseline = static_cast<long>(std::lround(run.baseline * scale));

    std::size_t pos = 0;
    while (pos < run.text.size()) {
      auto cp = utf8::decode(run.text, pos);
      if (!cp) {
        ++pos;
        continue;
      }
      if (FT_Load_Char(ft, *cp, FT_LOAD_RENDER) != 0) {
        continue;
      }

      const FT_GlyphSlot glyph = ft->glyph;
      const FT_Bitmap &bitmap = glyph->bitmap;
      long left = std::lround(pen_x) + glyph->bitmap_left;
      long top = baseline - glyph->bitmap_top;

      for (unsigned row = 0; row < bitmap.rows; ++row) {
        long py = top + static_cast<long>(row);
        if (py < 0 || py >= static_cast<long>(height)) {
          continue;
        }
        const unsigned char *src =
            bitmap.buffer + static_cast<long>(row) * bitmap.pitch;
        for (unsigned col = 0; col < bitmap.width; ++col) {
          long px = left + static_cast<long>(col);
          if (px < 0 || px >= static_cast<long>(width)) {
            continue;
          }

          unsigned coverage =
              bitmap.pixel_mode == FT_PIXEL_MODE_MONO
                  ? ((src[col / 8] >> (7 - col % 8)) & 1) * 255u
                  : src[col];
          if (coverage == 0) {
            continue;
          }

          // Black ink over an opaque page: only the colour channels change.
          std::uint8_t *dst = pixmap.pixel(static_cast<std::uint32_t>(px),
                                           static_cast<std::uint32_t>(py));
          for (int c = 0; c < 3; ++c) {
            dst[c] = static_cast<std::uint8_t>(dst[c] * (255 - coverage) / 255);
          }
        }
      }

      pen_x += glyph->advance.x / 64.0;
    }
  }

  return pixmap;
}
