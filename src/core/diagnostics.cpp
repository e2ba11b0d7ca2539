#include "diagnostics.hpp"
#include "utf8.hpp"
#include <algorithm>
#include <string>
#include <string_view>
#include <termcolor/termcolor.hpp>

static constexpr std::size_t tab_width = 2;

static std::string expand_tabs(std::string_view line) {
  std::string out;
  for (char c : line) {
    if (c == '\t') {
      out.append(tab_width, ' ');
    } else {
      out.push_back(c);
    }
  }
  return out;
}

static void print_location(std::ostream &os, const World &world,
                           const Span &span) {
  const Source &source = world.source(span.source);

  auto line = source.byte_to_line(span.start);
  auto column = source.byte_to_column(span.start);
  auto range = line ? source.line_to_range(*line) : std::nullopt;
  if (!line || !column || !range) {
    return;
  }

  std::string number = std::to_string(*line + 1);
  std::string gutter(number.size(), ' ');
  std::string_view text = source.text();
  std::string_view line_text = text.substr(range->first,
                                           range->second - range->first);

  os << gutter << " " << termcolor::bright_blue << "┌─ " << termcolor::reset
     << source.path().string() << ":" << (*line + 1) << ":" << (*column + 1)
     << "\n";
  os << gutter << " " << termcolor::bright_blue << "│" << termcolor::reset
     << "\n";
  os << termcolor::bright_blue << number << " │ " << termcolor::reset
     << expand_tabs(line_text) << "\n";

  std::size_t end = std::clamp(span.end, span.start, range->second);
  std::size_t lead =
      utf8::count(expand_tabs(text.substr(range->first,
                                          span.start - range->first)));
  std::size_t width = std::max<std::size_t>(
      1, utf8::count(expand_tabs(text.substr(span.start, end - span.start))));

  os << gutter << " " << termcolor::bright_blue << "│ " << termcolor::reset
     << std::string(lead, ' ') << termcolor::bright_red
     << std::string(width, '^') << termcolor::reset << "\n";
}

void print_diagnostics(std::ostream &os, const World &world,
                       const std::vector<SourceError> &errors) {
  for (const SourceError &error : errors) {
    os << termcolor::bright_red << "error" << termcolor::reset << ": "
       << termcolor::bright_white << error.message << termcolor::reset << "\n";
    if (error.span) {
      print_location(os, world, *error.span);
    }
    os << "\n";

    for (const Tracepoint &point : error.trace) {
      os << termcolor::bright_cyan << "help" << termcolor::reset << ": "
         << point.message << "\n";
      print_location(os, world, point.span);
      os << "\n";
    }
  }
}
