#ifndef SOURCE_ERROR_HPP
#define SOURCE_ERROR_HPP

#include "source.hpp"
#include <optional>
#include <string>
#include <vector>

// A secondary location explaining how the engine got to an error.
struct Tracepoint {
  std::string message;
  Span span;
};

// An error reported by the document engine, or a failure to load the main
// file, which has no span.
struct SourceError {
  std::optional<Span> span;
  std::string message;
  std::vector<Tracepoint> trace;
};

#endif // SOURCE_ERROR_HPP
