#ifndef RECOMPILER_HPP
#define RECOMPILER_HPP

#include "document_engine.hpp"
#include "pixmap.hpp"
#include "source_error.hpp"
#include "system_world.hpp"
#include <cstddef>
#include <filesystem>
#include <variant>
#include <vector>

namespace fs = std::filesystem;

struct Rendered {
  std::vector<Pixmap> pages;
};

struct Diagnostics {
  std::vector<SourceError> errors;
};

using RunResult = std::variant<Rendered, Diagnostics>;

struct RecompileOptions {
  float scale = 2.0f;
  std::size_t evict_max_age = 30;
};

// Runs one full compilation against a fresh cache generation. Owns the only
// code path that resets the world's cache.
class Recompiler {
public:
  Recompiler(SystemWorld &world, DocumentEngine &engine,
             RecompileOptions options = {});

  RunResult run_once(const fs::path &input);

  std::size_t cycles() const { return cycles_; }

private:
  SystemWorld &world_;
  DocumentEngine &engine_;
  RecompileOptions options_;
  std::size_t cycles_ = 0;
};

#endif // RECOMPILER_HPP
