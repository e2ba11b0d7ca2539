#include "recompiler.hpp"
#include "utils/log.hpp"
#include <chrono>
#include <iostream>

Recompiler::Recompiler(SystemWorld &world, DocumentEngine &engine,
                       RecompileOptions options)
    : world_(world), engine_(engine), options_(options) {}

RunResult Recompiler::run_once(const fs::path &input) {
  auto start = std::chrono::high_resolution_clock::now();
  ++cycles_;

  log_time(std::cout) << termcolor::bright_cyan << "🔨 " << input.string()
                      << termcolor::reset << ": compiling ...\n";

  auto elapsed = [&start] {
    return std::chrono::duration_cast<std::chrono::milliseconds>(
               std::chrono::high_resolution_clock::now() - start)
        .count();
  };

  world_.reset();

  RunResult result;
  auto main = world_.resolve(input);
  if (!main) {
    result = Diagnostics{{SourceError{std::nullopt, main.error().message(), {}}}};
  } else {
    world_.set_main(*main);

    auto document = engine_.compile(world_);
    if (document) {
      Rendered rendered;
      rendered.pages.reserve(document->pages.size());
      for (const Page &page : document->pages) {
        rendered.pages.push_back(engine_.render(world_, page, options_.scale));
      }
      result = std::move(rendered);
    } else {
      result = Diagnostics{std::move(document.error())};
    }
  }

  engine_.evict(options_.evict_max_age);

  if (const auto *rendered = std::get_if<Rendered>(&result)) {
    std::cout << termcolor::bright_green << "  ✓ " << termcolor::reset
              << input.string() << ": compiled successfully in "
              << termcolor::bright_white << elapsed() << "ms"
              << termcolor::reset << termcolor::bright_blue << " ("
              << rendered->pages.size()
              << (rendered->pages.size() == 1 ? " page" : " pages") << ")"
              << termcolor::reset << "\n";
  } else {
    std::cerr << termcolor::bright_red << "  ✗ " << termcolor::reset
              << input.string() << ": compiled with errors in "
              << termcolor::bright_white << elapsed() << "ms"
              << termcolor::reset << "\n";
  }

  return result;
}
