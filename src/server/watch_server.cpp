#include "watch_server.hpp"
#include "broadcast_hub.hpp"
#include "change_debouncer.hpp"
#include "core/dependency_tracker.hpp"
#include "core/diagnostics.hpp"
#include "core/recompiler.hpp"
#include "core/system_world.hpp"
#include "core/text_engine.hpp"
#include "utils/file_watcher_listener.hpp"
#include "utils/log.hpp"
#include "websocket_server.hpp"
#include <boost/asio/signal_set.hpp>
#include <chrono>
#include <csignal>
#include <efsw/efsw.hpp>
#include <format>
#include <iomanip>
#include <iostream>
#include <stdexcept>
#include <thread>

static fs::path resolve_root(const fs::path &input,
                             const PreviewConfig &config) {
  if (config.root) {
    return *config.root;
  }

  std::error_code ec;
  fs::path canonical = fs::canonical(input, ec);
  if (!ec && canonical.has_parent_path()) {
    return canonical.parent_path();
  }
  return fs::current_path();
}

static void print_ready_row(const std::string &label, const std::string &value) {
  std::cout << termcolor::bright_green << "║  " << termcolor::reset << label
            << termcolor::bright_white << std::setw(28) << std::left << value
            << termcolor::reset << termcolor::bright_green << "║"
            << termcolor::reset << "\n";
}

void start_watch_server(const fs::path &input, const PreviewConfig &config) {
  auto total_start = std::chrono::high_resolution_clock::now();

  std::cout << "\n"
            << termcolor::bright_cyan
            << "╔═══════════════════════════════════════════╗\n"
            << "║        🚀 Starting Preview Server         ║\n"
            << "╚═══════════════════════════════════════════╝"
            << termcolor::reset << "\n\n";

  fs::path root = resolve_root(input, config);

  SystemWorld world(root, config.font_paths, config.system_fonts);
  std::cout << termcolor::bright_green << "✓ " << termcolor::reset
            << "Indexed " << termcolor::bright_white << world.book().size()
            << termcolor::reset << " font faces\n";
  if (world.book().empty()) {
    std::cout << termcolor::bright_yellow << "⚠ Warning: " << termcolor::reset
              << "no fonts found, pass --font-path\n";
  }

  TextEngine engine;
  Recompiler recompiler(world, engine, {config.scale, config.evict_max_age});

  BroadcastHub hub(config.write_timeout);
  WebSocketServer server(hub);

  std::cout << termcolor::bright_cyan << "🔌 Starting WebSocket server..."
            << termcolor::reset << "\n";
  try {
    server.start(config.listen.host, config.listen.port);
  } catch (const std::exception &e) {
    throw std::runtime_error(std::format("Failed to listen on ws://{}: {}",
                                         config.listen.to_string(), e.what()));
  }
  std::cout << termcolor::bright_green << "✓ " << termcolor::reset
            << "WebSocket server running on " << termcolor::bright_white
            << "ws://" << config.listen.to_string() << termcolor::reset
            << "\n";

  auto compile = [&]() {
    try {
      RunResult result = recompiler.run_once(input);
      if (auto *rendered = std::get_if<Rendered>(&result)) {
        if (rendered->pages.empty()) {
          return;
        }
        if (hub.session_count() == 0) {
          std::cout << termcolor::bright_blue << "  ℹ  No viewers connected"
                    << termcolor::reset << "\n";
        }
        hub.broadcast(rendered->pages);
      } else {
        print_diagnostics(std::cerr, world,
                          std::get<Diagnostics>(result).errors);
      }
    } catch (const std::exception &e) {
      std::cerr << termcolor::bright_red
                << "  ✗ Rebuild failed: " << termcolor::reset
                << termcolor::bright_white << e.what() << termcolor::reset
                << "\n\n";
    }
  };

  compile();

  std::cout << "\n"
            << termcolor::bright_cyan << "👁️  Setting up file watcher"
            << termcolor::reset << "\n";

  DependencyTracker tracker(world.cache());
  ChangeDebouncer debouncer(
      config.debounce,
      [&tracker](const FsEvent &event) { return tracker.is_relevant(event); },
      compile);
  WatchListener listener(
      [&debouncer](FsEvent event) { debouncer.push(std::move(event)); });

  efsw::FileWatcher watcher;
  efsw::WatchID watch_id = watcher.addWatch(root.string(), &listener, true);
  if (watch_id < 0) {
    throw std::runtime_error(std::format("Failed to watch {}: {}",
                                         root.string(),
                                         efsw::Errors::Log::getLastErrorLog()));
  }
  watcher.watch();

  std::cout << termcolor::bright_green << "  ✓ " << termcolor::reset
            << "Watching " << termcolor::bright_white << root.string()
            << termcolor::reset << "\n";

  auto total_duration = std::chrono::duration_cast<std::chrono::milliseconds>(
      std::chrono::high_resolution_clock::now() - total_start);

  std::cout << "\n"
            << termcolor::bright_green
            << "╔═══════════════════════════════════════════╗\n"
            << "║           ✨ Server Ready!                ║\n"
            << "╠═══════════════════════════════════════════╣"
            << termcolor::reset << "\n";
  print_ready_row("WebSocket:  ", "ws://" + config.listen.to_string());
  print_ready_row("Input:      ", input.filename().string());
  print_ready_row("Fonts:      ", std::to_string(world.book().size()));
  print_ready_row("Debounce:   ",
                  std::to_string(config.debounce.count()) + "ms");
  print_ready_row("Started in: ", std::to_string(total_duration.count()) + "ms");
  std::cout << termcolor::bright_green
            << "╚═══════════════════════════════════════════╝"
            << termcolor::reset << "\n\n";

  std::cout << termcolor::bright_blue << "Press Ctrl+C to stop server..."
            << termcolor::reset << "\n\n";

  net::io_context signal_ioc;
  net::signal_set signals(signal_ioc, SIGINT, SIGTERM);
  signals.async_wait([&debouncer](const beast::error_code &ec, int) {
    if (!ec) {
      debouncer.stop();
    }
  });
  std::thread signal_thread([&signal_ioc]() { signal_ioc.run(); });

  debouncer.run();

  signal_ioc.stop();
  if (signal_thread.joinable()) {
    signal_thread.join();
  }

  std::cout << "\n"
            << termcolor::bright_yellow << "⏳ Shutting down..."
            << termcolor::reset << "\n";

  watcher.removeWatch(watch_id);
  server.stop();

  std::cout << termcolor::bright_green << "✓ " << termcolor::reset
            << "Preview server stopped cleanly\n\n";
}
