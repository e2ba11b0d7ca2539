#include "core/font_book.hpp"
#include "core/font_search.hpp"
#include "server/watch_server.hpp"
#include "utils/config.hpp"
#include <filesystem>
#include <iostream>
#include <optional>
#include <stdexcept>
#include <string>
#include <vector>

namespace fs = std::filesystem;

void print_usage() {
  std::cout << "pagecast - Live page preview over WebSocket\n\n";
  std::cout << "Commands:\n";
  std::cout << "  pagecast watch <input> [options]   Compile, watch and "
               "stream pages\n";
  std::cout << "  pagecast fonts [options]           List available fonts\n";
  std::cout << "  pagecast --help                    Show this help\n\n";
  std::cout << "Options:\n";
  std::cout << "  --root <dir>        Root directory for absolute paths\n";
  std::cout << "  --font-path <dir>   Additional font directory (repeatable)\n";
  std::cout << "  --host <host:port>  Listen address (default "
               "127.0.0.1:23625)\n";
  std::cout << "  --config <file>     Configuration file (default "
            << PreviewConfig::default_file << " if present)\n";
  std::cout << "  --variants          List style, weight and stretch of each "
               "font\n";
}

struct Arguments {
  std::string command;
  std::optional<fs::path> input;
  std::optional<fs::path> root;
  std::optional<std::string> host;
  std::optional<fs::path> config;
  std::vector<fs::path> font_paths;
  bool variants = false;
};

static Arguments parse_arguments(int argc, char *argv[]) {
  Arguments args;
  args.command = argv[1];

  auto value = [&](int &i, const std::string &flag) -> std::string {
    if (i + 1 >= argc) {
      throw std::runtime_error("Missing value for " + flag);
    }
    return argv[++i];
  };

  for (int i = 2; i < argc; ++i) {
    std::string arg = argv[i];
    if (arg == "--root") {
      args.root = value(i, arg);
    } else if (arg == "--font-path") {
      args.font_paths.emplace_back(value(i, arg));
    } else if (arg == "--host") {
      args.host = value(i, arg);
    } else if (arg == "--config") {
      args.config = value(i, arg);
    } else if (arg == "--variants") {
      args.variants = true;
    } else if (!arg.starts_with("--") && !args.input) {
      args.input = arg;
    } else {
      throw std::runtime_error("Unexpected argument: " + arg);
    }
  }

  return args;
}

int main(int argc, char *argv[]) {
  if (argc < 2) {
    print_usage();
    return 1;
  }

  std::string command = argv[1];

  if (command == "--help" || command == "-h") {
    print_usage();
    return 0;
  }

  try {
    Arguments args = parse_arguments(argc, argv);
    PreviewConfig config = PreviewConfig::discover(args.config);

    if (args.root) {
      config.root = args.root;
    }
    if (args.host) {
      config.listen = ListenAddress::parse(*args.host);
    }
    config.font_paths.insert(config.font_paths.end(), args.font_paths.begin(),
                             args.font_paths.end());

    if (command == "watch") {
      if (!args.input) {
        std::cerr << "Missing input file\n";
        print_usage();
        return 1;
      }
      start_watch_server(*args.input, config);
    } else if (command == "fonts") {
      FontSearcher searcher;
      if (config.system_fonts) {
        searcher.search_system();
      }
      for (const auto &path : config.font_paths) {
        searcher.search_dir(path);
      }
      print_families(std::cout, searcher.book(), args.variants);
    } else {
      std::cerr << "Unknown command: " << command << std::endl;
      print_usage();
      return 1;
    }

  } catch (const std::exception &e) {
    std::cerr << "Fatal error: " << e.what() << std::endl;
    return 1;
  }

  return 0;
}
