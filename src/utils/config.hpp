#ifndef CONFIG_HPP
#define CONFIG_HPP

#include <chrono>
#include <cstddef>
#include <filesystem>
#include <optional>
#include <string>
#include <vector>
#include <yaml-cpp/yaml.h>

namespace fs = std::filesystem;

struct ListenAddress {
  std::string host = "127.0.0.1";
  unsigned short port = 23625;

  // Parses "host:port"; IPv6 hosts are written in brackets ("[::1]:80").
  static ListenAddress parse(const std::string &text);

  std::string to_string() const;
};

class PreviewConfig {
public:
  static constexpr const char *default_file = "pagecast.yaml";

  ListenAddress listen;
  std::optional<fs::path> root;
  std::vector<fs::path> font_paths;
  bool system_fonts = true;

  std::chrono::milliseconds debounce{50};
  std::chrono::milliseconds write_timeout{5000};
  float scale = 2.0f;
  std::size_t evict_max_age = 30;

  static PreviewConfig load(const fs::path &config_path);
  static PreviewConfig from_yaml(const YAML::Node &yaml);

  // Reads `explicit_path` when given (it must exist), otherwise the default
  // file in the working directory when present, otherwise built-in defaults.
  static PreviewConfig
  discover(const std::optional<fs::path> &explicit_path);
};

#endif
