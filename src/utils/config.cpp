#include "config.hpp"
#include <charconv>
#include <format>
#include <stdexcept>

ListenAddress ListenAddress::parse(const std::string &text) {
  std::size_t colon = text.rfind(':');
  if (colon == std::string::npos || colon == 0 || colon + 1 == text.size()) {
    throw std::runtime_error(
        std::format("Invalid listen address '{}', expected host:port", text));
  }

  ListenAddress address;
  address.host = text.substr(0, colon);
  if (address.host.size() > 2 && address.host.front() == '[' &&
      address.host.back() == ']') {
    address.host = address.host.substr(1, address.host.size() - 2);
  }

  std::string port = text.substr(colon + 1);
  unsigned value = 0;
  auto [ptr, ec] = std::from_chars(port.data(), port.data() + port.size(), value);
  if (ec != std::errc() || ptr != port.data() + port.size() || value == 0 ||
      value > 65535) {
    throw std::runtime_error(
        std::format("Invalid port '{}' in listen address '{}'", port, text));
  }
  address.port = static_cast<unsigned short>(value);
  return address;
}

std::string ListenAddress::to_string() const {
  if (host.find(':') != std::string::npos) {
    return std::format("[{}]:{}", host, port);
  }
  return std::format("{}:{}", host, port);
}

PreviewConfig PreviewConfig::from_yaml(const YAML::Node &yaml) {
  PreviewConfig config;

  if (yaml["host"])
    config.listen = ListenAddress::parse(yaml["host"].as<std::string>());
  if (yaml["root"])
    config.root = yaml["root"].as<std::string>();

  if (yaml["font_paths"]) {
    for (const auto &item : yaml["font_paths"]) {
      config.font_paths.emplace_back(item.as<std::string>());
    }
  }
  if (yaml["system_fonts"])
    config.system_fonts = yaml["system_fonts"].as<bool>();

  if (yaml["debounce_ms"]) {
    auto ms = yaml["debounce_ms"].as<long>();
    if (ms <= 0) {
      throw std::runtime_error("debounce_ms must be positive");
    }
    config.debounce = std::chrono::milliseconds(ms);
  }

  if (yaml["write_timeout_ms"]) {
    auto ms = yaml["write_timeout_ms"].as<long>();
    if (ms <= 0) {
      throw std::runtime_error("write_timeout_ms must be positive");
    }
    config.write_timeout = std::chrono::milliseconds(ms);
  }

  if (yaml["scale"]) {
    config.scale = yaml["scale"].as<float>();
    if (!(config.scale > 0.0f)) {
      throw std::runtime_error("scale must be positive");
    }
  }

  if (yaml["evict_max_age"])
    config.evict_max_age = yaml["evict_max_age"].as<std::size_t>();

  return config;
}

PreviewConfig PreviewConfig::load(const fs::path &config_path) {
  if (!fs::exists(config_path)) {
    throw std::runtime_error("Config file not found: " + config_path.string());
  }

  PreviewConfig config;
  try {
    config = from_yaml(YAML::LoadFile(config_path.string()));
  } catch (const YAML::Exception &e) {
    throw std::runtime_error(std::format("Failed to parse {}: {}",
                                         config_path.string(), e.what()));
  }

  // Relative paths in the file are relative to the file.
  fs::path base = config_path.parent_path();
  if (config.root && config.root->is_relative()) {
    config.root = base / *config.root;
  }
  for (auto &path : config.font_paths) {
    if (path.is_relative()) {
      path = base / path;
    }
  }

  return config;
}

PreviewConfig
PreviewConfig::discover(const std::optional<fs::path> &explicit_path) {
  if (explicit_path) {
    return load(*explicit_path);
  }
  if (fs::exists(default_file)) {
    return load(default_file);
  }
  return PreviewConfig{};
}
