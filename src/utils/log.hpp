#pragma once

#include <chrono>
#include <ctime>
#include <iomanip>
#include <ostream>
#include <sstream>
#include <string>
#include <termcolor/termcolor.hpp>

inline std::string get_timestamp() {
  auto now = std::chrono::system_clock::now();
  auto time = std::chrono::system_clock::to_time_t(now);
  std::tm tm = *std::localtime(&time);

  std::stringstream ss;
  ss << std::put_time(&tm, "%H:%M:%S");
  return ss.str();
}

// Writes the coloured "HH:MM:SS " prefix every log line starts with.
inline std::ostream &log_time(std::ostream &os) {
  return os << termcolor::bright_blue << get_timestamp() << termcolor::reset
            << " ";
}
