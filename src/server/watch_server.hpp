#ifndef WATCH_SERVER_HPP
#define WATCH_SERVER_HPP

#include "utils/config.hpp"
#include <filesystem>

namespace fs = std::filesystem;

// Compile `input`, serve renders to viewers and recompile on every relevant
// change below the root until SIGINT/SIGTERM.
void start_watch_server(const fs::path &input, const PreviewConfig &config);

#endif // WATCH_SERVER_HPP
