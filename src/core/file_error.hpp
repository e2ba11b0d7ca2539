#ifndef FILE_ERROR_HPP
#define FILE_ERROR_HPP

#include <filesystem>
#include <string>
#include <system_error>

namespace fs = std::filesystem;

// Failure to load a single file. Carried as a value next to the result it
// replaces and never thrown across the cache boundary.
class FileError {
public:
  enum class Kind { NotFound, AccessDenied, IsDirectory, InvalidUtf8, Other };

  FileError(Kind kind, fs::path path) : kind_(kind), path_(std::move(path)) {}

  static FileError from_error_code(const std::error_code &ec,
                                   const fs::path &path);
  static FileError from_errno(int err, const fs::path &path);

  Kind kind() const { return kind_; }
  const fs::path &path() const { return path_; }

  std::string message() const;

  bool operator==(const FileError &other) const = default;

private:
  Kind kind_;
  fs::path path_;
};

#endif // FILE_ERROR_HPP
