#include "file_error.hpp"
#include <cerrno>
#include <format>

FileError FileError::from_error_code(const std::error_code &ec,
                                     const fs::path &path) {
  if (ec == std::errc::no_such_file_or_directory ||
      ec == std::errc::not_a_directory) {
    return FileError(Kind::NotFound, path);
  }
  if (ec == std::errc::permission_denied ||
      ec == std::errc::operation_not_permitted) {
    return FileError(Kind::AccessDenied, path);
  }
  if (ec == std::errc::is_a_directory) {
    return FileError(Kind::IsDirectory, path);
  }
  return FileError(Kind::Other, path);
}

FileError FileError::from_errno(int err, const fs::path &path) {
  return from_error_code(std::error_code(err, std::generic_category()), path);
}

std::string FileError::message() const {
  switch (kind_) {
  case Kind::NotFound:
    return std::format("file not found (searched at {})", path_.string());
  case Kind::AccessDenied:
    return std::format("failed to load file {} (access denied)",
                       path_.string());
  case Kind::IsDirectory:
    return std::format("failed to load file {} (is a directory)",
                       path_.string());
  case Kind::InvalidUtf8:
    return std::format("file {} is not valid utf-8", path_.string());
  case Kind::Other:
    break;
  }
  return std::format("failed to load file {}", path_.string());
}
