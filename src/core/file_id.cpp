#include "file_id.hpp"
#include <boost/container_hash/hash.hpp>
#include <cerrno>
#include <sys/stat.h>

std::expected<FileId, FileError> FileId::resolve(const fs::path &path) {
  struct stat info {};
  if (::stat(path.c_str(), &info) != 0) {
    return std::unexpected(FileError::from_errno(errno, path));
  }

  std::size_t seed = 0;
  boost::hash_combine(seed, static_cast<std::uint64_t>(info.st_dev));
  boost::hash_combine(seed, static_cast<std::uint64_t>(info.st_ino));
  return FileId(static_cast<std::uint64_t>(seed));
}
