#include "strata/io/durable_file.hpp"

#include <fstream>
#include <string>
#include <system_error>

#if defined(__linux__) || defined(__APPLE__)
#include <fcntl.h>
#include <unistd.h>
#endif

namespace strata::io {

using core::error;
using core::error_code;

auto sync_directory(const std::filesystem::path& dir) -> void {
#if defined(__linux__) || defined(__APPLE__)
  int dfd = ::open(dir.c_str(), O_RDONLY);
  if (dfd >= 0) { (void)::fsync(dfd); (void)::close(dfd); }
#else
  (void)dir;
#endif
}

auto write_file_atomic(const std::filesystem::path& path, std::span<const std::uint8_t> bytes)
    -> std::expected<void, error> {
  namespace fs = std::filesystem;
  const auto parent = path.parent_path();
  std::error_code ec;
  if (!parent.empty()) {
    fs::create_directories(parent, ec);
    if (ec) {
      return std::unexpected(error{error_code::io_failed,
                                   "create directories failed for " + parent.string() + ": " + ec.message(),
                                   "io.durable_file"});
    }
  }
  auto tmp = path;
  tmp += ".tmp";
  fs::remove(tmp, ec); // leftover from a crashed write

#if defined(__linux__) || defined(__APPLE__)
  int fd = ::open(tmp.c_str(), O_CREAT | O_TRUNC | O_WRONLY, 0644);
  if (fd < 0) {
    return std::unexpected(error{error_code::io_failed, "tmp open failed: " + tmp.string(), "io.durable_file"});
  }
  std::size_t written = 0;
  while (written < bytes.size()) {
    ssize_t n = ::write(fd, bytes.data() + written, bytes.size() - written);
    if (n < 0) {
      ::close(fd);
      fs::remove(tmp, ec);
      return std::unexpected(error{error_code::io_failed, "tmp write failed: " + tmp.string(), "io.durable_file"});
    }
    written += static_cast<std::size_t>(n);
  }
  if (::fsync(fd) != 0) {
    ::close(fd);
    fs::remove(tmp, ec);
    return std::unexpected(error{error_code::io_failed, "tmp fsync failed: " + tmp.string(), "io.durable_file"});
  }
  (void)::close(fd);
#else
  {
    std::ofstream out(tmp, std::ios::binary | std::ios::trunc);
    if (!out.good()) {
      return std::unexpected(error{error_code::io_failed, "tmp open failed: " + tmp.string(), "io.durable_file"});
    }
    out.write(reinterpret_cast<const char*>(bytes.data()), static_cast<std::streamsize>(bytes.size()));
    out.flush();
    if (!out.good()) {
      return std::unexpected(error{error_code::io_failed, "tmp write failed: " + tmp.string(), "io.durable_file"});
    }
  }
#endif

  fs::rename(tmp, path, ec);
  if (ec) {
    fs::remove(tmp, ec);
    return std::unexpected(error{error_code::io_failed, "rename failed: " + path.string(), "io.durable_file"});
  }
  sync_directory(parent.empty() ? fs::path(".") : parent);
  return {};
}

auto write_file_atomic(const std::filesystem::path& path, std::string_view text)
    -> std::expected<void, error> {
  return write_file_atomic(path, std::span<const std::uint8_t>(
      reinterpret_cast<const std::uint8_t*>(text.data()), text.size()));
}

auto read_file_bytes(const std::filesystem::path& path)
    -> std::expected<std::vector<std::uint8_t>, error> {
  std::error_code ec;
  if (!std::filesystem::exists(path, ec)) {
    return std::unexpected(error{error_code::not_found, "no such file: " + path.string(), "io.durable_file"});
  }
  std::ifstream in(path, std::ios::binary);
  if (!in.good()) {
    return std::unexpected(error{error_code::io_failed, "open failed: " + path.string(), "io.durable_file"});
  }
  in.seekg(0, std::ios::end);
  const auto size = static_cast<std::size_t>(in.tellg());
  in.seekg(0, std::ios::beg);
  std::vector<std::uint8_t> bytes(size);
  if (size > 0) {
    in.read(reinterpret_cast<char*>(bytes.data()), static_cast<std::streamsize>(size));
    if (static_cast<std::size_t>(in.gcount()) != size) {
      return std::unexpected(error{error_code::io_eof, "short read: " + path.string(), "io.durable_file"});
    }
  }
  return bytes;
}

} // namespace strata::io
