#include "strata/wal/wal_path.hpp"

#include <algorithm>
#include <cctype>
#include <vector>

namespace strata::wal {

using core::error;
using core::error_code;

namespace {

// files, org, type, stream, thread_id, YYYY, MM, DD, name
constexpr std::size_t MIN_SEGMENT_COMPONENTS = 9;

auto split(std::string_view s) -> std::vector<std::string_view> {
  std::vector<std::string_view> out;
  std::size_t start = 0;
  while (start <= s.size()) {
    auto end = s.find('/', start);
    if (end == std::string_view::npos) end = s.size();
    out.push_back(s.substr(start, end - start));
    start = end + 1;
  }
  return out;
}

auto join(const std::vector<std::string_view>& parts, std::size_t skip, std::size_t count) -> std::string {
  std::string out;
  bool first = true;
  for (std::size_t i = 0; i < count; ++i) {
    if (i == skip) continue;
    if (!first) out.push_back('/');
    out.append(parts[i]);
    first = false;
  }
  return out;
}

auto all_digits(std::string_view s) -> bool {
  return !s.empty() && std::all_of(s.begin(), s.end(), [](unsigned char c){ return std::isdigit(c) != 0; });
}

auto invalid(std::string_view key, const char* why) -> error {
  return error{error_code::invalid_argument, std::string("invalid segment key '") + std::string(key) + "': " + why,
               "wal.path"};
}

auto checked_components(std::string_view key) -> std::expected<std::vector<std::string_view>, error> {
  auto parts = split(key);
  if (parts.size() < MIN_SEGMENT_COMPONENTS) return std::unexpected(invalid(key, "too few components"));
  if (parts[0] != "files") return std::unexpected(invalid(key, "missing files/ prefix"));
  for (auto p : parts) {
    if (p.empty() || p == "." || p == "..") return std::unexpected(invalid(key, "empty or relative component"));
  }
  if (!all_digits(parts[THREAD_ID_COMPONENT])) return std::unexpected(invalid(key, "thread id is not numeric"));
  if (!stream::parse_stream_type(parts[2])) return std::unexpected(invalid(key, "unknown stream type"));
  return parts;
}

} // namespace

auto segment_key(const std::filesystem::path& wal_root, const std::filesystem::path& file)
    -> std::expected<std::string, error> {
  namespace fs = std::filesystem;
  std::error_code ec;
  const auto root = fs::weakly_canonical(wal_root, ec);
  if (ec) {
    return std::unexpected(error{error_code::io_failed, "canonicalize failed: " + wal_root.string(), "wal.path"});
  }
  const auto abs = fs::weakly_canonical(file, ec);
  if (ec) {
    return std::unexpected(error{error_code::io_failed, "canonicalize failed: " + file.string(), "wal.path"});
  }
  auto rel = abs.lexically_relative(root);
  if (rel.empty() || *rel.begin() == "..") {
    return std::unexpected(error{error_code::invalid_argument,
                                 "path outside WAL root: " + file.string(), "wal.path"});
  }
  return rel.generic_string();
}

auto partition_key(std::string_view segment_key) -> std::expected<std::string, error> {
  auto parts = checked_components(segment_key);
  if (!parts) return std::unexpected(parts.error());
  return join(*parts, THREAD_ID_COMPONENT, parts->size() - 1);
}

auto split_prefix(std::string_view partition_key) -> std::expected<PartitionPrefix, error> {
  auto parts = split(partition_key);
  if (parts.size() < 7 || parts[0] != "files") {
    return std::unexpected(error{error_code::invalid_argument,
                                 "invalid partition key '" + std::string(partition_key) + "'", "wal.path"});
  }
  auto type = stream::parse_stream_type(parts[2]);
  if (!type) {
    return std::unexpected(error{error_code::invalid_argument,
                                 "unknown stream type in '" + std::string(partition_key) + "'", "wal.path"});
  }
  PartitionPrefix p{};
  p.org = std::string(parts[1]);
  p.stream_type = *type;
  p.stream_name = std::string(parts[3]);
  p.date.append(parts[4]).append("-").append(parts[5]).append("-").append(parts[6]);
  return p;
}

auto storage_file_name(std::string_view segment_key) -> std::expected<std::string, error> {
  auto parts = checked_components(segment_key);
  if (!parts) return std::unexpected(parts.error());
  return join(*parts, THREAD_ID_COMPONENT, parts->size());
}

} // namespace strata::wal
