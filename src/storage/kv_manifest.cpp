#include "strata/storage/kv_manifest.hpp"
#include "strata/io/durable_file.hpp"

#include <fstream>
#include <sstream>

namespace strata::storage {

using core::error;
using core::error_code;

auto escape_value(std::string_view v) -> std::string {
  static constexpr char HEX[] = "0123456789ABCDEF";
  std::string out;
  out.reserve(v.size());
  for (unsigned char c : v) {
    if (c <= 0x20 || c == 0x7F || c == '=' || c == '%') {
      out.push_back('%');
      out.push_back(HEX[c >> 4]);
      out.push_back(HEX[c & 0xF]);
    } else {
      out.push_back(static_cast<char>(c));
    }
  }
  return out;
}

auto unescape_value(std::string_view v) -> std::expected<std::string, error> {
  auto hex = [](char c) -> int {
    if (c >= '0' && c <= '9') return c - '0';
    if (c >= 'A' && c <= 'F') return c - 'A' + 10;
    if (c >= 'a' && c <= 'f') return c - 'a' + 10;
    return -1;
  };
  std::string out;
  out.reserve(v.size());
  for (std::size_t i = 0; i < v.size(); ++i) {
    if (v[i] != '%') { out.push_back(v[i]); continue; }
    if (i + 2 >= v.size()) {
      return std::unexpected(error{error_code::data_integrity, "truncated escape", "storage.manifest"});
    }
    const int hi = hex(v[i + 1]);
    const int lo = hex(v[i + 2]);
    if (hi < 0 || lo < 0) {
      return std::unexpected(error{error_code::data_integrity, "invalid escape", "storage.manifest"});
    }
    out.push_back(static_cast<char>((hi << 4) | lo));
    i += 2;
  }
  return out;
}

auto load_kv_manifest(const std::filesystem::path& path, std::string_view header)
    -> std::expected<std::vector<KvLine>, error> {
  std::vector<KvLine> lines;
  std::error_code ec;
  if (!std::filesystem::exists(path, ec)) return lines;
  std::ifstream in(path);
  if (!in.good()) {
    return std::unexpected(error{error_code::io_failed, "manifest open failed: " + path.string(), "storage.manifest"});
  }
  std::string first;
  std::getline(in, first);
  if (first != header) {
    return std::unexpected(error{error_code::data_integrity, "bad manifest header: " + path.string(), "storage.manifest"});
  }
  std::string line;
  std::size_t line_no = 1;
  while (std::getline(in, line)) {
    ++line_no;
    if (line.empty()) continue;
    KvLine kv;
    std::istringstream iss(line);
    std::string tok;
    while (iss >> tok) {
      auto eq = tok.find('=');
      if (eq == std::string::npos || eq == 0) {
        return std::unexpected(error{error_code::data_integrity,
                                     "manifest parse error at line " + std::to_string(line_no) + ": expected key=value",
                                     "storage.manifest"});
      }
      auto value = unescape_value(std::string_view(tok).substr(eq + 1));
      if (!value) {
        return std::unexpected(error{error_code::data_integrity,
                                     "manifest parse error at line " + std::to_string(line_no) + ": " + value.error().message,
                                     "storage.manifest"});
      }
      kv[tok.substr(0, eq)] = std::move(*value);
    }
    lines.push_back(std::move(kv));
  }
  return lines;
}

auto save_kv_manifest(const std::filesystem::path& path, std::string_view header,
                      const std::vector<KvLine>& lines) -> std::expected<void, error> {
  std::string content;
  content.reserve(32 + lines.size() * 96);
  content.append(header).append("\n");
  for (const auto& kv : lines) {
    bool first = true;
    for (const auto& [k, v] : kv) {
      if (!first) content.push_back(' ');
      first = false;
      content.append(k).append("=").append(escape_value(v));
    }
    content.append("\n");
  }
  return io::write_file_atomic(path, std::string_view(content));
}

} // namespace strata::storage
