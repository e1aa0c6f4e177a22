#include "strata/storage/local_object_store.hpp"
#include "strata/io/durable_file.hpp"

namespace strata::storage {

using core::error;
using core::error_code;

namespace {

auto valid_key(std::string_view key) -> bool {
  if (key.empty() || key.front() == '/') return false;
  std::size_t start = 0;
  while (start <= key.size()) {
    auto end = key.find('/', start);
    if (end == std::string_view::npos) end = key.size();
    auto part = key.substr(start, end - start);
    if (part.empty() || part == "." || part == "..") return false;
    start = end + 1;
  }
  return true;
}

} // namespace

auto LocalObjectStore::object_path(std::string_view account, std::string_view key) const
    -> std::filesystem::path {
  auto p = root_;
  if (!account.empty()) p /= std::string(account);
  return p / std::string(key);
}

auto LocalObjectStore::put(std::string_view account, std::string_view key,
                           std::span<const std::uint8_t> bytes) -> std::expected<void, error> {
  if (!valid_key(key)) {
    return std::unexpected(error{error_code::invalid_argument, "invalid object key: " + std::string(key),
                                 "storage.object_store"});
  }
  return io::write_file_atomic(object_path(account, key), bytes);
}

auto LocalObjectStore::resolve_account_for_key(std::string_view key) -> std::string {
  const AccountRoute* best = nullptr;
  for (const auto& r : routes_) {
    if (key.starts_with(r.key_prefix) && (!best || r.key_prefix.size() > best->key_prefix.size())) {
      best = &r;
    }
  }
  return best ? best->account : std::string{};
}

auto LocalObjectStore::get(std::string_view account, std::string_view key)
    -> std::expected<std::vector<std::uint8_t>, error> {
  if (!valid_key(key)) {
    return std::unexpected(error{error_code::invalid_argument, "invalid object key: " + std::string(key),
                                 "storage.object_store"});
  }
  return io::read_file_bytes(object_path(account, key));
}

auto LocalObjectStore::exists(std::string_view account, std::string_view key) const -> bool {
  std::error_code ec;
  return valid_key(key) && std::filesystem::is_regular_file(object_path(account, key), ec);
}

} // namespace strata::storage
