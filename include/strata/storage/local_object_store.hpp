#pragma once

/** \file local_object_store.hpp
 *  \brief Filesystem-backed object storage.
 *
 * Objects live at <root>/<account>/<key> (the account directory is omitted
 * for the default account ""). Puts are atomic replacements, so re-uploading
 * a key is idempotent. Accounts are resolved from key prefixes: the longest
 * configured prefix wins; unmatched keys use the default account.
 */

#include <expected>
#include <filesystem>
#include <string>
#include <utility>
#include <vector>

#include "strata/compact/services.hpp"

namespace strata::storage {

struct AccountRoute {
  std::string key_prefix;
  std::string account;
};

class LocalObjectStore final : public compact::ObjectStorage {
public:
  explicit LocalObjectStore(std::filesystem::path root, std::vector<AccountRoute> routes = {})
      : root_(std::move(root)), routes_(std::move(routes)) {}

  auto put(std::string_view account, std::string_view key, std::span<const std::uint8_t> bytes)
      -> std::expected<void, core::error> override;
  auto resolve_account_for_key(std::string_view key) -> std::string override;

  auto get(std::string_view account, std::string_view key)
      -> std::expected<std::vector<std::uint8_t>, core::error>;
  auto exists(std::string_view account, std::string_view key) const -> bool;
  auto object_path(std::string_view account, std::string_view key) const -> std::filesystem::path;

private:
  std::filesystem::path root_;
  std::vector<AccountRoute> routes_;
};

} // namespace strata::storage
