#pragma once

/** \file stream_registry.hpp
 *  \brief Stream schema/settings lookup used by the compactor.
 *
 * StreamMetadataService is the seam the engine depends on; StreamRegistry is
 * an in-process implementation (thread-safe) that the compactor tool and the
 * tests populate directly or from a definition file.
 *
 * Definition file format (one statement per line, '#' comments):
 *   stream <org> <type> <name>
 *   field <name> <int64|float64|boolean|utf8>
 *   set <key> <value>      keys: retention_days, field_limit, store_original,
 *                          index_original_data, index_all_values,
 *                          bloom_filter_fields, fts_fields, index_fields,
 *                          defined_schema_fields (comma separated lists)
 *   deleting
 * `field`, `set` and `deleting` apply to the most recent `stream` line.
 */

#include <cstdint>
#include <expected>
#include <filesystem>
#include <map>
#include <set>
#include <shared_mutex>
#include <string>
#include <string_view>
#include <tuple>
#include <vector>

#include "strata/error.hpp"
#include "strata/format/schema.hpp"
#include "strata/stream/stream_type.hpp"

namespace strata::stream {

struct StreamSettings {
  std::int64_t data_retention{0};                   // days; 0 -> global default
  std::size_t field_limit{0};                        // 0 -> global file_move_fields_limit
  std::vector<std::string> bloom_filter_fields;
  std::vector<std::string> full_text_search_keys;
  std::vector<std::string> index_fields;
  std::vector<std::string> defined_schema_fields;
  bool store_original_data{false};
  bool index_original_data{false};
  bool index_all_values{false};

  friend bool operator==(const StreamSettings&, const StreamSettings&) = default;
};

/** \brief Latest schema of a stream plus the settings stored alongside it. */
struct StreamSchema {
  format::Schema schema;
  StreamSettings settings;
};

inline auto get_stream_settings(const StreamSchema& s) -> const StreamSettings& { return s.settings; }

class StreamMetadataService {
public:
  virtual ~StreamMetadataService() = default;

  /** \brief An unknown stream yields an empty schema, not an error. */
  virtual auto get_latest_schema(std::string_view org, StreamType type, std::string_view stream)
      -> std::expected<StreamSchema, core::error> = 0;

  virtual auto is_stream_being_deleted(std::string_view org, StreamType type, std::string_view stream)
      -> bool = 0;
};

class StreamRegistry final : public StreamMetadataService {
public:
  auto get_latest_schema(std::string_view org, StreamType type, std::string_view stream)
      -> std::expected<StreamSchema, core::error> override;
  auto is_stream_being_deleted(std::string_view org, StreamType type, std::string_view stream)
      -> bool override;

  auto upsert(std::string_view org, StreamType type, std::string_view stream,
              format::Schema schema, StreamSettings settings = {}) -> void;
  auto drop(std::string_view org, StreamType type, std::string_view stream) -> void;
  auto mark_deleting(std::string_view org, StreamType type, std::string_view stream) -> void;
  auto clear_deleting(std::string_view org, StreamType type, std::string_view stream) -> void;
  [[nodiscard]] auto size() const -> std::size_t;

private:
  using Key = std::tuple<std::string, StreamType, std::string>;
  static auto make_key(std::string_view org, StreamType type, std::string_view stream) -> Key;

  mutable std::shared_mutex mutex_;
  std::map<Key, StreamSchema> streams_;
  std::set<Key> deleting_;
};

auto load_stream_registry(const std::filesystem::path& path, StreamRegistry& into)
    -> std::expected<void, core::error>;

/** \brief Project a stream schema onto its defined fields.
 *
 * Keeps `_timestamp` and every defined field present in `schema`, plus
 * `_original` and `_o2_id` when original data is stored or indexed, and
 * `_all_values` when all values are indexed. An empty defined-field list
 * returns `schema` unchanged.
 */
auto generate_schema_for_defined_fields(const format::Schema& schema, const StreamSettings& settings)
    -> format::Schema;

} // namespace strata::stream
