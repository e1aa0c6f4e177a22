#include "strata/stream/stream_registry.hpp"

#include <algorithm>
#include <charconv>
#include <fstream>
#include <mutex>
#include <sstream>
#include <unordered_set>

namespace strata::stream {

using core::error;
using core::error_code;

auto StreamRegistry::make_key(std::string_view org, StreamType type, std::string_view stream) -> Key {
  return Key{std::string(org), type, std::string(stream)};
}

auto StreamRegistry::get_latest_schema(std::string_view org, StreamType type, std::string_view stream)
    -> std::expected<StreamSchema, error> {
  std::shared_lock lock(mutex_);
  auto it = streams_.find(make_key(org, type, stream));
  if (it == streams_.end()) return StreamSchema{};
  return it->second;
}

auto StreamRegistry::is_stream_being_deleted(std::string_view org, StreamType type, std::string_view stream)
    -> bool {
  std::shared_lock lock(mutex_);
  return deleting_.contains(make_key(org, type, stream));
}

auto StreamRegistry::upsert(std::string_view org, StreamType type, std::string_view stream,
                            format::Schema schema, StreamSettings settings) -> void {
  std::unique_lock lock(mutex_);
  streams_[make_key(org, type, stream)] = StreamSchema{std::move(schema), std::move(settings)};
}

auto StreamRegistry::drop(std::string_view org, StreamType type, std::string_view stream) -> void {
  std::unique_lock lock(mutex_);
  streams_.erase(make_key(org, type, stream));
}

auto StreamRegistry::mark_deleting(std::string_view org, StreamType type, std::string_view stream) -> void {
  std::unique_lock lock(mutex_);
  deleting_.insert(make_key(org, type, stream));
}

auto StreamRegistry::clear_deleting(std::string_view org, StreamType type, std::string_view stream) -> void {
  std::unique_lock lock(mutex_);
  deleting_.erase(make_key(org, type, stream));
}

auto StreamRegistry::size() const -> std::size_t {
  std::shared_lock lock(mutex_);
  return streams_.size();
}

namespace {

auto split_list(const std::string& v) -> std::vector<std::string> {
  std::vector<std::string> out;
  std::string cur;
  std::istringstream iss(v);
  while (std::getline(iss, cur, ',')) {
    if (!cur.empty()) out.push_back(cur);
  }
  return out;
}

auto parse_flag(const std::string& v, bool& out) -> bool {
  if (v == "true" || v == "1") { out = true; return true; }
  if (v == "false" || v == "0") { out = false; return true; }
  return false;
}

template <typename T>
auto parse_num(const std::string& v, T& out) -> bool {
  auto [ptr, ec] = std::from_chars(v.data(), v.data() + v.size(), out, 10);
  return ec == std::errc() && ptr == v.data() + v.size();
}

auto apply_setting(StreamSettings& s, const std::string& key, const std::string& value) -> bool {
  if (key == "retention_days") return parse_num(value, s.data_retention);
  if (key == "field_limit") return parse_num(value, s.field_limit);
  if (key == "store_original") return parse_flag(value, s.store_original_data);
  if (key == "index_original_data") return parse_flag(value, s.index_original_data);
  if (key == "index_all_values") return parse_flag(value, s.index_all_values);
  if (key == "bloom_filter_fields") { s.bloom_filter_fields = split_list(value); return true; }
  if (key == "fts_fields") { s.full_text_search_keys = split_list(value); return true; }
  if (key == "index_fields") { s.index_fields = split_list(value); return true; }
  if (key == "defined_schema_fields") { s.defined_schema_fields = split_list(value); return true; }
  return false;
}

struct PendingStream {
  std::string org;
  StreamType type{StreamType::logs};
  std::string name;
  std::vector<format::Field> fields;
  StreamSettings settings;
  bool deleting{false};
};

} // namespace

auto load_stream_registry(const std::filesystem::path& path, StreamRegistry& into)
    -> std::expected<void, error> {
  std::ifstream in(path);
  if (!in.good()) {
    return std::unexpected(error{error_code::not_found, "stream definition open failed: " + path.string(),
                                 "stream.registry"});
  }
  auto parse_error = [&](std::size_t line_no, const std::string& what) {
    return std::unexpected(error{error_code::config_invalid,
                                 "stream definition parse error at line " + std::to_string(line_no) + ": " + what,
                                 "stream.registry"});
  };

  std::vector<PendingStream> streams;
  std::string line;
  std::size_t line_no = 0;
  while (std::getline(in, line)) {
    ++line_no;
    if (auto hash = line.find('#'); hash != std::string::npos) line.erase(hash);
    std::istringstream iss(line);
    std::string verb;
    if (!(iss >> verb)) continue;
    if (verb == "stream") {
      PendingStream ps{};
      std::string type;
      if (!(iss >> ps.org >> type >> ps.name)) return parse_error(line_no, "expected: stream <org> <type> <name>");
      auto t = parse_stream_type(type);
      if (!t) return parse_error(line_no, "unknown stream type '" + type + "'");
      ps.type = *t;
      streams.push_back(std::move(ps));
      continue;
    }
    if (streams.empty()) return parse_error(line_no, "'" + verb + "' before any stream");
    auto& cur = streams.back();
    if (verb == "field") {
      std::string name, type;
      if (!(iss >> name >> type)) return parse_error(line_no, "expected: field <name> <type>");
      auto dt = format::parse_data_type(type);
      if (!dt) return parse_error(line_no, "unknown field type '" + type + "'");
      cur.fields.push_back(format::Field{name, *dt, true});
    } else if (verb == "set") {
      std::string key, value;
      if (!(iss >> key >> value)) return parse_error(line_no, "expected: set <key> <value>");
      if (!apply_setting(cur.settings, key, value)) return parse_error(line_no, "invalid setting '" + key + "'");
    } else if (verb == "deleting") {
      cur.deleting = true;
    } else {
      return parse_error(line_no, "unknown statement '" + verb + "'");
    }
  }

  for (auto& ps : streams) {
    into.upsert(ps.org, ps.type, ps.name, format::Schema(std::move(ps.fields)), std::move(ps.settings));
    if (ps.deleting) into.mark_deleting(ps.org, ps.type, ps.name);
  }
  return {};
}

auto generate_schema_for_defined_fields(const format::Schema& schema, const StreamSettings& settings)
    -> format::Schema {
  if (settings.defined_schema_fields.empty()) return schema;
  std::unordered_set<std::string> keep(settings.defined_schema_fields.begin(),
                                       settings.defined_schema_fields.end());
  keep.emplace(format::TIMESTAMP_COL);
  if (settings.store_original_data || settings.index_original_data) {
    keep.emplace(format::ORIGINAL_DATA_COL);
    keep.emplace(format::ID_COL);
  }
  if (settings.index_all_values) keep.emplace(format::ALL_VALUES_COL);

  std::vector<format::Field> fields;
  for (const auto& f : schema.fields()) {
    if (keep.contains(f.name)) fields.push_back(f);
  }
  return format::Schema(std::move(fields));
}

} // namespace strata::stream
