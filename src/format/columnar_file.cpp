#include "strata/format/columnar_file.hpp"
#include "strata/format/checksum.hpp"
#include "strata/io/durable_file.hpp"

#include <algorithm>
#include <cstring>
#include <fstream>
#include <limits>

#ifdef STRATA_HAS_ZSTD
#include <zstd.h>
#endif

namespace strata::format {

using core::error;
using core::error_code;

namespace {

class ByteWriter {
public:
  explicit ByteWriter(std::vector<std::uint8_t>& out) : out_(out) {}

  template <typename T>
  auto put(T v) -> void {
    const auto at = out_.size();
    out_.resize(at + sizeof(T));
    std::memcpy(out_.data() + at, &v, sizeof(T));
  }
  auto put_bytes(std::span<const std::uint8_t> b) -> void { out_.insert(out_.end(), b.begin(), b.end()); }
  auto put_string(std::string_view s) -> void {
    put<std::uint32_t>(static_cast<std::uint32_t>(s.size()));
    out_.insert(out_.end(), s.begin(), s.end());
  }
  [[nodiscard]] auto size() const noexcept -> std::size_t { return out_.size(); }

private:
  std::vector<std::uint8_t>& out_;
};

class ByteReader {
public:
  explicit ByteReader(std::span<const std::uint8_t> b) : p_(b.data()), end_(b.data() + b.size()) {}

  template <typename T>
  auto get() -> T {
    T v{};
    if (static_cast<std::size_t>(end_ - p_) < sizeof(T)) { ok_ = false; p_ = end_; return v; }
    std::memcpy(&v, p_, sizeof(T));
    p_ += sizeof(T);
    return v;
  }
  auto get_string() -> std::string {
    const auto n = get<std::uint32_t>();
    if (!ok_ || static_cast<std::size_t>(end_ - p_) < n) { ok_ = false; p_ = end_; return {}; }
    std::string s(reinterpret_cast<const char*>(p_), n);
    p_ += n;
    return s;
  }
  [[nodiscard]] auto ok() const noexcept -> bool { return ok_; }
  [[nodiscard]] auto remaining() const noexcept -> std::size_t { return static_cast<std::size_t>(end_ - p_); }

private:
  const std::uint8_t* p_;
  const std::uint8_t* end_;
  bool ok_{true};
};

auto corrupt(const std::string& what) -> error {
  return error{error_code::data_integrity, what, "format.columnar"};
}

struct SectionRef {
  SectionType type{SectionType::column};
  std::uint64_t offset{0};
  std::string name;
};

// Column payload: type u8 | rows u64 | per row {present u8 [, value]}
auto encode_column(const Field& f, const std::vector<Value>& values) -> std::vector<std::uint8_t> {
  std::vector<std::uint8_t> out;
  out.reserve(16 + values.size() * 9);
  ByteWriter w(out);
  w.put<std::uint8_t>(static_cast<std::uint8_t>(f.type));
  w.put<std::uint64_t>(values.size());
  for (const auto& raw : values) {
    const Value v = cast_value(raw, f.type);
    if (is_null(v)) { w.put<std::uint8_t>(0); continue; }
    w.put<std::uint8_t>(1);
    switch (f.type) {
      case DataType::int64: w.put<std::int64_t>(std::get<std::int64_t>(v)); break;
      case DataType::float64: w.put<double>(std::get<double>(v)); break;
      case DataType::boolean: w.put<std::uint8_t>(std::get<bool>(v) ? 1 : 0); break;
      case DataType::utf8: w.put_string(std::get<std::string>(v)); break;
    }
  }
  return out;
}

auto decode_column(std::span<const std::uint8_t> payload, const Field& f)
    -> std::expected<std::vector<Value>, error> {
  ByteReader r(payload);
  const auto type = r.get<std::uint8_t>();
  const auto rows = r.get<std::uint64_t>();
  if (!r.ok() || type != static_cast<std::uint8_t>(f.type)) {
    return std::unexpected(corrupt("column header mismatch for " + f.name));
  }
  if (rows > r.remaining()) return std::unexpected(corrupt("column row count exceeds payload for " + f.name));
  std::vector<Value> values;
  values.reserve(static_cast<std::size_t>(rows));
  for (std::uint64_t i = 0; i < rows; ++i) {
    if (r.get<std::uint8_t>() == 0) { values.emplace_back(std::monostate{}); continue; }
    switch (f.type) {
      case DataType::int64: values.emplace_back(r.get<std::int64_t>()); break;
      case DataType::float64: values.emplace_back(r.get<double>()); break;
      case DataType::boolean: values.emplace_back(r.get<std::uint8_t>() != 0); break;
      case DataType::utf8: values.emplace_back(r.get_string()); break;
    }
    if (!r.ok()) return std::unexpected(corrupt("truncated column " + f.name));
  }
  return values;
}

auto write_section(std::vector<std::uint8_t>& out, SectionType type,
                   const std::vector<std::uint8_t>& data, int zstd_level) -> void {
  ByteWriter w(out);
  const std::uint64_t unc = data.size();
  std::uint64_t comp = 0;
  std::vector<std::uint8_t> packed;
#ifdef STRATA_HAS_ZSTD
  if (zstd_level > 0 && !data.empty()) {
    const std::size_t bound = ZSTD_compressBound(data.size());
    packed.resize(bound);
    const std::size_t got = ZSTD_compress(packed.data(), bound, data.data(), data.size(), zstd_level);
    if (!ZSTD_isError(got) && got < data.size()) {
      packed.resize(got);
      comp = got;
    }
  }
#else
  (void)zstd_level;
#endif
  w.put<std::uint32_t>(static_cast<std::uint32_t>(type));
  w.put<std::uint64_t>(unc);
  w.put<std::uint64_t>(comp);
  w.put<std::uint64_t>(fnv64(data)); // checksum of uncompressed contents
  if (comp > 0) w.put_bytes(packed);
  else w.put_bytes(data);
}

auto read_section(std::span<const std::uint8_t> body, std::uint64_t offset, SectionType expect)
    -> std::expected<std::vector<std::uint8_t>, error> {
  if (offset > body.size() || body.size() - offset < SECTION_HEADER_SIZE) {
    return std::unexpected(corrupt("section offset out of range"));
  }
  ByteReader r(body.subspan(static_cast<std::size_t>(offset)));
  const auto type = r.get<std::uint32_t>();
  const auto unc = r.get<std::uint64_t>();
  const auto comp = r.get<std::uint64_t>();
  const auto shash = r.get<std::uint64_t>();
  if (type != static_cast<std::uint32_t>(expect)) return std::unexpected(corrupt("unexpected section type"));
  const std::uint64_t stored = comp > 0 ? comp : unc;
  if (stored > r.remaining()) return std::unexpected(corrupt("section payload truncated"));
  const auto payload = body.subspan(static_cast<std::size_t>(offset + SECTION_HEADER_SIZE),
                                    static_cast<std::size_t>(stored));
  std::vector<std::uint8_t> data;
  if (comp == 0) {
    data.assign(payload.begin(), payload.end());
  } else {
#ifdef STRATA_HAS_ZSTD
    data.resize(static_cast<std::size_t>(unc));
    const std::size_t got = ZSTD_decompress(data.data(), data.size(), payload.data(), payload.size());
    if (ZSTD_isError(got) || got != data.size()) {
      return std::unexpected(corrupt("section decompression failed"));
    }
#else
    return std::unexpected(error{error_code::unsupported,
                                 "compressed section requires zstd support", "format.columnar"});
#endif
  }
  if (fnv64(data) != shash) return std::unexpected(corrupt("section checksum mismatch"));
  return data;
}

auto encode_footer(const Footer& f, const std::vector<SectionRef>& sections) -> std::vector<std::uint8_t> {
  std::vector<std::uint8_t> out;
  ByteWriter w(out);
  w.put<std::int64_t>(f.meta.min_ts);
  w.put<std::int64_t>(f.meta.max_ts);
  w.put<std::uint64_t>(f.meta.records);
  w.put<std::uint64_t>(f.meta.original_size);
  w.put<std::uint64_t>(f.meta.compressed_size);
  w.put<std::uint64_t>(f.meta.index_size);
  w.put<std::uint8_t>(f.meta.flattened ? 1 : 0);
  w.put<std::uint32_t>(static_cast<std::uint32_t>(f.schema.size()));
  for (const auto& fld : f.schema.fields()) {
    w.put_string(fld.name);
    w.put<std::uint8_t>(static_cast<std::uint8_t>(fld.type));
    w.put<std::uint8_t>(fld.nullable ? 1 : 0);
  }
  w.put<std::uint32_t>(static_cast<std::uint32_t>(sections.size()));
  for (const auto& s : sections) {
    w.put<std::uint32_t>(static_cast<std::uint32_t>(s.type));
    w.put<std::uint64_t>(s.offset);
    w.put_string(s.name);
  }
  return out;
}

auto parse_footer(std::span<const std::uint8_t> bytes, std::vector<SectionRef>* sections)
    -> std::expected<Footer, error> {
  ByteReader r(bytes);
  Footer f{};
  f.meta.min_ts = r.get<std::int64_t>();
  f.meta.max_ts = r.get<std::int64_t>();
  f.meta.records = r.get<std::uint64_t>();
  f.meta.original_size = r.get<std::uint64_t>();
  f.meta.compressed_size = r.get<std::uint64_t>();
  f.meta.index_size = r.get<std::uint64_t>();
  f.meta.flattened = r.get<std::uint8_t>() != 0;
  const auto nfields = r.get<std::uint32_t>();
  if (!r.ok() || nfields > r.remaining()) return std::unexpected(corrupt("footer truncated"));
  std::vector<Field> fields;
  fields.reserve(nfields);
  for (std::uint32_t i = 0; i < nfields; ++i) {
    Field fld{};
    fld.name = r.get_string();
    const auto t = r.get<std::uint8_t>();
    fld.nullable = r.get<std::uint8_t>() != 0;
    if (!r.ok() || t < 1 || t > 4) return std::unexpected(corrupt("footer field malformed"));
    fld.type = static_cast<DataType>(t);
    fields.push_back(std::move(fld));
  }
  f.schema = Schema(std::move(fields));
  const auto nsections = r.get<std::uint32_t>();
  if (!r.ok() || nsections > r.remaining()) return std::unexpected(corrupt("footer section index truncated"));
  for (std::uint32_t i = 0; i < nsections; ++i) {
    SectionRef s{};
    s.type = static_cast<SectionType>(r.get<std::uint32_t>());
    s.offset = r.get<std::uint64_t>();
    s.name = r.get_string();
    if (!r.ok()) return std::unexpected(corrupt("footer section entry malformed"));
    if (sections) sections->push_back(std::move(s));
  }
  return f;
}

// Validates header/trailer and returns {footer bytes, body span}.
auto split_file(std::span<const std::uint8_t> bytes)
    -> std::expected<std::pair<std::span<const std::uint8_t>, std::span<const std::uint8_t>>, error> {
  if (bytes.size() < FILE_HEADER_SIZE + FILE_TRAILER_SIZE) return std::unexpected(corrupt("file too short"));
  std::uint32_t magic = 0;
  std::memcpy(&magic, bytes.data(), 4);
  if (magic != FILE_MAGIC) return std::unexpected(corrupt("bad header magic"));
  std::uint32_t footer_len = 0, crc = 0, tail_magic = 0;
  const auto* t = bytes.data() + bytes.size() - FILE_TRAILER_SIZE;
  std::memcpy(&footer_len, t, 4);
  std::memcpy(&crc, t + 4, 4);
  std::memcpy(&tail_magic, t + 8, 4);
  if (tail_magic != FILE_MAGIC) return std::unexpected(corrupt("bad trailer magic"));
  if (footer_len > bytes.size() - FILE_HEADER_SIZE - FILE_TRAILER_SIZE) {
    return std::unexpected(corrupt("footer length out of range"));
  }
  const std::size_t footer_at = bytes.size() - FILE_TRAILER_SIZE - footer_len;
  auto footer = bytes.subspan(footer_at, footer_len);
  if (crc32c(footer) != crc) return std::unexpected(corrupt("footer checksum mismatch"));
  return std::make_pair(footer, bytes.first(footer_at));
}

} // namespace

auto DecodedFile::bloom_filter(std::string_view field) const -> const BloomFilter* {
  for (const auto& [name, bf] : bloom_filters) {
    if (name == field) return &bf;
  }
  return nullptr;
}

auto compute_meta(const RecordBatch& batch) -> FileMeta {
  FileMeta m{};
  const std::size_t rows = batch.num_rows();
  if (rows == 0) return m;
  m.records = rows;
  if (const auto* ts = batch.column(TIMESTAMP_COL)) {
    bool first = true;
    for (const auto& v : *ts) {
      const auto c = cast_value(v, DataType::int64);
      if (is_null(c)) continue;
      const auto x = std::get<std::int64_t>(c);
      if (first) { m.min_ts = m.max_ts = x; first = false; }
      else { m.min_ts = std::min(m.min_ts, x); m.max_ts = std::max(m.max_ts, x); }
    }
  }
  for (std::size_t i = 0; i < batch.columns.size() && i < batch.schema.size(); ++i) {
    m.original_size += encode_column(batch.schema.fields()[i], batch.columns[i]).size();
  }
  return m;
}

auto encode_batch(const RecordBatch& batch, const EncodeOptions& options)
    -> std::expected<std::vector<std::uint8_t>, error> {
  if (batch.columns.size() != batch.schema.size()) {
    return std::unexpected(error{error_code::invalid_argument,
                                 "column count does not match schema", "format.columnar"});
  }
  const std::size_t rows = batch.num_rows();
  for (const auto& c : batch.columns) {
    if (c.size() != rows) {
      return std::unexpected(error{error_code::invalid_argument,
                                   "columns have different lengths", "format.columnar"});
    }
  }

  std::vector<std::uint8_t> out;
  ByteWriter w(out);
  w.put<std::uint32_t>(FILE_MAGIC);
  w.put<std::uint16_t>(FILE_VERSION);
  w.put<std::uint16_t>(0);

  std::vector<SectionRef> sections;
  std::uint64_t raw_bytes = 0;
  for (std::size_t i = 0; i < batch.schema.size(); ++i) {
    const auto& f = batch.schema.fields()[i];
    auto payload = encode_column(f, batch.columns[i]);
    raw_bytes += payload.size();
    sections.push_back(SectionRef{SectionType::column, out.size(), f.name});
    write_section(out, SectionType::column, payload, options.zstd_level);
  }
  for (const auto& name : options.bloom_filter_fields) {
    const auto* col = batch.column(name);
    if (!col) continue;
    auto bf = BloomFilter::for_items(rows);
    for (const auto& v : *col) {
      if (!is_null(v)) bf.add(value_to_string(v));
    }
    sections.push_back(SectionRef{SectionType::bloom_filter, out.size(), name});
    write_section(out, SectionType::bloom_filter, bf.serialize(), 0);
  }

  Footer footer{};
  footer.schema = batch.schema;
  if (options.meta) {
    footer.meta = *options.meta;
  } else {
    footer.meta = compute_meta(batch);
    if (rows > 0) footer.meta.original_size = raw_bytes;
  }
  const auto fbytes = encode_footer(footer, sections);
  if (fbytes.size() > std::numeric_limits<std::uint32_t>::max()) {
    return std::unexpected(error{error_code::out_of_range, "footer too large", "format.columnar"});
  }
  w.put_bytes(fbytes);
  w.put<std::uint32_t>(static_cast<std::uint32_t>(fbytes.size()));
  w.put<std::uint32_t>(crc32c(fbytes));
  w.put<std::uint32_t>(FILE_MAGIC);
  return out;
}

auto decode_footer(std::span<const std::uint8_t> bytes) -> std::expected<Footer, error> {
  auto parts = split_file(bytes);
  if (!parts) return std::unexpected(parts.error());
  return parse_footer(parts->first, nullptr);
}

auto decode_file(std::span<const std::uint8_t> bytes) -> std::expected<DecodedFile, error> {
  auto parts = split_file(bytes);
  if (!parts) return std::unexpected(parts.error());
  std::vector<SectionRef> sections;
  auto footer = parse_footer(parts->first, &sections);
  if (!footer) return std::unexpected(footer.error());

  DecodedFile out{};
  out.footer = *footer;
  out.batch.schema = footer->schema;
  out.batch.columns.resize(footer->schema.size());
  const auto body = parts->second;
  std::size_t rows = 0;
  bool have_rows = false;
  for (const auto& s : sections) {
    if (s.type == SectionType::column) {
      auto idx = footer->schema.index_of(s.name);
      if (!idx) return std::unexpected(corrupt("column section without schema field: " + s.name));
      auto data = read_section(body, s.offset, SectionType::column);
      if (!data) return std::unexpected(data.error());
      auto values = decode_column(*data, footer->schema.fields()[*idx]);
      if (!values) return std::unexpected(values.error());
      if (have_rows && values->size() != rows) return std::unexpected(corrupt("column length mismatch"));
      rows = values->size();
      have_rows = true;
      out.batch.columns[*idx] = std::move(*values);
    } else if (s.type == SectionType::bloom_filter) {
      auto data = read_section(body, s.offset, SectionType::bloom_filter);
      if (!data) return std::unexpected(data.error());
      auto bf = BloomFilter::deserialize(*data);
      if (!bf) return std::unexpected(bf.error());
      out.bloom_filters.emplace_back(s.name, std::move(*bf));
    } else {
      return std::unexpected(corrupt("unknown section type"));
    }
  }
  for (auto& c : out.batch.columns) {
    if (c.size() != rows) return std::unexpected(corrupt("missing column section"));
  }
  return out;
}

auto read_footer(const std::filesystem::path& path) -> std::expected<Footer, error> {
  std::error_code ec;
  const auto size = std::filesystem::file_size(path, ec);
  if (ec) {
    std::error_code ec2;
    const auto code = std::filesystem::exists(path, ec2) ? error_code::io_failed : error_code::not_found;
    return std::unexpected(error{code, "stat failed: " + path.string(), "format.columnar"});
  }
  if (size < FILE_HEADER_SIZE + FILE_TRAILER_SIZE) return std::unexpected(corrupt("file too short: " + path.string()));
  std::ifstream in(path, std::ios::binary);
  if (!in.good()) return std::unexpected(error{error_code::io_failed, "open failed: " + path.string(), "format.columnar"});

  std::uint8_t head[FILE_HEADER_SIZE];
  in.read(reinterpret_cast<char*>(head), FILE_HEADER_SIZE);
  std::uint8_t trailer[FILE_TRAILER_SIZE];
  in.seekg(static_cast<std::streamoff>(size - FILE_TRAILER_SIZE));
  in.read(reinterpret_cast<char*>(trailer), FILE_TRAILER_SIZE);
  if (!in.good()) return std::unexpected(error{error_code::io_eof, "short read: " + path.string(), "format.columnar"});

  std::uint32_t magic = 0, footer_len = 0, crc = 0, tail_magic = 0;
  std::memcpy(&magic, head, 4);
  std::memcpy(&footer_len, trailer, 4);
  std::memcpy(&crc, trailer + 4, 4);
  std::memcpy(&tail_magic, trailer + 8, 4);
  if (magic != FILE_MAGIC || tail_magic != FILE_MAGIC) return std::unexpected(corrupt("bad magic: " + path.string()));
  if (footer_len > size - FILE_HEADER_SIZE - FILE_TRAILER_SIZE) {
    return std::unexpected(corrupt("footer length out of range: " + path.string()));
  }
  std::vector<std::uint8_t> footer(footer_len);
  in.seekg(static_cast<std::streamoff>(size - FILE_TRAILER_SIZE - footer_len));
  in.read(reinterpret_cast<char*>(footer.data()), static_cast<std::streamsize>(footer_len));
  if (!in.good()) return std::unexpected(error{error_code::io_eof, "short footer read: " + path.string(), "format.columnar"});
  if (crc32c(footer) != crc) return std::unexpected(corrupt("footer checksum mismatch: " + path.string()));
  return parse_footer(footer, nullptr);
}

auto read_file_meta(const std::filesystem::path& path) -> std::expected<FileMeta, error> {
  auto f = read_footer(path);
  if (!f) return std::unexpected(f.error());
  return f->meta;
}

auto read_file_schema(const std::filesystem::path& path) -> std::expected<Schema, error> {
  auto f = read_footer(path);
  if (!f) return std::unexpected(f.error());
  return std::move(f->schema);
}

auto read_file(const std::filesystem::path& path) -> std::expected<DecodedFile, error> {
  auto bytes = io::read_file_bytes(path);
  if (!bytes) return std::unexpected(bytes.error());
  return decode_file(*bytes);
}

auto write_columnar_file(const std::filesystem::path& path, const RecordBatch& batch,
                         const EncodeOptions& options) -> std::expected<FileMeta, error> {
  auto bytes = encode_batch(batch, options);
  if (!bytes) return std::unexpected(bytes.error());
  if (auto w = io::write_file_atomic(path, std::span<const std::uint8_t>(*bytes)); !w) {
    return std::unexpected(w.error());
  }
  auto footer = decode_footer(*bytes);
  if (!footer) return std::unexpected(footer.error());
  return footer->meta;
}

} // namespace strata::format
