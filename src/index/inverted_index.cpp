#include "strata/index/inverted_index.hpp"
#include "strata/format/columnar_file.hpp"

#include <algorithm>
#include <cctype>
#include <cstring>
#include <exception>

namespace strata::index {

using core::error;
using core::error_code;

auto tokenize(std::string_view text) -> std::vector<std::string> {
  std::vector<std::string> tokens;
  std::string current;
  auto flush = [&]{
    if (!current.empty()) {
      tokens.push_back(std::move(current));
      current.clear();
    }
  };
  for (char c : text) {
    const auto uc = static_cast<unsigned char>(c);
    if (std::isspace(uc) || std::ispunct(uc)) {
      flush();
    } else {
      current.push_back(static_cast<char>(std::tolower(uc)));
    }
  }
  flush();
  return tokens;
}

auto index_key_for(std::string_view file_key) -> std::string {
  const auto slash = file_key.rfind('/');
  const auto dot = file_key.rfind('.');
  std::string out(file_key);
  if (dot != std::string_view::npos && (slash == std::string_view::npos || dot > slash)) {
    out.resize(dot);
  }
  return out + ".idx";
}

auto InvertedIndex::add_full_text(std::string_view field, std::uint32_t row, std::string_view text) -> void {
  auto [it, _] = fields_.try_emplace(std::string(field));
  it->second.kind = TermKind::full_text;
  for (auto& tok : tokenize(text)) it->second.terms[tok].add(row);
}

auto InvertedIndex::add_exact(std::string_view field, std::uint32_t row, std::string_view value) -> void {
  auto [it, _] = fields_.try_emplace(std::string(field));
  it->second.kind = TermKind::exact;
  it->second.terms[std::string(value)].add(row);
}

auto InvertedIndex::lookup(std::string_view field, std::string_view term) const -> roaring::Roaring {
  auto f = fields_.find(field);
  if (f == fields_.end()) return {};
  std::string t(term);
  if (f->second.kind == TermKind::full_text) {
    std::transform(t.begin(), t.end(), t.begin(), [](unsigned char c){ return static_cast<char>(std::tolower(c)); });
  }
  auto it = f->second.terms.find(t);
  return it == f->second.terms.end() ? roaring::Roaring{} : it->second;
}

namespace {

auto put_u32(std::vector<std::uint8_t>& out, std::uint32_t v) -> void {
  const auto at = out.size();
  out.resize(at + 4);
  std::memcpy(out.data() + at, &v, 4);
}

auto put_str(std::vector<std::uint8_t>& out, std::string_view s) -> void {
  put_u32(out, static_cast<std::uint32_t>(s.size()));
  out.insert(out.end(), s.begin(), s.end());
}

} // namespace

auto InvertedIndex::serialize() const -> std::vector<std::uint8_t> {
  std::vector<std::uint8_t> out;
  put_u32(out, MAGIC);
  put_u32(out, VERSION);
  put_u32(out, static_cast<std::uint32_t>(fields_.size()));
  for (const auto& [name, postings] : fields_) {
    put_str(out, name);
    out.push_back(static_cast<std::uint8_t>(postings.kind));
    put_u32(out, static_cast<std::uint32_t>(postings.terms.size()));
    for (const auto& [term, bitmap] : postings.terms) {
      put_str(out, term);
      roaring::Roaring optimized = bitmap;
      optimized.runOptimize();
      const std::size_t n = optimized.getSizeInBytes();
      put_u32(out, static_cast<std::uint32_t>(n));
      const auto at = out.size();
      out.resize(at + n);
      optimized.write(reinterpret_cast<char*>(out.data() + at));
    }
  }
  return out;
}

auto InvertedIndex::deserialize(std::span<const std::uint8_t> bytes) -> std::expected<InvertedIndex, error> {
  auto bad = [](const char* what) {
    return std::unexpected(error{error_code::data_integrity, what, "index.inverted"});
  };
  std::size_t pos = 0;
  auto get_u32 = [&](std::uint32_t& v) -> bool {
    if (bytes.size() - pos < 4) return false;
    std::memcpy(&v, bytes.data() + pos, 4);
    pos += 4;
    return true;
  };
  auto get_str = [&](std::string& s) -> bool {
    std::uint32_t n = 0;
    if (!get_u32(n) || bytes.size() - pos < n) return false;
    s.assign(reinterpret_cast<const char*>(bytes.data() + pos), n);
    pos += n;
    return true;
  };

  std::uint32_t magic = 0, version = 0, nfields = 0;
  if (!get_u32(magic) || magic != MAGIC) return bad("bad index magic");
  if (!get_u32(version) || version != VERSION) return bad("unsupported index version");
  if (!get_u32(nfields)) return bad("index truncated");

  InvertedIndex idx;
  for (std::uint32_t f = 0; f < nfields; ++f) {
    std::string name;
    if (!get_str(name) || pos >= bytes.size()) return bad("index field truncated");
    const std::uint8_t kind = bytes[pos++];
    if (kind != static_cast<std::uint8_t>(TermKind::full_text) && kind != static_cast<std::uint8_t>(TermKind::exact)) {
      return bad("unknown term kind");
    }
    std::uint32_t nterms = 0;
    if (!get_u32(nterms)) return bad("index field truncated");
    FieldPostings postings{};
    postings.kind = static_cast<TermKind>(kind);
    for (std::uint32_t t = 0; t < nterms; ++t) {
      std::string term;
      std::uint32_t n = 0;
      if (!get_str(term) || !get_u32(n) || bytes.size() - pos < n) return bad("index term truncated");
      try {
        postings.terms.emplace(std::move(term),
            roaring::Roaring::readSafe(reinterpret_cast<const char*>(bytes.data() + pos), n));
      } catch (const std::exception& e) {
        return std::unexpected(error{error_code::data_integrity,
                                     std::string("posting list decode failed: ") + e.what(), "index.inverted"});
      }
      pos += n;
    }
    idx.fields_.emplace(std::move(name), std::move(postings));
  }
  return idx;
}

auto RoaringIndexBuilder::build(const compact::IndexRequest& request) -> std::expected<std::uint64_t, error> {
  auto decoded = format::decode_file(request.merged_bytes);
  if (!decoded) return std::unexpected(decoded.error());
  const auto& batch = decoded->batch;

  InvertedIndex idx;
  auto index_column = [&](const std::string& field, bool full_text) {
    const auto* col = batch.column(field);
    if (!col) return;
    for (std::size_t row = 0; row < col->size(); ++row) {
      const auto& v = (*col)[row];
      if (format::is_null(v)) continue;
      const auto text = format::value_to_string(v);
      if (full_text) idx.add_full_text(field, static_cast<std::uint32_t>(row), text);
      else idx.add_exact(field, static_cast<std::uint32_t>(row), text);
    }
  };
  for (const auto& f : request.full_text_search_fields) {
    if (request.schema.contains(f)) index_column(f, true);
  }
  for (const auto& f : request.index_fields) {
    if (request.schema.contains(f)) index_column(f, false);
  }

  const auto bytes = idx.serialize();
  if (auto r = storage_.put(request.account, index_key_for(request.file_key), bytes); !r) {
    return std::unexpected(r.error());
  }
  return static_cast<std::uint64_t>(bytes.size());
}

} // namespace strata::index
