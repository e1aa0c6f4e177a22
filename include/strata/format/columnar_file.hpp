#pragma once

/** \file columnar_file.hpp
 *  \brief Self-describing columnar file used for WAL segments and merged outputs.
 *
 * Layout (little-endian):
 *   header : magic u32 "STSG" | version u16 | reserved u16
 *   body   : sections, each {type u32, unc u64, comp u64, fnv64 u64} + payload
 *            (comp == 0 -> payload stored uncompressed, unc bytes)
 *   footer : FileMeta | schema | section index
 *   trailer: footer_len u32 | crc32c(footer) u32 | magic u32
 *
 * Column payloads are zstd-compressed when that shrinks them. The footer can be
 * read without touching the body (read_footer), which is what the compactor
 * does for every discovered segment.
 */

#include <cstdint>
#include <expected>
#include <filesystem>
#include <optional>
#include <span>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

#include "strata/error.hpp"
#include "strata/format/bloom_filter.hpp"
#include "strata/format/file_meta.hpp"
#include "strata/format/schema.hpp"

namespace strata::format {

constexpr std::uint32_t FILE_MAGIC = 0x47535453u; // "STSG"
constexpr std::uint16_t FILE_VERSION = 1;
constexpr std::size_t FILE_HEADER_SIZE = 8;
constexpr std::size_t FILE_TRAILER_SIZE = 12;
constexpr std::size_t SECTION_HEADER_SIZE = 4 + 8 + 8 + 8;

enum class SectionType : std::uint32_t {
  column = 1,
  bloom_filter = 2,
};

struct EncodeOptions {
  int zstd_level{3};                             // 0 disables compression
  std::vector<std::string> bloom_filter_fields;  // fields absent from the schema are ignored
  std::optional<FileMeta> meta;                  // overrides the computed footer metadata
};

struct Footer {
  FileMeta meta;
  Schema schema;
};

struct DecodedFile {
  Footer footer;
  RecordBatch batch;
  std::vector<std::pair<std::string, BloomFilter>> bloom_filters;

  auto bloom_filter(std::string_view field) const -> const BloomFilter*;
};

/** \brief min/max of `_timestamp`, row count and encoded column bytes; zero rows -> FileMeta{}. */
auto compute_meta(const RecordBatch& batch) -> FileMeta;

auto encode_batch(const RecordBatch& batch, const EncodeOptions& options = {})
    -> std::expected<std::vector<std::uint8_t>, core::error>;

auto decode_file(std::span<const std::uint8_t> bytes) -> std::expected<DecodedFile, core::error>;

auto decode_footer(std::span<const std::uint8_t> bytes) -> std::expected<Footer, core::error>;

/** \brief Reads only the trailer and footer of a file on disk. */
auto read_footer(const std::filesystem::path& path) -> std::expected<Footer, core::error>;

auto read_file_meta(const std::filesystem::path& path) -> std::expected<FileMeta, core::error>;

auto read_file_schema(const std::filesystem::path& path) -> std::expected<Schema, core::error>;

auto read_file(const std::filesystem::path& path) -> std::expected<DecodedFile, core::error>;

/** \brief Encode and atomically write; returns the metadata stored in the footer. */
auto write_columnar_file(const std::filesystem::path& path, const RecordBatch& batch,
                         const EncodeOptions& options = {})
    -> std::expected<FileMeta, core::error>;

} // namespace strata::format
