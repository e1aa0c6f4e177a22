#pragma once

/** \file segment.hpp
 *  \brief A discovered WAL segment and a partition's group of them.
 */

#include <chrono>
#include <cstdint>
#include <filesystem>
#include <string>
#include <vector>

#include "strata/format/file_meta.hpp"

namespace strata::compact {

struct Segment {
  std::string key;                  // relative to the WAL root
  std::filesystem::path path;       // absolute
  format::FileMeta meta;
  std::uint64_t file_size{0};       // bytes on disk when discovered
};

struct PartitionGroup {
  std::string partition_key;
  std::vector<Segment> segments;
  std::chrono::steady_clock::time_point not_before{};  // retry gate for deferred groups
};

} // namespace strata::compact
