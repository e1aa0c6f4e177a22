#include "strata/compact/uploader.hpp"

#include <exception>

#include "strata/core/log.hpp"

namespace strata::compact {

using core::error;

Uploader::Uploader(ObjectStorage& storage, FileListIndex& file_list, MetricsSink& metrics)
    : storage_(storage), file_list_(file_list), metrics_(metrics) {}

auto Uploader::add_observer(MergeObserver& observer) -> void { observers_.push_back(&observer); }

auto Uploader::publish(const wal::PartitionPrefix& prefix, const MergeOutcome& outcome)
    -> std::expected<void, error> {
  if (auto r = storage_.put(outcome.account, outcome.file_key, outcome.bytes); !r) {
    return std::unexpected(error{r.error().code, "upload " + outcome.file_key + ": " + r.error().message,
                                 "compact.upload"});
  }
  if (auto r = file_list_.record(outcome.account, outcome.file_key, outcome.meta, false); !r) {
    return std::unexpected(error{r.error().code, "record " + outcome.file_key + ": " + r.error().message,
                                 "compact.upload"});
  }

  const auto type = stream::to_string(prefix.stream_type);
  metrics_.counter_add(metric::MERGED_FILES, prefix.org, type, 1);
  metrics_.counter_add(metric::MERGED_BYTES, prefix.org, type, outcome.meta.compressed_size);

  if (observers_.empty()) return {};
  MergedFileEvent event{};
  event.org = prefix.org;
  event.stream_type = prefix.stream_type;
  event.stream_name = prefix.stream_name;
  event.account = outcome.account;
  event.file_key = outcome.file_key;
  event.meta = outcome.meta;
  event.consumed_keys.reserve(outcome.consumed.size());
  for (const auto& s : outcome.consumed) event.consumed_keys.push_back(s.key);
  notify(event);
  return {};
}

auto Uploader::notify(const MergedFileEvent& event) -> void {
  auto log = core::logger();
  for (auto* observer : observers_) {
    try {
      if (auto r = observer->on_merged(event); !r) {
        log->warn("[upload] observer failed for {}: {}", event.file_key, core::describe(r.error()));
      }
    } catch (const std::exception& e) {
      log->warn("[upload] observer threw for {}: {}", event.file_key, e.what());
    }
  }
}

} // namespace strata::compact
