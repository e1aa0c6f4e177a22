// strata_compactor: run the compaction engine over a local WAL directory.
//
// Configuration comes from STRATA_* environment variables; stream schemas and
// settings from the definition file named by STRATA_STREAMS_FILE (or --streams).
// SIGTERM drains buffered segments and exits; SIGINT stops after the current pass.

#include <csignal>
#include <cstdlib>
#include <iostream>
#include <pthread.h>
#include <string>
#include <thread>

#include "strata/compact.hpp"
#include "strata/core/log.hpp"
#include "strata/index/inverted_index.hpp"
#include "strata/lock/file_locker.hpp"
#include "strata/merge/local_merge_service.hpp"
#include "strata/metrics/metrics_registry.hpp"
#include "strata/storage/file_list.hpp"
#include "strata/storage/local_object_store.hpp"
#include "strata/storage/pending_delete_store.hpp"
#include "strata/stream/stream_registry.hpp"

namespace {

struct Args {
  std::string streams_file;
  bool once{false};
  bool drain{false};
};

auto usage() -> void {
  std::cerr << "usage: strata_compactor [--streams FILE] [--once] [--drain]\n"
               "  --streams FILE  stream definition file (default: $STRATA_STREAMS_FILE)\n"
               "  --once          run a single pass and exit\n"
               "  --drain         flush everything buffered, then exit\n";
}

auto fail(const strata::core::error& e, int code) -> int {
  std::cerr << "strata_compactor: " << strata::core::describe(e) << "\n";
  return code;
}

} // namespace

int main(int argc, char** argv) {
  using namespace strata;

  Args args;
  if (auto env = core::process_env("STRATA_STREAMS_FILE")) args.streams_file = *env;
  for (int i = 1; i < argc; ++i) {
    std::string a(argv[i]);
    if (a == "--streams" && i + 1 < argc) {
      args.streams_file = argv[++i];
    } else if (a == "--once") {
      args.once = true;
    } else if (a == "--drain") {
      args.drain = true;
    } else if (a == "-h" || a == "--help") {
      usage();
      return 0;
    } else {
      usage();
      return 2;
    }
  }

  auto cfg = core::load_config_from_env();
  if (!cfg) return fail(cfg.error(), 2);
  auto log = core::logger();

  stream::StreamRegistry streams;
  if (!args.streams_file.empty()) {
    if (auto r = stream::load_stream_registry(args.streams_file, streams); !r) return fail(r.error(), 3);
    log->info("[main] loaded {} streams from {}", streams.size(), args.streams_file);
  } else {
    log->warn("[main] no stream definitions; every partition will be treated as a missing stream");
  }

  auto file_list = storage::LocalFileList::open(cfg->state_dir);
  if (!file_list) return fail(file_list.error(), 4);
  auto pending = storage::FilePendingDeleteStore::open(cfg->state_dir);
  if (!pending) return fail(pending.error(), 4);
  auto removing = storage::FileRemovingMarkerStore::open(cfg->state_dir);
  if (!removing) return fail(removing.error(), 4);

  storage::LocalObjectStore object_store(cfg->object_store_dir);
  lock::SearchingFileLocker locker;
  merge::LocalMergeService merger(cfg->zstd_level);
  strata::index::RoaringIndexBuilder indexer(object_store);
  metrics::MetricsRegistry metrics;

  // Signals go to a dedicated thread; block them before any worker starts.
  sigset_t signals;
  sigemptyset(&signals);
  sigaddset(&signals, SIGTERM);
  sigaddset(&signals, SIGINT);
  pthread_sigmask(SIG_BLOCK, &signals, nullptr);

  compact::EngineState state;
  compact::Compactor compactor(*cfg, state,
                               compact::Collaborators{streams, **file_list, object_store, locker, **pending,
                                                      **removing, merger, indexer, metrics});
  if (auto r = compactor.start(); !r) return fail(r.error(), 5);

  if (args.once) {
    auto stats = compactor.run_pass(args.drain);
    if (!stats) return fail(stats.error(), 6);
    std::cout << metrics.render();
    return stats->errors == 0 ? 0 : 1;
  }

  compact::DrainController controller(compactor, *cfg);
  if (args.drain) controller.request_drain();

  std::thread signal_thread([&controller, signals] {
    for (;;) {
      int sig = 0;
      if (sigwait(&signals, &sig) != 0) return;
      if (sig == SIGTERM) {
        controller.request_drain();
      } else {
        controller.request_stop();
        return;
      }
    }
  });

  controller.run();

  // Wake the signal thread if it is still waiting.
  pthread_kill(signal_thread.native_handle(), SIGINT);
  signal_thread.join();

  log->info("[main] exiting; {} segments still claimed", state.claims.size());
  return 0;
}
