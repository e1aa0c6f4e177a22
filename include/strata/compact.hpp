#pragma once

/** \file compact.hpp
 *  \brief Convenience header for embedding the compaction engine.
 */

#include "strata/compact/claim_set.hpp"
#include "strata/compact/compactor.hpp"
#include "strata/compact/deletion_coordinator.hpp"
#include "strata/compact/drain_controller.hpp"
#include "strata/compact/engine_state.hpp"
#include "strata/compact/merge_engine.hpp"
#include "strata/compact/meta_cache.hpp"
#include "strata/compact/partition_grouper.hpp"
#include "strata/compact/retention.hpp"
#include "strata/compact/segment.hpp"
#include "strata/compact/services.hpp"
#include "strata/compact/uploader.hpp"
#include "strata/compact/worker_pool.hpp"
#include "strata/core/config.hpp"
#include "strata/error.hpp"
