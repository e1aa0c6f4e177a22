#pragma once

/** \file engine_state.hpp
 *  \brief Shared in-memory state of one compactor instance.
 *
 * Constructed once at startup and handed by reference to the grouper, the
 * workers and the deletion coordinator.
 */

#include "strata/compact/claim_set.hpp"
#include "strata/compact/meta_cache.hpp"

namespace strata::compact {

struct EngineState {
  ClaimSet claims;
  SegmentMetaCache meta_cache;
};

} // namespace strata::compact
