#pragma once

#include <covermock/app/cover_runner.hpp>
#include <string>
#include <vector>

#ifdef COVERMOCK_HAS_TBB

namespace covermock::app {

/// Runs covers in parallel using TBB, one task per cover.
///
/// Covers share only the read-only \p context, so no synchronization is needed between tasks.
/// Outcomes are returned in input order; \p callback is invoked from TBB worker threads as each
/// cover finishes and must be thread-safe.
BatchSummary run_cover_batch_tbb(const std::vector<std::string>& cover_paths,
                                 const MockupContext& context,
                                 const CoverOutcomeCallback& callback = nullptr);

}  // namespace covermock::app

#endif  // COVERMOCK_HAS_TBB
