#include <covermock/app/cover_runner_tbb.hpp>

#ifdef COVERMOCK_HAS_TBB

#include <tbb/blocked_range.h>
#include <tbb/parallel_for.h>
#include <cstddef>
#include <utility>

namespace covermock::app {

BatchSummary run_cover_batch_tbb(const std::vector<std::string>& cover_paths,
                                 const MockupContext& context,
                                 const CoverOutcomeCallback& callback) {
  const std::size_t n = cover_paths.size();
  std::vector<CoverOutcome> outcomes(n);
  if (n == 0) return summarize(std::move(outcomes));
  const auto collisions = find_output_collisions(cover_paths, context);

  tbb::parallel_for(
      tbb::blocked_range<std::size_t>(0, n, 1),
      [&](const tbb::blocked_range<std::size_t>& range) {
        for (std::size_t i = range.begin(); i != range.end(); ++i) {
          if (const auto& first = collisions[i]) {
            outcomes[i] = duplicate_output_outcome(cover_paths[i], cover_paths[*first], context);
          } else {
            outcomes[i] = process_cover_file(cover_paths[i], context);
          }
          if (callback) callback(outcomes[i]);
        }
      });
  return summarize(std::move(outcomes));
}

}  // namespace covermock::app

#endif  // COVERMOCK_HAS_TBB
