/**
 * @file run_orchestrator.hpp
 * @brief RunOrchestrator drives one analysis run end to end.
 */
#pragma once
#include "pocnet/common/common.hpp"
#include "pocnet/coverage/coverage_tracker.hpp"
#include "pocnet/graph/graph_view.hpp"
#include "pocnet/graph/path_finder.hpp"
#include "pocnet/run/run_config.hpp"
#include "pocnet/run/run_result.hpp"
#include "pocnet/sampling/biased_sampler.hpp"
#include "pocnet/store/backing_store.hpp"
#include "pocnet/validation/validation_engine.hpp"

namespace pocnet
{

/**
 * @brief Runs the attempt loop of an analysis run against a backing store.
 *
 * @details
 * RANDOM runs repeat sample, shortest path, validate, record and score
 * coverage until the coverage target is reached, the attempt budget or the
 * timeout runs out, or a stop is requested. A sampled pair with no path gets
 * a NO_PATH_FOUND review flag. The whole network minus the ignore set is
 * loaded once per run, on the first sampled pair.
 *
 * SCENARIO runs load the filtered downstream view of one start node, find its
 * paths, then validate, record and score each path in path id order.
 *
 * `BackingStoreUnavailable` raised inside one attempt is logged and counted,
 * and the loop moves on. Any other error ends the run with status FAILED.
 * An invalid `RunConfig` is reported by throwing before the run starts.
 *
 * @par Thread safety
 * - `run()` is not thread-safe; call from one thread only.
 * - `request_stop()` and `stop_requested()` can be called from any thread.
 */
class RunOrchestrator
{
public:
    /**
     * @throws NetworkError with `InvalidConfiguration` if `store` is null.
     */
    explicit RunOrchestrator(std::shared_ptr<BackingStore> store);

    /**
     * @brief Execute one run.
     * @throws NetworkError with `InvalidConfiguration` if `config` is invalid.
     */
    RunResult run(const RunConfig& config);

    /**
     * @brief Request a graceful stop.
     *
     * @details
     * Checked before each attempt. The attempt in progress completes
     * normally. The flag is not cleared by later runs.
     */
    void request_stop();

    bool stop_requested() const noexcept;

private:
    struct RunContext
    {
        const RunConfig& config;
        RunResult& result;
        CoverageTracker& coverage;
        ValidationEngine& validation;
        std::chrono::steady_clock::time_point deadline;
        bool has_deadline{false};
    };

    void run_random(RunContext& ctx);
    void run_scenario(RunContext& ctx);

    /**
     * @brief Whether the loop must end before the next attempt; sets the
     *        matching result flag.
     */
    bool should_end(RunContext& ctx) const;

    /**
     * @brief Validate and score one path, committing it with its review flags.
     */
    void record_path(
        RunContext& ctx,
        const PathResult& path,
        TraversalAlgorithm algorithm,
        const NodeFlagMap& flags);

    void report_no_path(RunContext& ctx, const PocPair& pair);

    static std::string generate_run_id();

private:
    std::shared_ptr<BackingStore> m_store;
    std::atomic<bool> m_stop_requested{false};
};

/**
 * @brief Node flags of one path, in path order.
 */
std::vector<std::pair<NodeId, NodeFlag>> flags_for_path(const NodeFlagMap& flags, const PathResult& path);

} // namespace pocnet
