/**
 * @file run_result.hpp
 * @brief Definition of RunResult returned by RunOrchestrator::run().
 */
#pragma once
#include "pocnet/common/common.hpp"
#include "pocnet/coverage/coverage_tracker.hpp"
#include "pocnet/run/run_config.hpp"
#include "pocnet/sampling/biased_sampler.hpp"
#include "pocnet/validation/validation_types.hpp"

namespace pocnet
{

/**
 * @brief Outcome of one analysis run.
 */
struct RunResult
{
    std::string run_id;
    RunApproach approach{RunApproach::Random};
    RunStatus status{RunStatus::Running};

    /**
     * @brief Attempts made: sampled pairs (RANDOM) or discovered paths (SCENARIO).
     */
    size_t attempts{0};

    size_t paths_found{0};
    size_t paths_not_found{0};

    /**
     * @brief RANDOM: attempts where the sampler returned no pair.
     */
    size_t no_pair_attempts{0};

    /**
     * @brief Attempts skipped because the backing store was unavailable.
     */
    size_t store_errors{0};

    /**
     * @brief Ids of the committed path records, in commit order.
     */
    std::vector<std::int64_t> record_ids;

    CoverageMetrics coverage;
    ValidationSummary validation;
    SamplingStatistics sampling;

    bool target_reached{false};
    bool stopped{false};
    bool timed_out{false};

    /**
     * @brief Error that failed the run; empty unless `status` is FAILED.
     */
    std::string error_message;

    std::chrono::nanoseconds duration{0};

    /**
     * @brief Get a summary string for logging.
     */
    std::string summary() const
    {
        std::string result = "Run " + run_id + " " + to_string(status);
        if (stopped)
        {
            result += " (stopped by request)";
        }
        else if (timed_out)
        {
            result += " (timed out)";
        }
        result += ": attempts=" + std::to_string(attempts);
        result += ", paths=" + std::to_string(paths_found);
        result += ", not_found=" + std::to_string(paths_not_found);
        result += ", store_errors=" + std::to_string(store_errors);
        result += ", " + coverage.summary();
        result += ", blocking=" + std::to_string(validation.blocking_count());
        result += ", warnings=" + std::to_string(validation.by_severity.count(Severity::Warning) != 0u
                                                     ? validation.by_severity.at(Severity::Warning)
                                                     : 0);
        if (!error_message.empty())
        {
            result += ", error: " + error_message;
        }
        return result;
    }
};

} // namespace pocnet
