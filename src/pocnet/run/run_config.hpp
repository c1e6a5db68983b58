/**
 * @file run_config.hpp
 * @brief Run configuration consumed by RunOrchestrator.
 */
#pragma once
#include "pocnet/common/common.hpp"
#include "pocnet/common/network_exceptions.hpp"
#include "pocnet/graph/path_finder.hpp"
#include "pocnet/sampling/bias_state.hpp"
#include "pocnet/store/store_types.hpp"
#include "pocnet/validation/validation_engine.hpp"

namespace pocnet
{

/**
 * @brief How a run discovers paths.
 */
enum class RunApproach
{
    Random,  ///< Sample PoC pairs and connect each with a shortest path.
    Scenario ///< Traverse downstream from one start node.
};

/**
 * @brief Sampling method label recorded with a run.
 */
enum class RunMethod
{
    Simple,
    Stratified,
    Predefined,
    Synthetic,
    File
};

enum class RunStatus
{
    Running,
    Done,
    Failed
};

inline const char* to_string(RunApproach approach) noexcept
{
    switch (approach)
    {
        case RunApproach::Random:
            return "RANDOM";
        case RunApproach::Scenario:
            return "SCENARIO";
    }
    return "UNKNOWN";
}

inline const char* to_string(RunMethod method) noexcept
{
    switch (method)
    {
        case RunMethod::Simple:
            return "SIMPLE";
        case RunMethod::Stratified:
            return "STRATIFIED";
        case RunMethod::Predefined:
            return "PREDEFINED";
        case RunMethod::Synthetic:
            return "SYNTHETIC";
        case RunMethod::File:
            return "FILE";
    }
    return "UNKNOWN";
}

inline const char* to_string(RunStatus status) noexcept
{
    switch (status)
    {
        case RunStatus::Running:
            return "RUNNING";
        case RunStatus::Done:
            return "DONE";
        case RunStatus::Failed:
            return "FAILED";
    }
    return "UNKNOWN";
}

/**
 * @brief Configuration of one analysis run.
 *
 * @details
 * Parsing command lines or files into a `RunConfig` is the caller's job;
 * `validate()` only checks value ranges.
 */
struct RunConfig
{
    /**
     * @brief Run identifier; generated when empty.
     */
    std::string run_id;

    RunApproach approach{RunApproach::Random};
    RunMethod method{RunMethod::Simple};

    /**
     * @brief Coverage fraction at which the run stops.
     * @details Required in (0, 1] for RANDOM runs; 0 disables it for SCENARIO runs.
     */
    double coverage_target{0.0};

    CoverageScope scope;

    /**
     * @brief Nodes removed from every graph loaded by the run.
     */
    std::unordered_set<NodeId> ignore_node_ids;

    /**
     * @brief Data codes that mark TARGET endpoints and `E` node flags.
     */
    TargetCodeSet target_codes;

    /**
     * @brief RANDOM: attempt budget.
     */
    size_t max_attempts{10000};

    /**
     * @brief Wall-clock limit; zero disables it.
     */
    std::chrono::seconds timeout{3600};

    /**
     * @brief Seed of the sampler's random engine.
     */
    std::uint64_t seed{0};

    /**
     * @brief SCENARIO: node the downstream traversal starts from.
     */
    NodeId scenario_start_node_id{0};

    /**
     * @brief SCENARIO: node filters of the traversal.
     */
    PathFilters scenario_filters;

    /**
     * @brief SCENARIO: algorithm and budget. Its `target_codes` are replaced
     *        by `RunConfig::target_codes`.
     */
    TraversalOptions traversal;

    BiasConfig bias;
    ValidationConfig validation;

    /**
     * @brief Check value ranges.
     * @throws NetworkError with `InvalidConfiguration` on an invalid value.
     */
    void validate() const
    {
        auto fail = [](const std::string& what)
        {
            throw NetworkError(NetworkErrorCode::InvalidConfiguration, "Invalid run config: " + what);
        };
        if (approach == RunApproach::Random)
        {
            if (!(coverage_target > 0.0 && coverage_target <= 1.0))
            {
                fail("coverage_target must be in (0, 1] for RANDOM runs");
            }
            if (max_attempts == 0)
            {
                fail("max_attempts must be positive");
            }
        }
        else
        {
            if (coverage_target < 0.0 || coverage_target > 1.0)
            {
                fail("coverage_target must be in [0, 1]");
            }
            if (scenario_start_node_id == 0)
            {
                fail("scenario_start_node_id is required for SCENARIO runs");
            }
            if (ignore_node_ids.count(scenario_start_node_id) != 0u)
            {
                fail("scenario start node " + std::to_string(scenario_start_node_id) + " is in the ignore set");
            }
        }
        if (scope.model_no < 0 || scope.phase_no < 0)
        {
            fail("model_no and phase_no must not be negative");
        }
        if (timeout.count() < 0)
        {
            fail("timeout must not be negative");
        }
        bias.validate();
    }
};

} // namespace pocnet
