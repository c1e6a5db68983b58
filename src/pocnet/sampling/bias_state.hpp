/**
 * @file bias_state.hpp
 * @brief Bias mitigation configuration and per-run sampling state.
 */
#pragma once
#include "pocnet/common/common.hpp"
#include "pocnet/common/network_enums.hpp"
#include "pocnet/common/network_exceptions.hpp"

namespace pocnet
{

/**
 * @brief Configuration for bias mitigation in `BiasedSampler`.
 */
struct BiasConfig
{
    /**
     * @brief Toolsets with this many attempts are excluded from selection.
     */
    size_t max_attempts_per_toolset{5};

    /**
     * @brief Equipment with this many attempts is excluded from selection.
     */
    size_t max_attempts_per_equipment{3};

    /**
     * @brief Minimum absolute node id distance between a candidate node and
     *        its partner or any recently sampled node.
     */
    std::int64_t min_distance_between_nodes{10};

    /**
     * @brief Rejection probability for a pair whose utilities were all sampled before.
     */
    double utility_diversity_weight{0.3};

    /**
     * @brief Rejection probability for a pair whose equipment categories were all sampled before.
     */
    double category_diversity_weight{0.2};

    /**
     * @brief Consecutive path failures after which a toolset is suspended.
     */
    size_t max_consecutive_failures{50};

    /**
     * @brief Toolset draws before `sample()` reports that no pair was found.
     */
    size_t max_pair_attempts{100};

    /**
     * @brief Equipment pair draws within one toolset before it counts as failed.
     */
    size_t max_toolset_pair_attempts{50};

    /**
     * @brief Capacity of the recently sampled node buffer.
     */
    size_t recency_capacity{32};

    /**
     * @brief Check value ranges.
     * @throws NetworkError with `InvalidConfiguration` on an invalid value.
     */
    void validate() const
    {
        auto fail = [](const std::string& what)
        {
            throw NetworkError(NetworkErrorCode::InvalidConfiguration, "Invalid bias config: " + what);
        };
        if (max_attempts_per_toolset == 0)
        {
            fail("max_attempts_per_toolset must be positive");
        }
        if (max_attempts_per_equipment == 0)
        {
            fail("max_attempts_per_equipment must be positive");
        }
        if (min_distance_between_nodes < 0)
        {
            fail("min_distance_between_nodes must not be negative");
        }
        if (utility_diversity_weight < 0.0 || utility_diversity_weight > 1.0)
        {
            fail("utility_diversity_weight must be in [0, 1]");
        }
        if (category_diversity_weight < 0.0 || category_diversity_weight > 1.0)
        {
            fail("category_diversity_weight must be in [0, 1]");
        }
        if (max_pair_attempts == 0 || max_toolset_pair_attempts == 0)
        {
            fail("pair attempt limits must be positive");
        }
    }
};

/**
 * @brief Mutable bias mitigation state of one run.
 *
 * @details
 * Created fresh for each run and passed by reference to `BiasedSampler`.
 * Attempt counters only decrease through the partial resets the sampler
 * applies when a whole candidate pool is exhausted.
 */
struct BiasState
{
    std::map<std::string, size_t> toolset_attempts;
    std::map<std::int64_t, size_t> equipment_attempts;
    std::map<std::int64_t, size_t> utility_usage;
    std::map<std::string, size_t> category_usage;

    /// Toolsets suspended after too many consecutive path failures.
    std::set<std::string> suspended_toolsets;

    /// Recently sampled node ids, oldest first.
    std::deque<NodeId> recent_nodes;

    std::unordered_set<NodePair, NodePairHash> attempted_pairs;

    size_t consecutive_failures{0};
    std::string last_successful_toolset;

    size_t pairs_sampled{0};
    size_t rejected_too_close{0};
    size_t rejected_repeated{0};
    size_t rejected_diversity{0};
    size_t exhausted_draws{0};

    void remember_node(NodeId node_id, size_t capacity)
    {
        recent_nodes.push_back(node_id);
        while (recent_nodes.size() > capacity)
        {
            recent_nodes.pop_front();
        }
    }

    /**
     * @brief Clear all counters, buffers and suspensions.
     */
    void reset()
    {
        *this = BiasState{};
    }
};

} // namespace pocnet
