/**
 * @file biased_sampler_tests.cpp
 * Unit tests for pocnet::BiasedSampler
 */
#include <gtest/gtest.h>
#include "pocnet/common/network_exceptions.hpp"
#include "pocnet/sampling/biased_sampler.hpp"

#include <string>
#include <vector>

using namespace pocnet;

namespace
{

/**
 * @brief Toolset with `equipment_count` equipment of `pocs_per_equipment`
 *        used PoCs each. Node ids start at `first_node` and step by 100.
 */
Toolset make_toolset(const std::string& code, const std::string& fab, size_t equipment_count,
                     size_t pocs_per_equipment, NodeId first_node)
{
    Toolset toolset;
    toolset.code = code;
    toolset.fab = fab;
    NodeId node = first_node;
    for (size_t e = 0; e < equipment_count; ++e)
    {
        Equipment equipment;
        equipment.equipment_id = first_node + static_cast<std::int64_t>(e);
        equipment.toolset_code = code;
        equipment.kind = "PROCESSING";
        for (size_t p = 0; p < pocs_per_equipment; ++p)
        {
            EquipmentPoc poc;
            poc.poc_id = node;
            poc.equipment_id = equipment.equipment_id;
            poc.node_id = node;
            poc.utility_no = 13;
            poc.is_used = true;
            equipment.pocs.push_back(poc);
            node += 100;
        }
        toolset.equipment.push_back(equipment);
    }
    return toolset;
}

/**
 * @brief Configuration without distance or diversity rejections.
 */
BiasConfig permissive_config()
{
    BiasConfig config;
    config.min_distance_between_nodes = 0;
    config.utility_diversity_weight = 0.0;
    config.category_diversity_weight = 0.0;
    config.max_pair_attempts = 5;
    config.max_toolset_pair_attempts = 10;
    return config;
}

} // namespace

// ============================================================================
// Configuration
// ============================================================================

TEST(BiasedSamplerTests, Config_InvalidRejected)
{
    BiasConfig config;
    config.utility_diversity_weight = 1.5;
    try
    {
        BiasedSampler sampler(config, 1);
        FAIL() << "Expected NetworkError";
    }
    catch (const NetworkError& e)
    {
        EXPECT_EQ(e.code(), NetworkErrorCode::InvalidConfiguration);
    }

    BiasConfig zero_ceiling;
    zero_ceiling.max_attempts_per_toolset = 0;
    EXPECT_THROW(BiasedSampler(zero_ceiling, 1), NetworkError);

    BiasConfig negative_distance;
    negative_distance.min_distance_between_nodes = -1;
    EXPECT_THROW(BiasedSampler(negative_distance, 1), NetworkError);
}

// ============================================================================
// Toolset selection
// ============================================================================

TEST(BiasedSamplerTests, Toolset_AtCeilingExcluded)
{
    BiasedSampler sampler(permissive_config(), 7);
    BiasState state;
    std::vector<Toolset> catalog{make_toolset("A", "F1", 3, 2, 1000), make_toolset("B", "F1", 3, 2, 5000)};
    state.toolset_attempts["A"] = sampler.config().max_attempts_per_toolset;

    for (int i = 0; i < 4; ++i)
    {
        auto pair = sampler.sample(state, catalog, CoverageScope{});
        ASSERT_TRUE(pair.has_value());
        EXPECT_EQ(pair->toolset_code, "B");
    }
    EXPECT_EQ(state.toolset_attempts["A"], sampler.config().max_attempts_per_toolset);
    EXPECT_EQ(state.toolset_attempts["B"], 4u);
}

TEST(BiasedSamplerTests, Toolset_SoleToolsetAtCeilingIsLowered)
{
    BiasedSampler sampler(permissive_config(), 7);
    BiasState state;
    std::vector<Toolset> catalog{make_toolset("A", "F1", 3, 2, 1000)};
    state.toolset_attempts["A"] = 5;
    state.suspended_toolsets.insert("A");

    auto pair = sampler.sample(state, catalog, CoverageScope{});
    ASSERT_TRUE(pair.has_value());
    EXPECT_EQ(pair->toolset_code, "A");
    // Lowered by 2, then one accepted pair.
    EXPECT_EQ(state.toolset_attempts["A"], 4u);
    EXPECT_TRUE(state.suspended_toolsets.empty());
}

TEST(BiasedSamplerTests, Toolset_ScopeFabRestrictsSelection)
{
    BiasedSampler sampler(permissive_config(), 11);
    BiasState state;
    std::vector<Toolset> catalog{make_toolset("A", "F1", 3, 2, 1000), make_toolset("B", "F2", 3, 2, 5000)};
    CoverageScope scope;
    scope.fab = "F2";

    for (int i = 0; i < 3; ++i)
    {
        auto pair = sampler.sample(state, catalog, scope);
        ASSERT_TRUE(pair.has_value());
        EXPECT_EQ(pair->fab, "F2");
        EXPECT_EQ(pair->toolset_code, "B");
    }
}

TEST(BiasedSamplerTests, Toolset_SingleEquipmentNotEligible)
{
    BiasedSampler sampler(permissive_config(), 3);
    BiasState state;
    std::vector<Toolset> catalog{make_toolset("A", "F1", 1, 4, 1000)};

    EXPECT_FALSE(sampler.sample(state, catalog, CoverageScope{}).has_value());
    EXPECT_EQ(state.exhausted_draws, 1u);
    EXPECT_EQ(state.pairs_sampled, 0u);
}

// ============================================================================
// Pair checks
// ============================================================================

TEST(BiasedSamplerTests, Pair_NodesFromDistinctEquipment)
{
    BiasedSampler sampler(permissive_config(), 5);
    BiasState state;
    std::vector<Toolset> catalog{make_toolset("A", "F1", 4, 3, 1000)};

    for (int i = 0; i < 6; ++i)
    {
        auto pair = sampler.sample(state, catalog, CoverageScope{});
        ASSERT_TRUE(pair.has_value());
        EXPECT_NE(pair->from_equipment_id, pair->to_equipment_id);
        EXPECT_NE(pair->from_node_id, pair->to_node_id);
        EXPECT_GT(pair->estimated_cost, 0.0);
    }
    EXPECT_EQ(state.pairs_sampled, 6u);
    EXPECT_EQ(state.attempted_pairs.size(), 6u);
}

TEST(BiasedSamplerTests, Pair_TooCloseRejected)
{
    BiasConfig config = permissive_config();
    config.min_distance_between_nodes = 100000;
    BiasedSampler sampler(config, 5);
    BiasState state;
    std::vector<Toolset> catalog{make_toolset("A", "F1", 3, 2, 1000)};

    EXPECT_FALSE(sampler.sample(state, catalog, CoverageScope{}).has_value());
    EXPECT_GT(state.rejected_too_close, 0u);
    EXPECT_EQ(state.pairs_sampled, 0u);
    EXPECT_EQ(state.exhausted_draws, 1u);
    // Every failed toolset draw counts one attempt.
    EXPECT_EQ(state.toolset_attempts["A"], config.max_pair_attempts);
}

TEST(BiasedSamplerTests, Pair_RecentNodesRejected)
{
    BiasConfig config = permissive_config();
    config.min_distance_between_nodes = 50;
    BiasedSampler sampler(config, 5);
    BiasState state;
    std::vector<Toolset> catalog{make_toolset("A", "F1", 2, 1, 1000)};
    state.remember_node(1000, config.recency_capacity);

    EXPECT_FALSE(sampler.sample(state, catalog, CoverageScope{}).has_value());
    EXPECT_GT(state.rejected_too_close, 0u);
}

TEST(BiasedSamplerTests, Pair_RepeatedPairRejected)
{
    BiasedSampler sampler(permissive_config(), 9);
    BiasState state;
    std::vector<Toolset> catalog{make_toolset("A", "F1", 2, 1, 1000)};

    auto first = sampler.sample(state, catalog, CoverageScope{});
    ASSERT_TRUE(first.has_value());
    EXPECT_FALSE(sampler.sample(state, catalog, CoverageScope{}).has_value());
    EXPECT_GT(state.rejected_repeated, 0u);
    EXPECT_EQ(state.pairs_sampled, 1u);
}

TEST(BiasedSamplerTests, Pair_FullDiversityWeightRejectsSeenUtilities)
{
    BiasConfig config = permissive_config();
    config.utility_diversity_weight = 1.0;
    BiasedSampler sampler(config, 13);
    BiasState state;
    std::vector<Toolset> catalog{make_toolset("A", "F1", 3, 3, 1000)};

    // Nothing sampled yet, so the first pair passes the roll.
    ASSERT_TRUE(sampler.sample(state, catalog, CoverageScope{}).has_value());
    EXPECT_EQ(state.utility_usage[13], 2u);

    EXPECT_FALSE(sampler.sample(state, catalog, CoverageScope{}).has_value());
    EXPECT_GT(state.rejected_diversity, 0u);
}

TEST(BiasedSamplerTests, Poc_UsedPocsPreferred)
{
    std::vector<Toolset> catalog{make_toolset("A", "F1", 2, 3, 1000)};
    for (auto& equipment : catalog[0].equipment)
    {
        for (size_t p = 1; p < equipment.pocs.size(); ++p)
        {
            equipment.pocs[p].is_used = false;
        }
    }
    const NodeId used_a = catalog[0].equipment[0].pocs[0].node_id;
    const NodeId used_b = catalog[0].equipment[1].pocs[0].node_id;

    for (std::uint64_t seed = 1; seed <= 10; ++seed)
    {
        BiasedSampler sampler(permissive_config(), seed);
        BiasState state;
        auto pair = sampler.sample(state, catalog, CoverageScope{});
        ASSERT_TRUE(pair.has_value());
        EXPECT_EQ(make_node_pair(pair->from_node_id, pair->to_node_id), make_node_pair(used_a, used_b));
    }
}

TEST(BiasedSamplerTests, Poc_NodelessPocsSkipped)
{
    std::vector<Toolset> catalog{make_toolset("A", "F1", 2, 1, 1000)};
    catalog[0].equipment[1].pocs[0].node_id = 0;

    BiasedSampler sampler(permissive_config(), 2);
    BiasState state;
    EXPECT_FALSE(sampler.sample(state, catalog, CoverageScope{}).has_value());
}

TEST(BiasedSamplerTests, Seed_SameSeedSameSequence)
{
    std::vector<Toolset> catalog{make_toolset("A", "F1", 4, 3, 1000), make_toolset("B", "F1", 3, 2, 9000)};
    BiasConfig config;
    config.min_distance_between_nodes = 0;
    BiasedSampler first(config, 2024);
    BiasedSampler second(config, 2024);
    BiasState state_a;
    BiasState state_b;

    for (int i = 0; i < 10; ++i)
    {
        auto a = first.sample(state_a, catalog, CoverageScope{});
        auto b = second.sample(state_b, catalog, CoverageScope{});
        ASSERT_EQ(a.has_value(), b.has_value());
        if (a)
        {
            EXPECT_EQ(a->from_node_id, b->from_node_id);
            EXPECT_EQ(a->to_node_id, b->to_node_id);
        }
    }
}

// ============================================================================
// Outcomes, statistics and reset
// ============================================================================

TEST(BiasedSamplerTests, Outcome_ConsecutiveFailuresSuspendToolset)
{
    BiasConfig config = permissive_config();
    config.max_consecutive_failures = 2;
    BiasedSampler sampler(config, 1);
    BiasState state;
    PocPair pair;
    pair.toolset_code = "A";

    sampler.record_outcome(state, pair, false);
    EXPECT_TRUE(state.suspended_toolsets.empty());
    sampler.record_outcome(state, pair, false);
    EXPECT_EQ(state.suspended_toolsets.count("A"), 1u);

    sampler.record_outcome(state, pair, true);
    EXPECT_EQ(state.consecutive_failures, 0u);
    EXPECT_EQ(state.last_successful_toolset, "A");
}

TEST(BiasedSamplerTests, Statistics_SnapshotAndReset)
{
    BiasedSampler sampler(permissive_config(), 4);
    BiasState state;
    std::vector<Toolset> catalog{make_toolset("A", "F1", 3, 2, 1000)};
    ASSERT_TRUE(sampler.sample(state, catalog, CoverageScope{}).has_value());
    ASSERT_TRUE(sampler.sample(state, catalog, CoverageScope{}).has_value());

    SamplingStatistics stats = sampler.statistics(state);
    EXPECT_EQ(stats.pairs_sampled, 2u);
    EXPECT_EQ(stats.toolset_attempts.at("A"), 2u);
    EXPECT_FALSE(stats.summary().empty());

    sampler.reset(state);
    SamplingStatistics cleared = sampler.statistics(state);
    EXPECT_EQ(cleared.pairs_sampled, 0u);
    EXPECT_TRUE(cleared.toolset_attempts.empty());
    EXPECT_TRUE(state.attempted_pairs.empty());
    EXPECT_TRUE(state.recent_nodes.empty());
}
