/**
 * @file run_orchestrator_tests.cpp
 * Unit tests for pocnet::RunOrchestrator and pocnet::RunConfig
 */
#include <gtest/gtest.h>
#include "pocnet/common/network_exceptions.hpp"
#include "pocnet/run/run_orchestrator.hpp"
#include "pocnet/store/memory_store.hpp"

#include <memory>
#include <set>
#include <stdexcept>
#include <string>
#include <vector>

using namespace pocnet;

namespace
{

void add_node(MemoryStore& store, NodeId id, std::int64_t data_code = 0)
{
    NetworkNode node;
    node.node_id = id;
    node.data_code = data_code;
    node.utility_no = 13;
    node.toolset_id = 1;
    store.add_node(node);
}

void add_link(MemoryStore& store, LinkId id, NodeId from, NodeId to, bool bidirected)
{
    NetworkLink link;
    link.link_id = id;
    link.start_node_id = from;
    link.end_node_id = to;
    link.is_bidirected = bidirected;
    store.add_link(link);
}

Equipment make_equipment(std::int64_t equipment_id, NodeId poc_node)
{
    EquipmentPoc poc;
    poc.poc_id = poc_node * 100 + 1;
    poc.node_id = poc_node;
    poc.utility_no = 13;
    poc.markers = "PCW";
    poc.reference = "R-" + std::to_string(poc_node);
    poc.material = "SS316";
    poc.is_used = true;

    Equipment equipment;
    equipment.equipment_id = equipment_id;
    equipment.guid = "eq-" + std::to_string(equipment_id);
    equipment.kind = "PROCESSING";
    equipment.pocs.push_back(poc);
    return equipment;
}

/**
 * @brief 1 <-> 2 <-> 3 and an isolated node 4. Toolset TS-A has two
 *        equipment whose PoCs sit on node 1 and on `second_poc_node`.
 */
void populate_random(MemoryStore& store, NodeId second_poc_node)
{
    for (NodeId id = 1; id <= 4; ++id)
    {
        add_node(store, id);
    }
    add_link(store, 1, 1, 2, true);
    add_link(store, 2, 2, 3, true);

    Toolset toolset;
    toolset.toolset_id = 1;
    toolset.code = "TS-A";
    toolset.fab = "F1";
    toolset.equipment.push_back(make_equipment(10, 1));
    toolset.equipment.push_back(make_equipment(20, second_poc_node));
    store.add_toolset(toolset);
}

/**
 * @brief 1 -> 2 -> 3 -> 5 and 2 -> 4. Node 3 carries data code 107.
 */
void populate_scenario(MemoryStore& store)
{
    add_node(store, 1);
    add_node(store, 2);
    add_node(store, 3, 107);
    add_node(store, 4);
    add_node(store, 5);
    add_link(store, 1, 1, 2, false);
    add_link(store, 2, 2, 3, false);
    add_link(store, 3, 2, 4, false);
    add_link(store, 4, 3, 5, false);
}

RunConfig random_config(double target, size_t max_attempts)
{
    RunConfig config;
    config.run_id = "random-test";
    config.approach = RunApproach::Random;
    config.coverage_target = target;
    config.max_attempts = max_attempts;
    config.seed = 7;
    config.bias.min_distance_between_nodes = 0;
    config.bias.utility_diversity_weight = 0.0;
    config.bias.category_diversity_weight = 0.0;
    config.bias.max_pair_attempts = 3;
    config.bias.max_toolset_pair_attempts = 5;
    return config;
}

RunConfig scenario_config()
{
    RunConfig config;
    config.run_id = "scenario-test";
    config.approach = RunApproach::Scenario;
    config.scenario_start_node_id = 1;
    config.target_codes = {107};
    return config;
}

NetworkErrorCode config_error(const RunConfig& config)
{
    try
    {
        config.validate();
    }
    catch (const NetworkError& e)
    {
        return e.code();
    }
    ADD_FAILURE() << "Expected NetworkError";
    return NetworkErrorCode::InvalidState;
}

/**
 * @brief Store that refuses every path record.
 */
class ReadOnlyStore : public MemoryStore
{
public:
    std::int64_t commit_path_record(const PathRecord&) override
    {
        throw NetworkError(NetworkErrorCode::BackingStoreUnavailable, "store is read-only");
    }
};

/**
 * @brief Store whose PoC lookups fail and whose standalone flag commits fail.
 */
class FlagRejectingStore : public MemoryStore
{
public:
    std::optional<PocInfo> load_poc_attributes(NodeId) override
    {
        throw std::runtime_error("poc table locked");
    }

    void commit_review_flags(const std::string&, const std::vector<ReviewFlag>&) override
    {
        throw NetworkError(NetworkErrorCode::BackingStoreUnavailable, "flag table offline");
    }
};

/**
 * @brief Store whose link listing fails, so any graph load fails the run.
 */
class NoLinksStore : public MemoryStore
{
public:
    std::vector<NetworkLink> load_links_touching(const std::unordered_set<NodeId>&) override
    {
        throw NetworkError(NetworkErrorCode::InvalidState, "links must not be read");
    }
};

} // namespace

// ============================================================================
// Configuration
// ============================================================================

TEST(RunOrchestratorTests, Config_RangesChecked)
{
    EXPECT_NO_THROW(random_config(1.0, 1).validate());
    EXPECT_NO_THROW(scenario_config().validate());

    EXPECT_EQ(config_error(random_config(0.0, 10)), NetworkErrorCode::InvalidConfiguration);
    EXPECT_EQ(config_error(random_config(1.5, 10)), NetworkErrorCode::InvalidConfiguration);
    EXPECT_EQ(config_error(random_config(0.5, 0)), NetworkErrorCode::InvalidConfiguration);

    RunConfig no_start = scenario_config();
    no_start.scenario_start_node_id = 0;
    EXPECT_EQ(config_error(no_start), NetworkErrorCode::InvalidConfiguration);

    RunConfig ignored_start = scenario_config();
    ignored_start.ignore_node_ids = {1};
    EXPECT_EQ(config_error(ignored_start), NetworkErrorCode::InvalidConfiguration);

    RunConfig negative_timeout = scenario_config();
    negative_timeout.timeout = std::chrono::seconds(-1);
    EXPECT_EQ(config_error(negative_timeout), NetworkErrorCode::InvalidConfiguration);

    RunConfig bad_bias = random_config(0.5, 10);
    bad_bias.bias.utility_diversity_weight = 2.0;
    EXPECT_EQ(config_error(bad_bias), NetworkErrorCode::InvalidConfiguration);
}

TEST(RunOrchestratorTests, Construct_NullStoreRejected)
{
    EXPECT_THROW(RunOrchestrator(nullptr), NetworkError);
}

TEST(RunOrchestratorTests, Run_InvalidConfigThrowsBeforeStart)
{
    auto store = std::make_shared<MemoryStore>();
    populate_random(*store, 3);
    RunOrchestrator orchestrator(store);
    try
    {
        orchestrator.run(random_config(0.0, 10));
        FAIL() << "Expected NetworkError";
    }
    catch (const NetworkError& e)
    {
        EXPECT_EQ(e.code(), NetworkErrorCode::InvalidConfiguration);
    }
    EXPECT_TRUE(store->load_path_records("random-test").empty());
}

// ============================================================================
// RANDOM
// ============================================================================

TEST(RunOrchestratorTests, Random_ReachesTargetAndCommitsPath)
{
    auto store = std::make_shared<MemoryStore>();
    populate_random(*store, 3);
    RunOrchestrator orchestrator(store);

    RunResult result = orchestrator.run(random_config(0.5, 10));
    EXPECT_EQ(result.status, RunStatus::Done);
    EXPECT_TRUE(result.target_reached);
    EXPECT_EQ(result.attempts, 1u);
    EXPECT_EQ(result.paths_found, 1u);
    EXPECT_EQ(result.record_ids, (std::vector<std::int64_t>{1}));
    EXPECT_EQ(result.coverage.covered_nodes, 3u);
    EXPECT_EQ(result.coverage.covered_links, 2u);
    EXPECT_NEAR(result.coverage.coverage_fraction, 5.0 / 6.0, 1e-12);
    EXPECT_EQ(result.validation.total_errors, 0u);
    EXPECT_EQ(result.sampling.pairs_sampled, 1u);

    auto records = store->load_path_records("random-test");
    ASSERT_EQ(records.size(), 1u);
    const PathRecord& record = records.front();
    EXPECT_EQ(record.algorithm, TraversalAlgorithm::Dijkstra);
    EXPECT_EQ(record.path.steps.size(), 2u);
    std::set<NodeId> ends{record.path.start_node_id, record.path.end_node_id};
    EXPECT_EQ(ends, (std::set<NodeId>{1, 3}));
    ASSERT_EQ(record.node_flags.size(), 3u);
    EXPECT_EQ(record.node_flags[0].second, NodeFlag::Start);
    EXPECT_EQ(record.node_flags[1].first, 2);
    EXPECT_EQ(record.node_flags[1].second, NodeFlag::Intermediate);
    EXPECT_TRUE(record.validation_errors.empty());
}

TEST(RunOrchestratorTests, Random_AttemptBudgetHonored)
{
    auto store = std::make_shared<MemoryStore>();
    populate_random(*store, 3);
    RunOrchestrator orchestrator(store);

    RunResult result = orchestrator.run(random_config(1.0, 5));
    EXPECT_EQ(result.status, RunStatus::Done);
    EXPECT_FALSE(result.target_reached);
    EXPECT_EQ(result.attempts, 5u);
    EXPECT_EQ(result.paths_found, 1u);
    EXPECT_EQ(result.no_pair_attempts, 4u);
    EXPECT_EQ(result.sampling.pairs_sampled, 1u);
    EXPECT_EQ(store->load_path_records("random-test").size(), 1u);
}

TEST(RunOrchestratorTests, Random_UnreachablePairFlagged)
{
    auto store = std::make_shared<MemoryStore>();
    populate_random(*store, 4);
    RunOrchestrator orchestrator(store);

    RunResult result = orchestrator.run(random_config(0.5, 3));
    EXPECT_EQ(result.status, RunStatus::Done);
    EXPECT_EQ(result.paths_found, 0u);
    EXPECT_EQ(result.paths_not_found, 1u);
    EXPECT_EQ(result.sampling.consecutive_failures, 1u);
    EXPECT_TRUE(store->load_path_records("random-test").empty());

    auto flags = store->load_review_flags("random-test");
    ASSERT_EQ(flags.size(), 1u);
    EXPECT_EQ(flags[0].reason, "NO_PATH_FOUND");
    EXPECT_EQ(flags[0].severity, Severity::Medium);
    ASSERT_TRUE(flags[0].start_node_id.has_value());
    ASSERT_TRUE(flags[0].end_node_id.has_value());
    std::set<NodeId> ends{*flags[0].start_node_id, *flags[0].end_node_id};
    EXPECT_EQ(ends, (std::set<NodeId>{1, 4}));
    EXPECT_NE(flags[0].notes.find("TS-A"), std::string::npos);
}

TEST(RunOrchestratorTests, Random_IgnoredPairSkippedWithoutFlag)
{
    auto store = std::make_shared<MemoryStore>();
    populate_random(*store, 4);
    RunOrchestrator orchestrator(store);

    RunConfig config = random_config(0.5, 2);
    config.ignore_node_ids = {4};
    RunResult result = orchestrator.run(config);
    EXPECT_EQ(result.paths_not_found, 1u);
    EXPECT_EQ(result.no_pair_attempts, 1u);
    EXPECT_TRUE(store->load_review_flags("random-test").empty());
}

TEST(RunOrchestratorTests, Random_GeneratedRunId)
{
    auto store = std::make_shared<MemoryStore>();
    populate_random(*store, 3);
    RunOrchestrator orchestrator(store);

    RunConfig config = random_config(0.5, 10);
    config.run_id.clear();
    RunResult result = orchestrator.run(config);
    EXPECT_EQ(result.run_id.rfind("run-", 0), 0u);
    EXPECT_EQ(store->load_path_records(result.run_id).size(), 1u);
}

// ============================================================================
// Stop and failure
// ============================================================================

TEST(RunOrchestratorTests, Stop_RequestedBeforeRun)
{
    auto store = std::make_shared<MemoryStore>();
    populate_random(*store, 3);
    RunOrchestrator orchestrator(store);
    EXPECT_FALSE(orchestrator.stop_requested());

    orchestrator.request_stop();
    EXPECT_TRUE(orchestrator.stop_requested());

    RunResult result = orchestrator.run(random_config(0.5, 10));
    EXPECT_EQ(result.status, RunStatus::Done);
    EXPECT_TRUE(result.stopped);
    EXPECT_EQ(result.attempts, 0u);
    EXPECT_TRUE(store->load_path_records("random-test").empty());

    RunResult scenario = orchestrator.run(scenario_config());
    EXPECT_TRUE(scenario.stopped);
    EXPECT_EQ(scenario.attempts, 0u);
}

TEST(RunOrchestratorTests, Stop_ScenarioSkipsTraversal)
{
    auto store = std::make_shared<NoLinksStore>();
    populate_random(*store, 3);
    RunOrchestrator orchestrator(store);
    orchestrator.request_stop();

    RunConfig config = scenario_config();
    config.traversal.algorithm = TraversalAlgorithm::Dfs;
    RunResult result = orchestrator.run(config);
    EXPECT_EQ(result.status, RunStatus::Done);
    EXPECT_TRUE(result.stopped);
    EXPECT_EQ(result.attempts, 0u);
    EXPECT_TRUE(result.error_message.empty());
}

TEST(RunOrchestratorTests, Failure_UnavailableStoreFailsRun)
{
    auto store = std::make_shared<MemoryStore>();
    populate_random(*store, 3);
    store->set_available(false);
    RunOrchestrator orchestrator(store);

    RunResult result = orchestrator.run(random_config(0.5, 10));
    EXPECT_EQ(result.status, RunStatus::Failed);
    EXPECT_FALSE(result.error_message.empty());
    EXPECT_EQ(result.attempts, 0u);
    EXPECT_NE(result.summary().find("FAILED"), std::string::npos);
}

TEST(RunOrchestratorTests, Failure_UnknownScenarioStartFailsRun)
{
    auto store = std::make_shared<MemoryStore>();
    populate_scenario(*store);
    RunOrchestrator orchestrator(store);

    RunConfig config = scenario_config();
    config.scenario_start_node_id = 999;
    RunResult result = orchestrator.run(config);
    EXPECT_EQ(result.status, RunStatus::Failed);
    EXPECT_NE(result.error_message.find("999"), std::string::npos);
}

TEST(RunOrchestratorTests, Failure_CommitErrorsCountedPerPath)
{
    auto store = std::make_shared<ReadOnlyStore>();
    populate_scenario(*store);
    RunOrchestrator orchestrator(store);

    RunResult result = orchestrator.run(scenario_config());
    EXPECT_EQ(result.status, RunStatus::Done);
    EXPECT_EQ(result.attempts, 3u);
    EXPECT_EQ(result.store_errors, 3u);
    EXPECT_EQ(result.paths_found, 0u);
    EXPECT_EQ(result.coverage.covered_nodes, 0u);
}

TEST(RunOrchestratorTests, Commit_ReviewFlagsTravelWithRecord)
{
    auto store = std::make_shared<FlagRejectingStore>();
    populate_scenario(*store);
    RunOrchestrator orchestrator(store);

    RunResult result = orchestrator.run(scenario_config());
    EXPECT_EQ(result.status, RunStatus::Done);
    EXPECT_EQ(result.store_errors, 0u);
    EXPECT_EQ(result.paths_found, 3u);

    auto records = store->load_path_records("scenario-test");
    ASSERT_EQ(records.size(), result.paths_found);
    EXPECT_EQ(result.record_ids.size(), records.size());

    size_t record_flags = 0;
    for (const auto& record : records)
    {
        EXPECT_FALSE(record.review_flags.empty());
        record_flags += record.review_flags.size();
    }
    auto flags = store->load_review_flags("scenario-test");
    EXPECT_EQ(flags.size(), record_flags);
    EXPECT_EQ(result.validation.review_flags, record_flags);

    CoverageTracker rebuilt(store);
    rebuilt.initialize(CoverageScope{});
    CoverageMetrics from_store = rebuilt.rebuild_from_store("scenario-test");
    EXPECT_EQ(from_store.covered_nodes, result.coverage.covered_nodes);
    EXPECT_EQ(from_store.covered_links, result.coverage.covered_links);
}

// ============================================================================
// SCENARIO
// ============================================================================

TEST(RunOrchestratorTests, Scenario_RecordsEveryPathWithFlags)
{
    auto store = std::make_shared<MemoryStore>();
    populate_scenario(*store);
    RunOrchestrator orchestrator(store);

    RunResult result = orchestrator.run(scenario_config());
    EXPECT_EQ(result.status, RunStatus::Done);
    EXPECT_EQ(result.attempts, 3u);
    EXPECT_EQ(result.paths_found, 3u);
    EXPECT_FALSE(result.target_reached);
    EXPECT_DOUBLE_EQ(result.coverage.coverage_fraction, 1.0);

    auto records = store->load_path_records("scenario-test");
    ASSERT_EQ(records.size(), 3u);
    EXPECT_EQ(records[0].path.end_node_id, 3);
    EXPECT_EQ(records[0].path.endpoint_type, EndpointType::Target);
    EXPECT_EQ(records[1].path.end_node_id, 4);
    EXPECT_EQ(records[2].path.end_node_id, 5);

    using Flags = std::vector<std::pair<NodeId, NodeFlag>>;
    EXPECT_EQ(records[0].node_flags,
              (Flags{{1, NodeFlag::Start}, {2, NodeFlag::Convergence}, {3, NodeFlag::Endpoint}}));
    EXPECT_EQ(records[1].node_flags,
              (Flags{{1, NodeFlag::Start}, {2, NodeFlag::Convergence}, {4, NodeFlag::Leaf}}));
    EXPECT_EQ(records[2].node_flags, (Flags{{1, NodeFlag::Start},
                                            {2, NodeFlag::Convergence},
                                            {3, NodeFlag::Convergence},
                                            {5, NodeFlag::Leaf}}));
}

TEST(RunOrchestratorTests, Scenario_StopsAtCoverageTarget)
{
    auto store = std::make_shared<MemoryStore>();
    populate_scenario(*store);
    RunOrchestrator orchestrator(store);

    RunConfig config = scenario_config();
    config.coverage_target = 0.5;
    RunResult result = orchestrator.run(config);
    EXPECT_TRUE(result.target_reached);
    EXPECT_EQ(result.attempts, 1u);
    EXPECT_NEAR(result.coverage.coverage_fraction, 5.0 / 9.0, 1e-12);
    EXPECT_EQ(store->load_path_records("scenario-test").size(), 1u);
}

// ============================================================================
// Helpers
// ============================================================================

TEST(RunOrchestratorTests, FlagsForPath_PathOrderDistinctNodes)
{
    PathResult path;
    path.path_id = 2;
    path.start_node_id = 1;
    for (bool reversed : {false, true})
    {
        PathStep step;
        step.seq = path.steps.size() + 1;
        step.link_id = 10;
        step.from_node = 1;
        step.to_node = 2;
        step.reversed = reversed;
        path.steps.push_back(step);
    }
    path.end_node_id = 1;

    NodeFlagMap flags;
    flags[{2, 1}] = NodeFlag::Start;
    flags[{2, 2}] = NodeFlag::Intermediate;
    flags[{3, 2}] = NodeFlag::Leaf;

    auto result = flags_for_path(flags, path);
    ASSERT_EQ(result.size(), 2u);
    EXPECT_EQ(result[0].first, 1);
    EXPECT_EQ(result[0].second, NodeFlag::Start);
    EXPECT_EQ(result[1].first, 2);
    EXPECT_EQ(result[1].second, NodeFlag::Intermediate);
}
