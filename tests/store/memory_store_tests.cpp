/**
 * @file memory_store_tests.cpp
 * Unit tests for pocnet::MemoryStore
 */
#include <gtest/gtest.h>
#include "pocnet/common/network_exceptions.hpp"
#include "pocnet/store/memory_store.hpp"

#include <algorithm>
#include <string>
#include <vector>

using namespace pocnet;

namespace
{

NetworkNode make_node(NodeId id, std::int64_t utility, std::int64_t toolset_id = 0,
                      const std::string& eq_poc_no = "")
{
    NetworkNode node;
    node.node_id = id;
    node.utility_no = utility;
    node.toolset_id = toolset_id;
    node.eq_poc_no = eq_poc_no;
    node.kind = NodeKind::Poc;
    return node;
}

NetworkLink make_link(LinkId id, NodeId from, NodeId to, bool bidirected)
{
    NetworkLink link;
    link.link_id = id;
    link.guid = "g" + std::to_string(id);
    link.start_node_id = from;
    link.end_node_id = to;
    link.is_bidirected = bidirected;
    return link;
}

Toolset make_toolset(std::int64_t id, const std::string& code, const std::string& fab, NodeId first_node)
{
    Toolset toolset;
    toolset.toolset_id = id;
    toolset.code = code;
    toolset.fab = fab;
    toolset.model_no = 2;
    toolset.phase_no = 1;

    Equipment eq;
    eq.equipment_id = id * 100;
    eq.guid = "eq-" + code;
    eq.kind = "PROCESSING";
    EquipmentPoc poc;
    poc.poc_id = id * 1000;
    poc.node_id = first_node;
    poc.utility_no = 13;
    eq.pocs.push_back(poc);
    EquipmentPoc inactive = poc;
    inactive.poc_id = id * 1000 + 1;
    inactive.node_id = first_node + 1;
    inactive.is_active = false;
    eq.pocs.push_back(inactive);
    toolset.equipment.push_back(eq);
    return toolset;
}

/**
 * @brief Two toolsets in fab F1 and F2; nodes 10/11 belong to toolset 1,
 *        20/21 to toolset 2, 30 to none.
 */
void populate(MemoryStore& store)
{
    store.add_node(make_node(10, 13, 1, "EQ-A01"));
    store.add_node(make_node(11, 13, 1, "EQ-A02"));
    store.add_node(make_node(20, 13, 2, "EQ-B01"));
    store.add_node(make_node(21, 14, 2, "EQ-B02"));
    store.add_node(make_node(30, 13));
    store.add_link(make_link(1, 10, 11, false));
    store.add_link(make_link(2, 11, 20, true));
    store.add_link(make_link(3, 20, 21, false));
    store.add_link(make_link(4, 21, 30, false));
    store.add_toolset(make_toolset(1, "TS-A", "F1", 10));
    store.add_toolset(make_toolset(2, "TS-B", "F2", 20));
}

} // namespace

// ============================================================================
// Node and link queries
// ============================================================================

TEST(MemoryStoreTests, LoadNode_MissingIsEmpty)
{
    MemoryStore store;
    populate(store);
    EXPECT_TRUE(store.load_node(10).has_value());
    EXPECT_FALSE(store.load_node(99).has_value());
    EXPECT_TRUE(store.node_exists(30));
    EXPECT_FALSE(store.node_exists(31));
    EXPECT_TRUE(store.link_exists(4));
    EXPECT_FALSE(store.link_exists(5));
}

TEST(MemoryStoreTests, LoadNodes_AppliesFiltersAndExclusions)
{
    MemoryStore store;
    populate(store);
    PathFilters filters;
    filters.utility_no = 13;

    auto nodes = store.load_nodes(filters, {11});
    std::vector<NodeId> ids;
    for (const auto& node : nodes)
    {
        ids.push_back(node.node_id);
    }
    EXPECT_EQ(ids, (std::vector<NodeId>{10, 20, 30}));
}

TEST(MemoryStoreTests, LoadNodes_EqPocFilterIsTrimmedCaseInsensitiveSubstring)
{
    MemoryStore store;
    populate(store);
    PathFilters filters;
    filters.eq_poc_no = "  eq-b ";

    auto nodes = store.load_nodes(filters, {});
    ASSERT_EQ(nodes.size(), 2u);
    EXPECT_EQ(nodes[0].node_id, 20);
    EXPECT_EQ(nodes[1].node_id, 21);
}

TEST(MemoryStoreTests, LoadLinksTouching_EitherEndpoint)
{
    MemoryStore store;
    populate(store);
    auto links = store.load_links_touching({20});
    ASSERT_EQ(links.size(), 2u);
    EXPECT_EQ(links[0].link_id, 2);
    EXPECT_EQ(links[1].link_id, 3);
}

TEST(MemoryStoreTests, FindLinkBetween_RespectsDirection)
{
    MemoryStore store;
    populate(store);
    EXPECT_TRUE(store.find_link_between(10, 11).has_value());
    EXPECT_FALSE(store.find_link_between(11, 10).has_value());

    auto reverse = store.find_link_between(20, 11);
    ASSERT_TRUE(reverse.has_value());
    EXPECT_EQ(reverse->link_id, 2);
}

TEST(MemoryStoreTests, PocAttributes_JoinedWithEquipment)
{
    MemoryStore store;
    populate(store);
    auto info = store.load_poc_attributes(10);
    ASSERT_TRUE(info.has_value());
    EXPECT_EQ(info->equipment_guid, "eq-TS-A");
    EXPECT_EQ(info->equipment_kind, "PROCESSING");
    EXPECT_EQ(info->poc.equipment_id, 100);
    EXPECT_FALSE(store.load_poc_attributes(30).has_value());
}

// ============================================================================
// Scope and catalog
// ============================================================================

TEST(MemoryStoreTests, Scope_UnconstrainedCoversEverything)
{
    MemoryStore store;
    populate(store);
    ScopeTotals totals = store.count_scope(CoverageScope{});
    EXPECT_EQ(totals.nodes, 5u);
    EXPECT_EQ(totals.links, 4u);
}

TEST(MemoryStoreTests, Scope_FabSelectsToolsetNodesAndInnerLinks)
{
    MemoryStore store;
    populate(store);
    CoverageScope scope;
    scope.fab = "F2";

    EXPECT_EQ(store.list_scope_ids(scope, ScopeElement::Node), (std::vector<std::int64_t>{20, 21}));
    EXPECT_EQ(store.list_scope_ids(scope, ScopeElement::Link), (std::vector<std::int64_t>{3}));
}

TEST(MemoryStoreTests, Scope_NoMatchingToolsetIsEmpty)
{
    MemoryStore store;
    populate(store);
    CoverageScope scope;
    scope.toolset_code = "TS-Z";
    ScopeTotals totals = store.count_scope(scope);
    EXPECT_EQ(totals.nodes, 0u);
    EXPECT_EQ(totals.links, 0u);
}

TEST(MemoryStoreTests, Catalog_DropsInactivePocs)
{
    MemoryStore store;
    populate(store);
    CoverageScope scope;
    scope.fab = "F1";
    auto catalog = store.load_catalog(scope);
    ASSERT_EQ(catalog.size(), 1u);
    EXPECT_EQ(catalog[0].code, "TS-A");
    ASSERT_EQ(catalog[0].equipment.size(), 1u);
    ASSERT_EQ(catalog[0].equipment[0].pocs.size(), 1u);
    EXPECT_EQ(catalog[0].equipment[0].pocs[0].node_id, 10);
}

// ============================================================================
// Records
// ============================================================================

TEST(MemoryStoreTests, Records_AssignedIncreasingIdsPerRun)
{
    MemoryStore store;
    populate(store);
    PathRecord record;
    record.run_id = "r1";
    std::int64_t first = store.commit_path_record(record);
    std::int64_t second = store.commit_path_record(record);
    EXPECT_EQ(first, 1);
    EXPECT_EQ(second, 2);

    auto records = store.load_path_records("r1");
    ASSERT_EQ(records.size(), 2u);
    EXPECT_EQ(records[0].record_id, 1);
    EXPECT_EQ(records[1].record_id, 2);
    EXPECT_TRUE(store.load_path_records("other").empty());
}

TEST(MemoryStoreTests, Records_ReviewFlagsCommittedWithRecord)
{
    MemoryStore store;
    populate(store);
    ReviewFlag flag;
    flag.reason = "VALIDATION_TEST_FAILED";
    PathRecord record;
    record.run_id = "r1";
    record.review_flags = {flag, flag};
    store.commit_path_record(record);

    auto records = store.load_path_records("r1");
    ASSERT_EQ(records.size(), 1u);
    EXPECT_EQ(records[0].review_flags.size(), 2u);
    auto flags = store.load_review_flags("r1");
    ASSERT_EQ(flags.size(), 2u);
    EXPECT_EQ(flags[0].reason, "VALIDATION_TEST_FAILED");

    store.set_available(false);
    EXPECT_THROW(store.commit_path_record(record), NetworkError);
    store.set_available(true);
    EXPECT_EQ(store.load_path_records("r1").size(), 1u);
    EXPECT_EQ(store.load_review_flags("r1").size(), 2u);
}

TEST(MemoryStoreTests, Records_EmptyRunIdRejected)
{
    MemoryStore store;
    populate(store);
    try
    {
        store.commit_path_record(PathRecord{});
        FAIL() << "Expected NetworkError";
    }
    catch (const NetworkError& e)
    {
        EXPECT_EQ(e.code(), NetworkErrorCode::InvalidConfiguration);
    }
}

TEST(MemoryStoreTests, ReviewFlags_AppendedPerRun)
{
    MemoryStore store;
    populate(store);
    ReviewFlag flag;
    flag.reason = "NO_PATH_FOUND";
    store.commit_review_flags("r1", {flag});
    store.commit_review_flags("r1", {flag, flag});
    EXPECT_EQ(store.load_review_flags("r1").size(), 3u);
    EXPECT_TRUE(store.load_review_flags("r2").empty());
}

// ============================================================================
// Availability
// ============================================================================

TEST(MemoryStoreTests, Unavailable_EveryQueryThrows)
{
    MemoryStore store;
    populate(store);
    store.set_available(false);
    EXPECT_FALSE(store.available());
    EXPECT_THROW(store.load_node(10), NetworkError);
    EXPECT_THROW(store.load_nodes(PathFilters{}, {}), NetworkError);
    EXPECT_THROW(store.count_scope(CoverageScope{}), NetworkError);
    EXPECT_THROW(store.load_catalog(CoverageScope{}), NetworkError);

    try
    {
        store.node_exists(10);
        FAIL() << "Expected NetworkError";
    }
    catch (const NetworkError& e)
    {
        EXPECT_EQ(e.code(), NetworkErrorCode::BackingStoreUnavailable);
    }

    store.set_available(true);
    EXPECT_TRUE(store.node_exists(10));
}
