/**
 * @file backing_store.hpp
 * @brief BackingStore interface consumed by the analysis engine.
 */
#pragma once
#include "pocnet/common/common.hpp"
#include "pocnet/common/facility_items.hpp"
#include "pocnet/common/network_items.hpp"
#include "pocnet/store/store_types.hpp"

namespace pocnet
{

/**
 * @brief Interface for the persistent network and run store.
 *
 * @details
 * The engine only ever reads the network through this interface and writes
 * run results through `commit_path_record()` and `commit_review_flags()`.
 * Implementations report any failure to reach the underlying storage by
 * throwing `NetworkError` with code `BackingStoreUnavailable`; a lookup that
 * simply finds nothing is not an error.
 *
 * @par Thread safety
 * - Implementations define their own guarantees. `MemoryStore` is safe for
 *   concurrent use.
 */
class BackingStore
{
public:
    virtual ~BackingStore() = default;

    /**
     * @brief Load one node by id.
     * @return The node, or an empty optional if it does not exist.
     */
    virtual std::optional<NetworkNode> load_node(NodeId node_id) = 0;

    /**
     * @brief Load every node satisfying the filters, except the excluded ids.
     * @details Nodes are returned in ascending id order.
     */
    virtual std::vector<NetworkNode> load_nodes(
        const PathFilters& filters,
        const std::unordered_set<NodeId>& exclude) = 0;

    /**
     * @brief Load the nodes with the given ids; unknown ids are skipped.
     */
    virtual std::vector<NetworkNode> load_nodes_by_id(const std::vector<NodeId>& node_ids) = 0;

    /**
     * @brief Load every link with at least one endpoint in `node_ids`.
     * @details Links are returned in ascending id order.
     */
    virtual std::vector<NetworkLink> load_links_touching(
        const std::unordered_set<NodeId>& node_ids) = 0;

    virtual bool node_exists(NodeId node_id) = 0;

    virtual bool link_exists(LinkId link_id) = 0;

    virtual std::optional<NetworkLink> load_link(LinkId link_id) = 0;

    /**
     * @brief Find a link joining two nodes that can be traversed from `from` to `to`.
     * @details A unidirectional link qualifies only in its own orientation.
     */
    virtual std::optional<NetworkLink> find_link_between(NodeId from, NodeId to) = 0;

    /**
     * @brief Load the PoC attributes backed by a node.
     * @return The PoC with its owning equipment, or an empty optional if the
     *         node is not a PoC node.
     */
    virtual std::optional<PocInfo> load_poc_attributes(NodeId node_id) = 0;

    virtual ScopeTotals count_scope(const CoverageScope& scope) = 0;

    /**
     * @brief List the ids of all nodes or links in a scope, ascending.
     */
    virtual std::vector<std::int64_t> list_scope_ids(
        const CoverageScope& scope,
        ScopeElement element) = 0;

    /**
     * @brief Load the active toolsets of a scope with their active equipment and PoCs.
     */
    virtual std::vector<Toolset> load_catalog(const CoverageScope& scope) = 0;

    /**
     * @brief Atomically persist a path record.
     * @details The record's review flags are stored with it and become
     *          visible through `load_review_flags()` in the same commit.
     * @return The id assigned to the record.
     */
    virtual std::int64_t commit_path_record(const PathRecord& record) = 0;

    /**
     * @brief Persist review flags that are not attached to a path.
     */
    virtual void commit_review_flags(
        const std::string& run_id,
        const std::vector<ReviewFlag>& flags) = 0;

    virtual std::vector<PathRecord> load_path_records(const std::string& run_id) = 0;

    virtual std::vector<ReviewFlag> load_review_flags(const std::string& run_id) = 0;
};

} // namespace pocnet
