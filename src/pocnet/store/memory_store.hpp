/**
 * @file memory_store.hpp
 * @brief In-memory BackingStore implementation.
 */
#pragma once
#include "pocnet/common/common.hpp"
#include "pocnet/store/backing_store.hpp"

namespace pocnet
{

/**
 * @brief BackingStore held entirely in memory.
 *
 * @details
 * `MemoryStore` holds the network (nodes, links), the facility catalog
 * (toolsets, equipment, PoCs) and the run results written by the engine. It is
 * populated through the `add_*` methods before analysis starts.
 *
 * Scope membership: a node is in a scope when its `toolset_id` belongs to an
 * active toolset matching the scope; a link is in a scope when both of its
 * endpoints are. An unconstrained scope contains every node and link.
 *
 * `set_available(false)` makes every interface call throw
 * `BackingStoreUnavailable`, which lets callers exercise their failure paths.
 *
 * @par Thread safety
 * - All methods are safe to call concurrently.
 */
class MemoryStore : public BackingStore
{
public:
    MemoryStore() = default;

    void add_node(const NetworkNode& node);
    void add_link(const NetworkLink& link);

    /**
     * @brief Add a toolset with its equipment and PoCs.
     * @details Every PoC is registered as the PoC attributes of its `node_id`.
     */
    void add_toolset(const Toolset& toolset);

    void set_available(bool available) noexcept;
    bool available() const noexcept;

    size_t node_count() const;
    size_t link_count() const;

    std::optional<NetworkNode> load_node(NodeId node_id) override;
    std::vector<NetworkNode> load_nodes(
        const PathFilters& filters,
        const std::unordered_set<NodeId>& exclude) override;
    std::vector<NetworkNode> load_nodes_by_id(const std::vector<NodeId>& node_ids) override;
    std::vector<NetworkLink> load_links_touching(
        const std::unordered_set<NodeId>& node_ids) override;
    bool node_exists(NodeId node_id) override;
    bool link_exists(LinkId link_id) override;
    std::optional<NetworkLink> load_link(LinkId link_id) override;
    std::optional<NetworkLink> find_link_between(NodeId from, NodeId to) override;
    std::optional<PocInfo> load_poc_attributes(NodeId node_id) override;
    ScopeTotals count_scope(const CoverageScope& scope) override;
    std::vector<std::int64_t> list_scope_ids(
        const CoverageScope& scope,
        ScopeElement element) override;
    std::vector<Toolset> load_catalog(const CoverageScope& scope) override;
    std::int64_t commit_path_record(const PathRecord& record) override;
    void commit_review_flags(
        const std::string& run_id,
        const std::vector<ReviewFlag>& flags) override;
    std::vector<PathRecord> load_path_records(const std::string& run_id) override;
    std::vector<ReviewFlag> load_review_flags(const std::string& run_id) override;

private:
    void check_available() const;
    bool toolset_matches(const Toolset& toolset, const CoverageScope& scope) const;
    std::set<NodeId> scope_nodes_locked(const CoverageScope& scope) const;
    std::set<LinkId> scope_links_locked(const CoverageScope& scope) const;

private:
    mutable std::mutex m_mutex;
    std::atomic<bool> m_available{true};
    std::map<NodeId, NetworkNode> m_nodes;
    std::map<LinkId, NetworkLink> m_links;
    std::vector<Toolset> m_toolsets;
    std::unordered_map<NodeId, PocInfo> m_pocs;
    std::map<std::string, std::vector<PathRecord>> m_records;
    std::map<std::string, std::vector<ReviewFlag>> m_review_flags;
    std::int64_t m_next_record_id{1};
};

} // namespace pocnet
