/**
 * @file graph_view.hpp
 * @brief In-memory view of the network loaded for one traversal session.
 */
#pragma once
#include "pocnet/common/common.hpp"
#include "pocnet/common/network_enums.hpp"
#include "pocnet/common/network_items.hpp"
#include "pocnet/store/backing_store.hpp"

namespace pocnet
{

/**
 * @brief One outgoing adjacency entry of a node.
 *
 * @details
 * `reversed` is set when the entry walks a bidirectional link against its own
 * orientation (from `end_node_id` to `start_node_id`).
 */
struct AdjacencyEntry
{
    NodeId neighbor_id{0};
    LinkId link_id{0};
    double cost{1.0};
    bool reversed{false};
};

/**
 * @brief Inputs for loading a `GraphView`.
 */
struct GraphLoadRequest
{
    NodeId start_node_id{0};
    std::unordered_set<NodeId> ignore_node_ids;
    PathFilters filters;
};

/**
 * @brief Filtered in-memory view of the network for one traversal session.
 *
 * @details
 * A `GraphView` holds an arena of nodes and links indexed by position, with
 * lookup maps from node and link ids. Every loaded node is in the arena; the
 * traversable subset is the start node plus every node passing the path
 * filters. Nodes reached by a surviving link but excluded by the filters are
 * loaded without being traversable so that endpoint classification can read
 * their attributes.
 *
 * Invariants established by `load_graph_view()`:
 * - No ignore node is in the arena, in the link table, or in any adjacency entry.
 * - The start node is traversable.
 * - Every link has at least one traversable endpoint.
 * - Adjacency lists are ordered by ascending link id; the reverse entry of a
 *   bidirectional link is listed under its end node.
 *
 * A default-constructed `GraphView` is not loaded.
 *
 * @par Thread safety
 * - Not modified after loading; safe for concurrent reads.
 */
class GraphView
{
public:
    GraphView() = default;

    bool is_loaded() const noexcept
    {
        return m_loaded;
    }

    NodeId start_node_id() const noexcept
    {
        return m_start_node_id;
    }

    const PathFilters& filters() const noexcept
    {
        return m_filters;
    }

    const std::unordered_set<NodeId>& ignore_node_ids() const noexcept
    {
        return m_ignore_node_ids;
    }

    bool has_node(NodeId node_id) const
    {
        return m_node_index.count(node_id) != 0u;
    }

    bool is_traversable(NodeId node_id) const
    {
        auto it = m_node_index.find(node_id);
        return it != m_node_index.end() && m_traversable[it->second];
    }

    bool is_ignored(NodeId node_id) const
    {
        return m_ignore_node_ids.count(node_id) != 0u;
    }

    /**
     * @brief Find a loaded node.
     * @return Pointer into the arena, or nullptr if the node is not loaded.
     */
    const NetworkNode* find_node(NodeId node_id) const;

    /**
     * @brief Find a loaded link.
     * @return Pointer into the arena, or nullptr if the link is not loaded.
     */
    const NetworkLink* find_link(LinkId link_id) const;

    /**
     * @brief Get the outgoing adjacency entries of a node.
     * @return The entries; an empty list for nodes with none or not loaded.
     */
    const std::vector<AdjacencyEntry>& adjacency(NodeId node_id) const;

    /**
     * @brief Whether any adjacency entry of the node leads to a traversable node.
     */
    bool has_traversable_neighbor(NodeId node_id) const;

    size_t node_count() const noexcept
    {
        return m_nodes.size();
    }

    size_t traversable_count() const noexcept;

    size_t link_count() const noexcept
    {
        return m_links.size();
    }

    const std::vector<NetworkNode>& nodes() const noexcept
    {
        return m_nodes;
    }

    const std::vector<NetworkLink>& links() const noexcept
    {
        return m_links;
    }

    friend std::shared_ptr<GraphView> load_graph_view(
        BackingStore& store, const GraphLoadRequest& request);

private:
    void add_node(const NetworkNode& node, bool traversable);
    void add_link(NetworkLink link);

private:
    bool m_loaded{false};
    NodeId m_start_node_id{0};
    PathFilters m_filters;
    std::unordered_set<NodeId> m_ignore_node_ids;
    std::vector<NetworkNode> m_nodes;
    std::vector<bool> m_traversable;
    std::vector<std::vector<AdjacencyEntry>> m_adjacency;
    std::unordered_map<NodeId, size_t> m_node_index;
    std::vector<NetworkLink> m_links;
    std::unordered_map<LinkId, size_t> m_link_index;
};

/**
 * @brief Load a filtered `GraphView` from the backing store.
 *
 * @param store The backing store to read nodes and links from.
 * @param request Start node, ignore set and path filters.
 * @return The loaded view.
 *
 * @throws NetworkError with `InvalidConfiguration` if the start node is an
 *         ignore node or a filter value is negative.
 * @throws NetworkError with `NodeNotFound` if the start node does not exist.
 * @throws NetworkError with `BackingStoreUnavailable` if the store fails.
 */
std::shared_ptr<GraphView> load_graph_view(BackingStore& store, const GraphLoadRequest& request);

} // namespace pocnet
