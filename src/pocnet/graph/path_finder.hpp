/**
 * @file path_finder.hpp
 * @brief Path discovery and endpoint classification over a GraphView.
 */
#pragma once
#include "pocnet/common/common.hpp"
#include "pocnet/common/network_enums.hpp"
#include "pocnet/common/network_items.hpp"
#include "pocnet/graph/graph_view.hpp"

namespace pocnet
{

/**
 * @brief Set of data codes that mark a node as a TARGET endpoint.
 */
using TargetCodeSet = std::unordered_set<std::int64_t>;

/**
 * @brief Node flag classification keyed by (path id, node id).
 */
using NodeFlagMap = std::map<std::pair<size_t, NodeId>, NodeFlag>;

/**
 * @brief Options for a downstream traversal.
 */
struct TraversalOptions
{
    TraversalAlgorithm algorithm{TraversalAlgorithm::Dijkstra};

    /**
     * @brief Data codes that terminate a path; empty disables the TARGET rule.
     */
    TargetCodeSet target_codes;

    /**
     * @brief DFS only: stop after this many paths. 0 means unbounded.
     */
    size_t max_paths{0};

    /**
     * @brief DFS only: stop after this many work-list frames. 0 means unbounded.
     */
    size_t max_iterations{0};
};

/**
 * @brief Paths found by one traversal, with per-endpoint-type counts.
 */
struct TraversalResult
{
    TraversalAlgorithm algorithm{TraversalAlgorithm::Dijkstra};
    std::vector<PathResult> paths;
    size_t leaf_count{0};
    size_t target_count{0};
    size_t boundary_count{0};

    /**
     * @brief Number of work-list frames (DFS) or queue pops (Dijkstra) processed.
     */
    size_t iterations{0};

    /**
     * @brief True if a DFS budget stopped the traversal early.
     */
    bool budget_exhausted{false};

    /**
     * @brief Distinct terminal node ids of all paths, ascending.
     */
    std::set<NodeId> endpoint_node_ids() const
    {
        std::set<NodeId> ids;
        for (const auto& path : paths)
        {
            ids.insert(path.end_node_id);
        }
        return ids;
    }

    /**
     * @brief Get a summary string for logging.
     */
    std::string summary() const
    {
        std::string result = std::string(to_string(algorithm)) + " found " +
                             std::to_string(paths.size()) + " paths";
        result += " (leaf=" + std::to_string(leaf_count);
        result += ", target=" + std::to_string(target_count);
        result += ", boundary=" + std::to_string(boundary_count) + ")";
        if (budget_exhausted)
        {
            result += ", stopped by budget";
        }
        return result;
    }
};

/**
 * @brief Finds downstream paths from the start node of a GraphView.
 *
 * @details
 * Every visited node except the start node is classified with
 * `classify_endpoint()`. In DFS mode every path to every terminal node is
 * emitted, and exploration continues through TARGET and BOUNDARY nodes. In
 * Dijkstra mode one cost-minimal path is emitted per terminal node.
 *
 * Traversal only enters traversable nodes. Path ids are 1-based and local to
 * one call.
 *
 * @par Thread safety
 * - The attached GraphView is read-only; const methods may run concurrently.
 * - `attach()` must not race with any other call.
 */
class PathFinder
{
public:
    PathFinder() = default;
    explicit PathFinder(std::shared_ptr<const GraphView> graph);

    void attach(std::shared_ptr<const GraphView> graph);

    bool has_graph() const noexcept
    {
        return m_graph && m_graph->is_loaded();
    }

    /**
     * @brief Get the attached graph.
     * @throws NetworkError with `GraphNotLoaded` if no loaded graph is attached.
     */
    const GraphView& graph() const;

    /**
     * @brief Classify a node as a terminal of a path.
     *
     * @details
     * Rules in priority order: LEAF if the node has no adjacency entries,
     * TARGET if its data code is in `target_codes`, BOUNDARY if no adjacency
     * entry leads to a traversable node. The start node is never terminal.
     *
     * @throws NetworkError with `GraphNotLoaded` if no loaded graph is attached.
     */
    EndpointType classify_endpoint(NodeId node_id, const TargetCodeSet& target_codes) const;

    /**
     * @brief Run the traversal named by `options.algorithm`.
     * @throws NetworkError with `GraphNotLoaded` if no loaded graph is attached.
     */
    TraversalResult find_paths(const TraversalOptions& options) const;

    /**
     * @brief Find every cycle-free path to every terminal node.
     *
     * @details
     * Runs over an explicit work list of visit and backtrack frames. The
     * budget in `options` is checked before each frame; with no budget the
     * output may grow exponentially with the branching factor.
     */
    TraversalResult find_paths_dfs(const TraversalOptions& options) const;

    /**
     * @brief Find the cost-minimal path to each terminal node.
     *
     * @details
     * Equal-cost queue entries are popped in insertion order.
     */
    TraversalResult find_paths_dijkstra(const TraversalOptions& options) const;

    /**
     * @brief Find the cost-minimal path between two loaded nodes.
     *
     * @details
     * Intermediate nodes must be traversable; the destination need only be
     * loaded. Endpoint rules do not apply.
     *
     * @return The path, or an empty optional if `to` is unreachable, not
     *         loaded, or equal to `from`.
     */
    std::optional<PathResult> shortest_path(NodeId from, NodeId to) const;

    /**
     * @brief Classify every node of a batch of paths for persistence.
     *
     * @details
     * The first node of each path is `S`. The last node is `L` (no adjacency
     * entries), `E` (target data code), `F` (no traversable neighbor) or `E`
     * otherwise. Other nodes are `C` if they appear on more than one path of
     * the batch, else `I`. Paths without steps are skipped.
     */
    NodeFlagMap analyze_node_flags(
        const std::vector<PathResult>& paths,
        const TargetCodeSet& target_codes) const;

private:
    const GraphView& checked_graph() const;

private:
    std::shared_ptr<const GraphView> m_graph;
};

/**
 * @brief Parse a comma-separated list of target data codes.
 *
 * @details
 * Tokens are trimmed. Blank, zero, non-numeric and out-of-range tokens are
 * skipped, so "0" or "" yields an empty set.
 */
TargetCodeSet parse_target_codes(const std::string& text);

} // namespace pocnet
