#include "pocnet/graph/path_finder.hpp"
#include "pocnet/common/logging.hpp"
#include "pocnet/common/network_exceptions.hpp"

namespace pocnet
{

namespace
{

/**
 * @brief Step from `current` to the neighbor named by an adjacency entry.
 */
PathStep make_step(NodeId current, const AdjacencyEntry& entry)
{
    PathStep step;
    step.link_id = entry.link_id;
    step.cost = entry.cost;
    step.reversed = entry.reversed;
    // Stored in the link's own orientation.
    step.from_node = entry.reversed ? entry.neighbor_id : current;
    step.to_node = entry.reversed ? current : entry.neighbor_id;
    return step;
}

PathResult make_path(size_t path_id, NodeId start, NodeId end, double total_cost,
                     EndpointType endpoint_type, std::vector<PathStep> steps)
{
    for (size_t i = 0; i < steps.size(); ++i)
    {
        steps[i].seq = i + 1;
    }
    PathResult path;
    path.path_id = path_id;
    path.start_node_id = start;
    path.end_node_id = end;
    path.total_cost = total_cost;
    path.endpoint_type = endpoint_type;
    path.steps = std::move(steps);
    return path;
}

void count_endpoint(TraversalResult& result, EndpointType type)
{
    switch (type)
    {
        case EndpointType::Leaf:
            ++result.leaf_count;
            break;
        case EndpointType::Target:
            ++result.target_count;
            break;
        case EndpointType::Boundary:
            ++result.boundary_count;
            break;
        case EndpointType::None:
            break;
    }
}

// ============================================================================
// DFS work list
// ============================================================================

struct VisitFrame
{
    NodeId node_id{0};
    /// Step that leads into the node; empty for the start node.
    std::optional<PathStep> step;
};

struct BacktrackFrame
{
    NodeId node_id{0};
    bool has_step{false};
};

using DfsFrame = std::variant<VisitFrame, BacktrackFrame>;

// ============================================================================
// Dijkstra queue
// ============================================================================

struct QueueEntry
{
    double distance{0.0};
    size_t order{0};
    NodeId node_id{0};
};

struct QueueEntryGreater
{
    bool operator()(const QueueEntry& a, const QueueEntry& b) const noexcept
    {
        if (a.distance != b.distance)
        {
            return a.distance > b.distance;
        }
        return a.order > b.order;
    }
};

using DijkstraQueue = std::priority_queue<QueueEntry, std::vector<QueueEntry>, QueueEntryGreater>;

struct Predecessor
{
    NodeId prev_node_id{0};
    AdjacencyEntry entry;
};

/**
 * @brief Shortest-path tree from one source over the traversable set.
 */
struct ShortestPathTree
{
    std::unordered_map<NodeId, double> distances;
    std::unordered_map<NodeId, Predecessor> previous;

    /**
     * @brief Walk predecessors back from `end` to the source.
     * @return Steps in source-to-end order.
     */
    std::vector<PathStep> steps_to(NodeId end) const
    {
        std::vector<PathStep> steps;
        NodeId current = end;
        auto it = previous.find(current);
        while (it != previous.end())
        {
            steps.push_back(make_step(it->second.prev_node_id, it->second.entry));
            current = it->second.prev_node_id;
            it = previous.find(current);
        }
        std::reverse(steps.begin(), steps.end());
        return steps;
    }
};

} // namespace

PathFinder::PathFinder(std::shared_ptr<const GraphView> graph)
    : m_graph(std::move(graph))
{
}

void PathFinder::attach(std::shared_ptr<const GraphView> graph)
{
    m_graph = std::move(graph);
}

const GraphView& PathFinder::graph() const
{
    return checked_graph();
}

const GraphView& PathFinder::checked_graph() const
{
    if (!has_graph())
    {
        throw NetworkError(NetworkErrorCode::GraphNotLoaded,
                           "No loaded graph is attached to the path finder");
    }
    return *m_graph;
}

EndpointType PathFinder::classify_endpoint(NodeId node_id, const TargetCodeSet& target_codes) const
{
    const GraphView& g = checked_graph();
    if (node_id == g.start_node_id())
    {
        return EndpointType::None;
    }
    if (g.adjacency(node_id).empty())
    {
        return EndpointType::Leaf;
    }
    if (!target_codes.empty())
    {
        const NetworkNode* node = g.find_node(node_id);
        if (node != nullptr && target_codes.count(node->data_code) != 0u)
        {
            return EndpointType::Target;
        }
    }
    if (!g.has_traversable_neighbor(node_id))
    {
        return EndpointType::Boundary;
    }
    return EndpointType::None;
}

TraversalResult PathFinder::find_paths(const TraversalOptions& options) const
{
    switch (options.algorithm)
    {
        case TraversalAlgorithm::Dfs:
            return find_paths_dfs(options);
        case TraversalAlgorithm::Dijkstra:
            return find_paths_dijkstra(options);
    }
    throw NetworkError(NetworkErrorCode::InvalidConfiguration, "Unsupported traversal algorithm");
}

TraversalResult PathFinder::find_paths_dfs(const TraversalOptions& options) const
{
    const GraphView& g = checked_graph();
    auto logger = get_logger();
    const NodeId start = g.start_node_id();

    TraversalResult result;
    result.algorithm = TraversalAlgorithm::Dfs;

    std::vector<DfsFrame> stack;
    std::unordered_set<NodeId> on_branch;
    std::vector<PathStep> branch_steps;
    double branch_cost = 0.0;

    stack.push_back(VisitFrame{start, std::nullopt});

    while (!stack.empty())
    {
        if (options.max_iterations != 0 && result.iterations >= options.max_iterations)
        {
            result.budget_exhausted = true;
            break;
        }
        if (options.max_paths != 0 && result.paths.size() >= options.max_paths)
        {
            result.budget_exhausted = true;
            break;
        }
        ++result.iterations;

        DfsFrame frame = std::move(stack.back());
        stack.pop_back();

        if (auto* back = std::get_if<BacktrackFrame>(&frame))
        {
            on_branch.erase(back->node_id);
            if (back->has_step)
            {
                branch_cost -= branch_steps.back().cost;
                branch_steps.pop_back();
            }
            continue;
        }

        auto& visit = std::get<VisitFrame>(frame);
        const NodeId current = visit.node_id;
        on_branch.insert(current);
        if (visit.step)
        {
            branch_cost += visit.step->cost;
            branch_steps.push_back(*visit.step);
        }
        stack.push_back(BacktrackFrame{current, visit.step.has_value()});

        if (current != start)
        {
            EndpointType type = classify_endpoint(current, options.target_codes);
            if (type != EndpointType::None)
            {
                result.paths.push_back(make_path(result.paths.size() + 1, start, current,
                                                 branch_cost, type, branch_steps));
                count_endpoint(result, type);
                logger->debug("DFS path {} ends at {} node {}", result.paths.size(),
                              to_string(type), current);
                if (type == EndpointType::Leaf)
                {
                    continue;
                }
            }
        }

        // Pushed in reverse so adjacency order is explored first-to-last.
        const auto& entries = g.adjacency(current);
        for (auto it = entries.rbegin(); it != entries.rend(); ++it)
        {
            if (!g.is_traversable(it->neighbor_id) || on_branch.count(it->neighbor_id) != 0u)
            {
                continue;
            }
            stack.push_back(VisitFrame{it->neighbor_id, make_step(current, *it)});
        }
    }

    logger->info("From node {}: {}", start, result.summary());
    return result;
}

TraversalResult PathFinder::find_paths_dijkstra(const TraversalOptions& options) const
{
    const GraphView& g = checked_graph();
    auto logger = get_logger();
    const NodeId start = g.start_node_id();

    TraversalResult result;
    result.algorithm = TraversalAlgorithm::Dijkstra;

    ShortestPathTree tree;
    std::unordered_set<NodeId> visited;
    std::vector<std::pair<NodeId, EndpointType>> candidates;
    DijkstraQueue queue;
    size_t order = 0;

    tree.distances[start] = 0.0;
    queue.push(QueueEntry{0.0, order++, start});

    while (!queue.empty())
    {
        QueueEntry top = queue.top();
        queue.pop();
        if (!visited.insert(top.node_id).second)
        {
            continue;
        }
        ++result.iterations;

        if (top.node_id != start)
        {
            EndpointType type = classify_endpoint(top.node_id, options.target_codes);
            if (type != EndpointType::None)
            {
                candidates.emplace_back(top.node_id, type);
                logger->debug("Dijkstra candidate {} endpoint: node {} at cost {}",
                              to_string(type), top.node_id, top.distance);
            }
        }

        for (const auto& entry : g.adjacency(top.node_id))
        {
            if (!g.is_traversable(entry.neighbor_id) || visited.count(entry.neighbor_id) != 0u)
            {
                continue;
            }
            double next = top.distance + entry.cost;
            auto it = tree.distances.find(entry.neighbor_id);
            if (it == tree.distances.end() || next < it->second)
            {
                tree.distances[entry.neighbor_id] = next;
                tree.previous[entry.neighbor_id] = Predecessor{top.node_id, entry};
                queue.push(QueueEntry{next, order++, entry.neighbor_id});
            }
        }
    }

    for (const auto& [node_id, type] : candidates)
    {
        auto dist = tree.distances.find(node_id);
        std::vector<PathStep> steps;
        if (dist != tree.distances.end())
        {
            steps = tree.steps_to(node_id);
        }
        if (steps.empty())
        {
            logger->warn("Endpoint {} is unreachable from node {}, skipped", node_id, start);
            continue;
        }
        result.paths.push_back(make_path(result.paths.size() + 1, start, node_id,
                                         dist->second, type, std::move(steps)));
        count_endpoint(result, type);
    }

    logger->info("From node {}: {}", start, result.summary());
    return result;
}

std::optional<PathResult> PathFinder::shortest_path(NodeId from, NodeId to) const
{
    const GraphView& g = checked_graph();
    if (from == to || !g.has_node(from) || !g.has_node(to))
    {
        return std::nullopt;
    }

    ShortestPathTree tree;
    std::unordered_set<NodeId> visited;
    DijkstraQueue queue;
    size_t order = 0;

    tree.distances[from] = 0.0;
    queue.push(QueueEntry{0.0, order++, from});

    while (!queue.empty())
    {
        QueueEntry top = queue.top();
        queue.pop();
        if (!visited.insert(top.node_id).second)
        {
            continue;
        }
        if (top.node_id == to)
        {
            break;
        }
        for (const auto& entry : g.adjacency(top.node_id))
        {
            if (visited.count(entry.neighbor_id) != 0u)
            {
                continue;
            }
            if (entry.neighbor_id != to && !g.is_traversable(entry.neighbor_id))
            {
                continue;
            }
            double next = top.distance + entry.cost;
            auto it = tree.distances.find(entry.neighbor_id);
            if (it == tree.distances.end() || next < it->second)
            {
                tree.distances[entry.neighbor_id] = next;
                tree.previous[entry.neighbor_id] = Predecessor{top.node_id, entry};
                queue.push(QueueEntry{next, order++, entry.neighbor_id});
            }
        }
    }

    auto dist = tree.distances.find(to);
    if (dist == tree.distances.end())
    {
        get_logger()->debug("No path from node {} to node {}", from, to);
        return std::nullopt;
    }
    PathResult path = make_path(1, from, to, dist->second, EndpointType::None, tree.steps_to(to));
    return path;
}

NodeFlagMap PathFinder::analyze_node_flags(
    const std::vector<PathResult>& paths,
    const TargetCodeSet& target_codes) const
{
    const GraphView& g = checked_graph();

    std::unordered_map<NodeId, size_t> path_count;
    for (const auto& path : paths)
    {
        auto sequence = path.node_sequence();
        std::unordered_set<NodeId> distinct(sequence.begin(), sequence.end());
        for (NodeId id : distinct)
        {
            ++path_count[id];
        }
    }

    NodeFlagMap flags;
    for (const auto& path : paths)
    {
        if (path.steps.empty())
        {
            continue;
        }
        std::vector<NodeId> nodes;
        std::unordered_set<NodeId> seen;
        for (NodeId id : path.node_sequence())
        {
            if (seen.insert(id).second)
            {
                nodes.push_back(id);
            }
        }

        for (size_t i = 0; i < nodes.size(); ++i)
        {
            const NodeId id = nodes[i];
            const auto key = std::make_pair(path.path_id, id);
            if (i == 0)
            {
                flags[key] = NodeFlag::Start;
            }
            else if (i + 1 == nodes.size())
            {
                const NetworkNode* node = g.find_node(id);
                if (g.adjacency(id).empty())
                {
                    flags[key] = NodeFlag::Leaf;
                }
                else if (!target_codes.empty() && node != nullptr &&
                         target_codes.count(node->data_code) != 0u)
                {
                    flags[key] = NodeFlag::Endpoint;
                }
                else if (!g.has_traversable_neighbor(id))
                {
                    flags[key] = NodeFlag::Boundary;
                }
                else
                {
                    flags[key] = NodeFlag::Endpoint;
                }
            }
            else
            {
                flags[key] = path_count[id] > 1 ? NodeFlag::Convergence : NodeFlag::Intermediate;
            }
        }
    }
    return flags;
}

TargetCodeSet parse_target_codes(const std::string& text)
{
    TargetCodeSet codes;
    std::istringstream stream(text);
    std::string token;
    while (std::getline(stream, token, ','))
    {
        auto first = token.find_first_not_of(" \t");
        if (first == std::string::npos)
        {
            continue;
        }
        auto last = token.find_last_not_of(" \t");
        token = token.substr(first, last - first + 1);
        bool digits = std::all_of(token.begin(), token.end(),
                                  [](unsigned char c) { return std::isdigit(c) != 0; });
        if (!digits)
        {
            continue;
        }
        try
        {
            std::int64_t code = std::stoll(token);
            if (code != 0)
            {
                codes.insert(code);
            }
        }
        catch (const std::out_of_range&)
        {
            get_logger()->warn("Target code '{}' is out of range, skipped", token);
        }
    }
    return codes;
}

} // namespace pocnet
