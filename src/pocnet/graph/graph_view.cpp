#include "pocnet/graph/graph_view.hpp"
#include "pocnet/common/logging.hpp"
#include "pocnet/common/network_exceptions.hpp"

namespace pocnet
{

namespace
{

const std::vector<AdjacencyEntry> k_no_adjacency;

void check_request(const GraphLoadRequest& request)
{
    if (request.filters.utility_no < 0)
    {
        throw NetworkError(NetworkErrorCode::InvalidConfiguration,
                           "Utility filter must not be negative: " +
                               std::to_string(request.filters.utility_no));
    }
    if (request.filters.toolset_id < 0)
    {
        throw NetworkError(NetworkErrorCode::InvalidConfiguration,
                           "Toolset filter must not be negative: " +
                               std::to_string(request.filters.toolset_id));
    }
    if (request.ignore_node_ids.count(request.start_node_id) != 0u)
    {
        throw NetworkError(NetworkErrorCode::InvalidConfiguration,
                           "Start node " + std::to_string(request.start_node_id) +
                               " is in the ignore set");
    }
}

/**
 * @brief Run a store call, turning foreign exceptions into BackingStoreUnavailable.
 */
template <typename Fn>
auto call_store(const char* what, Fn&& fn) -> decltype(fn())
{
    try
    {
        return fn();
    }
    catch (const NetworkError&)
    {
        throw;
    }
    catch (const std::exception& e)
    {
        throw NetworkError(NetworkErrorCode::BackingStoreUnavailable,
                           std::string(what) + ": " + e.what());
    }
}

} // namespace

const NetworkNode* GraphView::find_node(NodeId node_id) const
{
    auto it = m_node_index.find(node_id);
    if (it == m_node_index.end())
    {
        return nullptr;
    }
    return &m_nodes[it->second];
}

const NetworkLink* GraphView::find_link(LinkId link_id) const
{
    auto it = m_link_index.find(link_id);
    if (it == m_link_index.end())
    {
        return nullptr;
    }
    return &m_links[it->second];
}

const std::vector<AdjacencyEntry>& GraphView::adjacency(NodeId node_id) const
{
    auto it = m_node_index.find(node_id);
    if (it == m_node_index.end())
    {
        return k_no_adjacency;
    }
    return m_adjacency[it->second];
}

bool GraphView::has_traversable_neighbor(NodeId node_id) const
{
    const auto& entries = adjacency(node_id);
    return std::any_of(entries.begin(), entries.end(),
                       [this](const AdjacencyEntry& e) { return is_traversable(e.neighbor_id); });
}

size_t GraphView::traversable_count() const noexcept
{
    return static_cast<size_t>(std::count(m_traversable.begin(), m_traversable.end(), true));
}

void GraphView::add_node(const NetworkNode& node, bool traversable)
{
    auto it = m_node_index.find(node.node_id);
    if (it != m_node_index.end())
    {
        if (traversable)
        {
            m_traversable[it->second] = true;
        }
        return;
    }
    m_node_index.emplace(node.node_id, m_nodes.size());
    m_nodes.push_back(node);
    m_traversable.push_back(traversable);
    m_adjacency.emplace_back();
}

void GraphView::add_link(NetworkLink link)
{
    if (!(link.cost > 0.0))
    {
        link.cost = 1.0;
    }
    m_link_index.emplace(link.link_id, m_links.size());
    m_links.push_back(link);

    size_t start_idx = m_node_index.at(link.start_node_id);
    m_adjacency[start_idx].push_back(AdjacencyEntry{link.end_node_id, link.link_id, link.cost, false});
    if (link.is_bidirected)
    {
        size_t end_idx = m_node_index.at(link.end_node_id);
        m_adjacency[end_idx].push_back(AdjacencyEntry{link.start_node_id, link.link_id, link.cost, true});
    }
}

std::shared_ptr<GraphView> load_graph_view(BackingStore& store, const GraphLoadRequest& request)
{
    check_request(request);
    auto logger = get_logger();

    auto view = std::make_shared<GraphView>();
    view->m_start_node_id = request.start_node_id;
    view->m_filters = request.filters;
    view->m_ignore_node_ids = request.ignore_node_ids;

    auto start_node = call_store("load_node", [&] { return store.load_node(request.start_node_id); });
    if (!start_node)
    {
        throw NetworkError(NetworkErrorCode::NodeNotFound,
                           "Start node " + std::to_string(request.start_node_id) + " does not exist");
    }
    view->add_node(*start_node, true);

    auto filtered = call_store("load_nodes",
                               [&] { return store.load_nodes(request.filters, request.ignore_node_ids); });
    for (const auto& node : filtered)
    {
        view->add_node(node, true);
    }

    std::unordered_set<NodeId> traversable_ids;
    for (const auto& node : view->m_nodes)
    {
        traversable_ids.insert(node.node_id);
    }

    auto links = call_store("load_links_touching",
                            [&] { return store.load_links_touching(traversable_ids); });

    // Endpoints outside the filters are loaded for classification only.
    std::vector<NodeId> extra_ids;
    std::unordered_set<NodeId> extra_seen;
    size_t excluded_links = 0;
    for (const auto& link : links)
    {
        if (view->is_ignored(link.start_node_id) || view->is_ignored(link.end_node_id))
        {
            continue;
        }
        for (NodeId id : {link.start_node_id, link.end_node_id})
        {
            if (!view->has_node(id) && extra_seen.insert(id).second)
            {
                extra_ids.push_back(id);
            }
        }
    }
    if (!extra_ids.empty())
    {
        auto extra = call_store("load_nodes_by_id", [&] { return store.load_nodes_by_id(extra_ids); });
        for (const auto& node : extra)
        {
            if (!view->is_ignored(node.node_id))
            {
                view->add_node(node, false);
            }
        }
    }

    for (const auto& link : links)
    {
        if (view->is_ignored(link.start_node_id) || view->is_ignored(link.end_node_id))
        {
            ++excluded_links;
            continue;
        }
        if (!view->has_node(link.start_node_id) || !view->has_node(link.end_node_id))
        {
            logger->debug("Skipping link {} with a dangling endpoint", link.link_id);
            continue;
        }
        view->add_link(link);
    }

    view->m_loaded = true;
    logger->info("Loaded graph from node {}: {} nodes ({} traversable), {} links, {} links excluded by ignore set",
                 request.start_node_id, view->node_count(), view->traversable_count(),
                 view->link_count(), excluded_links);
    return view;
}

} // namespace pocnet
