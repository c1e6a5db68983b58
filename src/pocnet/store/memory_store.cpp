#include "pocnet/store/memory_store.hpp"
#include "pocnet/common/network_exceptions.hpp"

namespace pocnet
{

void MemoryStore::add_node(const NetworkNode& node)
{
    std::lock_guard<std::mutex> lock(m_mutex);
    m_nodes[node.node_id] = node;
}

void MemoryStore::add_link(const NetworkLink& link)
{
    std::lock_guard<std::mutex> lock(m_mutex);
    m_links[link.link_id] = link;
}

void MemoryStore::add_toolset(const Toolset& toolset)
{
    std::lock_guard<std::mutex> lock(m_mutex);
    m_toolsets.push_back(toolset);
    for (const auto& equipment : toolset.equipment)
    {
        for (const auto& poc : equipment.pocs)
        {
            PocInfo info;
            info.poc = poc;
            info.poc.equipment_id = equipment.equipment_id;
            info.equipment_guid = equipment.guid;
            info.equipment_kind = equipment.kind;
            m_pocs[poc.node_id] = std::move(info);
        }
    }
}

void MemoryStore::set_available(bool available) noexcept
{
    m_available.store(available);
}

bool MemoryStore::available() const noexcept
{
    return m_available.load();
}

size_t MemoryStore::node_count() const
{
    std::lock_guard<std::mutex> lock(m_mutex);
    return m_nodes.size();
}

size_t MemoryStore::link_count() const
{
    std::lock_guard<std::mutex> lock(m_mutex);
    return m_links.size();
}

void MemoryStore::check_available() const
{
    if (!m_available.load())
    {
        throw NetworkError(NetworkErrorCode::BackingStoreUnavailable,
                           "Memory store is marked unavailable");
    }
}

std::optional<NetworkNode> MemoryStore::load_node(NodeId node_id)
{
    check_available();
    std::lock_guard<std::mutex> lock(m_mutex);
    auto it = m_nodes.find(node_id);
    if (it == m_nodes.end())
    {
        return std::nullopt;
    }
    return it->second;
}

std::vector<NetworkNode> MemoryStore::load_nodes(
    const PathFilters& filters,
    const std::unordered_set<NodeId>& exclude)
{
    check_available();
    std::lock_guard<std::mutex> lock(m_mutex);
    std::vector<NetworkNode> result;
    for (const auto& [id, node] : m_nodes)
    {
        if (exclude.count(id) != 0u || !filters.matches(node))
        {
            continue;
        }
        result.push_back(node);
    }
    return result;
}

std::vector<NetworkNode> MemoryStore::load_nodes_by_id(const std::vector<NodeId>& node_ids)
{
    check_available();
    std::lock_guard<std::mutex> lock(m_mutex);
    std::vector<NetworkNode> result;
    result.reserve(node_ids.size());
    for (NodeId id : node_ids)
    {
        auto it = m_nodes.find(id);
        if (it != m_nodes.end())
        {
            result.push_back(it->second);
        }
    }
    return result;
}

std::vector<NetworkLink> MemoryStore::load_links_touching(
    const std::unordered_set<NodeId>& node_ids)
{
    check_available();
    std::lock_guard<std::mutex> lock(m_mutex);
    std::vector<NetworkLink> result;
    for (const auto& [id, link] : m_links)
    {
        if (node_ids.count(link.start_node_id) != 0u || node_ids.count(link.end_node_id) != 0u)
        {
            result.push_back(link);
        }
    }
    return result;
}

bool MemoryStore::node_exists(NodeId node_id)
{
    check_available();
    std::lock_guard<std::mutex> lock(m_mutex);
    return m_nodes.count(node_id) != 0u;
}

bool MemoryStore::link_exists(LinkId link_id)
{
    check_available();
    std::lock_guard<std::mutex> lock(m_mutex);
    return m_links.count(link_id) != 0u;
}

std::optional<NetworkLink> MemoryStore::load_link(LinkId link_id)
{
    check_available();
    std::lock_guard<std::mutex> lock(m_mutex);
    auto it = m_links.find(link_id);
    if (it == m_links.end())
    {
        return std::nullopt;
    }
    return it->second;
}

std::optional<NetworkLink> MemoryStore::find_link_between(NodeId from, NodeId to)
{
    check_available();
    std::lock_guard<std::mutex> lock(m_mutex);
    for (const auto& [id, link] : m_links)
    {
        if (link.start_node_id == from && link.end_node_id == to)
        {
            return link;
        }
        if (link.is_bidirected && link.start_node_id == to && link.end_node_id == from)
        {
            return link;
        }
    }
    return std::nullopt;
}

std::optional<PocInfo> MemoryStore::load_poc_attributes(NodeId node_id)
{
    check_available();
    std::lock_guard<std::mutex> lock(m_mutex);
    auto it = m_pocs.find(node_id);
    if (it == m_pocs.end())
    {
        return std::nullopt;
    }
    return it->second;
}

bool MemoryStore::toolset_matches(const Toolset& toolset, const CoverageScope& scope) const
{
    if (!toolset.is_active)
    {
        return false;
    }
    if (!scope.fab.empty() && toolset.fab != scope.fab)
    {
        return false;
    }
    if (scope.model_no != 0 && toolset.model_no != scope.model_no)
    {
        return false;
    }
    if (scope.phase_no != 0 && toolset.phase_no != scope.phase_no)
    {
        return false;
    }
    if (!scope.toolset_code.empty() && toolset.code != scope.toolset_code)
    {
        return false;
    }
    return true;
}

std::set<NodeId> MemoryStore::scope_nodes_locked(const CoverageScope& scope) const
{
    std::set<NodeId> result;
    if (scope.unconstrained())
    {
        for (const auto& [id, node] : m_nodes)
        {
            result.insert(id);
        }
        return result;
    }
    std::unordered_set<std::int64_t> toolset_ids;
    for (const auto& toolset : m_toolsets)
    {
        if (toolset_matches(toolset, scope))
        {
            toolset_ids.insert(toolset.toolset_id);
        }
    }
    for (const auto& [id, node] : m_nodes)
    {
        if (toolset_ids.count(node.toolset_id) != 0u)
        {
            result.insert(id);
        }
    }
    return result;
}

std::set<LinkId> MemoryStore::scope_links_locked(const CoverageScope& scope) const
{
    std::set<LinkId> result;
    if (scope.unconstrained())
    {
        for (const auto& [id, link] : m_links)
        {
            result.insert(id);
        }
        return result;
    }
    std::set<NodeId> nodes = scope_nodes_locked(scope);
    for (const auto& [id, link] : m_links)
    {
        if (nodes.count(link.start_node_id) != 0u && nodes.count(link.end_node_id) != 0u)
        {
            result.insert(id);
        }
    }
    return result;
}

ScopeTotals MemoryStore::count_scope(const CoverageScope& scope)
{
    check_available();
    std::lock_guard<std::mutex> lock(m_mutex);
    ScopeTotals totals;
    totals.nodes = scope_nodes_locked(scope).size();
    totals.links = scope_links_locked(scope).size();
    return totals;
}

std::vector<std::int64_t> MemoryStore::list_scope_ids(
    const CoverageScope& scope,
    ScopeElement element)
{
    check_available();
    std::lock_guard<std::mutex> lock(m_mutex);
    if (element == ScopeElement::Node)
    {
        auto nodes = scope_nodes_locked(scope);
        return std::vector<std::int64_t>(nodes.begin(), nodes.end());
    }
    auto links = scope_links_locked(scope);
    return std::vector<std::int64_t>(links.begin(), links.end());
}

std::vector<Toolset> MemoryStore::load_catalog(const CoverageScope& scope)
{
    check_available();
    std::lock_guard<std::mutex> lock(m_mutex);
    std::vector<Toolset> result;
    for (const auto& toolset : m_toolsets)
    {
        if (!toolset_matches(toolset, scope))
        {
            continue;
        }
        Toolset copy = toolset;
        copy.equipment.clear();
        for (const auto& equipment : toolset.equipment)
        {
            if (!equipment.is_active)
            {
                continue;
            }
            Equipment eq_copy = equipment;
            eq_copy.pocs.clear();
            for (const auto& poc : equipment.pocs)
            {
                if (poc.is_active)
                {
                    eq_copy.pocs.push_back(poc);
                }
            }
            copy.equipment.push_back(std::move(eq_copy));
        }
        result.push_back(std::move(copy));
    }
    return result;
}

std::int64_t MemoryStore::commit_path_record(const PathRecord& record)
{
    check_available();
    if (record.run_id.empty())
    {
        throw NetworkError(NetworkErrorCode::InvalidConfiguration,
                           "Path record has no run id");
    }
    // Build the stored copy fully before touching shared state.
    PathRecord stored = record;
    std::lock_guard<std::mutex> lock(m_mutex);
    stored.record_id = m_next_record_id;
    auto& flags = m_review_flags[stored.run_id];
    flags.insert(flags.end(), stored.review_flags.begin(), stored.review_flags.end());
    m_records[stored.run_id].push_back(std::move(stored));
    return m_next_record_id++;
}

void MemoryStore::commit_review_flags(
    const std::string& run_id,
    const std::vector<ReviewFlag>& flags)
{
    check_available();
    std::lock_guard<std::mutex> lock(m_mutex);
    auto& stored = m_review_flags[run_id];
    stored.insert(stored.end(), flags.begin(), flags.end());
}

std::vector<PathRecord> MemoryStore::load_path_records(const std::string& run_id)
{
    check_available();
    std::lock_guard<std::mutex> lock(m_mutex);
    auto it = m_records.find(run_id);
    if (it == m_records.end())
    {
        return {};
    }
    return it->second;
}

std::vector<ReviewFlag> MemoryStore::load_review_flags(const std::string& run_id)
{
    check_available();
    std::lock_guard<std::mutex> lock(m_mutex);
    auto it = m_review_flags.find(run_id);
    if (it == m_review_flags.end())
    {
        return {};
    }
    return it->second;
}

} // namespace pocnet
