#include "pocnet/coverage/coverage_tracker.hpp"
#include "pocnet/common/logging.hpp"
#include "pocnet/common/network_exceptions.hpp"

namespace pocnet
{

namespace
{

void mix(size_t& seed, std::int64_t value)
{
    seed ^= std::hash<std::int64_t>{}(value) + 0x9e3779b97f4a7c15ULL + (seed << 6) + (seed >> 2);
}

size_t path_key(const std::vector<NodeId>& path_nodes, const std::vector<LinkId>& path_links)
{
    size_t seed = path_nodes.size();
    for (NodeId id : path_nodes)
    {
        mix(seed, id);
    }
    mix(seed, static_cast<std::int64_t>(path_links.size()));
    for (LinkId id : path_links)
    {
        mix(seed, id);
    }
    return seed;
}

} // namespace

CoverageTracker::CoverageTracker(std::shared_ptr<BackingStore> store)
    : m_store(std::move(store))
{
    if (!m_store)
    {
        throw NetworkError(NetworkErrorCode::InvalidConfiguration,
                           "Coverage tracker requires a backing store");
    }
}

CoverageMetrics CoverageTracker::initialize(const CoverageScope& scope)
{
    auto node_ids = m_store->list_scope_ids(scope, ScopeElement::Node);
    auto link_ids = m_store->list_scope_ids(scope, ScopeElement::Link);

    m_scope = scope;
    m_scope_nodes = std::set<NodeId>(node_ids.begin(), node_ids.end());
    m_scope_links = std::set<LinkId>(link_ids.begin(), link_ids.end());
    m_covered_nodes.clear();
    m_covered_links.clear();
    m_seen_paths.clear();
    m_initialized = true;

    get_logger()->info("Coverage scope fab='{}' model={} phase={} toolset='{}': {} nodes, {} links",
                       scope.fab, scope.model_no, scope.phase_no, scope.toolset_code,
                       m_scope_nodes.size(), m_scope_links.size());
    return metrics();
}

void CoverageTracker::check_initialized(const char* operation) const
{
    if (!m_initialized)
    {
        throw NetworkError(NetworkErrorCode::InvalidState,
                           std::string("Coverage tracker used before initialize(): ") + operation);
    }
}

void CoverageTracker::apply(const std::vector<NodeId>& path_nodes, const std::vector<LinkId>& path_links)
{
    for (NodeId id : path_nodes)
    {
        if (m_scope_nodes.count(id) != 0u)
        {
            m_covered_nodes.insert(id);
        }
    }
    for (LinkId id : path_links)
    {
        if (m_scope_links.count(id) != 0u)
        {
            m_covered_links.insert(id);
        }
    }
    m_seen_paths.insert(path_key(path_nodes, path_links));
}

CoverageMetrics CoverageTracker::update(const std::vector<NodeId>& path_nodes,
                                        const std::vector<LinkId>& path_links)
{
    check_initialized("update");
    apply(path_nodes, path_links);
    return metrics();
}

CoverageMetrics CoverageTracker::update(const PathResult& path)
{
    return update(path.node_sequence(), path.link_sequence());
}

CoverageMetrics CoverageTracker::metrics() const
{
    CoverageMetrics m;
    if (!m_initialized)
    {
        return m;
    }
    m.covered_nodes = m_covered_nodes.size();
    m.covered_links = m_covered_links.size();
    m.total_nodes = m_scope_nodes.size();
    m.total_links = m_scope_links.size();
    m.unique_paths = m_seen_paths.size();
    size_t total = m.total_nodes + m.total_links;
    if (total > 0)
    {
        m.coverage_fraction =
            static_cast<double>(m.covered_nodes + m.covered_links) / static_cast<double>(total);
    }
    return m;
}

double CoverageTracker::contribution(const std::vector<NodeId>& path_nodes,
                                     const std::vector<LinkId>& path_links) const
{
    check_initialized("contribution");
    size_t total = m_scope_nodes.size() + m_scope_links.size();
    if (total == 0)
    {
        return 0.0;
    }
    std::set<NodeId> new_nodes;
    for (NodeId id : path_nodes)
    {
        if (m_scope_nodes.count(id) != 0u && m_covered_nodes.count(id) == 0u)
        {
            new_nodes.insert(id);
        }
    }
    std::set<LinkId> new_links;
    for (LinkId id : path_links)
    {
        if (m_scope_links.count(id) != 0u && m_covered_links.count(id) == 0u)
        {
            new_links.insert(id);
        }
    }
    return static_cast<double>(new_nodes.size() + new_links.size()) / static_cast<double>(total);
}

std::vector<std::int64_t> CoverageTracker::uncovered(ScopeElement kind, size_t limit) const
{
    check_initialized("uncovered");
    const auto& scope_ids = kind == ScopeElement::Node ? m_scope_nodes : m_scope_links;
    const auto& covered_ids = kind == ScopeElement::Node ? m_covered_nodes : m_covered_links;

    std::vector<std::int64_t> result;
    std::set_difference(scope_ids.begin(), scope_ids.end(),
                        covered_ids.begin(), covered_ids.end(),
                        std::back_inserter(result));
    if (limit != 0 && result.size() > limit)
    {
        result.resize(limit);
    }
    return result;
}

CoverageMetrics CoverageTracker::rebuild(const std::vector<PathRecord>& records)
{
    check_initialized("rebuild");
    m_covered_nodes.clear();
    m_covered_links.clear();
    m_seen_paths.clear();
    for (const auto& record : records)
    {
        apply(record.path.node_sequence(), record.path.link_sequence());
    }
    CoverageMetrics m = metrics();
    get_logger()->info("Rebuilt {} from {} path records", m.summary(), records.size());
    return m;
}

CoverageMetrics CoverageTracker::rebuild_from_store(const std::string& run_id)
{
    check_initialized("rebuild_from_store");
    return rebuild(m_store->load_path_records(run_id));
}

bool CoverageTracker::has_reached(double target) const
{
    return m_initialized && metrics().coverage_fraction >= target;
}

} // namespace pocnet
