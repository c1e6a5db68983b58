#include "pocnet/validation/validation_engine.hpp"
#include "pocnet/common/logging.hpp"
#include "pocnet/common/network_exceptions.hpp"

namespace pocnet
{

namespace
{

bool is_blank(const std::string& s)
{
    return std::all_of(s.begin(), s.end(), [](unsigned char c) { return std::isspace(c) != 0; });
}

bool counts_as_warning(Severity severity) noexcept
{
    return severity == Severity::Warning || severity == Severity::Low;
}

std::string join_ids(const std::vector<NodeId>& ids)
{
    std::string result;
    for (size_t i = 0; i < ids.size(); ++i)
    {
        if (i != 0)
        {
            result += ", ";
        }
        result += std::to_string(ids[i]);
    }
    return result;
}

} // namespace

void ValidationEngine::Findings::add(Severity severity, ErrorKind kind, ObjectType object_type,
                                     std::int64_t object_id, std::string message)
{
    ValidationError error;
    error.severity = severity;
    error.scope = scope;
    error.kind = kind;
    error.object_type = object_type;
    error.object_id = object_id;
    error.test_code = test_code;
    error.message = std::move(message);
    errors.push_back(std::move(error));
}

ValidationEngine::ValidationEngine(std::shared_ptr<BackingStore> store, ValidationConfig config)
    : m_store(std::move(store))
    , m_config(std::move(config))
{
    if (!m_store)
    {
        throw NetworkError(NetworkErrorCode::InvalidConfiguration,
                           "Validation engine requires a backing store");
    }
}

const std::vector<ValidationEngine::TestEntry>& ValidationEngine::battery()
{
    static const std::vector<TestEntry> s_battery{
        {"CONN_001", "PoC Connectivity Validation", ValidationScope::Connectivity,
         &ValidationEngine::check_connectivity},
        {"DATA_001", "Required Attributes Check", ValidationScope::Connectivity,
         &ValidationEngine::check_required_attributes},
        {"UTY_001", "Utility Consistency Check", ValidationScope::Flow,
         &ValidationEngine::check_utility_consistency},
        {"UTY_002", "Utility Flow Direction", ValidationScope::Flow,
         &ValidationEngine::check_flow_direction},
        {"MAT_001", "Material Consistency Check", ValidationScope::Material,
         &ValidationEngine::check_material},
        {"QA_001", "Path Quality Assessment", ValidationScope::Qa,
         &ValidationEngine::check_structure},
        {"QA_002", "Loopback Detection", ValidationScope::Qa,
         &ValidationEngine::check_loops},
    };
    return s_battery;
}

std::vector<std::pair<std::string, std::string>> ValidationEngine::test_catalog()
{
    std::vector<std::pair<std::string, std::string>> result;
    for (const auto& entry : battery())
    {
        result.emplace_back(entry.code, entry.name);
    }
    return result;
}

ValidationReport ValidationEngine::validate(const PathResult& path) const
{
    return validate(path.node_sequence(), path.link_sequence());
}

ValidationReport ValidationEngine::validate(const std::vector<NodeId>& nodes,
                                            const std::vector<LinkId>& links) const
{
    auto logger = get_logger();
    ValidationReport report;
    PathInput input{nodes, links};

    std::optional<NodeId> start_node;
    std::optional<NodeId> end_node;
    if (!nodes.empty())
    {
        start_node = nodes.front();
        end_node = nodes.back();
    }

    for (const auto& entry : battery())
    {
        Findings findings;
        findings.test_code = entry.code;
        findings.scope = entry.scope;
        try
        {
            (this->*entry.fn)(input, findings);
        }
        catch (const std::exception& e)
        {
            logger->warn("Validation test {} failed: {}", entry.code, e.what());
            findings.add(Severity::Error, ErrorKind::TestExecutionFailed, ObjectType::Path, 0,
                         std::string("Validation test ") + entry.code + " failed: " + e.what());

            ReviewFlag flag;
            flag.severity = Severity::High;
            flag.reason = "VALIDATION_TEST_FAILED";
            flag.object_type = ObjectType::Path;
            flag.start_node_id = start_node;
            flag.end_node_id = end_node;
            flag.notes = std::string(entry.code) + ": " + e.what();
            report.m_review_flags.push_back(std::move(flag));
        }

        ValidationTestResult result;
        result.test_code = entry.code;
        result.test_name = entry.name;
        for (const auto& error : findings.errors)
        {
            if (counts_as_warning(error.severity))
            {
                ++result.warning_count;
            }
            else
            {
                ++result.error_count;
            }
        }
        result.passed = result.error_count == 0;
        report.m_test_results.push_back(std::move(result));
        report.m_errors.insert(report.m_errors.end(),
                               std::make_move_iterator(findings.errors.begin()),
                               std::make_move_iterator(findings.errors.end()));
    }

    size_t critical = report.count(Severity::Critical);
    if (critical > 0)
    {
        ReviewFlag flag;
        flag.severity = Severity::Critical;
        flag.reason = "CRITICAL_VALIDATION_ERRORS";
        flag.object_type = ObjectType::Path;
        flag.start_node_id = start_node;
        flag.end_node_id = end_node;
        flag.notes = std::to_string(critical) + " critical validation errors";
        report.m_review_flags.push_back(std::move(flag));
    }

    logger->debug("Validated path of {} nodes: {} findings, {} blocking", nodes.size(),
                  report.errors().size(), report.count(Severity::Critical) + report.count(Severity::Error));
    return report;
}

bool ValidationEngine::is_valid_transition(std::int64_t from, std::int64_t to,
                                           const std::string& kind) const
{
    if (from == to)
    {
        return true;
    }
    if (m_config.converting_kinds.count(kind) == 0u)
    {
        return false;
    }
    auto it = m_config.utility_transitions.find(from);
    return it != m_config.utility_transitions.end() && it->second.count(to) != 0u;
}

bool ValidationEngine::is_compatible_utility(std::int64_t from, std::int64_t to) const
{
    if (from == to)
    {
        return true;
    }
    for (const auto& group : m_config.utility_groups)
    {
        if (group.count(from) != 0u && group.count(to) != 0u)
        {
            return true;
        }
    }
    return false;
}

// ============================================================================
// Tests
// ============================================================================

void ValidationEngine::check_connectivity(const PathInput& path, Findings& out) const
{
    if (path.nodes.size() < 2)
    {
        return;
    }

    for (NodeId id : path.nodes)
    {
        if (!m_store->node_exists(id))
        {
            out.add(Severity::Critical, ErrorKind::MissingNode, ObjectType::Node, id,
                    "Node " + std::to_string(id) + " does not exist");
        }
    }

    std::vector<std::optional<NetworkLink>> links;
    links.reserve(path.links.size());
    for (LinkId id : path.links)
    {
        auto link = m_store->load_link(id);
        if (!link)
        {
            out.add(Severity::Critical, ErrorKind::MissingLink, ObjectType::Link, id,
                    "Link " + std::to_string(id) + " does not exist");
        }
        links.push_back(std::move(link));
    }

    if (links.size() + 1 == path.nodes.size())
    {
        for (size_t i = 0; i < links.size(); ++i)
        {
            if (!links[i])
            {
                continue;
            }
            const NetworkLink& link = *links[i];
            NodeId a = path.nodes[i];
            NodeId b = path.nodes[i + 1];
            bool forward = link.start_node_id == a && link.end_node_id == b;
            bool backward = link.is_bidirected && link.start_node_id == b && link.end_node_id == a;
            if (!forward && !backward)
            {
                out.add(Severity::Critical, ErrorKind::ConnectivityBreak, ObjectType::Link, link.link_id,
                        "Link " + std::to_string(link.link_id) + " does not lead from node " +
                            std::to_string(a) + " to node " + std::to_string(b));
            }
        }
        return;
    }

    // Link list does not line up with the nodes; check each hop directly.
    for (size_t i = 0; i + 1 < path.nodes.size(); ++i)
    {
        NodeId a = path.nodes[i];
        NodeId b = path.nodes[i + 1];
        if (!m_store->find_link_between(a, b))
        {
            out.add(Severity::Critical, ErrorKind::ConnectivityBreak, ObjectType::Node, a,
                    "No usable link from node " + std::to_string(a) + " to node " + std::to_string(b));
        }
    }
}

void ValidationEngine::check_required_attributes(const PathInput& path, Findings& out) const
{
    std::unordered_set<NodeId> seen;
    for (NodeId id : path.nodes)
    {
        if (!seen.insert(id).second)
        {
            continue;
        }
        auto info = m_store->load_poc_attributes(id);
        if (!info)
        {
            continue;
        }
        const EquipmentPoc& poc = info->poc;

        std::vector<std::string> missing;
        if (!poc.utility_no)
        {
            missing.emplace_back("utility_no");
        }
        if (is_blank(poc.markers))
        {
            missing.emplace_back("markers");
        }
        if (is_blank(poc.reference))
        {
            missing.emplace_back("reference");
        }
        if (!missing.empty())
        {
            std::string list;
            for (const auto& name : missing)
            {
                list += list.empty() ? name : ", " + name;
            }
            if (!poc.utility_no)
            {
                out.add(Severity::High, ErrorKind::MissingUtility, ObjectType::Poc, poc.poc_id,
                        "PoC node " + std::to_string(id) + " missing required attributes: " + list);
            }
            else
            {
                out.add(Severity::Medium, ErrorKind::MissingAttributes, ObjectType::Poc, poc.poc_id,
                        "PoC node " + std::to_string(id) + " missing required attributes: " + list);
            }
        }

        if (!poc.is_used)
        {
            out.add(Severity::Medium, ErrorKind::UnusedPoc, ObjectType::Poc, poc.poc_id,
                    "PoC node " + std::to_string(id) + " is on a path but not marked as used");
        }
    }
}

void ValidationEngine::check_utility_consistency(const PathInput& path, Findings& out) const
{
    if (path.nodes.size() < 2)
    {
        return;
    }

    std::vector<std::optional<PocInfo>> infos;
    infos.reserve(path.nodes.size());
    std::optional<std::int64_t> current;
    for (NodeId id : path.nodes)
    {
        infos.push_back(m_store->load_poc_attributes(id));
        const auto& info = infos.back();
        if (!info || !info->poc.utility_no)
        {
            continue;
        }
        std::int64_t utility = *info->poc.utility_no;
        if (current && *current != utility &&
            !is_valid_transition(*current, utility, info->equipment_kind))
        {
            out.add(Severity::High, ErrorKind::InvalidUtilityChange, ObjectType::Poc, info->poc.poc_id,
                    "Invalid utility change from " + std::to_string(*current) + " to " +
                        std::to_string(utility) + " at equipment " + info->equipment_guid +
                        " (node " + std::to_string(id) + ")");
        }
        current = utility;
    }

    // Per-hop checks only look at directly adjacent PoCs.
    for (size_t i = 0; i + 1 < infos.size(); ++i)
    {
        const auto& from = infos[i];
        const auto& to = infos[i + 1];
        if (!from || !to)
        {
            continue;
        }
        const std::string hop = std::to_string(path.nodes[i]) + "-" + std::to_string(path.nodes[i + 1]);

        if (from->poc.utility_no && to->poc.utility_no &&
            !is_compatible_utility(*from->poc.utility_no, *to->poc.utility_no))
        {
            out.add(Severity::Warning, ErrorKind::FlowInconsistency, ObjectType::Node, path.nodes[i],
                    "Flow inconsistency between nodes " + hop + ": incompatible utilities " +
                        std::to_string(*from->poc.utility_no) + " -> " +
                        std::to_string(*to->poc.utility_no));
        }

        const FlowDirection flow = from->poc.flow;
        if (flow == to->poc.flow && (flow == FlowDirection::In || flow == FlowDirection::Out))
        {
            out.add(Severity::Warning, ErrorKind::FlowInconsistency, ObjectType::Node, path.nodes[i],
                    "Flow inconsistency between nodes " + hop + ": both nodes have " +
                        (flow == FlowDirection::In ? "IN" : "OUT") + " flow direction");
        }
    }
}

void ValidationEngine::check_flow_direction(const PathInput& path, Findings& out) const
{
    if (path.nodes.size() < 2)
    {
        return;
    }

    std::vector<NodeId> in_nodes;
    std::vector<NodeId> out_nodes;
    for (NodeId id : path.nodes)
    {
        auto info = m_store->load_poc_attributes(id);
        if (!info)
        {
            continue;
        }
        if (info->poc.flow == FlowDirection::In)
        {
            in_nodes.push_back(id);
        }
        else if (info->poc.flow == FlowDirection::Out)
        {
            out_nodes.push_back(id);
        }
    }

    if (in_nodes.size() > 1)
    {
        out.add(Severity::Warning, ErrorKind::MultipleInflows, ObjectType::Path, 0,
                "Path has multiple IN flow points: " + join_ids(in_nodes));
    }
    if (out_nodes.size() > 1)
    {
        out.add(Severity::Warning, ErrorKind::MultipleOutflows, ObjectType::Path, 0,
                "Path has multiple OUT flow points: " + join_ids(out_nodes));
    }
}

void ValidationEngine::check_material(const PathInput& path, Findings& out) const
{
    std::set<std::string> materials;
    for (NodeId id : path.nodes)
    {
        auto info = m_store->load_poc_attributes(id);
        if (info && !is_blank(info->poc.material))
        {
            materials.insert(info->poc.material);
        }
    }
    if (materials.size() > 1)
    {
        std::string list;
        for (const auto& m : materials)
        {
            list += list.empty() ? m : ", " + m;
        }
        out.add(Severity::Warning, ErrorKind::InvalidMaterial, ObjectType::Path, 0,
                "Path mixes materials: " + list);
    }
}

void ValidationEngine::check_structure(const PathInput& path, Findings& out) const
{
    const size_t node_count = path.nodes.size();
    const size_t link_count = path.links.size();

    if (node_count < 2 || link_count == 0)
    {
        out.add(Severity::Error, ErrorKind::PathTooShort, ObjectType::Path, 0,
                "Path too short: " + std::to_string(node_count) + " nodes, " +
                    std::to_string(link_count) + " links");
    }
    if (node_count > m_config.max_path_nodes)
    {
        out.add(Severity::Warning, ErrorKind::PathTooLong, ObjectType::Path, 0,
                "Path has " + std::to_string(node_count) + " nodes, above the limit of " +
                    std::to_string(m_config.max_path_nodes));
    }
    if (node_count > 1 && link_count != node_count - 1)
    {
        out.add(Severity::Warning, ErrorKind::LinkCountMismatch, ObjectType::Path, 0,
                "Expected " + std::to_string(node_count - 1) + " links for " +
                    std::to_string(node_count) + " nodes, found " + std::to_string(link_count));
    }
}

void ValidationEngine::check_loops(const PathInput& path, Findings& out) const
{
    std::unordered_map<NodeId, size_t> positions;
    std::vector<NodeId> distinct;
    for (size_t i = 0; i < path.nodes.size(); ++i)
    {
        NodeId id = path.nodes[i];
        auto [it, inserted] = positions.emplace(id, i);
        if (inserted)
        {
            distinct.push_back(id);
        }
        else
        {
            out.add(Severity::Medium, ErrorKind::PathLoop, ObjectType::Node, id,
                    "Node " + std::to_string(id) + " appears multiple times in path (positions " +
                        std::to_string(it->second) + " and " + std::to_string(i) + ")");
        }
    }

    for (NodeId id : distinct)
    {
        auto info = m_store->load_poc_attributes(id);
        if (info && info->poc.is_loopback)
        {
            out.add(Severity::Warning, ErrorKind::LoopbackPoc, ObjectType::Poc, info->poc.poc_id,
                    "Node " + std::to_string(id) + " is marked as loopback PoC");
        }
    }
}

} // namespace pocnet
