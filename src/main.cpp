#include "pocnet/common/logging.hpp"
#include "pocnet/run/run_orchestrator.hpp"
#include "pocnet/store/memory_store.hpp"
#include <iostream>
#include <stdexcept>

namespace
{

using namespace pocnet;

constexpr std::int64_t kUtility = 13;
constexpr std::int64_t kToolsetId = 7;
constexpr std::int64_t kPocCode = 107;
constexpr std::int64_t kSourceCode = 15000;

void add_node(MemoryStore& store, NodeId id, std::int64_t data_code, std::int64_t toolset_id, NodeKind kind)
{
    NetworkNode node;
    node.node_id = id;
    node.data_code = data_code;
    node.utility_no = kUtility;
    node.toolset_id = toolset_id;
    node.eq_poc_no = kind == NodeKind::Poc ? "EQ-" + std::to_string(id) : "";
    node.kind = kind;
    store.add_node(node);
}

void add_link(MemoryStore& store, LinkId id, NodeId from, NodeId to, double cost)
{
    NetworkLink link;
    link.link_id = id;
    link.guid = "link-" + std::to_string(id);
    link.start_node_id = from;
    link.end_node_id = to;
    link.is_bidirected = true;
    link.cost = cost;
    store.add_link(link);
}

/**
 * @brief Supply header 1000..1030 feeding three tools whose outlets drain into
 *        a return header 2000..2020.
 */
void build_demo_network(MemoryStore& store)
{
    add_node(store, 1000, kSourceCode, 0, NodeKind::Logical);
    for (NodeId id : {1010, 1020, 1030, 2000, 2010, 2020})
    {
        add_node(store, id, 0, 0, NodeKind::Logical);
    }

    LinkId next_link = 1;
    add_link(store, next_link++, 1000, 1010, 2.0);
    add_link(store, next_link++, 1010, 1020, 2.0);
    add_link(store, next_link++, 1020, 1030, 2.0);
    add_link(store, next_link++, 2000, 2010, 2.0);
    add_link(store, next_link++, 2010, 2020, 2.0);

    Toolset toolset;
    toolset.toolset_id = kToolsetId;
    toolset.code = "TS-ETCH-01";
    toolset.fab = "F1";
    toolset.model_no = 1;
    toolset.phase_no = 1;
    toolset.name = "Etch line 1";

    const std::vector<std::pair<NodeId, NodeId>> headers{{1010, 2000}, {1020, 2010}, {1030, 2020}};
    for (size_t i = 0; i < headers.size(); ++i)
    {
        const std::int64_t equipment_id = static_cast<std::int64_t>(i) + 1;
        const NodeId inlet = 1100 + static_cast<NodeId>(i) * 100;
        const NodeId outlet = inlet + 10;
        add_node(store, inlet, kPocCode, kToolsetId, NodeKind::Poc);
        add_node(store, outlet, kPocCode, kToolsetId, NodeKind::Poc);
        add_link(store, next_link++, headers[i].first, inlet, 1.0);
        add_link(store, next_link++, inlet, outlet, 0.5);
        add_link(store, next_link++, outlet, headers[i].second, 1.0);

        Equipment equipment;
        equipment.equipment_id = equipment_id;
        equipment.guid = "eq-" + std::to_string(equipment_id);
        equipment.name = "Chamber " + std::to_string(equipment_id);
        equipment.toolset_code = toolset.code;
        equipment.kind = "PROCESSING";

        EquipmentPoc poc_in;
        poc_in.poc_id = equipment_id * 10 + 1;
        poc_in.equipment_id = equipment_id;
        poc_in.code = "IN";
        poc_in.node_id = inlet;
        poc_in.utility_no = kUtility;
        poc_in.markers = "PCW";
        poc_in.reference = "P&ID-" + std::to_string(equipment_id);
        poc_in.material = "SS316";
        poc_in.flow = FlowDirection::In;
        poc_in.is_used = true;

        EquipmentPoc poc_out = poc_in;
        poc_out.poc_id = equipment_id * 10 + 2;
        poc_out.code = "OUT";
        poc_out.node_id = outlet;
        poc_out.flow = FlowDirection::Out;

        equipment.pocs = {poc_in, poc_out};
        toolset.equipment.push_back(equipment);
    }
    store.add_toolset(toolset);
}

} // namespace

int main(int argc, char** argv)
{
    try
    {
        std::cout << "\n\n====== pocnet ======\n" << std::flush;

        if (argc > 1 && std::string(argv[1]) == "--debug")
        {
            pocnet::set_log_level(spdlog::level::debug);
        }

        auto store = std::make_shared<pocnet::MemoryStore>();
        build_demo_network(*store);

        pocnet::RunOrchestrator orchestrator(store);

        pocnet::RunConfig random_run;
        random_run.run_id = "demo-random";
        random_run.approach = pocnet::RunApproach::Random;
        random_run.coverage_target = 0.6;
        random_run.max_attempts = 200;
        random_run.seed = 42;
        random_run.bias.min_distance_between_nodes = 5;
        random_run.bias.recency_capacity = 2;
        pocnet::RunResult random_result = orchestrator.run(random_run);
        std::cout << random_result.summary() << "\n";

        pocnet::RunConfig scenario_run;
        scenario_run.run_id = "demo-scenario";
        scenario_run.approach = pocnet::RunApproach::Scenario;
        scenario_run.scenario_start_node_id = 1000;
        scenario_run.scenario_filters.utility_no = kUtility;
        scenario_run.target_codes = pocnet::parse_target_codes(std::to_string(kPocCode));
        scenario_run.traversal.algorithm = pocnet::TraversalAlgorithm::Dijkstra;
        pocnet::RunResult scenario_result = orchestrator.run(scenario_run);
        std::cout << scenario_result.summary() << "\n";

        if (random_result.status != pocnet::RunStatus::Done ||
            scenario_result.status != pocnet::RunStatus::Done)
        {
            throw std::runtime_error("demo run failed");
        }

        std::cout << "\n\n====== normal exit ======\n" << std::flush;
    }
    catch (const std::exception& e)
    {
        std::cerr << "\n\nError:\n" << e.what() << "\n" << std::flush;
        std::cout << "\n\n====== abnormal exit ======\n" << std::flush;
        return EXIT_FAILURE;
    }
    return EXIT_SUCCESS;
}
