/**
 * @file network_items.hpp
 * @brief Value types for network nodes, links and discovered paths.
 */
#pragma once
#include "pocnet/common/common.hpp"
#include "pocnet/common/network_enums.hpp"

namespace pocnet
{

/**
 * @brief A node of the utility network.
 *
 * @details
 * Nodes are immutable once loaded for a traversal session. Attributes that are
 * absent in the backing store are loaded as zero / empty.
 */
struct NetworkNode
{
    NodeId node_id{0};
    std::int64_t data_code{0};
    std::int64_t utility_no{0};
    std::int64_t toolset_id{0};
    std::string eq_poc_no;
    NodeKind kind{NodeKind::Unknown};
};

/**
 * @brief A physical or logical link between two nodes.
 *
 * @details
 * A bidirectional link is traversable in both directions; a unidirectional
 * link only from `start_node_id` to `end_node_id`.
 */
struct NetworkLink
{
    LinkId link_id{0};
    std::string guid;
    NodeId start_node_id{0};
    NodeId end_node_id{0};
    bool is_bidirected{false};
    double cost{1.0};
    LinkKind kind{LinkKind::Link};
};

/**
 * @brief One traversed link of a path.
 *
 * @details
 * `from_node` and `to_node` are recorded in the link's own orientation. When
 * the link was traversed against that orientation, `reversed` is set and the
 * traversal went from `to_node` to `from_node`. Use `entry_node()` and
 * `exit_node()` to read the traversal order.
 */
struct PathStep
{
    /// 1-based position of this step in the path.
    size_t seq{0};
    LinkId link_id{0};
    NodeId from_node{0};
    NodeId to_node{0};
    double cost{0.0};
    bool reversed{false};

    NodeId entry_node() const noexcept
    {
        return reversed ? to_node : from_node;
    }

    NodeId exit_node() const noexcept
    {
        return reversed ? from_node : to_node;
    }
};

/**
 * @brief A path discovered by `PathFinder`.
 *
 * @details
 * Produced once per discovered path and not modified afterwards. The
 * `path_id` is local to the traversal invocation that produced it (1-based,
 * in emission order); persisted ids are assigned by the backing store.
 */
struct PathResult
{
    size_t path_id{0};
    NodeId start_node_id{0};
    NodeId end_node_id{0};
    double total_cost{0.0};
    EndpointType endpoint_type{EndpointType::None};
    std::vector<PathStep> steps;

    /**
     * @brief Get the ordered node sequence, start node first.
     */
    std::vector<NodeId> node_sequence() const
    {
        std::vector<NodeId> nodes;
        nodes.reserve(steps.size() + 1);
        nodes.push_back(start_node_id);
        for (const auto& step : steps)
        {
            nodes.push_back(step.exit_node());
        }
        return nodes;
    }

    /**
     * @brief Get the ordered link id sequence.
     */
    std::vector<LinkId> link_sequence() const
    {
        std::vector<LinkId> links;
        links.reserve(steps.size());
        for (const auto& step : steps)
        {
            links.push_back(step.link_id);
        }
        return links;
    }
};

} // namespace pocnet
