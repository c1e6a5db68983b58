/**
 * @file network_enums.hpp
 */
#pragma once
#include "pocnet/common/common.hpp"

namespace pocnet
{

// ============================================================================
// Identifier type aliases
// ============================================================================

/**
 * @brief Type alias for network node identifiers.
 *
 * @details
 * Node ids are the integer keys assigned by the backing store. The value 0 is
 * never a valid node id and is used by callers to mean "no node".
 */
using NodeId = std::int64_t;

/**
 * @brief Type alias for network link identifiers.
 */
using LinkId = std::int64_t;

/**
 * @brief Unordered pair of node ids, stored as (min, max).
 */
using NodePair = std::pair<NodeId, NodeId>;

inline NodePair make_node_pair(NodeId a, NodeId b) noexcept
{
    return a < b ? NodePair{a, b} : NodePair{b, a};
}

/**
 * @brief Hash functor for `NodePair`, for use in unordered containers.
 */
struct NodePairHash
{
    size_t operator()(const NodePair& p) const noexcept
    {
        size_t h1 = std::hash<NodeId>{}(p.first);
        size_t h2 = std::hash<NodeId>{}(p.second);
        return h1 ^ (h2 + 0x9e3779b97f4a7c15ULL + (h1 << 6) + (h1 >> 2));
    }
};

// ============================================================================
// Enumerations
// ============================================================================

/**
 * @brief Object kind of a network node, as stored in the backing store.
 */
enum class NodeKind
{
    Unknown = 0,
    Logical = 1,
    Poc = 2,
    Virtual = 3
};

/**
 * @brief Object kind of a network link, as stored in the backing store.
 */
enum class LinkKind
{
    Link = 101,
    LogicalPoc = 201,
    PocPoc = 202,
    PocDistance = 203,
    PocVirtual = 204
};

/**
 * @brief Traversal algorithm used by `PathFinder`.
 */
enum class TraversalAlgorithm
{
    Dfs,
    Dijkstra
};

/**
 * @brief Reason a traversal stopped at a node.
 *
 * @details
 * The rules are evaluated in declaration order; the first matching rule wins.
 * `None` means the node is not terminal and traversal continues through it.
 */
enum class EndpointType
{
    None,
    Leaf,     ///< No outgoing adjacency entries at all.
    Target,   ///< Data code is in the caller-supplied target-code set.
    Boundary  ///< Has adjacency entries, none lead to a traversable node.
};

/**
 * @brief One-character classification of a node on a persisted path.
 */
enum class NodeFlag : char
{
    Start = 'S',
    Leaf = 'L',
    Endpoint = 'E',
    Boundary = 'F',
    Convergence = 'C',
    Intermediate = 'I'
};

/**
 * @brief Flow direction tag carried by an equipment PoC.
 */
enum class FlowDirection
{
    Unknown,
    In,
    Out,
    Bidirectional
};

inline const char* to_string(TraversalAlgorithm algorithm) noexcept
{
    switch (algorithm)
    {
        case TraversalAlgorithm::Dfs:
            return "DFS";
        case TraversalAlgorithm::Dijkstra:
            return "DIJKSTRA";
    }
    return "UNKNOWN";
}

inline const char* to_string(EndpointType type) noexcept
{
    switch (type)
    {
        case EndpointType::None:
            return "NONE";
        case EndpointType::Leaf:
            return "LEAF";
        case EndpointType::Target:
            return "TARGET";
        case EndpointType::Boundary:
            return "BOUNDARY";
    }
    return "UNKNOWN";
}

inline const char* to_string(FlowDirection flow) noexcept
{
    switch (flow)
    {
        case FlowDirection::Unknown:
            return "";
        case FlowDirection::In:
            return "IN";
        case FlowDirection::Out:
            return "OUT";
        case FlowDirection::Bidirectional:
            return "BIDIRECTIONAL";
    }
    return "";
}

inline char to_char(NodeFlag flag) noexcept
{
    return static_cast<char>(flag);
}

} // namespace pocnet
