/**
 * @file store_types.hpp
 * @brief Query and record types exchanged with the backing store.
 */
#pragma once
#include "pocnet/common/common.hpp"
#include "pocnet/common/network_enums.hpp"
#include "pocnet/common/network_items.hpp"
#include "pocnet/validation/validation_types.hpp"

namespace pocnet
{

/**
 * @brief Node inclusion filters for a traversal session.
 *
 * @details
 * A zero or empty value disables the corresponding filter. `eq_poc_no` is
 * matched as a case-insensitive substring after trimming surrounding
 * whitespace.
 */
struct PathFilters
{
    std::int64_t utility_no{0};
    std::int64_t toolset_id{0};
    std::string eq_poc_no;

    bool empty() const noexcept
    {
        return utility_no == 0 && toolset_id == 0 && trimmed_eq_poc_no().empty();
    }

    /**
     * @brief Check whether a node satisfies every active filter.
     */
    bool matches(const NetworkNode& node) const
    {
        if (utility_no != 0 && node.utility_no != utility_no)
        {
            return false;
        }
        if (toolset_id != 0 && node.toolset_id != toolset_id)
        {
            return false;
        }
        std::string needle = trimmed_eq_poc_no();
        if (!needle.empty())
        {
            std::string haystack = to_lower(node.eq_poc_no);
            if (haystack.find(to_lower(needle)) == std::string::npos)
            {
                return false;
            }
        }
        return true;
    }

    std::string trimmed_eq_poc_no() const
    {
        const char* ws = " \t\r\n";
        auto first = eq_poc_no.find_first_not_of(ws);
        if (first == std::string::npos)
        {
            return std::string{};
        }
        auto last = eq_poc_no.find_last_not_of(ws);
        return eq_poc_no.substr(first, last - first + 1);
    }

private:
    static std::string to_lower(std::string s)
    {
        std::transform(s.begin(), s.end(), s.begin(),
                       [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
        return s;
    }
};

/**
 * @brief Coverage scope: a fab, optionally narrowed by model, phase or toolset.
 *
 * @details
 * Empty strings and zero values leave the corresponding dimension
 * unconstrained. A scope with every field unset covers the whole network.
 */
struct CoverageScope
{
    std::string fab;
    std::int64_t model_no{0};
    std::int64_t phase_no{0};
    std::string toolset_code;

    bool unconstrained() const noexcept
    {
        return fab.empty() && model_no == 0 && phase_no == 0 && toolset_code.empty();
    }
};

/**
 * @brief Element kind for scope queries.
 */
enum class ScopeElement
{
    Node,
    Link
};

/**
 * @brief Total node and link counts of a coverage scope.
 */
struct ScopeTotals
{
    size_t nodes{0};
    size_t links{0};
};

/**
 * @brief Everything persisted for one discovered path.
 *
 * @details
 * A record is committed as a unit: the path, its node flags, the coverage it
 * contributes (its node and link sequences) and its validation outcome are
 * either all stored or none of them are. `record_id` is assigned by the store
 * on commit.
 */
struct PathRecord
{
    std::int64_t record_id{0};
    std::string run_id;
    TraversalAlgorithm algorithm{TraversalAlgorithm::Dijkstra};
    PathResult path;
    std::vector<std::pair<NodeId, NodeFlag>> node_flags;
    std::vector<ValidationError> validation_errors;
    std::vector<ReviewFlag> review_flags;
};

} // namespace pocnet
