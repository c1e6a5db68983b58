/**
 * @file coverage_tracker.hpp
 * @brief Cumulative node and link coverage of one run.
 */
#pragma once
#include "pocnet/common/common.hpp"
#include "pocnet/common/network_enums.hpp"
#include "pocnet/common/network_items.hpp"
#include "pocnet/store/backing_store.hpp"

namespace pocnet
{

/**
 * @brief Snapshot of coverage counts for a run.
 *
 * @details
 * Nodes and links are weighted equally: `coverage_fraction` is
 * (covered nodes + covered links) / (total nodes + total links), in [0, 1],
 * and 0 when the scope is empty.
 */
struct CoverageMetrics
{
    size_t covered_nodes{0};
    size_t covered_links{0};
    size_t total_nodes{0};
    size_t total_links{0};

    /**
     * @brief Number of distinct paths applied with `update()`, keyed by a
     *        hash of the node and link sequences.
     */
    size_t unique_paths{0};

    double coverage_fraction{0.0};

    double coverage_percentage() const noexcept
    {
        return coverage_fraction * 100.0;
    }

    double node_ratio() const noexcept
    {
        return total_nodes == 0 ? 0.0
                                : static_cast<double>(covered_nodes) / static_cast<double>(total_nodes);
    }

    double link_ratio() const noexcept
    {
        return total_links == 0 ? 0.0
                                : static_cast<double>(covered_links) / static_cast<double>(total_links);
    }

    /**
     * @brief Get a summary string for logging.
     */
    std::string summary() const
    {
        std::ostringstream os;
        os.setf(std::ios::fixed);
        os.precision(2);
        os << "coverage " << coverage_percentage() << "% (nodes=" << covered_nodes << "/"
           << total_nodes << ", links=" << covered_links << "/" << total_links
           << ", paths=" << unique_paths << ")";
        return os.str();
    }
};

/**
 * @brief Tracks which in-scope nodes and links have appeared on any path.
 *
 * @details
 * `initialize()` reads the scope's node and link ids from the backing store
 * and resets the covered sets. `update()` adds a path's ids; ids outside the
 * scope are not counted. Covered sets only grow until the next
 * `initialize()` or `rebuild()`.
 *
 * The covered sets are a cache of what the run's persisted path records
 * contain; `rebuild()` recomputes them from those records.
 *
 * @par Thread safety
 * - Not thread-safe. Owned by a single run.
 */
class CoverageTracker
{
public:
    explicit CoverageTracker(std::shared_ptr<BackingStore> store);

    /**
     * @brief Load the scope and reset coverage.
     * @return Metrics with zero covered items.
     * @throws NetworkError with `BackingStoreUnavailable` if the store fails.
     */
    CoverageMetrics initialize(const CoverageScope& scope);

    bool is_initialized() const noexcept
    {
        return m_initialized;
    }

    const CoverageScope& scope() const noexcept
    {
        return m_scope;
    }

    /**
     * @brief Add a path's nodes and links to the covered sets.
     * @return Metrics after the update. Applying the same path twice leaves
     *         the covered counts unchanged.
     * @throws NetworkError with `InvalidState` before `initialize()`.
     */
    CoverageMetrics update(const std::vector<NodeId>& path_nodes, const std::vector<LinkId>& path_links);

    CoverageMetrics update(const PathResult& path);

    /**
     * @brief Current metrics; all zero before `initialize()`.
     */
    CoverageMetrics metrics() const;

    /**
     * @brief Fraction of the scope that a path would newly cover.
     * @throws NetworkError with `InvalidState` before `initialize()`.
     */
    double contribution(const std::vector<NodeId>& path_nodes, const std::vector<LinkId>& path_links) const;

    /**
     * @brief In-scope ids not yet covered, ascending, at most `limit` of them.
     * @details A `limit` of 0 returns every uncovered id.
     * @throws NetworkError with `InvalidState` before `initialize()`.
     */
    std::vector<std::int64_t> uncovered(ScopeElement kind, size_t limit) const;

    /**
     * @brief Recompute the covered sets by replaying persisted path records.
     * @throws NetworkError with `InvalidState` before `initialize()`.
     */
    CoverageMetrics rebuild(const std::vector<PathRecord>& records);

    /**
     * @brief Load a run's path records from the store and replay them.
     */
    CoverageMetrics rebuild_from_store(const std::string& run_id);

    /**
     * @brief Whether the coverage fraction has reached `target`.
     */
    bool has_reached(double target) const;

    const std::set<NodeId>& covered_nodes() const noexcept
    {
        return m_covered_nodes;
    }

    const std::set<LinkId>& covered_links() const noexcept
    {
        return m_covered_links;
    }

private:
    void check_initialized(const char* operation) const;
    void apply(const std::vector<NodeId>& path_nodes, const std::vector<LinkId>& path_links);

private:
    std::shared_ptr<BackingStore> m_store;
    bool m_initialized{false};
    CoverageScope m_scope;
    std::set<NodeId> m_scope_nodes;
    std::set<LinkId> m_scope_links;
    std::set<NodeId> m_covered_nodes;
    std::set<LinkId> m_covered_links;

    /**
     * @brief Hashes of the node and link sequences applied so far.
     */
    std::unordered_set<size_t> m_seen_paths;
};

} // namespace pocnet
