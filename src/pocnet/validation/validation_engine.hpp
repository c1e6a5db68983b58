/**
 * @file validation_engine.hpp
 * @brief Fixed battery of validation tests run against discovered paths.
 */
#pragma once
#include "pocnet/common/common.hpp"
#include "pocnet/common/network_items.hpp"
#include "pocnet/store/backing_store.hpp"
#include "pocnet/validation/validation_types.hpp"

namespace pocnet
{

/**
 * @brief Configuration for `ValidationEngine`.
 */
struct ValidationConfig
{
    /**
     * @brief Paths with more nodes than this get a PATH_TOO_LONG warning.
     */
    size_t max_path_nodes{1000};

    /**
     * @brief Equipment kinds at which the utility may change.
     */
    std::set<std::string> converting_kinds{"PROCESSING", "SUPPLY", "TREATMENT"};

    /**
     * @brief Allowed utility conversions, keyed by the upstream utility.
     */
    std::map<std::int64_t, std::set<std::int64_t>> utility_transitions{
        {1, {2, 3}},
        {2, {1, 3}},
        {3, {1, 2, 4}},
        {4, {1}},
        {10, {11, 12}},
        {11, {10, 12}},
        {20, {}},
    };

    /**
     * @brief Groups of mutually compatible utilities.
     *
     * @details Adjacent PoCs whose utilities differ and share no group get a
     *          FLOW_INCONSISTENCY warning. A utility listed in no group is
     *          compatible only with itself.
     */
    std::vector<std::set<std::int64_t>> utility_groups{
        {1, 2, 3, 4},
        {10, 11, 12, 13},
        {20, 21, 22},
        {30, 31, 32},
    };
};

/**
 * @brief Runs the validation battery against one path at a time.
 *
 * @details
 * Tests run in a fixed order:
 * - CONN_001: every node and link exists; consecutive nodes are joined by a
 *   link usable in that direction. Paths with fewer than 2 nodes are skipped.
 * - DATA_001: PoCs carry a utility, a marker and a reference, and are marked
 *   as used.
 * - UTY_001: the utility only changes at a converting equipment kind, along
 *   an allowed transition. Adjacent PoCs with incompatible utility groups, or
 *   with the same IN or OUT flow, get FLOW_INCONSISTENCY warnings.
 * - UTY_002: at most one IN and at most one OUT PoC.
 * - MAT_001: at most one material along the path.
 * - QA_001: at least 2 nodes and 1 link; node count within the ceiling; link
 *   count equals node count minus one.
 * - QA_002: no repeated nodes; no loopback PoCs.
 *
 * A test that throws is reported as an ERROR finding tagged with its code,
 * with a review flag, and the remaining tests still run. A path with any
 * CRITICAL finding also gets a review flag.
 *
 * @par Thread safety
 * - `validate()` only reads engine state; safe to call concurrently when the
 *   backing store is.
 */
class ValidationEngine
{
public:
    explicit ValidationEngine(std::shared_ptr<BackingStore> store, ValidationConfig config = {});

    const ValidationConfig& config() const noexcept
    {
        return m_config;
    }

    /**
     * @brief Validate a path given as node and link id sequences.
     */
    ValidationReport validate(const std::vector<NodeId>& nodes, const std::vector<LinkId>& links) const;

    ValidationReport validate(const PathResult& path) const;

    /**
     * @brief Codes and names of the battery, in execution order.
     */
    static std::vector<std::pair<std::string, std::string>> test_catalog();

    /**
     * @brief Whether the utility may change from `from` to `to` at equipment of `kind`.
     */
    bool is_valid_transition(std::int64_t from, std::int64_t to, const std::string& kind) const;

    /**
     * @brief Whether `from` and `to` are the same utility or share a utility group.
     */
    bool is_compatible_utility(std::int64_t from, std::int64_t to) const;

private:
    /**
     * @brief Findings emitted by the test currently running.
     */
    struct Findings
    {
        std::string test_code;
        ValidationScope scope{ValidationScope::Qa};
        std::vector<ValidationError> errors;

        void add(Severity severity, ErrorKind kind, ObjectType object_type,
                 std::int64_t object_id, std::string message);
    };

    struct PathInput
    {
        const std::vector<NodeId>& nodes;
        const std::vector<LinkId>& links;
    };

    using TestFn = void (ValidationEngine::*)(const PathInput&, Findings&) const;

    struct TestEntry
    {
        const char* code;
        const char* name;
        ValidationScope scope;
        TestFn fn;
    };

    static const std::vector<TestEntry>& battery();

    void check_connectivity(const PathInput& path, Findings& out) const;
    void check_required_attributes(const PathInput& path, Findings& out) const;
    void check_utility_consistency(const PathInput& path, Findings& out) const;
    void check_flow_direction(const PathInput& path, Findings& out) const;
    void check_material(const PathInput& path, Findings& out) const;
    void check_structure(const PathInput& path, Findings& out) const;
    void check_loops(const PathInput& path, Findings& out) const;

private:
    std::shared_ptr<BackingStore> m_store;
    ValidationConfig m_config;
};

} // namespace pocnet
