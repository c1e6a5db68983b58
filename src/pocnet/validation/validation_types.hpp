/**
 * @file validation_types.hpp
 * @brief Validation error and review flag records, and the report container.
 */
#pragma once
#include "pocnet/common/common.hpp"
#include "pocnet/common/network_enums.hpp"

namespace pocnet
{

// ============================================================================
// Enumerations
// ============================================================================

/**
 * @brief Severity of a validation error or review flag.
 *
 * @details
 * `Critical` and `Error` are blocking; `Warning` is informational. `Low`,
 * `Medium` and `High` grade data-quality issues that do not block a run.
 */
enum class Severity
{
    Low,
    Medium,
    High,
    Critical,
    Warning,
    Error
};

/**
 * @brief Area of a validation rule.
 */
enum class ValidationScope
{
    Connectivity,
    Flow,
    Material,
    Qa
};

/**
 * @brief Typed kind of a validation error.
 */
enum class ErrorKind
{
    MissingNode,          ///< Node referenced by the path is not in the store.
    MissingLink,          ///< Link referenced by the path is not in the store.
    ConnectivityBreak,    ///< Consecutive nodes are not joined by a usable link.
    MissingUtility,       ///< PoC on the path has no utility assignment.
    MissingAttributes,    ///< PoC on the path lacks a marker or reference.
    UnusedPoc,            ///< PoC on the path is not marked as used.
    InvalidUtilityChange, ///< Utility changes outside an allowed conversion.
    MultipleInflows,      ///< More than one IN terminus on the path.
    MultipleOutflows,     ///< More than one OUT terminus on the path.
    FlowInconsistency,    ///< Adjacent PoCs disagree on utility group or flow direction.
    InvalidMaterial,      ///< More than one material along the path.
    PathTooShort,         ///< Fewer than 2 nodes or no link.
    PathTooLong,          ///< Node count above the configured ceiling.
    LinkCountMismatch,    ///< Link count is not node count minus one.
    PathLoop,             ///< A node appears more than once.
    LoopbackPoc,          ///< A PoC on the path is marked as loopback.
    TestExecutionFailed   ///< The validation test itself threw.
};

/**
 * @brief Type of the object a validation error or review flag refers to.
 */
enum class ObjectType
{
    Node,
    Link,
    Poc,
    Path
};

inline const char* to_string(Severity severity) noexcept
{
    switch (severity)
    {
        case Severity::Low:
            return "LOW";
        case Severity::Medium:
            return "MEDIUM";
        case Severity::High:
            return "HIGH";
        case Severity::Critical:
            return "CRITICAL";
        case Severity::Warning:
            return "WARNING";
        case Severity::Error:
            return "ERROR";
    }
    return "UNKNOWN";
}

inline const char* to_string(ValidationScope scope) noexcept
{
    switch (scope)
    {
        case ValidationScope::Connectivity:
            return "CONNECTIVITY";
        case ValidationScope::Flow:
            return "FLOW";
        case ValidationScope::Material:
            return "MATERIAL";
        case ValidationScope::Qa:
            return "QA";
    }
    return "UNKNOWN";
}

inline const char* to_string(ErrorKind kind) noexcept
{
    switch (kind)
    {
        case ErrorKind::MissingNode:
            return "MISSING_NODE";
        case ErrorKind::MissingLink:
            return "MISSING_LINK";
        case ErrorKind::ConnectivityBreak:
            return "CONNECTIVITY_BREAK";
        case ErrorKind::MissingUtility:
            return "MISSING_UTILITY";
        case ErrorKind::MissingAttributes:
            return "MISSING_ATTRIBUTES";
        case ErrorKind::UnusedPoc:
            return "UNUSED_POC";
        case ErrorKind::InvalidUtilityChange:
            return "INVALID_UTILITY_CHANGE";
        case ErrorKind::MultipleInflows:
            return "MULTIPLE_INFLOWS";
        case ErrorKind::MultipleOutflows:
            return "MULTIPLE_OUTFLOWS";
        case ErrorKind::FlowInconsistency:
            return "FLOW_INCONSISTENCY";
        case ErrorKind::InvalidMaterial:
            return "INVALID_MATERIAL";
        case ErrorKind::PathTooShort:
            return "PATH_TOO_SHORT";
        case ErrorKind::PathTooLong:
            return "PATH_TOO_LONG";
        case ErrorKind::LinkCountMismatch:
            return "LINK_COUNT_MISMATCH";
        case ErrorKind::PathLoop:
            return "PATH_LOOP";
        case ErrorKind::LoopbackPoc:
            return "LOOPBACK_POC";
        case ErrorKind::TestExecutionFailed:
            return "TEST_EXECUTION_FAILED";
    }
    return "UNKNOWN";
}

inline const char* to_string(ObjectType type) noexcept
{
    switch (type)
    {
        case ObjectType::Node:
            return "NODE";
        case ObjectType::Link:
            return "LINK";
        case ObjectType::Poc:
            return "POC";
        case ObjectType::Path:
            return "PATH";
    }
    return "UNKNOWN";
}

/**
 * @brief Whether a severity blocks a path from being accepted as clean.
 */
inline bool is_blocking(Severity severity) noexcept
{
    return severity == Severity::Critical || severity == Severity::Error;
}

// ============================================================================
// Records
// ============================================================================

/**
 * @brief A single validation finding against one path.
 *
 * @details
 * Created during validation, persisted by the backing store, never mutated
 * afterwards. `object_id` is the node, link or PoC id named by `object_type`,
 * or 0 for path-level findings.
 */
struct ValidationError
{
    Severity severity{Severity::Error};
    ValidationScope scope{ValidationScope::Qa};
    ErrorKind kind{ErrorKind::TestExecutionFailed};
    ObjectType object_type{ObjectType::Path};
    std::int64_t object_id{0};
    /// Code of the validation test that produced this error, e.g. "CONN_001".
    std::string test_code;
    std::string message;
};

/**
 * @brief An out-of-band anomaly raised for human review.
 */
struct ReviewFlag
{
    Severity severity{Severity::Medium};
    std::string reason;
    ObjectType object_type{ObjectType::Path};
    std::optional<NodeId> start_node_id;
    std::optional<NodeId> end_node_id;
    std::optional<LinkId> link_id;
    std::string notes;
};

/**
 * @brief Outcome of one validation test.
 */
struct ValidationTestResult
{
    std::string test_code;
    std::string test_name;
    bool passed{true};
    size_t error_count{0};
    size_t warning_count{0};
};

// ============================================================================
// ValidationReport
// ============================================================================

/**
 * @brief All findings produced by validating one path.
 *
 * @details
 * `ValidationReport` is produced by `ValidationEngine::validate()`. Findings
 * are kept in emission order. A path is considered valid when it has no
 * blocking (CRITICAL or ERROR) findings; other severities are reported but do
 * not invalidate the path.
 *
 * @par Thread safety
 * - No internal synchronization.
 * - Once returned by the engine, the data is not modified.
 */
class ValidationReport
{
public:
    bool has_blocking_errors() const noexcept
    {
        return std::any_of(m_errors.begin(), m_errors.end(),
                           [](const ValidationError& e) { return is_blocking(e.severity); });
    }

    bool is_valid() const noexcept
    {
        return !has_blocking_errors();
    }

    const std::vector<ValidationError>& errors() const noexcept
    {
        return m_errors;
    }

    const std::vector<ReviewFlag>& review_flags() const noexcept
    {
        return m_review_flags;
    }

    const std::vector<ValidationTestResult>& test_results() const noexcept
    {
        return m_test_results;
    }

    /**
     * @brief Count findings of one severity.
     */
    size_t count(Severity severity) const noexcept
    {
        return static_cast<size_t>(std::count_if(
            m_errors.begin(), m_errors.end(),
            [severity](const ValidationError& e) { return e.severity == severity; }));
    }

    /**
     * @brief Count findings of one kind.
     */
    size_t count(ErrorKind kind) const noexcept
    {
        return static_cast<size_t>(std::count_if(
            m_errors.begin(), m_errors.end(),
            [kind](const ValidationError& e) { return e.kind == kind; }));
    }

    // Allow ValidationEngine to populate the report
    friend class ValidationEngine;

private:
    std::vector<ValidationError> m_errors;
    std::vector<ReviewFlag> m_review_flags;
    std::vector<ValidationTestResult> m_test_results;
};

/**
 * @brief Aggregated validation counts across many paths of a run.
 */
struct ValidationSummary
{
    size_t total_errors{0};
    std::map<Severity, size_t> by_severity;
    std::map<ErrorKind, size_t> by_kind;
    size_t review_flags{0};

    size_t blocking_count() const noexcept
    {
        size_t n = 0;
        for (const auto& [severity, count] : by_severity)
        {
            if (is_blocking(severity))
            {
                n += count;
            }
        }
        return n;
    }

    void add(const ValidationReport& report)
    {
        for (const auto& error : report.errors())
        {
            ++total_errors;
            ++by_severity[error.severity];
            ++by_kind[error.kind];
        }
        review_flags += report.review_flags().size();
    }
};

} // namespace pocnet
