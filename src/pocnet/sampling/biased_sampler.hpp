/**
 * @file biased_sampler.hpp
 * @brief Random PoC pair selection with bias mitigation.
 */
#pragma once
#include "pocnet/common/common.hpp"
#include "pocnet/common/facility_items.hpp"
#include "pocnet/sampling/bias_state.hpp"
#include "pocnet/store/store_types.hpp"

namespace pocnet
{

/**
 * @brief A sampled pair of PoCs on two equipment of one toolset.
 */
struct PocPair
{
    std::string fab;
    std::string toolset_code;
    std::int64_t from_equipment_id{0};
    std::int64_t to_equipment_id{0};
    std::int64_t from_poc_id{0};
    std::int64_t to_poc_id{0};
    NodeId from_node_id{0};
    NodeId to_node_id{0};

    /**
     * @brief Rough cost hint: node id distance, raised for unused PoCs and
     *        lowered for pairs of different utilities.
     */
    double estimated_cost{0.0};

    NodePair node_pair() const noexcept
    {
        return make_node_pair(from_node_id, to_node_id);
    }
};

/**
 * @brief Snapshot of a run's sampling counters.
 */
struct SamplingStatistics
{
    size_t pairs_sampled{0};
    size_t rejected_too_close{0};
    size_t rejected_repeated{0};
    size_t rejected_diversity{0};
    size_t exhausted_draws{0};
    size_t consecutive_failures{0};
    std::string last_successful_toolset;
    std::map<std::string, size_t> toolset_attempts;
    std::map<std::int64_t, size_t> equipment_attempts;
    std::set<std::string> suspended_toolsets;

    /**
     * @brief Get a summary string for logging.
     */
    std::string summary() const
    {
        std::string result = "sampled=" + std::to_string(pairs_sampled);
        result += " (rejected: close=" + std::to_string(rejected_too_close);
        result += ", repeated=" + std::to_string(rejected_repeated);
        result += ", diversity=" + std::to_string(rejected_diversity) + ")";
        result += ", exhausted=" + std::to_string(exhausted_draws);
        result += ", toolsets=" + std::to_string(toolset_attempts.size());
        result += ", suspended=" + std::to_string(suspended_toolsets.size());
        return result;
    }
};

/**
 * @brief Selects PoC pairs for path discovery while spreading samples.
 *
 * @details
 * Selection is hierarchical: fab (when the scope leaves it open), toolset,
 * two distinct equipment of the toolset, one PoC per equipment. Toolsets and
 * equipment that reached their attempt ceiling are skipped; when that leaves
 * no candidate, the pool's counters are lowered (toolsets by 2, equipment by
 * 1, never below 0) and the pool is drawn from again.
 *
 * A drawn pair is rejected when a node lies within
 * `min_distance_between_nodes` of its partner or of a recently sampled node,
 * when the unordered node pair was attempted before, or by the diversity
 * rolls. Rejections do not count as toolset or equipment attempts; an
 * accepted pair counts one attempt for its toolset and each equipment, and a
 * toolset that yields no acceptable pair within `max_toolset_pair_attempts`
 * draws counts one toolset attempt.
 *
 * All randomness comes from an engine seeded at construction.
 *
 * @par Thread safety
 * - Not thread-safe. Each run uses its own sampler and `BiasState`.
 */
class BiasedSampler
{
public:
    /**
     * @throws NetworkError with `InvalidConfiguration` if `config` is invalid.
     */
    BiasedSampler(BiasConfig config, std::uint64_t seed);

    const BiasConfig& config() const noexcept
    {
        return m_config;
    }

    /**
     * @brief Draw a PoC pair from the catalog.
     *
     * @param state The run's bias state; updated on acceptance and rejection.
     * @param catalog Active toolsets with their active equipment and PoCs.
     * @param scope Restricts fab and toolset; other fields are ignored here.
     * @return The pair, or an empty optional after `max_pair_attempts` failed
     *         toolset draws or when no toolset has two equipment.
     */
    std::optional<PocPair> sample(
        BiasState& state,
        const std::vector<Toolset>& catalog,
        const CoverageScope& scope);

    /**
     * @brief Record whether a path was found for a sampled pair.
     *
     * @details
     * A success clears the consecutive failure counter. After
     * `max_consecutive_failures` failures in a row the pair's toolset is
     * suspended until its pool is exhausted.
     */
    void record_outcome(BiasState& state, const PocPair& pair, bool path_found) const;

    SamplingStatistics statistics(const BiasState& state) const;

    /**
     * @brief Clear the state completely.
     */
    void reset(BiasState& state) const;

private:
    enum class PairVerdict
    {
        Accepted,
        TooClose,
        Repeated,
        DiversityRejected
    };

    std::vector<const Toolset*> eligible_toolsets(
        const std::vector<Toolset>& catalog,
        const CoverageScope& scope,
        const std::string& fab) const;
    std::optional<std::string> pick_fab(
        const std::vector<Toolset>& catalog,
        const CoverageScope& scope);
    const Toolset* pick_toolset(BiasState& state, const std::vector<const Toolset*>& candidates);
    std::optional<std::pair<const Equipment*, const Equipment*>> pick_equipment_pair(
        BiasState& state,
        const Toolset& toolset);
    const EquipmentPoc* pick_poc(const Equipment& equipment);
    PairVerdict check_pair(
        const BiasState& state,
        const EquipmentPoc& a,
        const EquipmentPoc& b,
        const std::string& category_a,
        const std::string& category_b);
    void accept(
        BiasState& state,
        const Toolset& toolset,
        const Equipment& eq_a,
        const EquipmentPoc& poc_a,
        const Equipment& eq_b,
        const EquipmentPoc& poc_b) const;
    bool roll_accept(double weight);
    size_t pick_index(size_t count);

private:
    BiasConfig m_config;
    std::mt19937_64 m_rng;
};

} // namespace pocnet
