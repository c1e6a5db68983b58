#include "pocnet/sampling/biased_sampler.hpp"
#include "pocnet/common/logging.hpp"

namespace pocnet
{

namespace
{

std::int64_t node_distance(NodeId a, NodeId b) noexcept
{
    return a > b ? a - b : b - a;
}

} // namespace

BiasedSampler::BiasedSampler(BiasConfig config, std::uint64_t seed)
    : m_config(std::move(config))
    , m_rng(seed)
{
    m_config.validate();
}

std::optional<PocPair> BiasedSampler::sample(
    BiasState& state,
    const std::vector<Toolset>& catalog,
    const CoverageScope& scope)
{
    auto logger = get_logger();

    for (size_t draw = 0; draw < m_config.max_pair_attempts; ++draw)
    {
        auto fab = pick_fab(catalog, scope);
        if (!fab)
        {
            logger->warn("No toolset with at least two equipment in scope fab='{}' toolset='{}'",
                         scope.fab, scope.toolset_code);
            ++state.exhausted_draws;
            return std::nullopt;
        }
        auto candidates = eligible_toolsets(catalog, scope, *fab);
        const Toolset* toolset = pick_toolset(state, candidates);

        for (size_t k = 0; k < m_config.max_toolset_pair_attempts; ++k)
        {
            auto equipment = pick_equipment_pair(state, *toolset);
            if (!equipment)
            {
                continue;
            }
            const Equipment& eq_a = *equipment->first;
            const Equipment& eq_b = *equipment->second;
            const EquipmentPoc* poc_a = pick_poc(eq_a);
            const EquipmentPoc* poc_b = pick_poc(eq_b);
            if (poc_a == nullptr || poc_b == nullptr)
            {
                continue;
            }

            switch (check_pair(state, *poc_a, *poc_b, eq_a.kind, eq_b.kind))
            {
                case PairVerdict::TooClose:
                    ++state.rejected_too_close;
                    continue;
                case PairVerdict::Repeated:
                    ++state.rejected_repeated;
                    continue;
                case PairVerdict::DiversityRejected:
                    ++state.rejected_diversity;
                    continue;
                case PairVerdict::Accepted:
                    break;
            }

            accept(state, *toolset, eq_a, *poc_a, eq_b, *poc_b);

            PocPair pair;
            pair.fab = toolset->fab;
            pair.toolset_code = toolset->code;
            pair.from_equipment_id = eq_a.equipment_id;
            pair.to_equipment_id = eq_b.equipment_id;
            pair.from_poc_id = poc_a->poc_id;
            pair.to_poc_id = poc_b->poc_id;
            pair.from_node_id = poc_a->node_id;
            pair.to_node_id = poc_b->node_id;
            double cost = static_cast<double>(node_distance(poc_a->node_id, poc_b->node_id));
            if (!poc_a->is_used)
            {
                cost *= 1.5;
            }
            if (!poc_b->is_used)
            {
                cost *= 1.5;
            }
            if (poc_a->utility_no && poc_b->utility_no && *poc_a->utility_no != *poc_b->utility_no)
            {
                cost *= 0.8;
            }
            pair.estimated_cost = cost;

            logger->debug("Sampled pair {} -> {} in toolset {} ({})", pair.from_node_id,
                          pair.to_node_id, pair.toolset_code, pair.fab);
            return pair;
        }

        // The toolset yielded no acceptable pair.
        ++state.toolset_attempts[toolset->code];
    }

    ++state.exhausted_draws;
    logger->warn("No PoC pair found after {} toolset draws", m_config.max_pair_attempts);
    return std::nullopt;
}

void BiasedSampler::record_outcome(BiasState& state, const PocPair& pair, bool path_found) const
{
    if (path_found)
    {
        state.consecutive_failures = 0;
        state.last_successful_toolset = pair.toolset_code;
        return;
    }
    ++state.consecutive_failures;
    if (state.consecutive_failures >= m_config.max_consecutive_failures &&
        state.suspended_toolsets.insert(pair.toolset_code).second)
    {
        get_logger()->warn("Toolset {} suspended after {} consecutive failures",
                           pair.toolset_code, state.consecutive_failures);
    }
}

SamplingStatistics BiasedSampler::statistics(const BiasState& state) const
{
    SamplingStatistics stats;
    stats.pairs_sampled = state.pairs_sampled;
    stats.rejected_too_close = state.rejected_too_close;
    stats.rejected_repeated = state.rejected_repeated;
    stats.rejected_diversity = state.rejected_diversity;
    stats.exhausted_draws = state.exhausted_draws;
    stats.consecutive_failures = state.consecutive_failures;
    stats.last_successful_toolset = state.last_successful_toolset;
    stats.toolset_attempts = state.toolset_attempts;
    stats.equipment_attempts = state.equipment_attempts;
    stats.suspended_toolsets = state.suspended_toolsets;
    return stats;
}

void BiasedSampler::reset(BiasState& state) const
{
    state.reset();
    get_logger()->info("Bias tracking reset");
}

std::vector<const Toolset*> BiasedSampler::eligible_toolsets(
    const std::vector<Toolset>& catalog,
    const CoverageScope& scope,
    const std::string& fab) const
{
    std::vector<const Toolset*> result;
    for (const auto& toolset : catalog)
    {
        if (toolset.fab != fab || !toolset.is_active || toolset.equipment.size() < 2)
        {
            continue;
        }
        if (!scope.toolset_code.empty() && toolset.code != scope.toolset_code)
        {
            continue;
        }
        result.push_back(&toolset);
    }
    return result;
}

std::optional<std::string> BiasedSampler::pick_fab(
    const std::vector<Toolset>& catalog,
    const CoverageScope& scope)
{
    if (!scope.fab.empty())
    {
        if (eligible_toolsets(catalog, scope, scope.fab).empty())
        {
            return std::nullopt;
        }
        return scope.fab;
    }
    std::set<std::string> fabs;
    for (const auto& toolset : catalog)
    {
        if (fabs.count(toolset.fab) == 0u && !eligible_toolsets(catalog, scope, toolset.fab).empty())
        {
            fabs.insert(toolset.fab);
        }
    }
    if (fabs.empty())
    {
        return std::nullopt;
    }
    auto it = fabs.begin();
    std::advance(it, static_cast<std::ptrdiff_t>(pick_index(fabs.size())));
    return *it;
}

const Toolset* BiasedSampler::pick_toolset(
    BiasState& state,
    const std::vector<const Toolset*>& candidates)
{
    auto available = [&]()
    {
        std::vector<std::pair<const Toolset*, double>> pool;
        for (const Toolset* toolset : candidates)
        {
            size_t attempts = state.toolset_attempts[toolset->code];
            if (state.suspended_toolsets.count(toolset->code) != 0u ||
                attempts >= m_config.max_attempts_per_toolset)
            {
                continue;
            }
            double weight = static_cast<double>(toolset->equipment.size()) /
                            static_cast<double>(1 + attempts);
            pool.emplace_back(toolset, weight);
        }
        return pool;
    };

    auto pool = available();
    if (pool.empty())
    {
        for (const Toolset* toolset : candidates)
        {
            state.suspended_toolsets.erase(toolset->code);
            size_t& attempts = state.toolset_attempts[toolset->code];
            attempts = attempts > 2 ? attempts - 2 : 0;
        }
        get_logger()->debug("Toolset pool exhausted, lowered attempt counters of {} toolsets",
                            candidates.size());
        pool = available();
    }
    if (pool.empty())
    {
        for (const Toolset* toolset : candidates)
        {
            pool.emplace_back(toolset, static_cast<double>(toolset->equipment.size()));
        }
    }

    std::vector<double> weights;
    weights.reserve(pool.size());
    for (const auto& entry : pool)
    {
        weights.push_back(entry.second);
    }
    std::discrete_distribution<size_t> dist(weights.begin(), weights.end());
    return pool[dist(m_rng)].first;
}

std::optional<std::pair<const Equipment*, const Equipment*>> BiasedSampler::pick_equipment_pair(
    BiasState& state,
    const Toolset& toolset)
{
    auto available = [&]()
    {
        std::vector<const Equipment*> pool;
        for (const auto& equipment : toolset.equipment)
        {
            if (state.equipment_attempts[equipment.equipment_id] < m_config.max_attempts_per_equipment)
            {
                pool.push_back(&equipment);
            }
        }
        return pool;
    };

    auto pool = available();
    if (pool.size() < 2)
    {
        for (const auto& equipment : toolset.equipment)
        {
            size_t& attempts = state.equipment_attempts[equipment.equipment_id];
            attempts = attempts > 1 ? attempts - 1 : 0;
        }
        pool = available();
    }
    if (pool.size() < 2)
    {
        pool.clear();
        for (const auto& equipment : toolset.equipment)
        {
            pool.push_back(&equipment);
        }
    }
    if (pool.size() < 2)
    {
        return std::nullopt;
    }

    size_t i = pick_index(pool.size());
    size_t j = pick_index(pool.size() - 1);
    if (j >= i)
    {
        ++j;
    }
    return std::make_pair(pool[i], pool[j]);
}

const EquipmentPoc* BiasedSampler::pick_poc(const Equipment& equipment)
{
    std::vector<const EquipmentPoc*> all;
    std::vector<const EquipmentPoc*> used;
    std::vector<const EquipmentPoc*> with_utility;
    for (const auto& poc : equipment.pocs)
    {
        if (!poc.is_active || poc.node_id == 0)
        {
            continue;
        }
        all.push_back(&poc);
        if (poc.is_used)
        {
            used.push_back(&poc);
        }
        if (poc.utility_no)
        {
            with_utility.push_back(&poc);
        }
    }
    const auto& pool = !used.empty() ? used : (!with_utility.empty() ? with_utility : all);
    if (pool.empty())
    {
        return nullptr;
    }
    return pool[pick_index(pool.size())];
}

BiasedSampler::PairVerdict BiasedSampler::check_pair(
    const BiasState& state,
    const EquipmentPoc& a,
    const EquipmentPoc& b,
    const std::string& category_a,
    const std::string& category_b)
{
    const std::int64_t min_distance = m_config.min_distance_between_nodes;
    if (a.poc_id == b.poc_id || a.node_id == b.node_id ||
        node_distance(a.node_id, b.node_id) < min_distance)
    {
        return PairVerdict::TooClose;
    }
    for (NodeId recent : state.recent_nodes)
    {
        if (node_distance(a.node_id, recent) < min_distance ||
            node_distance(b.node_id, recent) < min_distance)
        {
            return PairVerdict::TooClose;
        }
    }

    if (state.attempted_pairs.count(make_node_pair(a.node_id, b.node_id)) != 0u)
    {
        return PairVerdict::Repeated;
    }

    std::vector<std::int64_t> utilities;
    for (const auto* poc : {&a, &b})
    {
        if (poc->utility_no)
        {
            utilities.push_back(*poc->utility_no);
        }
    }
    bool utilities_seen = !utilities.empty() &&
                          std::all_of(utilities.begin(), utilities.end(),
                                      [&](std::int64_t u) { return state.utility_usage.count(u) != 0u; });
    if (utilities_seen && !roll_accept(m_config.utility_diversity_weight))
    {
        return PairVerdict::DiversityRejected;
    }

    std::vector<std::string> categories;
    for (const auto* category : {&category_a, &category_b})
    {
        if (!category->empty())
        {
            categories.push_back(*category);
        }
    }
    bool categories_seen = !categories.empty() &&
                           std::all_of(categories.begin(), categories.end(),
                                       [&](const std::string& c) { return state.category_usage.count(c) != 0u; });
    if (categories_seen && !roll_accept(m_config.category_diversity_weight))
    {
        return PairVerdict::DiversityRejected;
    }

    return PairVerdict::Accepted;
}

void BiasedSampler::accept(
    BiasState& state,
    const Toolset& toolset,
    const Equipment& eq_a,
    const EquipmentPoc& poc_a,
    const Equipment& eq_b,
    const EquipmentPoc& poc_b) const
{
    ++state.toolset_attempts[toolset.code];
    ++state.equipment_attempts[eq_a.equipment_id];
    ++state.equipment_attempts[eq_b.equipment_id];
    for (const auto* poc : {&poc_a, &poc_b})
    {
        if (poc->utility_no)
        {
            ++state.utility_usage[*poc->utility_no];
        }
    }
    for (const auto* equipment : {&eq_a, &eq_b})
    {
        if (!equipment->kind.empty())
        {
            ++state.category_usage[equipment->kind];
        }
    }
    state.attempted_pairs.insert(make_node_pair(poc_a.node_id, poc_b.node_id));
    state.remember_node(poc_a.node_id, m_config.recency_capacity);
    state.remember_node(poc_b.node_id, m_config.recency_capacity);
    ++state.pairs_sampled;
}

bool BiasedSampler::roll_accept(double weight)
{
    if (weight <= 0.0)
    {
        return true;
    }
    std::uniform_real_distribution<double> dist(0.0, 1.0);
    return dist(m_rng) < 1.0 - weight;
}

size_t BiasedSampler::pick_index(size_t count)
{
    std::uniform_int_distribution<size_t> dist(0, count - 1);
    return dist(m_rng);
}

} // namespace pocnet
