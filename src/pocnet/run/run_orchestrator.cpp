#include "pocnet/run/run_orchestrator.hpp"
#include "pocnet/common/logging.hpp"
#include "pocnet/common/network_exceptions.hpp"

namespace pocnet
{

namespace
{

bool is_recoverable(const NetworkError& e) noexcept
{
    return e.code() == NetworkErrorCode::BackingStoreUnavailable;
}

} // namespace

std::vector<std::pair<NodeId, NodeFlag>> flags_for_path(const NodeFlagMap& flags, const PathResult& path)
{
    std::vector<std::pair<NodeId, NodeFlag>> result;
    std::unordered_set<NodeId> seen;
    for (NodeId id : path.node_sequence())
    {
        if (!seen.insert(id).second)
        {
            continue;
        }
        auto it = flags.find(std::make_pair(path.path_id, id));
        if (it != flags.end())
        {
            result.emplace_back(id, it->second);
        }
    }
    return result;
}

RunOrchestrator::RunOrchestrator(std::shared_ptr<BackingStore> store)
    : m_store(std::move(store))
{
    if (!m_store)
    {
        throw NetworkError(NetworkErrorCode::InvalidConfiguration,
                           "RunOrchestrator requires a backing store");
    }
}

void RunOrchestrator::request_stop()
{
    m_stop_requested.store(true);
}

bool RunOrchestrator::stop_requested() const noexcept
{
    return m_stop_requested.load();
}

RunResult RunOrchestrator::run(const RunConfig& config)
{
    config.validate();

    auto logger = get_logger();
    RunResult result;
    result.run_id = config.run_id.empty() ? generate_run_id() : config.run_id;
    result.approach = config.approach;
    auto start_time = std::chrono::steady_clock::now();

    logger->info("Run {} started: approach={}, method={}, coverage_target={:.3f}",
                 result.run_id, to_string(config.approach), to_string(config.method),
                 config.coverage_target);

    try
    {
        CoverageTracker coverage(m_store);
        ValidationEngine validation(m_store, config.validation);
        RunContext ctx{config, result, coverage, validation, start_time + config.timeout,
                       config.timeout.count() > 0};

        result.coverage = coverage.initialize(config.scope);

        if (config.approach == RunApproach::Random)
        {
            run_random(ctx);
        }
        else
        {
            run_scenario(ctx);
        }

        result.coverage = coverage.metrics();
        result.status = RunStatus::Done;
    }
    catch (const std::exception& e)
    {
        result.status = RunStatus::Failed;
        result.error_message = e.what();
        logger->error("Run {} failed: {}", result.run_id, e.what());
    }

    auto end_time = std::chrono::steady_clock::now();
    result.duration = std::chrono::duration_cast<std::chrono::nanoseconds>(end_time - start_time);
    logger->info("{}", result.summary());
    return result;
}

bool RunOrchestrator::should_end(RunContext& ctx) const
{
    if (m_stop_requested.load())
    {
        ctx.result.stopped = true;
        return true;
    }
    if (ctx.has_deadline && std::chrono::steady_clock::now() >= ctx.deadline)
    {
        ctx.result.timed_out = true;
        return true;
    }
    return false;
}

void RunOrchestrator::run_random(RunContext& ctx)
{
    auto logger = get_logger();
    const RunConfig& config = ctx.config;
    RunResult& result = ctx.result;

    const std::vector<Toolset> catalog = m_store->load_catalog(config.scope);
    logger->info("Run {}: catalog holds {} toolsets", result.run_id, catalog.size());

    BiasedSampler sampler(config.bias, config.seed);
    BiasState state;
    PathFinder finder;

    while (result.attempts < config.max_attempts && !should_end(ctx))
    {
        ++result.attempts;
        try
        {
            std::optional<PocPair> pair = sampler.sample(state, catalog, config.scope);
            if (!pair)
            {
                ++result.no_pair_attempts;
                continue;
            }

            if (config.ignore_node_ids.count(pair->from_node_id) != 0u ||
                config.ignore_node_ids.count(pair->to_node_id) != 0u)
            {
                logger->debug("Attempt {}: pair {} -> {} touches an ignored node",
                              result.attempts, pair->from_node_id, pair->to_node_id);
                sampler.record_outcome(state, *pair, false);
                ++result.paths_not_found;
                continue;
            }

            if (!finder.has_graph())
            {
                GraphLoadRequest request;
                request.start_node_id = pair->from_node_id;
                request.ignore_node_ids = config.ignore_node_ids;
                try
                {
                    finder.attach(load_graph_view(*m_store, request));
                }
                catch (const NetworkError& e)
                {
                    if (e.code() != NetworkErrorCode::NodeNotFound)
                    {
                        throw;
                    }
                    logger->warn("Attempt {}: {}", result.attempts, e.what());
                    sampler.record_outcome(state, *pair, false);
                    ++result.paths_not_found;
                    continue;
                }
            }

            std::optional<PathResult> path = finder.shortest_path(pair->from_node_id, pair->to_node_id);
            if (!path)
            {
                sampler.record_outcome(state, *pair, false);
                ++result.paths_not_found;
                report_no_path(ctx, *pair);
                continue;
            }

            sampler.record_outcome(state, *pair, true);
            NodeFlagMap flags = finder.analyze_node_flags({*path}, config.target_codes);
            record_path(ctx, *path, TraversalAlgorithm::Dijkstra, flags);

            if (ctx.coverage.has_reached(config.coverage_target))
            {
                result.target_reached = true;
                logger->info("Run {}: coverage target {:.3f} reached after {} attempts",
                             result.run_id, config.coverage_target, result.attempts);
                break;
            }
        }
        catch (const NetworkError& e)
        {
            if (!is_recoverable(e))
            {
                throw;
            }
            ++result.store_errors;
            logger->warn("Attempt {} skipped: {}", result.attempts, e.what());
        }
    }

    result.sampling = sampler.statistics(state);
    logger->info("Run {}: {}", result.run_id, result.sampling.summary());
}

void RunOrchestrator::run_scenario(RunContext& ctx)
{
    auto logger = get_logger();
    const RunConfig& config = ctx.config;
    RunResult& result = ctx.result;

    if (should_end(ctx))
    {
        return;
    }

    GraphLoadRequest request;
    request.start_node_id = config.scenario_start_node_id;
    request.ignore_node_ids = config.ignore_node_ids;
    request.filters = config.scenario_filters;
    PathFinder finder(load_graph_view(*m_store, request));

    TraversalOptions options = config.traversal;
    options.target_codes = config.target_codes;
    TraversalResult traversal = finder.find_paths(options);
    logger->info("Run {}: scenario from node {}: {}", result.run_id,
                 config.scenario_start_node_id, traversal.summary());

    NodeFlagMap flags = finder.analyze_node_flags(traversal.paths, options.target_codes);

    for (const auto& path : traversal.paths)
    {
        if (should_end(ctx))
        {
            break;
        }
        ++result.attempts;
        try
        {
            record_path(ctx, path, traversal.algorithm, flags);
        }
        catch (const NetworkError& e)
        {
            if (!is_recoverable(e))
            {
                throw;
            }
            ++result.store_errors;
            logger->warn("Path {} not recorded: {}", path.path_id, e.what());
            continue;
        }

        if (config.coverage_target > 0.0 && ctx.coverage.has_reached(config.coverage_target))
        {
            result.target_reached = true;
            logger->info("Run {}: coverage target {:.3f} reached after {} paths",
                         result.run_id, config.coverage_target, result.attempts);
            break;
        }
    }
}

void RunOrchestrator::record_path(
    RunContext& ctx,
    const PathResult& path,
    TraversalAlgorithm algorithm,
    const NodeFlagMap& flags)
{
    auto logger = get_logger();
    RunResult& result = ctx.result;

    ValidationReport report = ctx.validation.validate(path);

    PathRecord record;
    record.run_id = result.run_id;
    record.algorithm = algorithm;
    record.path = path;
    record.node_flags = flags_for_path(flags, path);
    record.validation_errors = report.errors();
    record.review_flags = report.review_flags();

    // Coverage is scored only for committed paths.
    std::int64_t record_id = m_store->commit_path_record(record);

    const auto nodes = path.node_sequence();
    const auto links = path.link_sequence();
    const double gain = ctx.coverage.contribution(nodes, links);
    result.coverage = ctx.coverage.update(nodes, links);
    result.validation.add(report);
    result.record_ids.push_back(record_id);
    ++result.paths_found;

    if (report.has_blocking_errors())
    {
        logger->warn("Path {} -> {} (record {}) has blocking validation errors",
                     path.start_node_id, path.end_node_id, record_id);
    }
    logger->debug("Path {} -> {} recorded as {}: {} steps, cost {:.2f}, {} findings, coverage +{:.4f}",
                  path.start_node_id, path.end_node_id, record_id, path.steps.size(),
                  path.total_cost, report.errors().size(), gain);
}

void RunOrchestrator::report_no_path(RunContext& ctx, const PocPair& pair)
{
    ReviewFlag flag;
    flag.severity = Severity::Medium;
    flag.reason = "NO_PATH_FOUND";
    flag.object_type = ObjectType::Path;
    flag.start_node_id = pair.from_node_id;
    flag.end_node_id = pair.to_node_id;
    flag.notes = "No path between PoC " + std::to_string(pair.from_poc_id) + " and PoC " +
                 std::to_string(pair.to_poc_id) + " of toolset " + pair.toolset_code;
    m_store->commit_review_flags(ctx.result.run_id, {flag});
    get_logger()->warn("Attempt {}: no path from node {} to node {}",
                       ctx.result.attempts, pair.from_node_id, pair.to_node_id);
}

std::string RunOrchestrator::generate_run_id()
{
    static std::atomic<std::uint64_t> counter{0};
    const auto ms = std::chrono::duration_cast<std::chrono::milliseconds>(
                        std::chrono::system_clock::now().time_since_epoch())
                        .count();
    return "run-" + std::to_string(ms) + "-" + std::to_string(++counter);
}

} // namespace pocnet
