/**
 * @file rolling_horizon.cpp
 * @brief 滚动区间控制器 - 工作线程池、分区状态机、修复阶梯、批次汇总
 */

#include "rolling_horizon.h"
#include "partition.h"
#include "problem_builder.h"
#include "solver_adapter.h"
#include "logger.h"

#include <thread>
#include <atomic>

// ============================================================================
// PolicyCache
// ============================================================================

bool PolicyCache::Lookup(const string& partition_id, vector<Policy>& policies) const {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = policies_.find(partition_id);
    if (it == policies_.end()) return false;
    policies = it->second;
    return true;
}

void PolicyCache::Store(const string& partition_id, const vector<Policy>& policies) {
    std::lock_guard<std::mutex> lock(mutex_);
    policies_[partition_id] = policies;
}

void PolicyCache::Flag(const string& partition_id) {
    std::lock_guard<std::mutex> lock(mutex_);
    flagged_.insert(partition_id);
}

set<string> PolicyCache::TakeFlagged() {
    std::lock_guard<std::mutex> lock(mutex_);
    set<string> taken;
    taken.swap(flagged_);
    return taken;
}

bool PolicyCache::IsFlagged(const string& partition_id) const {
    std::lock_guard<std::mutex> lock(mutex_);
    return flagged_.count(partition_id) > 0;
}

int PolicyCache::Size() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return static_cast<int>(policies_.size());
}

// ============================================================================
// CycleResult
// ============================================================================

vector<Policy> CycleResult::AllPolicies() const {
    vector<Policy> all;
    for (const PartitionOutcome& outcome : outcomes) {
        all.insert(all.end(), outcome.policies.begin(), outcome.policies.end());
    }
    return all;
}

// ============================================================================
// 分区状态机
// ============================================================================

static void Persist(PartitionOutcome& outcome, ExtractedPlan& plan, PolicySource source) {
    outcome.state = PartitionState::Persisted;
    outcome.source = source;
    outcome.policies = std::move(plan.policies);
    outcome.audit = plan.audit;
}

static void MarkFailed(PartitionOutcome& outcome, const Partition& partition,
                       const Horizon& horizon, SolveStatus status) {
    outcome.state = PartitionState::Failed;
    outcome.source = PolicySource::None;
    outcome.policies = PlaceholderPolicies(partition, horizon, status);
    outcome.audit = ExtractionAudit();
}

// 把上一周期的策略平移到当前区间: 周期重叠的记录原样沿用,
// 超出旧区间的周期沿用该 (p,l) 最后一条记录的安全库存与再订货点, 不下单
bool RollingHorizonController::ReusePriorCycle(const Partition& partition, const Horizon& horizon,
                                               PartitionOutcome& outcome) {
    vector<Policy> cached;
    if (!cache_.Lookup(partition.partition_id, cached)) {
        return false;
    }

    map<PeriodKey, const Policy*> by_key;
    map<PairKey, const Policy*> latest;
    for (const Policy& policy : cached) {
        by_key[PeriodKey(policy.product_id, policy.location_id, policy.period)] = &policy;
        const Policy*& last = latest[PairKey(policy.product_id, policy.location_id)];
        if (last == nullptr || policy.period > last->period) last = &policy;
    }

    vector<Policy> reused = PlaceholderPolicies(partition, horizon, SolveStatus::TimedOut);
    for (Policy& policy : reused) {
        auto exact = by_key.find(PeriodKey(policy.product_id, policy.location_id, policy.period));
        if (exact != by_key.end()) {
            policy = *exact->second;
        } else {
            auto last = latest.find(PairKey(policy.product_id, policy.location_id));
            if (last == latest.end()) {
                LOG_WARN_FMT("[超时] 缓存策略不含 %s@%s, 无法沿用\n",
                             policy.product_id.c_str(), policy.location_id.c_str());
                return false;
            }
            policy.safety_stock = last->second->safety_stock;
            policy.reorder_point = last->second->reorder_point;
        }
        policy.solver_status = SolveStatus::TimedOut;
        policy.source = PolicySource::PriorCycle;
    }

    outcome.state = PartitionState::Persisted;
    outcome.source = PolicySource::PriorCycle;
    outcome.policies = std::move(reused);
    outcome.audit = ExtractionAudit();
    LOG_WARN_FMT("[超时] 沿用上一周期策略 %d 条, 下周期优先重解\n",
                 static_cast<int>(outcome.policies.size()));
    return true;
}

bool RollingHorizonController::RunRepairLadder(const Partition& partition,
                                               const MasterSnapshot& snapshot,
                                               const Horizon& horizon,
                                               double time_limit,
                                               const vector<PairData>& pairs,
                                               PartitionOutcome& outcome) {
    vector<pair<RelaxationLevel, PolicySource>> rungs;
    RelaxationLevel backlog;
    backlog.allow_backlog = true;
    rungs.push_back(make_pair(backlog, PolicySource::RelaxedBacklog));
    for (double scale : config_.safety_stock_scales) {
        RelaxationLevel relaxed = backlog;
        relaxed.safety_stock_scale = scale;
        rungs.push_back(make_pair(relaxed, PolicySource::RelaxedSafetyStock));
    }

    SolverAdapter adapter(backend_, config_);
    for (const auto& rung : rungs) {
        string step = PolicySourceName(rung.second);
        if (rung.second == PolicySource::RelaxedSafetyStock) {
            step += "(" + ToString(rung.first.safety_stock_scale, 2) + ")";
        }
        outcome.repair_steps.push_back(step);

        OptimizationProblem relaxed = BuildProblem(partition, snapshot, horizon, config_, rung.first);
        Solution solution = adapter.Solve(relaxed, time_limit, config_.gap_tolerance);
        if (!IsAccepted(solution.status)) {
            LOG_DETAIL_FMT("[修复] %s 未得到可接受解: %s\n", step.c_str(),
                           SolveStatusName(solution.status));
            continue;
        }

        try {
            ExtractedPlan plan = ExtractPolicies(relaxed, solution, config_,
                                                 outcome.solver_status, rung.second);
            Persist(outcome, plan, rung.second);
            LOG_WARN_FMT("[修复] %s 成功, 缺货合计 %.4f\n", step.c_str(), outcome.audit.total_shortage);
            return true;
        } catch (const PolicyRoundingError& e) {
            LOG_WARN_FMT("[修复] %s 舍入失败: %s\n", step.c_str(), e.what());
        }
    }

    outcome.repair_steps.push_back(PolicySourceName(PolicySource::Heuristic));
    ExtractedPlan plan;
    string reason;
    if (RunReorderPointHeuristic(pairs, horizon, config_, 1.0, outcome.solver_status, plan, reason)) {
        Persist(outcome, plan, PolicySource::Heuristic);
        LOG_WARN_FMT("[修复] 启发式生成策略, 缺货合计 %.4f\n", outcome.audit.total_shortage);
        return true;
    }

    outcome.message = reason;
    LOG_WARN_FMT("[修复] 启发式失败: %s\n", reason.c_str());
    return false;
}

PartitionOutcome RollingHorizonController::RunPartition(const Partition& partition,
                                                        const MasterSnapshot& snapshot,
                                                        const Horizon& horizon,
                                                        double time_limit) {
    ScopedLogTag tag(partition.partition_id);
    auto start = chrono::steady_clock::now();
    auto elapsed = [&start]() {
        return chrono::duration<double>(chrono::steady_clock::now() - start).count();
    };

    PartitionOutcome outcome;
    outcome.partition_id = partition.partition_id;

    // Building
    OptimizationProblem problem;
    try {
        problem = BuildProblem(partition, snapshot, horizon, config_);
    } catch (const ValidationError& e) {
        outcome.message = e.what();
        MarkFailed(outcome, partition, horizon, SolveStatus::Error);
        outcome.seconds = elapsed();
        LOG_WARN_FMT("[分区] %s\n", e.what());
        return outcome;
    }

    // Solving
    outcome.state = PartitionState::Solving;
    SolverAdapter adapter(backend_, config_);
    Solution solution = adapter.Solve(problem, time_limit, config_.gap_tolerance);
    outcome.solver_status = solution.status;
    outcome.message = solution.message;

    if (IsAccepted(solution.status)) {
        // Extracting
        outcome.state = PartitionState::Extracting;
        try {
            ExtractedPlan plan = ExtractPolicies(problem, solution, config_, solution.status,
                                                 PolicySource::Solver);
            Persist(outcome, plan, PolicySource::Solver);
            cache_.Store(partition.partition_id, outcome.policies);
            outcome.seconds = elapsed();
            LOG_DETAIL_FMT("[分区] %s 目标=%.4f 用时 %s\n", SolveStatusName(solution.status),
                           solution.objective, FormatElapsed(outcome.seconds).c_str());
            return outcome;
        } catch (const PolicyRoundingError& e) {
            outcome.message = e.what();
            LOG_WARN_FMT("[分区] %s, 进入修复\n", e.what());
        }
    } else if (solution.status == SolveStatus::TimedOut) {
        outcome.flagged_for_resolve = true;
        cache_.Flag(partition.partition_id);
        if (ReusePriorCycle(partition, horizon, outcome)) {
            outcome.seconds = elapsed();
            return outcome;
        }
        LOG_WARN("[分区] 超时且无缓存策略, 进入修复");
    } else {
        LOG_WARN_FMT("[分区] 名义模型 %s (%s), 进入修复\n", SolveStatusName(solution.status),
                     solution.message.c_str());
    }

    // Repairing
    outcome.state = PartitionState::Repairing;
    if (RunRepairLadder(partition, snapshot, horizon, time_limit, problem.pairs, outcome)) {
        cache_.Store(partition.partition_id, outcome.policies);
    } else {
        MarkFailed(outcome, partition, horizon, outcome.solver_status);
    }
    outcome.seconds = elapsed();
    return outcome;
}

// ============================================================================
// 周期调度
// ============================================================================

CycleResult RollingHorizonController::RunCycle(const MasterSnapshot& snapshot,
                                               const vector<Partition>& partitions,
                                               const Horizon& horizon,
                                               int cycle) {
    auto start = chrono::steady_clock::now();
    CycleResult result;
    result.outcomes.resize(partitions.size());

    // 上周期超时的分区排在队首, 并获得更长的时间预算
    set<string> flagged = cache_.TakeFlagged();
    vector<size_t> queue;
    for (size_t i = 0; i < partitions.size(); ++i) {
        if (flagged.count(partitions[i].partition_id)) queue.push_back(i);
    }
    for (size_t i = 0; i < partitions.size(); ++i) {
        if (!flagged.count(partitions[i].partition_id)) queue.push_back(i);
    }

    LOG_FMT("[周期 %d] 区间 [%d, %d) 分区=%d 优先重解=%d 工作线程=%d\n", cycle,
            horizon.start_period, horizon.start_period + horizon.length,
            static_cast<int>(partitions.size()), static_cast<int>(flagged.size()), config_.workers);

    std::atomic<size_t> next(0);
    auto worker = [&]() {
        while (true) {
            size_t k = next.fetch_add(1);
            if (k >= queue.size()) break;
            size_t index = queue[k];
            const Partition& partition = partitions[index];
            bool priority = flagged.count(partition.partition_id) > 0;
            double time_limit = priority ? config_.time_limit * config_.resolve_time_factor
                                         : config_.time_limit;

            PartitionOutcome& outcome = result.outcomes[index];
            try {
                outcome = RunPartition(partition, snapshot, horizon, time_limit);
            } catch (const std::exception& e) {
                // 线程边界: 记录为失败分区, 不让异常终止进程
                outcome = PartitionOutcome();
                outcome.partition_id = partition.partition_id;
                outcome.message = e.what();
                MarkFailed(outcome, partition, horizon, SolveStatus::Error);
                LOG_WARN_FMT("[周期 %d] 分区 %s 异常: %s\n", cycle,
                             partition.partition_id.c_str(), e.what());
            }
            outcome.resolved_with_priority = priority;
        }
    };

    int workers = Max(1, Min(config_.workers, static_cast<int>(queue.size())));
    vector<std::thread> threads;
    for (int w = 0; w < workers; ++w) {
        threads.emplace_back(worker);
    }
    for (auto& thread : threads) {
        thread.join();
    }

    // 所有分区已到达终态
    BatchReport& report = result.report;
    report.cycle = cycle;
    report.horizon = horizon;
    report.partitions = static_cast<int>(partitions.size());
    report.rejected_rows = static_cast<int>(snapshot.rejected_rows.size());
    for (const PartitionOutcome& outcome : result.outcomes) {
        report.by_status[SolveStatusName(outcome.solver_status)]++;
        report.by_source[PolicySourceName(outcome.source)]++;
        if (outcome.state == PartitionState::Persisted) {
            report.persisted++;
            report.audit.Add(outcome.audit);
        } else {
            report.failed++;
            report.failed_partitions.push_back(outcome.partition_id);
        }
        if (outcome.flagged_for_resolve) {
            report.flagged_partitions.push_back(outcome.partition_id);
        }
    }
    report.failed_fraction = report.partitions > 0
        ? static_cast<double>(report.failed) / report.partitions : 0.0;
    report.seconds = chrono::duration<double>(chrono::steady_clock::now() - start).count();

    LOG_FMT("[周期 %d] 完成: 落地=%d 失败=%d (%.1f%%) 超时标记=%d 用时 %s\n", cycle,
            report.persisted, report.failed, report.failed_fraction * 100.0,
            static_cast<int>(report.flagged_partitions.size()), FormatElapsed(report.seconds).c_str());
    return result;
}

void CheckBatchHealth(const BatchReport& report, double threshold) {
    if (report.partitions > 0 && report.failed_fraction > threshold) {
        throw PartialBatchFailure("周期 " + ToString(report.cycle) + " 失败分区 " +
                                  ToString(report.failed) + "/" + ToString(report.partitions) +
                                  " 超过阈值 " + ToString(threshold, 3),
                                  report.failed, report.partitions);
    }
}
