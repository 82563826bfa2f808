/**
 * @file solver_adapter.cpp
 * @brief 求解器适配层 - 结果分类、字典序次目标、异常隔离
 */

#include "solver_adapter.h"
#include "logger.h"

// gap 小于该值视为已证明最优
constexpr double kProvenOptimalGap = 1e-9;

// 第二阶段主目标允许的相对劣化
constexpr double kCutoffRelTolerance = 1e-7;

SolveStatus SolverAdapter::Classify(const BackendResult& result, double gap_tolerance) {
    bool gap_known = result.gap >= 0.0;
    switch (result.outcome) {
        case BackendOutcome::Optimal:
            return SolveStatus::Optimal;
        case BackendOutcome::Feasible:
            if (gap_known && result.gap <= kProvenOptimalGap) return SolveStatus::Optimal;
            if (gap_known && result.gap <= gap_tolerance * (1.0 + 1e-9)) return SolveStatus::Suboptimal;
            return SolveStatus::Error;
        case BackendOutcome::TimeLimitWithSolution:
            if (gap_known && result.gap <= gap_tolerance * (1.0 + 1e-9)) return SolveStatus::Suboptimal;
            return SolveStatus::TimedOut;
        case BackendOutcome::TimeLimitNoSolution:
            return SolveStatus::TimedOut;
        case BackendOutcome::Infeasible:
            return SolveStatus::Infeasible;
        case BackendOutcome::Failed:
        default:
            return SolveStatus::Error;
    }
}

BackendResult SolverAdapter::RunBackend(const LinearModel& model,
                                        const vector<ModelTerm>& objective,
                                        const SolveSettings& settings) const {
    try {
        return backend_.Solve(model, objective, settings);
    } catch (const std::exception& e) {
        BackendResult failed;
        failed.outcome = BackendOutcome::Failed;
        failed.message = backend_.Name() + " 异常: " + e.what();
        return failed;
    }
}

Solution SolverAdapter::Solve(const OptimizationProblem& problem,
                              double time_limit, double gap_tolerance) const {
    Solution solution;
    solution.partition_id = problem.partition_id;
    const LinearModel& model = problem.model;

    if (time_limit <= 0.0) {
        solution.status = SolveStatus::TimedOut;
        solution.message = "时间预算为 0";
        return solution;
    }

    SolveSettings settings;
    settings.time_limit = time_limit;
    settings.gap_tolerance = gap_tolerance;
    settings.random_seed = config_.random_seed;
    settings.threads = config_.solver_threads;
    settings.det_time_limit = config_.det_time_limit;

    // 阶段1: 主目标
    BackendResult primary = RunBackend(model, model.objective, settings);
    solution.status = Classify(primary, gap_tolerance);
    solution.message = primary.message;
    solution.gap = primary.gap;
    solution.seconds = primary.seconds;

    if (IsAccepted(solution.status) && primary.values.size() != model.vars.size()) {
        solution.status = SolveStatus::Error;
        solution.message = "后端返回的取值不完整 (" + ToString(static_cast<int>(primary.values.size())) +
                           "/" + ToString(static_cast<int>(model.vars.size())) + ")";
    }
    if (!IsAccepted(solution.status)) {
        LOG_DETAIL_FMT("[求解] %s 状态=%s %s\n", problem.partition_id.c_str(),
                       SolveStatusName(solution.status), solution.message.c_str());
        return solution;
    }

    solution.objective = primary.objective;
    solution.values = std::move(primary.values);

    // 阶段2: 主目标不劣化的前提下最小化次目标
    // 预算与阶段1相同且不依赖实测耗时, 是否进入本阶段只取决于输入与配置
    if (config_.order_count_tiebreak && !model.secondary_objective.empty()) {
        LinearModel lex = model;
        double cutoff = solution.objective + kCutoffRelTolerance * Max(1.0, Abs(solution.objective));
        lex.AddRow("objective_cutoff", RowFamily::ObjectiveCutoff, model.objective,
                   RowSense::LessEqual, cutoff);

        BackendResult secondary = RunBackend(lex, model.secondary_objective, settings);
        solution.seconds += secondary.seconds;

        if (IsAccepted(Classify(secondary, gap_tolerance)) &&
            secondary.values.size() == model.vars.size()) {
            solution.values = std::move(secondary.values);
            solution.objective = EvaluateTerms(model.objective, solution.values);
            solution.tie_break_applied = true;
        } else {
            LOG_DETAIL_FMT("[求解] %s 次目标阶段未完成 (%s), 保留主目标解\n",
                           problem.partition_id.c_str(), secondary.message.c_str());
        }
    }

    LOG_DETAIL_FMT("[求解] %s 状态=%s 目标=%.4f 用时=%.3fs\n", problem.partition_id.c_str(),
                   SolveStatusName(solution.status), solution.objective, solution.seconds);
    return solution;
}
