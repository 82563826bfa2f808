// solver_adapter.h - 求解器适配层
//
// 契约: Solve(problem, time_limit, gap_tolerance) -> Solution
//   - 每个后端结果恰好归入 Optimal / Suboptimal / Infeasible / TimedOut / Error
//   - 非接受状态的 Solution 不携带变量取值
//   - 相同输入 + 相同配置 (变量顺序、随机种子) 得到相同结果
//   - 启用次目标时, 在主目标不劣化的前提下再最小化下单次数

#ifndef SOLVER_ADAPTER_H_
#define SOLVER_ADAPTER_H_

#include "problem_builder.h"
#include "solvers/solver_backend.h"

struct Solution {
    string partition_id;          // 所属问题
    SolveStatus status = SolveStatus::Error;
    double objective = 0.0;       // 主目标值
    double gap = -1.0;
    vector<double> values;        // 变量编号 -> 取值
    string message;
    double seconds = 0.0;
    bool tie_break_applied = false;

    double Value(int var) const { return values[var]; }
};

class SolverAdapter {
public:
    SolverAdapter(SolverBackend& backend, const OptimizerConfig& config)
        : backend_(backend), config_(config) {}

    Solution Solve(const OptimizationProblem& problem,
                   double time_limit, double gap_tolerance) const;

    // 后端原始结果 -> 状态分类
    static SolveStatus Classify(const BackendResult& result, double gap_tolerance);

private:
    BackendResult RunBackend(const LinearModel& model,
                             const vector<ModelTerm>& objective,
                             const SolveSettings& settings) const;

    SolverBackend& backend_;
    OptimizerConfig config_;
};

#endif  // SOLVER_ADAPTER_H_
