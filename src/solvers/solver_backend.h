// solver_backend.h - MILP 求解器后端接口
//
// 后端只负责把 LinearModel 交给具体求解器并报告原始结果;
// 结果分类、字典序次目标和确定性配置由 SolverAdapter 负责。

#ifndef SOLVER_BACKEND_H_
#define SOLVER_BACKEND_H_

#include "../linear_model.h"

// 求解器原始结果
enum class BackendOutcome {
    Optimal,                // 证明最优
    Feasible,               // 有可行解 (含 gap 容差内停止)
    Infeasible,             // 不可行 (含不可行或无界)
    TimeLimitWithSolution,  // 时间到, 有可行解
    TimeLimitNoSolution,    // 时间到, 无可行解
    Failed                  // 无界、数值错误、求解器异常
};

struct SolveSettings {
    double time_limit = 30.0;     // 秒
    double det_time_limit = 0.0;  // 确定性时间 (ticks), <= 0 不限
    double gap_tolerance = 1e-4;  // 相对 MIP gap
    int random_seed = 0;
    int threads = 1;
};

struct BackendResult {
    BackendOutcome outcome = BackendOutcome::Failed;
    double objective = 0.0;
    double best_bound = 0.0;
    double gap = -1.0;            // 相对 gap, 未知时为 -1
    vector<double> values;        // 按变量编号, 仅在有解时填充
    string message;
    double seconds = 0.0;
};

class SolverBackend {
public:
    virtual ~SolverBackend() = default;

    // 以给定目标 (最小化) 求解模型; 抛出的异常由 SolverAdapter 归类为 Error
    virtual BackendResult Solve(const LinearModel& model,
                                const vector<ModelTerm>& objective,
                                const SolveSettings& settings) = 0;

    virtual string Name() const = 0;
};

#endif  // SOLVER_BACKEND_H_
