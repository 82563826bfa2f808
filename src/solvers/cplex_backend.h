// cplex_backend.h - CPLEX 求解器后端
//
// 每次求解创建独立的 IloEnv, 工作线程之间不共享任何 CPLEX 对象。
// 确定性: 固定随机种子 + 确定性并行模式 (Parallel = 1)。

#ifndef CPLEX_BACKEND_H_
#define CPLEX_BACKEND_H_

#include "solver_backend.h"

struct CplexOptions {
    string workdir = "";      // 节点文件目录, 为空时使用 CPLEX 默认
    int workmem = 4096;       // MB
};

class CplexBackend : public SolverBackend {
public:
    CplexBackend() = default;
    explicit CplexBackend(const CplexOptions& options) : options_(options) {}

    BackendResult Solve(const LinearModel& model,
                        const vector<ModelTerm>& objective,
                        const SolveSettings& settings) override;

    string Name() const override { return "CPLEX"; }

private:
    CplexOptions options_;
};

#endif  // CPLEX_BACKEND_H_
