// rolling_horizon.h - 滚动区间控制器
//
// 每个周期:
//   1. 冻结主数据快照, 划分分区
//   2. 有界工作线程池并发处理分区, 每个分区走状态机
//        Building -> Solving -> Extracting -> Persisted
//                       |           |
//                       v           v
//                   Repairing --> Persisted / Failed
//   3. 所有分区到达终态 (线程 join) 后汇总批次报告
//
// 修复阶梯 (逐级累加放松):
//   放开缺货上限 -> 下调安全库存目标 -> 再订货点启发式 -> Failed
// 超时: 沿用上一周期的策略 (PriorCycle) 并标记下周期优先重解;
//       无缓存时进入修复阶梯。

#ifndef ROLLING_HORIZON_H_
#define ROLLING_HORIZON_H_

#include "replenish.h"
#include "policy_extractor.h"
#include "solvers/solver_backend.h"

#include <mutex>

// 跨周期的最近可用策略缓存, 工作线程并发访问
class PolicyCache {
public:
    bool Lookup(const string& partition_id, vector<Policy>& policies) const;
    void Store(const string& partition_id, const vector<Policy>& policies);

    // 超时分区在下一周期优先重解
    void Flag(const string& partition_id);
    set<string> TakeFlagged();
    bool IsFlagged(const string& partition_id) const;

    int Size() const;

private:
    mutable std::mutex mutex_;
    map<string, vector<Policy>> policies_;
    set<string> flagged_;
};

struct PartitionOutcome {
    string partition_id;
    PartitionState state = PartitionState::Building;
    SolveStatus solver_status = SolveStatus::Error;   // 名义模型的求解状态
    PolicySource source = PolicySource::None;
    vector<Policy> policies;
    ExtractionAudit audit;
    vector<string> repair_steps;                       // 依次尝试过的修复级别
    string message;
    bool flagged_for_resolve = false;
    bool resolved_with_priority = false;               // 本周期按重解预算求解
    double seconds = 0.0;
};

struct BatchReport {
    int cycle = 0;
    Horizon horizon;
    int partitions = 0;
    int persisted = 0;
    int failed = 0;
    double failed_fraction = 0.0;
    map<string, int> by_status;       // 名义求解状态计数
    map<string, int> by_source;       // 策略来源计数
    vector<string> failed_partitions;
    vector<string> flagged_partitions;
    int rejected_rows = 0;
    ExtractionAudit audit;
    double seconds = 0.0;
};

struct CycleResult {
    vector<PartitionOutcome> outcomes;   // 与输入分区顺序一致
    BatchReport report;

    vector<Policy> AllPolicies() const;
};

class RollingHorizonController {
public:
    RollingHorizonController(SolverBackend& backend, const OptimizerConfig& config, PolicyCache& cache)
        : backend_(backend), config_(config), cache_(cache) {}

    // 运行一个周期; 不因失败分区抛出异常, 失败比例由 CheckBatchHealth 判断
    CycleResult RunCycle(const MasterSnapshot& snapshot,
                         const vector<Partition>& partitions,
                         const Horizon& horizon,
                         int cycle = 0);

    // 单个分区的完整状态机
    PartitionOutcome RunPartition(const Partition& partition,
                                  const MasterSnapshot& snapshot,
                                  const Horizon& horizon,
                                  double time_limit);

private:
    bool RunRepairLadder(const Partition& partition, const MasterSnapshot& snapshot,
                         const Horizon& horizon, double time_limit,
                         const vector<PairData>& pairs, PartitionOutcome& outcome);

    bool ReusePriorCycle(const Partition& partition, const Horizon& horizon,
                         PartitionOutcome& outcome);

    SolverBackend& backend_;
    OptimizerConfig config_;
    PolicyCache& cache_;
};

// 失败分区比例超过阈值时抛出 PartialBatchFailure
void CheckBatchHealth(const BatchReport& report, double threshold);

// 批次报告 (JSON), 实现见 output.cpp
void WriteBatchReportJson(const string& path, const CycleResult& result);

#endif  // ROLLING_HORIZON_H_
