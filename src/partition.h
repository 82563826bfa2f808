// partition.h - 分区划分与单分区直接求解
//
// MakePartitions: 每个库位一个分区组, 产品按 id 排序后切块,
// 主数据或风险事件有缺陷的产品各自单独成区,
// 每块最多 max_pairs 个 (产品, 库位) 对, 分区编号 P-<库位>-<块号>。
//
// SolvePartition: 查询接口, 与控制器共享建模/求解/提取三步,
// 但不经过修复状态机, 直接返回求解器的原始状态。

#ifndef PARTITION_H_
#define PARTITION_H_

#include "replenish.h"
#include "solvers/solver_backend.h"

vector<Partition> MakePartitions(const MasterSnapshot& snapshot, int max_pairs);

// 非接受状态时每个 (p,l,t) 返回一条占位记录 (数量为 0, 携带原始状态);
// 数据缺失时抛出 ValidationError
vector<Policy> SolvePartition(const vector<string>& product_ids,
                              const vector<string>& location_ids,
                              const Horizon& horizon,
                              const MasterSnapshot& snapshot,
                              SolverBackend& backend,
                              const OptimizerConfig& config);

// 分区中每个 (p,l,t) 的占位记录
vector<Policy> PlaceholderPolicies(const Partition& partition, const Horizon& horizon,
                                   SolveStatus status);

#endif  // PARTITION_H_
