/**
 * @file partition.cpp
 * @brief 分区划分与单分区直接求解
 */

#include "partition.h"
#include "problem_builder.h"
#include "solver_adapter.h"
#include "policy_extractor.h"
#include "logger.h"

vector<Partition> MakePartitions(const MasterSnapshot& snapshot, int max_pairs) {
    const int chunk = Max(max_pairs, 1);
    vector<Partition> partitions;

    // map 已按 id 排序
    vector<string> product_ids;
    for (const auto& entry : snapshot.products) {
        product_ids.push_back(entry.first);
    }

    for (const auto& entry : snapshot.locations) {
        const string& location_id = entry.first;

        // 主数据或风险事件有缺陷的产品单独成区, 校验失败不波及同库位的其他产品
        vector<string> valid;
        vector<string> isolated;
        for (const string& product_id : product_ids) {
            bool defective = !ProductDefect(snapshot.products.at(product_id)).empty() ||
                             snapshot.invalid_pairs.count(PairKey(product_id, location_id)) > 0;
            (defective ? isolated : valid).push_back(product_id);
        }

        int block = 0;
        for (size_t begin = 0; begin < valid.size(); begin += chunk) {
            size_t end = Min(begin + static_cast<size_t>(chunk), valid.size());
            Partition partition;
            partition.partition_id = "P-" + location_id + "-" + ToString(block++);
            partition.product_ids.assign(valid.begin() + begin, valid.begin() + end);
            partition.location_ids.push_back(location_id);
            partitions.push_back(partition);
        }
        for (const string& product_id : isolated) {
            Partition partition;
            partition.partition_id = "P-" + location_id + "-" + ToString(block++);
            partition.product_ids.push_back(product_id);
            partition.location_ids.push_back(location_id);
            partitions.push_back(partition);
        }
    }

    LOG_DETAIL_FMT("[分区] 产品=%d 库位=%d 分区=%d (每分区最多 %d 对)\n",
                   static_cast<int>(product_ids.size()), static_cast<int>(snapshot.locations.size()),
                   static_cast<int>(partitions.size()), chunk);
    return partitions;
}

vector<Policy> PlaceholderPolicies(const Partition& partition, const Horizon& horizon,
                                   SolveStatus status) {
    set<string> products(partition.product_ids.begin(), partition.product_ids.end());
    set<string> locations(partition.location_ids.begin(), partition.location_ids.end());

    vector<Policy> policies;
    for (const string& l : locations) {
        for (const string& p : products) {
            for (int t = 0; t < horizon.length; ++t) {
                Policy policy;
                policy.product_id = p;
                policy.location_id = l;
                policy.period = horizon.start_period + t;
                policy.solver_status = status;
                policy.source = PolicySource::None;
                policies.push_back(policy);
            }
        }
    }
    return policies;
}

vector<Policy> SolvePartition(const vector<string>& product_ids,
                              const vector<string>& location_ids,
                              const Horizon& horizon,
                              const MasterSnapshot& snapshot,
                              SolverBackend& backend,
                              const OptimizerConfig& config) {
    Partition partition;
    partition.partition_id = "query";
    partition.product_ids = product_ids;
    partition.location_ids = location_ids;

    OptimizationProblem problem = BuildProblem(partition, snapshot, horizon, config);
    SolverAdapter adapter(backend, config);
    Solution solution = adapter.Solve(problem, config.time_limit, config.gap_tolerance);

    if (!IsAccepted(solution.status)) {
        return PlaceholderPolicies(partition, horizon, solution.status);
    }
    return ExtractPolicies(problem, solution, config, solution.status, PolicySource::Solver).policies;
}
