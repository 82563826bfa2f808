// policy_extractor.h - 策略提取
//
// 把求解器的取值向量映射回 (产品, 库位, 周期) 策略记录:
//   1. 订货量舍入到最小销售单位 (粒度), 低于 MOQ 的正订货量上调到 MOQ
//   2. 复核非负与 MOQ, 在舍入后的计划上重算库存轨迹并复核库容
//   3. 重算实际持有/缺货/订货成本用于审计
// 舍入破坏 MOQ 或库容时抛出 PolicyRoundingError, 交由控制器修复。

#ifndef POLICY_EXTRACTOR_H_
#define POLICY_EXTRACTOR_H_

#include "problem_builder.h"
#include "solver_adapter.h"

// 舍入后计划的实际成本
struct ExtractionAudit {
    double holding_cost = 0.0;
    double shortage_cost = 0.0;
    double ordering_cost = 0.0;
    double total_shortage = 0.0;
    int orders = 0;

    double Total() const { return holding_cost + shortage_cost + ordering_cost; }

    void Add(const ExtractionAudit& other) {
        holding_cost += other.holding_cost;
        shortage_cost += other.shortage_cost;
        ordering_cost += other.ordering_cost;
        total_shortage += other.total_shortage;
        orders += other.orders;
    }
};

struct ExtractedPlan {
    vector<Policy> policies;
    ExtractionAudit audit;
};

// 在给定订货计划下按需求均值推演库存 (缺货即损失)
struct PlanSimulation {
    vector<double> inventory;     // 期末库存
    vector<double> shortage;      // 缺货量
    vector<double> period_cost;   // 每期实际成本
    vector<double> available;     // 到货时刻的在库量 (期初 + 在途 + 到货订单)
    vector<bool> receives_order;  // 本期是否有正订货量到货
    ExtractionAudit audit;
    bool capacity_ok = true;
    int violation_period = -1;    // 第一个超库容的相对周期
};

// 只有订单到货的周期受库容约束, 期初库存与在途本身超库容不算违例
PlanSimulation SimulatePlan(const PairData& pair, const vector<double>& orders);

// 舍入到粒度 (四舍五入), 正订货量低于 MOQ 时上调到不小于 MOQ 的最小粒度倍数
double RoundOrderQuantity(double raw, double granularity, double moq);

// 从已接受的 Solution 提取策略; reported_status 写入记录的 solver_status
ExtractedPlan ExtractPolicies(const OptimizationProblem& problem,
                              const Solution& solution,
                              const OptimizerConfig& config,
                              SolveStatus reported_status,
                              PolicySource source);

// 修复第3级: 不经过求解器的再订货点启发式;
// 库容为负等无法给出合法策略时返回 false 并给出原因
bool RunReorderPointHeuristic(const vector<PairData>& pairs,
                              const Horizon& horizon,
                              const OptimizerConfig& config,
                              double safety_stock_scale,
                              SolveStatus reported_status,
                              ExtractedPlan& plan,
                              string& reason);

#endif  // POLICY_EXTRACTOR_H_
