/**
 * @file policy_extractor.cpp
 * @brief 策略提取 - 舍入、MOQ/库容复核、审计成本重算
 */

#include "policy_extractor.h"
#include "logger.h"

static double CapacityTolerance(double capacity) {
    return kEpsilon * Max(1.0, Abs(capacity));
}

PlanSimulation SimulatePlan(const PairData& pair, const vector<double>& orders) {
    const int T = static_cast<int>(pair.demand_mean.size());
    const Product& prod = pair.product;
    const double capacity = pair.location.capacity;

    PlanSimulation sim;
    sim.inventory.assign(T, 0.0);
    sim.shortage.assign(T, 0.0);
    sim.period_cost.assign(T, 0.0);
    sim.available.assign(T, 0.0);
    sim.receives_order.assign(T, false);

    double previous = pair.on_hand;
    for (int t = 0; t < T; ++t) {
        double available = previous + pair.pipeline[t];
        for (int tau : pair.arrivals[t]) {
            available += orders[tau];
            if (orders[tau] > kEpsilon) sim.receives_order[t] = true;
        }
        sim.available[t] = available;
        if (sim.receives_order[t] && available > capacity + CapacityTolerance(capacity) &&
            sim.capacity_ok) {
            sim.capacity_ok = false;
            sim.violation_period = t;
        }

        double demand = pair.demand_mean[t];
        sim.inventory[t] = Max(0.0, available - demand);
        sim.shortage[t] = Max(0.0, demand - available);

        bool placed = orders[t] > kEpsilon;
        double holding = prod.holding_cost * sim.inventory[t];
        double shortage = prod.shortage_cost * sim.shortage[t];
        double ordering = placed ? prod.ordering_cost : 0.0;
        sim.period_cost[t] = holding + shortage + ordering;

        sim.audit.holding_cost += holding;
        sim.audit.shortage_cost += shortage;
        sim.audit.ordering_cost += ordering;
        sim.audit.total_shortage += sim.shortage[t];
        if (placed) sim.audit.orders++;

        previous = sim.inventory[t];
    }
    return sim;
}

double RoundOrderQuantity(double raw, double granularity, double moq) {
    double q = Max(raw, 0.0);
    if (granularity <= 0.0) {
        return q;
    }
    double rounded = floor(q / granularity + 0.5) * granularity;
    if (rounded > kEpsilon && rounded < moq - kEpsilon) {
        rounded = ceil(moq / granularity - kEpsilon) * granularity;
    }
    return Round(rounded, 9);
}

ExtractedPlan ExtractPolicies(const OptimizationProblem& problem,
                              const Solution& solution,
                              const OptimizerConfig& config,
                              SolveStatus reported_status,
                              PolicySource source) {
    if (!IsAccepted(solution.status) || solution.values.size() != problem.model.vars.size()) {
        throw invalid_argument("ExtractPolicies: 分区 " + problem.partition_id +
                               " 的解未被接受, 状态=" + SolveStatusName(solution.status));
    }

    ExtractedPlan plan;
    const int T = problem.NumPeriods();

    for (size_t i = 0; i < problem.pairs.size(); ++i) {
        const PairData& pair = problem.pairs[i];
        const PairVars& v = problem.vars[i];
        const Product& prod = pair.product;

        // 舍入并复核 MOQ
        vector<double> orders(T, 0.0);
        for (int t = 0; t < T; ++t) {
            double rounded = RoundOrderQuantity(solution.Value(v.order_qty[t]), config.granularity, prod.moq);
            if (rounded < 0.0 || (rounded > kEpsilon && rounded < prod.moq - kEpsilon)) {
                throw PolicyRoundingError(prod.product_id + "@" + pair.location.location_id +
                                          " 周期 " + ToString(problem.horizon.start_period + t) +
                                          " 订货量 " + ToString(rounded) + " 违反 MOQ " + ToString(prod.moq));
            }
            orders[t] = rounded;
        }

        // 舍入后的库容复核与审计成本
        PlanSimulation sim = SimulatePlan(pair, orders);
        if (!sim.capacity_ok) {
            throw PolicyRoundingError(prod.product_id + "@" + pair.location.location_id +
                                      " 周期 " + ToString(problem.horizon.start_period + sim.violation_period) +
                                      " 舍入后超出库容 " + ToString(pair.location.capacity));
        }
        plan.audit.Add(sim.audit);

        for (int t = 0; t < T; ++t) {
            Policy policy;
            policy.product_id = prod.product_id;
            policy.location_id = pair.location.location_id;
            policy.period = problem.horizon.start_period + t;
            policy.order_quantity = orders[t];

            double ss = Max(0.0, Round(solution.Value(v.safety_stock[t])));
            double rop = Round(solution.Value(v.reorder_point[t]));
            policy.safety_stock = ss;
            policy.reorder_point = Max(rop, ss);

            // 本记录的目标函数贡献 (求解器取值)
            double placed = solution.Value(v.order_placed[t]) > kBinaryThreshold ? 1.0 : 0.0;
            policy.objective_value = Round(prod.holding_cost * solution.Value(v.inventory[t]) +
                                           prod.shortage_cost * solution.Value(v.shortage[t]) +
                                           prod.ordering_cost * placed);

            policy.solver_status = reported_status;
            policy.source = source;
            policy.planned_inventory = Round(sim.inventory[t]);
            policy.planned_shortage = Round(sim.shortage[t]);
            plan.policies.push_back(policy);
        }
    }

    LOG_DETAIL_FMT("[提取] %s 记录=%d 下单=%d 审计成本=%.4f (求解目标 %.4f)\n",
                   problem.partition_id.c_str(), static_cast<int>(plan.policies.size()),
                   plan.audit.orders, plan.audit.Total(), solution.objective);
    return plan;
}
