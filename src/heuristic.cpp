/**
 * @file heuristic.cpp
 * @brief 再订货点启发式 - 修复阶梯的最后一级, 不调用求解器
 *
 * 对每个 (p,l) 按周期推进:
 *   库存位置 IP_t = 期初在手 + 区间内未到的在途 + 已下未到的订单
 *   IP_t <= ROP_t 且订单能在区间内到货时, 订货至 ROP_t + d_t,
 *   订货量向上取整到粒度并不低于 MOQ, 再按到货期及之后有订单到货各期的剩余库容截断。
 * 截断后低于 MOQ 的订单放弃; 最终计划必须通过库容复核。
 */

#include "policy_extractor.h"
#include "logger.h"

static double CeilToGranularity(double q, double granularity) {
    if (granularity <= 0.0) return q;
    return ceil(q / granularity - kEpsilon) * granularity;
}

static double FloorToGranularity(double q, double granularity) {
    if (granularity <= 0.0) return q;
    return floor(q / granularity + kEpsilon) * granularity;
}

// 计划在 period 开始时 (下单前) 的期初在手量
static double OnHandBefore(const PairData& pair, const PlanSimulation& sim, int period) {
    return period == 0 ? pair.on_hand : sim.inventory[period - 1];
}

static bool PlanPair(const PairData& pair, const OptimizerConfig& config, double scale,
                     vector<double>& orders, vector<double>& safety, string& reason) {
    const int T = static_cast<int>(pair.demand_mean.size());
    const double capacity = pair.location.capacity;
    const double moq = pair.product.moq;
    const string label = pair.product.product_id + "@" + pair.location.location_id;

    if (capacity < 0.0) {
        reason = label + " 库容为负 (" + ToString(capacity) + ")";
        return false;
    }

    RelaxationLevel relax;
    relax.safety_stock_scale = scale;

    orders.assign(T, 0.0);
    safety.assign(T, 0.0);
    for (int t = 0; t < T; ++t) {
        safety[t] = Min(ScaledSafetyTarget(pair, t, relax), capacity);
    }

    for (int t = 0; t < T; ++t) {
        int arrive = t + pair.lead_time[t];
        if (arrive >= T) continue;

        PlanSimulation sim = SimulatePlan(pair, orders);

        double position = OnHandBefore(pair, sim, t);
        for (int k = t; k < T; ++k) {
            position += pair.pipeline[k];
        }
        for (int tau = 0; tau < t; ++tau) {
            int due = tau + pair.lead_time[tau];
            if (due >= t && due < T) position += orders[tau];
        }

        double rop = pair.window_mean[t] + safety[t];
        if (position > rop + kEpsilon) continue;

        double qty = CeilToGranularity(rop + pair.demand_mean[t] - position, config.granularity);
        if (moq > 0.0) qty = Max(qty, CeilToGranularity(moq, config.granularity));

        // 剩余库容: 新订单最多使到货期及之后每期的在库量增加 qty,
        // 到货期本身和之后已有订单到货的周期都要留出空间
        double headroom = capacity - sim.available[arrive];
        for (int k = arrive + 1; k < T; ++k) {
            if (sim.receives_order[k]) {
                headroom = Min(headroom, capacity - sim.available[k]);
            }
        }
        qty = Min(qty, FloorToGranularity(headroom, config.granularity));
        if (qty <= kEpsilon || qty < moq - kEpsilon) continue;

        orders[t] = qty;
    }

    PlanSimulation final_sim = SimulatePlan(pair, orders);
    if (!final_sim.capacity_ok) {
        reason = label + " 启发式计划在相对周期 " + ToString(final_sim.violation_period) + " 超出库容";
        return false;
    }
    return true;
}

bool RunReorderPointHeuristic(const vector<PairData>& pairs,
                              const Horizon& horizon,
                              const OptimizerConfig& config,
                              double safety_stock_scale,
                              SolveStatus reported_status,
                              ExtractedPlan& plan,
                              string& reason) {
    ExtractedPlan result;
    for (const PairData& pair : pairs) {
        vector<double> orders;
        vector<double> safety;
        if (!PlanPair(pair, config, safety_stock_scale, orders, safety, reason)) {
            return false;
        }

        PlanSimulation sim = SimulatePlan(pair, orders);
        result.audit.Add(sim.audit);

        for (int t = 0; t < horizon.length; ++t) {
            Policy policy;
            policy.product_id = pair.product.product_id;
            policy.location_id = pair.location.location_id;
            policy.period = horizon.start_period + t;
            policy.order_quantity = orders[t];
            policy.safety_stock = Round(safety[t]);
            policy.reorder_point = Round(pair.window_mean[t] + safety[t]);
            policy.solver_status = reported_status;
            policy.objective_value = Round(sim.period_cost[t]);
            policy.source = PolicySource::Heuristic;
            policy.planned_inventory = Round(sim.inventory[t]);
            policy.planned_shortage = Round(sim.shortage[t]);
            result.policies.push_back(policy);
        }
    }

    LOG_DETAIL_FMT("[启发式] 记录=%d 下单=%d 成本=%.4f 缺货=%.4f\n",
                   static_cast<int>(result.policies.size()), result.audit.orders,
                   result.audit.Total(), result.audit.total_shortage);
    plan = std::move(result);
    return true;
}
