/**
 * @file constraint_generator.cpp
 * @brief 约束生成器 - 库存平衡/库容/安全库存/再订货点/MOQ 约束与目标函数
 *
 * 对每个 (p,l,t):
 *   平衡:   I_t - I_{t-1} - sum_{tau: tau+L_tau=t} Q_tau - S_t = pipe_t - d_t   (I_{-1} = 期初库存)
 *   库容:   I_{t-1} + sum Q_tau <= cap - pipe_t   (仅当有订单可在 t 到货;
 *           已知在库量可能超库容时改为按 Y_tau 生效的条件约束)
 *   安全库存: SS_t = scale * z(SL) * sigma_LT(t),  SS_t <= cap
 *   再订货点: ROP_t - SS_t = mu_LT(t)
 *   联动:   Q_t <= M * Y_t,  Q_t >= moq * Y_t
 * 目标: min sum h*I + b*S + K*Y; 次目标 min sum Y
 */

#include "problem_builder.h"

double ScaledSafetyTarget(const PairData& pair, int t, const RelaxationLevel& relaxation) {
    return pair.safety_target[t] * Max(relaxation.safety_stock_scale, 0.0);
}

// 名义缺货上限 (1-SL)*d, 且不低于订单到货前无法避免的缺口; 放松后缺货最多为全部需求
double ShortageCap(const PairData& pair, int t, const RelaxationLevel& relaxation) {
    double demand = Max(pair.demand_mean[t], 0.0);
    if (relaxation.allow_backlog) {
        return demand;
    }
    double nominal = (1.0 - pair.location.service_level_target) * demand;
    if (t < static_cast<int>(pair.unavoidable_shortage.size())) {
        nominal = Max(nominal, pair.unavoidable_shortage[t]);
    }
    return nominal;
}

static string RowName(const char* prefix, const PairData& pair, int t) {
    return string(prefix) + "_" + pair.product.product_id + "_" +
           pair.location.location_id + "_" + ToString(t);
}

void GenerateConstraints(OptimizationProblem& problem, const OptimizerConfig& config) {
    LinearModel& model = problem.model;
    const int T = problem.NumPeriods();

    for (size_t i = 0; i < problem.pairs.size(); ++i) {
        const PairData& pair = problem.pairs[i];
        const PairVars& v = problem.vars[i];
        const Product& prod = pair.product;
        const double capacity = pair.location.capacity;

        for (int t = 0; t < T; ++t) {
            // 本期可获得的外部量: 在途到货 (+ 第一期的期初库存)
            double external = pair.pipeline[t] + (t == 0 ? pair.on_hand : 0.0);

            // 库存平衡
            vector<ModelTerm> balance;
            balance.push_back({v.inventory[t], 1.0});
            if (t > 0) {
                balance.push_back({v.inventory[t - 1], -1.0});
            }
            for (int tau : pair.arrivals[t]) {
                balance.push_back({v.order_qty[tau], -1.0});
            }
            balance.push_back({v.shortage[t], -1.0});
            model.AddRow(RowName("balance", pair, t), RowFamily::Balance, std::move(balance),
                         RowSense::Equal, external - pair.demand_mean[t]);

            // 到货时刻库容; 没有订单能在本期到货时, 在库量由已知数据决定, 不建约束
            if (!pair.arrivals[t].empty()) {
                vector<ModelTerm> storage;
                if (t > 0) {
                    storage.push_back({v.inventory[t - 1], 1.0});
                }
                for (int tau : pair.arrivals[t]) {
                    storage.push_back({v.order_qty[tau], 1.0});
                }
                const double excess = pair.receipt_excess[t];
                if (excess <= 0.0) {
                    model.AddRow(RowName("capacity", pair, t), RowFamily::Capacity, std::move(storage),
                                 RowSense::LessEqual, capacity - external);
                } else {
                    // 已知在库量可能超库容: 只有 Y_tau = 1 时约束生效
                    //   I_{t-1} + sum Q + M*Y_tau <= cap - pipe_t + M
                    for (int tau : pair.arrivals[t]) {
                        vector<ModelTerm> conditional = storage;
                        conditional.push_back({v.order_placed[tau], excess});
                        model.AddRow(RowName("capacity", pair, t) + "_" + ToString(tau),
                                     RowFamily::Capacity, std::move(conditional),
                                     RowSense::LessEqual, capacity - external + excess);
                    }
                }
            }

            // 安全库存: 目标值固定为等式, 满足 SS >= z*sigma_LT 且取值确定
            model.AddRow(RowName("safety", pair, t), RowFamily::SafetyStock,
                         {{v.safety_stock[t], 1.0}}, RowSense::Equal,
                         ScaledSafetyTarget(pair, t, problem.relaxation));
            model.AddRow(RowName("safety_cap", pair, t), RowFamily::SafetyCapacity,
                         {{v.safety_stock[t], 1.0}}, RowSense::LessEqual, capacity);

            // 再订货点 = 保护期需求均值 + 安全库存
            model.AddRow(RowName("rop", pair, t), RowFamily::ReorderPoint,
                         {{v.reorder_point[t], 1.0}, {v.safety_stock[t], -1.0}},
                         RowSense::Equal, pair.window_mean[t]);

            // 固定订货成本与 MOQ 联动
            model.AddRow(RowName("link", pair, t), RowFamily::OrderLink,
                         {{v.order_qty[t], 1.0}, {v.order_placed[t], -pair.big_m}},
                         RowSense::LessEqual, 0.0);
            if (prod.moq > 0.0) {
                model.AddRow(RowName("moq", pair, t), RowFamily::Moq,
                             {{v.order_qty[t], 1.0}, {v.order_placed[t], -prod.moq}},
                             RowSense::GreaterEqual, 0.0);
            }

            // 目标函数
            model.objective.push_back({v.inventory[t], prod.holding_cost});
            model.objective.push_back({v.shortage[t], prod.shortage_cost});
            model.objective.push_back({v.order_placed[t], prod.ordering_cost});

            if (config.order_count_tiebreak) {
                model.secondary_objective.push_back({v.order_placed[t], 1.0});
            }
        }
    }
}
