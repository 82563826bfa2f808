/**
 * @file problem_builder.cpp
 * @brief 问题构建器 - 校验分区数据, 派生提前期/保护期参数, 创建决策变量
 */

#include "problem_builder.h"
#include "service_level.h"
#include "logger.h"

// 分区内 id 去重并排序, 同一分区不论输入顺序都生成相同的模型
static vector<string> CanonicalIds(const vector<string>& ids) {
    set<string> unique_ids(ids.begin(), ids.end());
    return vector<string>(unique_ids.begin(), unique_ids.end());
}

string ProductDefect(const Product& p) {
    if (p.holding_cost < 0.0 || p.shortage_cost < 0.0 || p.ordering_cost < 0.0) {
        return "产品 " + p.product_id + " 缺少成本字段";
    }
    if (p.lead_time < 0) {
        return "产品 " + p.product_id + " 缺少提前期";
    }
    if (p.moq < 0.0) {
        return "产品 " + p.product_id + " MOQ 为负";
    }
    return "";
}

string LocationDefect(const Location& l) {
    if (!(l.service_level_target > 0.0 && l.service_level_target < 1.0)) {
        return "库位 " + l.location_id + " 服务水平必须在 (0,1) 内";
    }
    if (!std::isfinite(l.capacity)) {
        return "库位 " + l.location_id + " 库容无效";
    }
    return "";
}

static RiskAdjustment LookupRisk(const MasterSnapshot& snapshot, const string& p,
                                 const string& l, int period) {
    auto it = snapshot.risk.find(PeriodKey(p, l, period));
    return it == snapshot.risk.end() ? RiskAdjustment() : it->second;
}

// 保护期可能超出规划区间: 优先使用快照中更远期的预测, 缺失时沿用区间最后一期
static const DemandForecast& ForecastAt(const MasterSnapshot& snapshot, const string& p,
                                        const string& l, int period,
                                        const DemandForecast& last_in_horizon) {
    auto it = snapshot.forecasts.find(PeriodKey(p, l, period));
    return it == snapshot.forecasts.end() ? last_in_horizon : it->second;
}

vector<PairData> DerivePairData(const Partition& partition,
                                const MasterSnapshot& snapshot,
                                const Horizon& horizon,
                                const OptimizerConfig& config) {
    if (horizon.length <= 0) {
        throw ValidationError("分区 " + partition.partition_id + " 规划区间为空");
    }
    vector<string> product_ids = CanonicalIds(partition.product_ids);
    vector<string> location_ids = CanonicalIds(partition.location_ids);
    if (product_ids.empty() || location_ids.empty()) {
        throw ValidationError("分区 " + partition.partition_id + " 不含产品或库位");
    }

    const int T = horizon.length;
    const int R = Max(config.review_period, 1);
    vector<PairData> pairs;

    for (const string& l : location_ids) {
        auto loc_it = snapshot.locations.find(l);
        if (loc_it == snapshot.locations.end()) {
            throw ValidationError("库位 " + l + " 不在主数据中");
        }
        string location_defect = LocationDefect(loc_it->second);
        if (!location_defect.empty()) {
            throw ValidationError(location_defect);
        }

        for (const string& p : product_ids) {
            auto prod_it = snapshot.products.find(p);
            if (prod_it == snapshot.products.end()) {
                throw ValidationError("产品 " + p + " 不在主数据中");
            }
            string product_defect = ProductDefect(prod_it->second);
            if (!product_defect.empty()) {
                throw ValidationError(product_defect);
            }
            auto invalid_it = snapshot.invalid_pairs.find(PairKey(p, l));
            if (invalid_it != snapshot.invalid_pairs.end()) {
                throw ValidationError("风险事件无效: " + p + "@" + l + " " + invalid_it->second);
            }

            PairData pair;
            pair.product = prod_it->second;
            pair.location = loc_it->second;
            const double sl = pair.location.service_level_target;

            // 区间内每期必须有预测
            vector<const DemandForecast*> in_horizon(T, nullptr);
            for (int t = 0; t < T; ++t) {
                auto it = snapshot.forecasts.find(PeriodKey(p, l, horizon.start_period + t));
                if (it == snapshot.forecasts.end()) {
                    throw ValidationError("缺少预测: " + p + "@" + l + " 周期 " +
                                          ToString(horizon.start_period + t));
                }
                in_horizon[t] = &it->second;
            }
            const DemandForecast& last = *in_horizon[T - 1];

            pair.demand_mean.resize(T);
            pair.demand_stddev.resize(T);
            pair.lead_time.resize(T);
            pair.arrivals.assign(T, vector<int>());
            pair.window_mean.resize(T);
            pair.safety_target.resize(T);
            pair.pipeline.assign(T, 0.0);

            for (int t = 0; t < T; ++t) {
                pair.demand_mean[t] = in_horizon[t]->mean;
                pair.demand_stddev[t] = in_horizon[t]->stddev;

                RiskAdjustment risk = LookupRisk(snapshot, p, l, horizon.start_period + t);
                if (risk.lead_time_multiplier <= 0.0 || risk.demand_variance_multiplier < 0.0) {
                    throw ValidationError("风险调整系数无效: " + p + "@" + l + " 周期 " +
                                          ToString(horizon.start_period + t));
                }
                pair.lead_time[t] = static_cast<int>(
                    lround(pair.product.lead_time * risk.lead_time_multiplier));
                int arrive = t + pair.lead_time[t];
                if (arrive < T) {
                    pair.arrivals[arrive].push_back(t);
                }
            }

            // 保护期 [t, t + L_t + R) 上的需求均值与安全库存
            for (int t = 0; t < T; ++t) {
                int window_end = t + pair.lead_time[t] + R;
                double mean_sum = 0.0;
                double variance_sum = 0.0;
                double excess_sum = 0.0;
                for (int k = t; k < window_end; ++k) {
                    int period = horizon.start_period + k;
                    const DemandForecast& f = (k < T) ? *in_horizon[k]
                                                      : ForecastAt(snapshot, p, l, period, last);
                    RiskAdjustment risk = LookupRisk(snapshot, p, l, period);
                    double vm = risk.demand_variance_multiplier *
                                (risk.shock ? config.shock_variance_multiplier : 1.0);

                    mean_sum += f.mean;
                    variance_sum += f.stddev * f.stddev * vm;
                    if (config.service_model == ServiceModel::Empirical) {
                        excess_sum += EmpiricalSafetyExcess(f.quantiles, f.mean, f.stddev, sl) * sqrt(vm);
                    }
                }
                pair.window_mean[t] = mean_sum;
                pair.safety_target[t] = (config.service_model == ServiceModel::Empirical)
                    ? excess_sum
                    : NormalSafetyStock(sl, variance_sum);
            }

            // 期初库存与区间内的在途到货
            auto pos_it = snapshot.positions.find(PairKey(p, l));
            if (pos_it != snapshot.positions.end()) {
                pair.on_hand = pos_it->second.on_hand;
                for (const auto& receipt : pos_it->second.pipeline) {
                    int t = receipt.first - horizon.start_period;
                    if (t >= 0 && t < T) {
                        pair.pipeline[t] += receipt.second;
                    }
                }
            }

            // 区间内订单最早到货前, 缺口只由期初库存与在途决定
            pair.unavoidable_shortage.assign(T, 0.0);
            double exogenous = pair.on_hand;
            for (int t = 0; t < T && pair.arrivals[t].empty(); ++t) {
                double available = exogenous + pair.pipeline[t];
                double demand = Max(pair.demand_mean[t], 0.0);
                pair.unavoidable_shortage[t] = Max(demand - available, 0.0);
                exogenous = Max(available - demand, 0.0);
            }

            // 期初库存或在途本身可能超库容; 此时库容只约束有订单到货的周期
            pair.receipt_excess.assign(T, 0.0);
            double stock_bound = pair.on_hand;
            for (int t = 0; t < T; ++t) {
                double at_receipt = stock_bound + pair.pipeline[t];
                pair.receipt_excess[t] = Max(at_receipt - pair.location.capacity, 0.0);
                stock_bound = Max(at_receipt, pair.location.capacity);
            }

            // 单期到货受库容约束, 库容即订货量的天然上界
            pair.big_m = (config.big_m > 0.0) ? config.big_m : Max(pair.location.capacity, 0.0);

            pairs.push_back(std::move(pair));
        }
    }
    return pairs;
}

static string VarName(const char* prefix, const PairData& pair, int period) {
    return string(prefix) + "_" + pair.product.product_id + "_" +
           pair.location.location_id + "_" + ToString(period);
}

OptimizationProblem BuildProblem(const Partition& partition,
                                 const MasterSnapshot& snapshot,
                                 const Horizon& horizon,
                                 const OptimizerConfig& config,
                                 const RelaxationLevel& relaxation) {
    OptimizationProblem problem;
    problem.partition_id = partition.partition_id;
    problem.horizon = horizon;
    problem.relaxation = relaxation;
    problem.pairs = DerivePairData(partition, snapshot, horizon, config);

    const int T = horizon.length;
    const VarKind qty_kind = (config.integer_orders && IsEqual(config.granularity, 1.0))
        ? VarKind::Integer : VarKind::Continuous;
    LinearModel& model = problem.model;

    // 变量按 (pair, 变量类别, t) 顺序创建, 编号稳定
    for (const PairData& pair : problem.pairs) {
        PairVars v;
        for (int t = 0; t < T; ++t) {
            int period = horizon.start_period + t;
            // 到货落在区间外的订单不进入平衡约束, 固定为 0
            bool lands = t + pair.lead_time[t] < T;
            double qty_ub = lands ? pair.big_m : 0.0;
            double placed_ub = lands ? 1.0 : 0.0;

            v.order_qty.push_back(model.AddVar(VarName("q", pair, period), 0.0, qty_ub, qty_kind));
            v.order_placed.push_back(model.AddVar(VarName("y", pair, period), 0.0, placed_ub, VarKind::Binary));
            v.inventory.push_back(model.AddVar(VarName("inv", pair, period), 0.0, kInfinityValue, VarKind::Continuous));
            v.shortage.push_back(model.AddVar(VarName("s", pair, period), 0.0,
                                              ShortageCap(pair, t, relaxation), VarKind::Continuous));
            v.safety_stock.push_back(model.AddVar(VarName("ss", pair, period), 0.0, kInfinityValue, VarKind::Continuous));
            v.reorder_point.push_back(model.AddVar(VarName("rop", pair, period), 0.0, kInfinityValue, VarKind::Continuous));
        }
        problem.vars.push_back(std::move(v));
    }

    GenerateConstraints(problem, config);

    LOG_DEBUG_FMT("[建模] 分区 %s: 产品库位对=%d 周期=%d 变量=%d (整数 %d) 约束=%d\n",
                  problem.partition_id.c_str(), static_cast<int>(problem.pairs.size()), T,
                  static_cast<int>(model.vars.size()), model.NumIntegerVars(),
                  static_cast<int>(model.rows.size()));
    return problem;
}
