// problem_builder.h - 问题构建器与约束生成器
//
// 为一个分区 (产品 x 库位) 在规划区间 H 上构建 MILP:
//   决策变量: order_qty[p,l,t], order_placed[p,l,t], inventory[p,l,t],
//             shortage[p,l,t], safety_stock[p,l,t], reorder_point[p,l,t]
//   约束: 库存平衡、到货库容、安全库存、再订货点、MOQ/固定成本联动
//   目标: sum h*I + sum b*S + sum K*Y, 次目标 sum Y (等成本时下单次数最少)
//
// OptimizationProblem 只存在于一次求解期间, 由工作线程独占。

#ifndef PROBLEM_BUILDER_H_
#define PROBLEM_BUILDER_H_

#include "replenish.h"
#include "linear_model.h"

// 修复阶梯对模型的放松程度
struct RelaxationLevel {
    bool allow_backlog = false;         // 放开缺货上限 (名义为 (1-SL)*需求)
    double safety_stock_scale = 1.0;    // 安全库存目标缩放系数
};

// 单个 (产品, 库位) 在规划区间内的派生数据, 下标 t 为区间内相对周期
struct PairData {
    Product product;
    Location location;
    vector<double> demand_mean;           // 需求均值
    vector<double> demand_stddev;         // 需求标准差 (未调整)
    vector<int> lead_time;                // 第 t 期下单的风险调整后提前期
    vector<vector<int>> arrivals;         // 第 t 期到货的下单期列表
    vector<double> window_mean;           // 保护期 (提前期 + 检查期) 需求均值
    vector<double> safety_target;         // 名义安全库存目标 (未缩放)
    vector<double> pipeline;              // 外部在途到货
    vector<double> unavoidable_shortage;  // 首个订单到货前仅靠期初库存与在途无法满足的需求
    vector<double> receipt_excess;        // 不下单时到货时刻在库量超出库容的上界, 条件库容约束的 M
    double on_hand = 0.0;                 // 期初库存
    double big_m = 0.0;                   // 订货量上界
};

// 变量编号, 与 PairData 一一对应
struct PairVars {
    vector<int> order_qty;
    vector<int> order_placed;
    vector<int> inventory;
    vector<int> shortage;
    vector<int> safety_stock;
    vector<int> reorder_point;
};

struct OptimizationProblem {
    string partition_id;
    Horizon horizon;
    RelaxationLevel relaxation;
    vector<PairData> pairs;
    vector<PairVars> vars;
    LinearModel model;

    int NumPeriods() const { return horizon.length; }
};

// 构建分区模型; 主数据字段缺失、预测缺失或区间为空时抛出 ValidationError
OptimizationProblem BuildProblem(const Partition& partition,
                                 const MasterSnapshot& snapshot,
                                 const Horizon& horizon,
                                 const OptimizerConfig& config,
                                 const RelaxationLevel& relaxation = RelaxationLevel());

// 仅做分区数据校验与派生 (不建模), 启发式回退也使用这一步
vector<PairData> DerivePairData(const Partition& partition,
                                const MasterSnapshot& snapshot,
                                const Horizon& horizon,
                                const OptimizerConfig& config);

// 约束生成器: 在已创建变量的问题上添加结构约束与目标函数
void GenerateConstraints(OptimizationProblem& problem, const OptimizerConfig& config);

// 主数据缺陷描述, 完整时返回空串
string ProductDefect(const Product& p);
string LocationDefect(const Location& l);

// 当前放松级别下 t 期的安全库存目标与缺货上限
double ScaledSafetyTarget(const PairData& pair, int t, const RelaxationLevel& relaxation);
double ShortageCap(const PairData& pair, int t, const RelaxationLevel& relaxation);

#endif  // PROBLEM_BUILDER_H_
