// replenish.h - 核心配置、数据结构和接口定义
// 定义补货优化引擎的业务常量、输入/输出记录、运行配置和数据读写接口

#ifndef REPLENISH_H_
#define REPLENISH_H_

#include "common.h"
#include "errors.h"

// ============================================================================
// 状态枚举
// ============================================================================

// 求解器结果分类, 每个求解恰好落入其中一类
enum class SolveStatus {
    Optimal,       // 证明最优
    Suboptimal,    // 可行, gap 在容差内
    Infeasible,    // 当前约束下无可行解
    TimedOut,      // 时间限制内未得到可接受的解
    Error          // 数值错误或求解器异常
};

// 策略记录的来源
enum class PolicySource {
    Solver,              // 名义模型直接求解
    RelaxedBacklog,      // 修复第1级: 放开缺货上限
    RelaxedSafetyStock,  // 修复第2级: 下调安全库存目标
    Heuristic,           // 修复第3级: 再订货点启发式 (不经过求解器)
    PriorCycle,          // 超时回退: 沿用上一周期策略
    None                 // 分区失败, 占位记录
};

// 分区状态机
enum class PartitionState {
    Building,
    Solving,
    Extracting,
    Repairing,
    Persisted,
    Failed
};

// 服务水平约束的近似方式
enum class ServiceModel {
    Normal,     // z(SL) * sigma_LT
    Empirical   // 预测分位数超出均值部分的累加
};

inline const char* SolveStatusName(SolveStatus status) {
    switch (status) {
        case SolveStatus::Optimal:    return "Optimal";
        case SolveStatus::Suboptimal: return "Suboptimal";
        case SolveStatus::Infeasible: return "Infeasible";
        case SolveStatus::TimedOut:   return "TimedOut";
        case SolveStatus::Error:      return "Error";
        default: return "Unknown";
    }
}

inline const char* PolicySourceName(PolicySource source) {
    switch (source) {
        case PolicySource::Solver:             return "Solver";
        case PolicySource::RelaxedBacklog:     return "RelaxedBacklog";
        case PolicySource::RelaxedSafetyStock: return "RelaxedSafetyStock";
        case PolicySource::Heuristic:          return "Heuristic";
        case PolicySource::PriorCycle:         return "PriorCycle";
        case PolicySource::None:               return "None";
        default: return "Unknown";
    }
}

inline const char* PartitionStateName(PartitionState state) {
    switch (state) {
        case PartitionState::Building:   return "Building";
        case PartitionState::Solving:    return "Solving";
        case PartitionState::Extracting: return "Extracting";
        case PartitionState::Repairing:  return "Repairing";
        case PartitionState::Persisted:  return "Persisted";
        case PartitionState::Failed:     return "Failed";
        default: return "Unknown";
    }
}

inline bool IsAccepted(SolveStatus status) {
    return status == SolveStatus::Optimal || status == SolveStatus::Suboptimal;
}

// ============================================================================
// 业务常量
// ============================================================================
constexpr const char* kLogsDir = "logs/";
constexpr const char* kResultsDir = "results/";
constexpr const char* kProductsFile = "products.csv";
constexpr const char* kLocationsFile = "locations.csv";
constexpr const char* kForecastsFile = "forecasts.csv";
constexpr const char* kInventoryFile = "inventory.csv";
constexpr const char* kRiskFile = "risk.json";

// 求解器配置
constexpr double kDefaultTimeLimit = 30.0;
constexpr double kDefaultGapTolerance = 1e-4;
constexpr int kDefaultRandomSeed = 20240601;
constexpr int kDefaultSolverThreads = 1;
constexpr int kDefaultWorkers = 4;

// 策略配置
constexpr double kDefaultGranularity = 1.0;
constexpr int kDefaultReviewPeriod = 1;
constexpr double kDefaultShockVarianceMultiplier = 2.0;
constexpr double kDefaultFailureThreshold = 0.2;
constexpr double kDefaultResolveTimeFactor = 2.0;
constexpr int kDefaultPartitionSize = 50;

// 求解值的整数判定阈值
constexpr double kBinaryThreshold = 0.5;

// ============================================================================
// 输入记录
// ============================================================================

// 产品主数据 (外部拥有, 只读). 负值表示字段缺失
struct Product {
    string product_id;
    double holding_cost = -1.0;    // 单位期末库存持有成本
    double shortage_cost = -1.0;   // 单位缺货成本
    double ordering_cost = -1.0;   // 每次下单固定成本
    double moq = 0.0;              // 最小订货量
    int lead_time = -1;            // 提前期 (周期数)
};

// 库位主数据
struct Location {
    string location_id;
    double capacity = 0.0;               // 库容上限 (到货时刻)
    double service_level_target = -1.0; // 目标服务水平, (0,1)
};

struct QuantilePoint {
    double level = 0.0;   // 概率水平 (0,1)
    double value = 0.0;   // 需求分位数
};

// 需求预测: (产品, 库位, 周期) -> 均值与离散度
struct DemandForecast {
    string product_id;
    string location_id;
    int period = 0;
    double mean = 0.0;
    double stddev = 0.0;
    vector<QuantilePoint> quantiles;   // 可选, 按 level 升序
};

// 风险调整, 缺省为恒等
struct RiskAdjustment {
    double lead_time_multiplier = 1.0;
    double demand_variance_multiplier = 1.0;
    bool shock = false;
};

// 期初库存与在途到货
struct StartingPosition {
    double on_hand = 0.0;
    map<int, double> pipeline;   // 到货周期 -> 到货量
};

typedef tuple<string, string, int> PeriodKey;   // (product, location, period)
typedef pair<string, string> PairKey;           // (product, location)

// 周期开始时冻结的只读数据快照, 各工作线程共享
struct MasterSnapshot {
    map<string, Product> products;
    map<string, Location> locations;
    map<PeriodKey, DemandForecast> forecasts;
    map<PeriodKey, RiskAdjustment> risk;
    map<PairKey, StartingPosition> positions;
    map<PairKey, string> invalid_pairs;   // 风险事件无效的 (产品, 库位) -> 原因
    vector<string> rejected_rows;   // 入口校验拒绝的行 (文件:行号 原因)
};

// 规划区间 [start_period, start_period + length)
struct Horizon {
    int start_period = 0;
    int length = 0;
};

// 一个分区: 产品集合 x 库位集合
struct Partition {
    string partition_id;
    vector<string> product_ids;
    vector<string> location_ids;
};

// ============================================================================
// 输出记录
// ============================================================================
struct Policy {
    string product_id;
    string location_id;
    int period = 0;
    double order_quantity = 0.0;
    double safety_stock = 0.0;
    double reorder_point = 0.0;
    SolveStatus solver_status = SolveStatus::Error;
    double objective_value = 0.0;     // 本记录对目标函数的贡献
    PolicySource source = PolicySource::None;
    double planned_inventory = 0.0;   // 舍入后计划的期末库存
    double planned_shortage = 0.0;    // 舍入后计划的缺货量
};

// ============================================================================
// 运行配置
// ============================================================================
struct OptimizerConfig {
    // 求解器
    double time_limit = kDefaultTimeLimit;
    double det_time_limit = 0.0;          // 每阶段确定性时间上限 (ticks), <= 0 不限
    double gap_tolerance = kDefaultGapTolerance;
    int random_seed = kDefaultRandomSeed;
    int solver_threads = kDefaultSolverThreads;
    double big_m = -1.0;                  // <= 0 时按库容自动推导

    // 模型
    bool integer_orders = false;          // 订货量为整数变量 (粒度为 1 时)
    int review_period = kDefaultReviewPeriod;
    ServiceModel service_model = ServiceModel::Normal;
    bool order_count_tiebreak = true;     // 等成本最优解中最小化下单次数
    double shock_variance_multiplier = kDefaultShockVarianceMultiplier;

    // 策略提取
    double granularity = kDefaultGranularity;

    // 修复阶梯: 第2级依次尝试的安全库存缩放系数
    vector<double> safety_stock_scales = {0.5, 0.0};

    // 控制器
    int workers = kDefaultWorkers;
    double failure_threshold = kDefaultFailureThreshold;
    double resolve_time_factor = kDefaultResolveTimeFactor;
    int partition_size = kDefaultPartitionSize;
};

// ============================================================================
// 数据输入/输出
// ============================================================================
vector<Product> ReadProducts(const string& path, vector<string>& rejected);
vector<Location> ReadLocations(const string& path, vector<string>& rejected);
vector<DemandForecast> ReadForecasts(const string& path, vector<string>& rejected);
map<PairKey, StartingPosition> ReadPositions(const string& path, vector<string>& rejected);

// 读取数据目录下的全部输入, 风险与库存文件可选
MasterSnapshot LoadSnapshot(const string& data_dir, const OptimizerConfig& config);

void WritePolicyCsv(const string& path, const vector<Policy>& policies);

#endif  // REPLENISH_H_
