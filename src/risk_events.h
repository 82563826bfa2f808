// risk_events.h - 风险事件 (risk.json)
//
// 风险事件由外部采集, 在周期开始时折叠为 (产品, 库位, 周期) 上的 RiskAdjustment:
//   supplier_delay     提前期乘数
//   demand_volatility  需求方差乘数
//   supply_shock       标记供应冲击, 方差乘以配置的冲击系数
// 同一 key 上的多个事件乘数相乘, 冲击标记取或。

#ifndef RISK_EVENTS_H_
#define RISK_EVENTS_H_

#include "replenish.h"
#include <variant>

struct SupplierDelay {
    double lead_time_multiplier = 1.0;
};

struct DemandVolatility {
    double demand_variance_multiplier = 1.0;
};

struct SupplyShock {};

typedef std::variant<SupplierDelay, DemandVolatility, SupplyShock> RiskPayload;

struct RiskEvent {
    string product_id;
    string location_id;
    int first_period = 0;
    int last_period = 0;   // 闭区间
    RiskPayload payload;
};

// 逐事件解析的结果: 无效事件记入 rejected (来源[序号] 原因),
// 能识别出产品与库位的无效事件同时记入 invalid_pairs, 只让该 (产品, 库位) 的分区失败
struct RiskEventBatch {
    vector<RiskEvent> events;
    vector<string> rejected;
    map<PairKey, string> invalid_pairs;
};

// 解析 JSON 文本: 事件数组, 或 {"events": [...]};
// 文本本身不是合法的事件列表时抛出 ValidationError
RiskEventBatch ParseRiskEventBatch(const string& json_text, const string& source);

RiskEventBatch ReadRiskEventBatch(const string& path);

// 严格解析: 任一事件无效即抛出 ValidationError
vector<RiskEvent> ParseRiskEvents(const string& json_text);

// 把事件折叠进调整表
void ApplyRiskEvents(const vector<RiskEvent>& events, map<PeriodKey, RiskAdjustment>& risk);

#endif  // RISK_EVENTS_H_
