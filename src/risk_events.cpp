/**
 * @file risk_events.cpp
 * @brief risk.json 解析与风险调整折叠
 */

#include "risk_events.h"
#include "logger.h"

#include <nlohmann/json.hpp>

using nlohmann::json;

static const json& RequireField(const json& event, const char* field, size_t index) {
    auto it = event.find(field);
    if (it == event.end() || it->is_null()) {
        throw ValidationError("risk.json 第 " + ToString(static_cast<int>(index)) +
                              " 个事件缺少字段 " + field);
    }
    return *it;
}

static double RequirePositive(const json& event, const char* field, size_t index) {
    const json& value = RequireField(event, field, index);
    if (!value.is_number() || value.get<double>() <= 0.0) {
        throw ValidationError("risk.json 第 " + ToString(static_cast<int>(index)) +
                              " 个事件字段 " + field + " 必须为正数");
    }
    return value.get<double>();
}

static RiskEvent ParseEvent(const json& event, size_t index) {
    if (!event.is_object()) {
        throw ValidationError("risk.json 第 " + ToString(static_cast<int>(index)) + " 个事件不是对象");
    }

    RiskEvent parsed;
    parsed.product_id = RequireField(event, "product_id", index).get<string>();
    parsed.location_id = RequireField(event, "location_id", index).get<string>();

    // 单期 "period" 或闭区间 "periods": [from, to]
    if (event.contains("periods")) {
        const json& range = event.at("periods");
        if (!range.is_array() || range.size() != 2) {
            throw ValidationError("risk.json 第 " + ToString(static_cast<int>(index)) +
                                  " 个事件 periods 必须为 [from, to]");
        }
        parsed.first_period = range[0].get<int>();
        parsed.last_period = range[1].get<int>();
    } else {
        parsed.first_period = RequireField(event, "period", index).get<int>();
        parsed.last_period = parsed.first_period;
    }
    if (parsed.last_period < parsed.first_period) {
        throw ValidationError("risk.json 第 " + ToString(static_cast<int>(index)) + " 个事件周期区间为空");
    }

    const string type = RequireField(event, "event_type", index).get<string>();
    if (type == "supplier_delay") {
        parsed.payload = SupplierDelay{RequirePositive(event, "lead_time_multiplier", index)};
    } else if (type == "demand_volatility") {
        parsed.payload = DemandVolatility{RequirePositive(event, "demand_variance_multiplier", index)};
    } else if (type == "supply_shock") {
        parsed.payload = SupplyShock{};
    } else {
        throw ValidationError("risk.json 第 " + ToString(static_cast<int>(index)) +
                              " 个事件类型未知: " + type);
    }
    return parsed;
}

// 无效事件若带有可读的产品与库位, 归属到该 (产品, 库位)
static bool EventPair(const json& event, PairKey& key) {
    if (!event.is_object()) return false;
    auto product = event.find("product_id");
    auto location = event.find("location_id");
    if (product == event.end() || location == event.end() ||
        !product->is_string() || !location->is_string()) {
        return false;
    }
    key = PairKey(product->get<string>(), location->get<string>());
    return !key.first.empty() && !key.second.empty();
}

RiskEventBatch ParseRiskEventBatch(const string& json_text, const string& source) {
    json document;
    try {
        document = json::parse(json_text);
    } catch (const json::parse_error& e) {
        throw ValidationError(source + " 解析失败: " + e.what());
    }

    const json* events = &document;
    if (document.is_object() && document.contains("events")) {
        events = &document.at("events");
    }
    if (!events->is_array()) {
        throw ValidationError(source + " 顶层必须是事件数组");
    }

    RiskEventBatch batch;
    for (size_t i = 0; i < events->size(); ++i) {
        const json& event = (*events)[i];
        string reason;
        try {
            batch.events.push_back(ParseEvent(event, i));
        } catch (const ValidationError& e) {
            reason = e.what();
            const string prefix = "ValidationError: ";
            if (reason.compare(0, prefix.size(), prefix) == 0) reason.erase(0, prefix.size());
        } catch (const json::exception& e) {
            // 字段类型错误 (例如 period 为字符串)
            reason = "risk.json 第 " + ToString(static_cast<int>(i)) + " 个事件字段类型错误: " + e.what();
        }
        if (reason.empty()) continue;

        string entry = source + "[" + ToString(static_cast<int>(i)) + "] " + reason;
        LOG_WARN_FMT("[风险] 拒绝事件 %s\n", entry.c_str());
        batch.rejected.push_back(entry);
        PairKey key;
        if (EventPair(event, key) && !batch.invalid_pairs.count(key)) {
            batch.invalid_pairs[key] = reason;
        }
    }
    return batch;
}

RiskEventBatch ReadRiskEventBatch(const string& path) {
    ifstream in(path);
    if (!in.is_open()) {
        throw runtime_error("无法打开风险文件: " + path);
    }
    stringstream buffer;
    buffer << in.rdbuf();
    return ParseRiskEventBatch(buffer.str(), path);
}

vector<RiskEvent> ParseRiskEvents(const string& json_text) {
    RiskEventBatch batch = ParseRiskEventBatch(json_text, "risk.json");
    if (!batch.rejected.empty()) {
        throw ValidationError(batch.rejected.front());
    }
    return batch.events;
}

namespace {

// 事件载荷 -> 调整量
struct FoldVisitor {
    RiskAdjustment& adj;

    void operator()(const SupplierDelay& e) const { adj.lead_time_multiplier *= e.lead_time_multiplier; }
    void operator()(const DemandVolatility& e) const { adj.demand_variance_multiplier *= e.demand_variance_multiplier; }
    void operator()(const SupplyShock&) const { adj.shock = true; }
};

}  // namespace

void ApplyRiskEvents(const vector<RiskEvent>& events, map<PeriodKey, RiskAdjustment>& risk) {
    for (const RiskEvent& event : events) {
        for (int period = event.first_period; period <= event.last_period; ++period) {
            RiskAdjustment& adj = risk[PeriodKey(event.product_id, event.location_id, period)];
            std::visit(FoldVisitor{adj}, event.payload);
        }
    }
    LOG_DETAIL_FMT("[风险] 事件=%d 调整键=%d\n", static_cast<int>(events.size()),
                   static_cast<int>(risk.size()));
}
