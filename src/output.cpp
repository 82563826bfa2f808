/**
 * @file output.cpp
 * @brief 结果输出模块 - 策略 CSV 与批次报告 JSON
 */

#include "replenish.h"
#include "rolling_horizon.h"
#include "logger.h"

#include <filesystem>

// JSON 字符串转义
static string JsonEscape(const string& s) {
    string result;
    for (char c : s) {
        switch (c) {
            case '"': result += "\\\""; break;
            case '\\': result += "\\\\"; break;
            case '\n': result += "\\n"; break;
            case '\r': result += "\\r"; break;
            case '\t': result += "\\t"; break;
            default:
                if (static_cast<unsigned char>(c) < 0x20) {
                    char buf[8];
                    snprintf(buf, sizeof(buf), "\\u%04x", static_cast<unsigned>(static_cast<unsigned char>(c)));
                    result += buf;
                } else {
                    result += c;
                }
        }
    }
    return result;
}

static void EnsureParentDir(const string& path) {
    std::filesystem::path p(path);
    if (p.has_parent_path()) {
        std::error_code ec;
        std::filesystem::create_directories(p.parent_path(), ec);
    }
}

// 输出策略表, 行序与输入记录一致; 数值固定 6 位小数, 相同输入逐字节相同
void WritePolicyCsv(const string& path, const vector<Policy>& policies) {
    EnsureParentDir(path);
    ofstream fout(path);
    if (!fout) {
        throw runtime_error("无法写入策略文件: " + path);
    }

    fout << "product_id,location_id,period,order_quantity,safety_stock,reorder_point,"
            "solver_status,objective_value,source,planned_inventory,planned_shortage\n";
    fout << fixed << setprecision(6);
    for (const Policy& p : policies) {
        fout << p.product_id << ","
             << p.location_id << ","
             << p.period << ","
             << p.order_quantity << ","
             << p.safety_stock << ","
             << p.reorder_point << ","
             << SolveStatusName(p.solver_status) << ","
             << p.objective_value << ","
             << PolicySourceName(p.source) << ","
             << p.planned_inventory << ","
             << p.planned_shortage << "\n";
    }

    if (!fout) {
        throw runtime_error("写入策略文件失败: " + path);
    }
    LOG_DETAIL_FMT("[输出] 策略 %d 条 -> %s\n", static_cast<int>(policies.size()), path.c_str());
}

static void WriteStringArray(ofstream& fout, const vector<string>& items) {
    fout << "[";
    for (size_t i = 0; i < items.size(); i++) {
        fout << "\"" << JsonEscape(items[i]) << "\"";
        if (i + 1 < items.size()) fout << ", ";
    }
    fout << "]";
}

static void WriteCountMap(ofstream& fout, const map<string, int>& counts) {
    fout << "{";
    size_t i = 0;
    for (const auto& entry : counts) {
        fout << "\"" << JsonEscape(entry.first) << "\": " << entry.second;
        if (++i < counts.size()) fout << ", ";
    }
    fout << "}";
}

void WriteBatchReportJson(const string& path, const CycleResult& result) {
    EnsureParentDir(path);
    ofstream fout(path);
    if (!fout) {
        throw runtime_error("无法写入批次报告: " + path);
    }

    const BatchReport& report = result.report;
    fout << fixed;

    fout << "{\n";

    // 汇总
    fout << "  \"summary\": {\n";
    fout << "    \"cycle\": " << report.cycle << ",\n";
    fout << "    \"start_period\": " << report.horizon.start_period << ",\n";
    fout << "    \"horizon\": " << report.horizon.length << ",\n";
    fout << "    \"partitions\": " << report.partitions << ",\n";
    fout << "    \"persisted\": " << report.persisted << ",\n";
    fout << "    \"failed\": " << report.failed << ",\n";
    fout << setprecision(4);
    fout << "    \"failed_fraction\": " << report.failed_fraction << ",\n";
    fout << setprecision(3);
    fout << "    \"seconds\": " << report.seconds << ",\n";
    fout << "    \"rejected_rows\": " << report.rejected_rows << ",\n";
    fout << "    \"by_status\": ";
    WriteCountMap(fout, report.by_status);
    fout << ",\n";
    fout << "    \"by_source\": ";
    WriteCountMap(fout, report.by_source);
    fout << ",\n";
    fout << "    \"failed_partitions\": ";
    WriteStringArray(fout, report.failed_partitions);
    fout << ",\n";
    fout << "    \"flagged_partitions\": ";
    WriteStringArray(fout, report.flagged_partitions);
    fout << ",\n";
    fout << setprecision(6);
    fout << "    \"audit\": {\"holding_cost\": " << report.audit.holding_cost
         << ", \"shortage_cost\": " << report.audit.shortage_cost
         << ", \"ordering_cost\": " << report.audit.ordering_cost
         << ", \"total_shortage\": " << report.audit.total_shortage
         << ", \"orders\": " << report.audit.orders << "}\n";
    fout << "  },\n";

    // 各分区
    fout << "  \"partitions\": [\n";
    for (size_t k = 0; k < result.outcomes.size(); k++) {
        const PartitionOutcome& o = result.outcomes[k];
        fout << "    {";
        fout << "\"partition_id\": \"" << JsonEscape(o.partition_id) << "\", ";
        fout << "\"state\": \"" << PartitionStateName(o.state) << "\", ";
        fout << "\"solver_status\": \"" << SolveStatusName(o.solver_status) << "\", ";
        fout << "\"source\": \"" << PolicySourceName(o.source) << "\", ";
        fout << "\"records\": " << o.policies.size() << ", ";
        fout << "\"repair_steps\": ";
        WriteStringArray(fout, o.repair_steps);
        fout << ", ";
        fout << "\"flagged_for_resolve\": " << (o.flagged_for_resolve ? "true" : "false") << ", ";
        fout << "\"priority_resolve\": " << (o.resolved_with_priority ? "true" : "false") << ", ";
        fout << setprecision(6);
        fout << "\"realized_cost\": " << o.audit.Total() << ", ";
        fout << setprecision(3);
        fout << "\"seconds\": " << o.seconds << ", ";
        fout << "\"message\": \"" << JsonEscape(o.message) << "\"}";
        if (k + 1 < result.outcomes.size()) fout << ",";
        fout << "\n";
    }
    fout << "  ]\n";
    fout << "}\n";

    if (!fout) {
        throw runtime_error("写入批次报告失败: " + path);
    }
    LOG_DETAIL_FMT("[输出] 批次报告 -> %s\n", path.c_str());
}
