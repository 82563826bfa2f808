// input.cpp - 数据输入处理模块
// 从 CSV/JSON 文件读取补货优化的主数据、预测、期初库存与风险事件

#include "replenish.h"
#include "risk_events.h"
#include "logger.h"

#include <filesystem>

// 按分隔符分割字符串
void SplitString(const string& input, vector<string>& output, const string& delimiter) {
  output.clear();
  size_t start = 0;
  size_t end = input.find(delimiter);

  while (end != string::npos) {
    string token = input.substr(start, end - start);
    output.push_back(token);
    start = end + delimiter.length();
    end = input.find(delimiter, start);
  }

  if (start < input.length()) {
    output.push_back(input.substr(start));
  }
}

// 整个字段必须是数字, "12abc" 视为无效
static bool ParseDouble(const string& token, double& value) {
  string s = Trim(token);
  if (s.empty()) return false;
  try {
    size_t used = 0;
    value = stod(s, &used);
    return used == s.size() && std::isfinite(value);
  } catch (const invalid_argument&) {
    return false;
  } catch (const out_of_range&) {
    return false;
  }
}

static bool ParseInt(const string& token, int& value) {
  string s = Trim(token);
  if (s.empty()) return false;
  try {
    size_t used = 0;
    value = stoi(s, &used);
    return used == s.size();
  } catch (const invalid_argument&) {
    return false;
  } catch (const out_of_range&) {
    return false;
  }
}

// 逐行读取 CSV (跳过表头与空行), 每行交给 handler; handler 返回非空原因即拒绝该行
static void ForEachCsvRow(const string& path, vector<string>& rejected,
                          const function<string(const vector<string>&)>& handler) {
  ifstream inFile(path, ios::in);
  if (!inFile) {
    throw ValidationError("无法打开文件: " + path);
  }

  LOG_DETAIL_FMT("[读取] 文件: %s\n", path.c_str());
  string one_line;
  vector<string> data_in_line;
  int line_no = 0;

  getline(inFile, one_line);  // 表头
  line_no++;

  while (getline(inFile, one_line)) {
    line_no++;
    if (Trim(one_line).empty()) continue;

    SplitString(Trim(one_line), data_in_line, ",");
    for (string& token : data_in_line) {
      token = Trim(token);
    }

    string reason = handler(data_in_line);
    if (!reason.empty()) {
      string entry = path + ":" + ToString(line_no) + " " + reason;
      LOG_WARN_FMT("[读取] 拒绝行 %s\n", entry.c_str());
      rejected.push_back(entry);
    }
  }
}

// "level:value;level:value" 或 "period:qty;period:qty"
static bool ParsePairList(const string& field, vector<pair<double, double>>& items) {
  items.clear();
  if (field.empty()) return true;
  vector<string> entries;
  vector<string> parts;
  SplitString(field, entries, ";");
  for (const string& entry : entries) {
    if (Trim(entry).empty()) continue;
    SplitString(entry, parts, ":");
    double first = 0.0;
    double second = 0.0;
    if (parts.size() != 2 || !ParseDouble(parts[0], first) || !ParseDouble(parts[1], second)) {
      return false;
    }
    items.push_back(make_pair(first, second));
  }
  return true;
}

vector<Product> ReadProducts(const string& path, vector<string>& rejected) {
  vector<Product> products;
  set<string> seen;

  ForEachCsvRow(path, rejected, [&](const vector<string>& row) -> string {
    Product p;
    p.product_id = row.empty() ? string() : row[0];
    if (p.product_id.empty()) return "product_id 为空";
    if (seen.count(p.product_id)) return "重复的 product_id " + p.product_id;

    string reason;
    if (row.size() < 6) {
      reason = "列数不足";
    } else if (!ParseDouble(row[1], p.holding_cost) || p.holding_cost < 0.0) {
      reason = "holding_cost 无效";
    } else if (!ParseDouble(row[2], p.shortage_cost) || p.shortage_cost < 0.0) {
      reason = "shortage_cost 无效";
    } else if (!ParseDouble(row[3], p.ordering_cost) || p.ordering_cost < 0.0) {
      reason = "ordering_cost 无效";
    } else if (!row[4].empty() && (!ParseDouble(row[4], p.moq) || p.moq < 0.0)) {
      reason = "moq 无效";
    } else if (!ParseInt(row[5], p.lead_time) || p.lead_time < 0) {
      reason = "lead_time 必须为非负整数";
    }

    // 字段无效的产品仍以缺省值 (-1) 登记, 其分区在建模校验时失败并输出占位记录
    seen.insert(p.product_id);
    if (!reason.empty()) {
      Product incomplete;
      incomplete.product_id = p.product_id;
      products.push_back(incomplete);
      return reason;
    }
    products.push_back(p);
    return "";
  });

  LOG_DETAIL_FMT("[读取] 产品 %d 个\n", static_cast<int>(products.size()));
  return products;
}

vector<Location> ReadLocations(const string& path, vector<string>& rejected) {
  vector<Location> locations;
  set<string> seen;

  ForEachCsvRow(path, rejected, [&](const vector<string>& row) -> string {
    Location l;
    l.location_id = row.empty() ? string() : row[0];
    if (l.location_id.empty()) return "location_id 为空";
    if (seen.count(l.location_id)) return "重复的 location_id " + l.location_id;

    // 负库容照常接受, 由修复流程处理
    string reason;
    if (row.size() < 3) {
      reason = "列数不足";
    } else if (!ParseDouble(row[1], l.capacity)) {
      reason = "capacity 无效";
    } else if (!ParseDouble(row[2], l.service_level_target) ||
               !(l.service_level_target > 0.0 && l.service_level_target < 1.0)) {
      reason = "service_level_target 必须在 (0,1) 内";
    }

    // 同产品: 无效库位以缺省服务水平 (-1) 登记, 该库位的分区校验失败
    seen.insert(l.location_id);
    if (!reason.empty()) {
      Location incomplete;
      incomplete.location_id = l.location_id;
      locations.push_back(incomplete);
      return reason;
    }
    if (l.capacity < 0.0) {
      LOG_WARN_FMT("[读取] 库位 %s 库容为负 (%.4f)\n", l.location_id.c_str(), l.capacity);
    }
    locations.push_back(l);
    return "";
  });

  LOG_DETAIL_FMT("[读取] 库位 %d 个\n", static_cast<int>(locations.size()));
  return locations;
}

vector<DemandForecast> ReadForecasts(const string& path, vector<string>& rejected) {
  vector<DemandForecast> forecasts;
  set<PeriodKey> seen;

  ForEachCsvRow(path, rejected, [&](const vector<string>& row) -> string {
    if (row.size() < 5) return "列数不足";
    DemandForecast f;
    f.product_id = row[0];
    f.location_id = row[1];
    if (f.product_id.empty() || f.location_id.empty()) return "product_id/location_id 为空";
    if (!ParseInt(row[2], f.period)) return "period 无效";
    if (!ParseDouble(row[3], f.mean) || f.mean < 0.0) return "mean 无效";

    vector<pair<double, double>> items;
    if (row.size() > 5 && !ParsePairList(row[5], items)) return "quantiles 格式无效";
    for (const auto& item : items) {
      if (!(item.first > 0.0 && item.first < 1.0)) return "分位数水平必须在 (0,1) 内";
      f.quantiles.push_back(QuantilePoint{item.first, item.second});
    }
    sort(f.quantiles.begin(), f.quantiles.end(),
         [](const QuantilePoint& a, const QuantilePoint& b) { return a.level < b.level; });

    // stddev 与 quantiles 至少给出一项
    if (row[4].empty()) {
      if (f.quantiles.empty()) return "stddev 与 quantiles 均缺失";
      f.stddev = 0.0;
    } else if (!ParseDouble(row[4], f.stddev) || f.stddev < 0.0) {
      return "stddev 无效";
    }

    PeriodKey key(f.product_id, f.location_id, f.period);
    if (seen.count(key)) return "重复的预测 " + f.product_id + "@" + f.location_id + " 周期 " + row[2];
    seen.insert(key);
    forecasts.push_back(f);
    return "";
  });

  LOG_DETAIL_FMT("[读取] 预测 %d 条\n", static_cast<int>(forecasts.size()));
  return forecasts;
}

map<PairKey, StartingPosition> ReadPositions(const string& path, vector<string>& rejected) {
  map<PairKey, StartingPosition> positions;

  ForEachCsvRow(path, rejected, [&](const vector<string>& row) -> string {
    if (row.size() < 3) return "列数不足";
    PairKey key(row[0], row[1]);
    if (key.first.empty() || key.second.empty()) return "product_id/location_id 为空";
    if (positions.count(key)) return "重复的期初库存 " + key.first + "@" + key.second;

    StartingPosition pos;
    if (!ParseDouble(row[2], pos.on_hand) || pos.on_hand < 0.0) return "on_hand 无效";

    vector<pair<double, double>> items;
    if (row.size() > 3 && !ParsePairList(row[3], items)) return "pipeline 格式无效";
    for (const auto& item : items) {
      if (item.second < 0.0) return "在途数量为负";
      pos.pipeline[static_cast<int>(lround(item.first))] += item.second;
    }

    positions[key] = pos;
    return "";
  });

  return positions;
}

MasterSnapshot LoadSnapshot(const string& data_dir, const OptimizerConfig& config) {
  namespace fs = std::filesystem;
  MasterSnapshot snapshot;
  fs::path dir(data_dir);

  for (const Product& p : ReadProducts((dir / kProductsFile).string(), snapshot.rejected_rows)) {
    snapshot.products[p.product_id] = p;
  }
  for (const Location& l : ReadLocations((dir / kLocationsFile).string(), snapshot.rejected_rows)) {
    snapshot.locations[l.location_id] = l;
  }
  for (const DemandForecast& f : ReadForecasts((dir / kForecastsFile).string(), snapshot.rejected_rows)) {
    snapshot.forecasts[PeriodKey(f.product_id, f.location_id, f.period)] = f;
  }

  fs::path inventory = dir / kInventoryFile;
  if (fs::exists(inventory)) {
    snapshot.positions = ReadPositions(inventory.string(), snapshot.rejected_rows);
  }

  // 单个风险事件无效只影响其 (产品, 库位); 整个文件无法解析时记为拒绝并按无风险事件继续
  fs::path risk = dir / kRiskFile;
  if (fs::exists(risk)) {
    try {
      RiskEventBatch batch = ReadRiskEventBatch(risk.string());
      ApplyRiskEvents(batch.events, snapshot.risk);
      snapshot.invalid_pairs = batch.invalid_pairs;
      snapshot.rejected_rows.insert(snapshot.rejected_rows.end(),
                                    batch.rejected.begin(), batch.rejected.end());
    } catch (const ValidationError& e) {
      LOG_WARN_FMT("[读取] 风险文件被拒绝: %s\n", e.what());
      snapshot.rejected_rows.push_back(risk.string() + " " + e.what());
    }
  }

  // 方差乘数在建模时才与冲击系数合并, 这里只做一致性提示
  if (config.shock_variance_multiplier < 1.0) {
    LOG_WARN_FMT("[读取] 供应冲击方差系数 %.4f 小于 1\n", config.shock_variance_multiplier);
  }

  LOG_FMT("[读取] 产品=%d 库位=%d 预测=%d 期初库存=%d 风险键=%d 拒绝行=%d\n",
          static_cast<int>(snapshot.products.size()), static_cast<int>(snapshot.locations.size()),
          static_cast<int>(snapshot.forecasts.size()), static_cast<int>(snapshot.positions.size()),
          static_cast<int>(snapshot.risk.size()), static_cast<int>(snapshot.rejected_rows.size()));
  return snapshot;
}
