// service_level.h - 服务水平与安全库存计算
//
// 正态近似: safety_stock = z(SL) * sigma_LT, z 为标准正态分布逆函数
// 经验分位数: 保护期内每期 (SL 分位数 - 均值) 之和 (同单调假设, 偏保守)

#ifndef SERVICE_LEVEL_H_
#define SERVICE_LEVEL_H_

#include "replenish.h"

// 标准正态分布函数
double NormalCdf(double x);

// 标准正态分布逆函数, p 必须在 (0,1) 内, 否则抛出 invalid_argument
double InverseNormalCdf(double p);

// 在分位数集合上线性插值, level 超出集合覆盖范围时返回 false
bool InterpolateQuantile(const vector<QuantilePoint>& quantiles, double level, double& value);

// 正态近似下的安全库存: max(0, z(SL)) * sqrt(window_variance)
double NormalSafetyStock(double service_level, double window_variance);

// 单期的经验安全余量: SL 分位数超出均值的部分;
// 分位数不覆盖 SL 时退化为 z(SL) * stddev
double EmpiricalSafetyExcess(const vector<QuantilePoint>& quantiles,
                             double mean, double stddev, double service_level);

#endif  // SERVICE_LEVEL_H_
