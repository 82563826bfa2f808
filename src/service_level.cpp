// service_level.cpp - 服务水平与安全库存计算实现

#include "service_level.h"

double NormalCdf(double x) {
    return 0.5 * erfc(-x / sqrt(2.0));
}

// 有理函数逼近 (Acklam), 再做一步 Halley 迭代修正
double InverseNormalCdf(double p) {
    if (!(p > 0.0 && p < 1.0)) {
        throw invalid_argument("InverseNormalCdf: 概率必须在 (0,1) 内, 实际为 " + ToString(p));
    }

    static const double a[] = {
        -3.969683028665376e+01, 2.209460984245205e+02,
        -2.759285104469687e+02, 1.383577518672690e+02,
        -3.066479806614716e+01, 2.506628277459239e+00
    };
    static const double b[] = {
        -5.447609879822406e+01, 1.615858368580409e+02,
        -1.556989798598866e+02, 6.680131188771972e+01,
        -1.328068155288572e+01
    };
    static const double c[] = {
        -7.784894002430293e-03, -3.223964580411365e-01,
        -2.400758277161838e+00, -2.549732539343734e+00,
        4.374664141464968e+00, 2.938163982698783e+00
    };
    static const double d[] = {
        7.784695709041462e-03, 3.224671290700398e-01,
        2.445134137142996e+00, 3.754408661907416e+00
    };

    const double p_low = 0.02425;
    const double p_high = 1.0 - p_low;
    double x = 0.0;

    if (p < p_low) {
        double q = sqrt(-2.0 * log(p));
        x = (((((c[0] * q + c[1]) * q + c[2]) * q + c[3]) * q + c[4]) * q + c[5]) /
            ((((d[0] * q + d[1]) * q + d[2]) * q + d[3]) * q + 1.0);
    } else if (p <= p_high) {
        double q = p - 0.5;
        double r = q * q;
        x = (((((a[0] * r + a[1]) * r + a[2]) * r + a[3]) * r + a[4]) * r + a[5]) * q /
            (((((b[0] * r + b[1]) * r + b[2]) * r + b[3]) * r + b[4]) * r + 1.0);
    } else {
        double q = sqrt(-2.0 * log(1.0 - p));
        x = -(((((c[0] * q + c[1]) * q + c[2]) * q + c[3]) * q + c[4]) * q + c[5]) /
             ((((d[0] * q + d[1]) * q + d[2]) * q + d[3]) * q + 1.0);
    }

    // Halley 修正, 误差降到 1e-9 量级
    double e = NormalCdf(x) - p;
    double u = e * 2.5066282746310002 * exp(x * x / 2.0);   // sqrt(2*pi)
    x = x - u / (1.0 + x * u / 2.0);
    return x;
}

bool InterpolateQuantile(const vector<QuantilePoint>& quantiles, double level, double& value) {
    if (quantiles.empty()) return false;
    if (level < quantiles.front().level - kEpsilon || level > quantiles.back().level + kEpsilon) {
        return false;
    }

    for (size_t k = 0; k < quantiles.size(); ++k) {
        if (IsEqual(quantiles[k].level, level, 1e-12)) {
            value = quantiles[k].value;
            return true;
        }
        if (k + 1 < quantiles.size() && level < quantiles[k + 1].level) {
            const QuantilePoint& lo = quantiles[k];
            const QuantilePoint& hi = quantiles[k + 1];
            double w = (level - lo.level) / (hi.level - lo.level);
            value = lo.value + w * (hi.value - lo.value);
            return true;
        }
    }
    value = quantiles.back().value;
    return true;
}

double NormalSafetyStock(double service_level, double window_variance) {
    if (window_variance <= 0.0) return 0.0;
    double z = InverseNormalCdf(service_level);
    return Max(0.0, z) * sqrt(window_variance);
}

double EmpiricalSafetyExcess(const vector<QuantilePoint>& quantiles,
                             double mean, double stddev, double service_level) {
    double q = 0.0;
    if (InterpolateQuantile(quantiles, service_level, q)) {
        return Max(0.0, q - mean);
    }
    return NormalSafetyStock(service_level, stddev * stddev);
}
