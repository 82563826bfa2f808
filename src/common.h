// common.h - 公共头文件
// 包含全局使用的头文件、类型定义、常量、数值与字符串工具函数

#ifndef COMMON_H_
#define COMMON_H_

// 标准库头文件
#include <iostream>
#include <fstream>
#include <vector>
#include <string>
#include <algorithm>
#include <cmath>
#include <ctime>
#include <chrono>
#include <iomanip>
#include <sstream>
#include <map>
#include <set>
#include <tuple>
#include <limits>
#include <memory>
#include <functional>
#include <numeric>
#include <cstring>
#include <cstdio>
#include <cstdlib>
#include <stdexcept>
#include <exception>

using namespace std;

// 全局常量
constexpr double kEpsilon = 1e-6;
constexpr double kInfinityValue = 1e20;

// 通用 constexpr 函数
template<typename T>
constexpr T Min(T a, T b) {
    return (a < b) ? a : b;
}

template<typename T>
constexpr T Max(T a, T b) {
    return (a > b) ? a : b;
}

template<typename T>
constexpr T Abs(T a) {
    return (a < 0) ? -a : a;
}

// 数值比较工具函数
constexpr bool IsEqual(double a, double b, double epsilon = kEpsilon) {
    return Abs(a - b) < epsilon;
}

// 按精度四舍五入, 用于消除求解器返回值的浮点噪声
// 结果中的 -0.0 统一为 0.0, 保证输出逐位一致
inline double Round(double value, int precision = 6) {
    double factor = pow(10.0, precision);
    double r = round(value * factor) / factor;
    return (r == 0.0) ? 0.0 : r;
}

// 字符串工具函数
inline string ToString(int value) {
    return to_string(value);
}

inline string ToString(double value, int precision = 6) {
    stringstream ss;
    ss << fixed << setprecision(precision) << value;
    return ss.str();
}

inline string Trim(const string& s) {
    size_t begin = s.find_first_not_of(" \t\r\n");
    if (begin == string::npos) return "";
    size_t end = s.find_last_not_of(" \t\r\n");
    return s.substr(begin, end - begin + 1);
}

// 按分隔符分割字符串 (实现见 input.cpp)
void SplitString(const string& input, vector<string>& output, const string& delimiter);

#endif  // COMMON_H_
