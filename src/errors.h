// errors.h - 异常类型
//
// 输入数据或舍入阶段的错误以异常形式抛出, 作用域限定在单个分区;
// 求解器侧的失败 (不可行、超时、数值错误) 是 Solution 上的状态值,
// 不会以异常形式穿过 SolverAdapter。

#ifndef ERRORS_H_
#define ERRORS_H_

#include <stdexcept>
#include <string>

// 主数据/预测数据缺失或格式错误, 分区在求解前被拒绝
class ValidationError : public std::runtime_error {
public:
    explicit ValidationError(const std::string& msg)
        : std::runtime_error("ValidationError: " + msg) {}
};

// 舍入后的订货计划违反 MOQ 或容量, 触发修复流程
class PolicyRoundingError : public std::runtime_error {
public:
    explicit PolicyRoundingError(const std::string& msg)
        : std::runtime_error("PolicyRoundingError: " + msg) {}
};

// 周期级聚合错误: 失败分区比例超过阈值
class PartialBatchFailure : public std::runtime_error {
public:
    PartialBatchFailure(const std::string& msg, int failed, int total)
        : std::runtime_error("PartialBatchFailure: " + msg)
        , failed_(failed)
        , total_(total) {}

    int failed() const { return failed_; }
    int total() const { return total_; }

private:
    int failed_;
    int total_;
};

#endif  // ERRORS_H_
