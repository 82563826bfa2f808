// linear_model.h - 与求解器无关的 MILP 模型表示
//
// 问题构建器只生成这里的变量/约束/目标, 由求解器后端翻译为
// 具体求解器 (CPLEX) 的模型对象。变量按创建顺序编号, 编号即
// Solution 中取值向量的下标; 同一输入生成的模型顺序完全一致。

#ifndef LINEAR_MODEL_H_
#define LINEAR_MODEL_H_

#include "common.h"

enum class VarKind { Continuous, Integer, Binary };

enum class RowSense { LessEqual, GreaterEqual, Equal };

// 约束族, 用于日志统计和测试中按族检索
enum class RowFamily {
    Balance,          // 库存平衡
    Capacity,         // 到货时刻库容
    SafetyStock,      // 安全库存目标
    SafetyCapacity,   // 安全库存不超过库容
    ReorderPoint,     // 再订货点定义
    OrderLink,        // order_qty <= M * order_placed
    Moq,              // order_qty >= moq * order_placed
    ObjectiveCutoff   // 字典序第二阶段: 主目标不劣化
};

struct ModelVar {
    string name;
    double lower = 0.0;
    double upper = kInfinityValue;
    VarKind kind = VarKind::Continuous;
};

struct ModelTerm {
    int var = -1;
    double coef = 0.0;
};

struct ModelRow {
    string name;
    RowFamily family = RowFamily::Balance;
    vector<ModelTerm> terms;
    RowSense sense = RowSense::Equal;
    double rhs = 0.0;
};

struct LinearModel {
    vector<ModelVar> vars;
    vector<ModelRow> rows;
    vector<ModelTerm> objective;            // 主目标 (最小化)
    vector<ModelTerm> secondary_objective;  // 次目标, 仅用于等成本最优解之间的取舍

    int AddVar(const string& name, double lower, double upper, VarKind kind) {
        ModelVar v;
        v.name = name;
        v.lower = lower;
        v.upper = upper;
        v.kind = kind;
        vars.push_back(v);
        return static_cast<int>(vars.size()) - 1;
    }

    int AddRow(const string& name, RowFamily family, vector<ModelTerm> terms,
               RowSense sense, double rhs) {
        ModelRow row;
        row.name = name;
        row.family = family;
        row.terms = std::move(terms);
        row.sense = sense;
        row.rhs = rhs;
        rows.push_back(std::move(row));
        return static_cast<int>(rows.size()) - 1;
    }

    int NumIntegerVars() const {
        int n = 0;
        for (const auto& v : vars) {
            if (v.kind != VarKind::Continuous) ++n;
        }
        return n;
    }

    int CountRows(RowFamily family) const {
        int n = 0;
        for (const auto& r : rows) {
            if (r.family == family) ++n;
        }
        return n;
    }
};

// 在给定取值下计算线性表达式
inline double EvaluateTerms(const vector<ModelTerm>& terms, const vector<double>& values) {
    double sum = 0.0;
    for (const auto& term : terms) {
        sum += term.coef * values[term.var];
    }
    return sum;
}

#endif  // LINEAR_MODEL_H_
