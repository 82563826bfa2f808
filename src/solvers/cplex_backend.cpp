/**
 * @file cplex_backend.cpp
 * @brief CPLEX 后端 - 将 LinearModel 翻译为 Concert 模型并求解
 */

#include "cplex_backend.h"
#include "../logger.h"

#include <ilcplex/ilocplex.h>

// 确定性并行模式 (CPX_PARALLEL_DETERMINISTIC)
constexpr int kCplexDeterministicParallel = 1;

// Strategy::File = 3: 节点文件压缩后写入 WorkDir
constexpr int kCplexNodeFileCompressed = 3;

static IloNumVar::Type ToIloType(VarKind kind) {
    switch (kind) {
        case VarKind::Integer: return ILOINT;
        case VarKind::Binary:  return ILOBOOL;
        default:               return ILOFLOAT;
    }
}

static IloNum ToIloBound(double value) {
    if (value >= kInfinityValue) return IloInfinity;
    if (value <= -kInfinityValue) return -IloInfinity;
    return value;
}

BackendResult CplexBackend::Solve(const LinearModel& model,
                                  const vector<ModelTerm>& objective,
                                  const SolveSettings& settings) {
    BackendResult result;
    auto wall_start = chrono::steady_clock::now();
    const int n = static_cast<int>(model.vars.size());

    IloEnv env;
    try {
        IloModel ilo_model(env);

        // 决策变量
        IloNumVarArray x(env, n);
        for (int j = 0; j < n; ++j) {
            const ModelVar& v = model.vars[j];
            x[j] = IloNumVar(env, ToIloBound(v.lower), ToIloBound(v.upper),
                             ToIloType(v.kind), v.name.c_str());
        }
        ilo_model.add(x);

        // 约束
        for (const ModelRow& row : model.rows) {
            IloExpr expr(env);
            for (const ModelTerm& term : row.terms) {
                expr += term.coef * x[term.var];
            }
            IloNum lb = -IloInfinity;
            IloNum ub = IloInfinity;
            switch (row.sense) {
                case RowSense::LessEqual:    ub = row.rhs; break;
                case RowSense::GreaterEqual: lb = row.rhs; break;
                case RowSense::Equal:        lb = row.rhs; ub = row.rhs; break;
            }
            ilo_model.add(IloRange(env, lb, expr, ub, row.name.c_str()));
            expr.end();
        }

        // 目标函数
        IloExpr obj(env);
        for (const ModelTerm& term : objective) {
            obj += term.coef * x[term.var];
        }
        ilo_model.add(IloMinimize(env, obj));
        obj.end();

        // 求解器配置
        IloCplex cplex(ilo_model);
        cplex.setParam(IloCplex::Param::TimeLimit, settings.time_limit);
        if (settings.det_time_limit > 0.0) {
            cplex.setParam(IloCplex::Param::DetTimeLimit, settings.det_time_limit);
        }
        cplex.setParam(IloCplex::Param::MIP::Tolerances::MIPGap, settings.gap_tolerance);
        cplex.setParam(IloCplex::Param::RandomSeed, settings.random_seed);
        cplex.setParam(IloCplex::Param::Threads, settings.threads);
        cplex.setParam(IloCplex::Param::Parallel, kCplexDeterministicParallel);
        cplex.setParam(IloCplex::Param::WorkMem, options_.workmem);
        if (!options_.workdir.empty()) {
            cplex.setParam(IloCplex::Param::MIP::Strategy::File, kCplexNodeFileCompressed);
            cplex.setParam(IloCplex::Param::WorkDir, options_.workdir.c_str());
        }

        // CPLEX 原始日志只在 DEBUG 级别进入日志系统
        if (g_logger && g_logger->Enabled(LogLevel::DEBUG)) {
            cplex.setOut(g_logger->GetTeeStream());
            cplex.setWarning(g_logger->GetTeeStream());
        } else {
            cplex.setOut(env.getNullStream());
            cplex.setWarning(env.getNullStream());
        }

        cplex.solve();

        IloAlgorithm::Status status = cplex.getStatus();
        IloCplex::CplexStatus cplex_status = cplex.getCplexStatus();
        bool has_incumbent = (status == IloAlgorithm::Optimal || status == IloAlgorithm::Feasible);

        switch (cplex_status) {
            case IloCplex::Optimal:
                result.outcome = BackendOutcome::Optimal;
                break;
            case IloCplex::OptimalTol:
                result.outcome = BackendOutcome::Feasible;
                break;
            case IloCplex::Infeasible:
            case IloCplex::InfOrUnbd:
                result.outcome = BackendOutcome::Infeasible;
                break;
            case IloCplex::AbortTimeLim:
            case IloCplex::AbortDetTimeLim:
                result.outcome = has_incumbent ? BackendOutcome::TimeLimitWithSolution
                                               : BackendOutcome::TimeLimitNoSolution;
                break;
            default:
                result.outcome = has_incumbent ? BackendOutcome::Feasible : BackendOutcome::Failed;
                break;
        }

        stringstream msg;
        msg << "CPLEX status=" << cplex_status;
        result.message = msg.str();

        if (has_incumbent) {
            result.objective = cplex.getObjValue();
            IloNumArray vals(env);
            cplex.getValues(vals, x);
            result.values.resize(n);
            for (int j = 0; j < n; ++j) {
                result.values[j] = vals[j];
            }
            vals.end();

            if (cplex.isMIP()) {
                result.best_bound = cplex.getBestObjValue();
                result.gap = cplex.getMIPRelativeGap();
            } else {
                result.best_bound = result.objective;
                result.gap = 0.0;
            }
        }

        LOG_DEBUG_FMT("[CPLEX] %s 目标=%.6f gap=%.6g\n",
                      result.message.c_str(), result.objective, result.gap);

    } catch (IloException& e) {
        result.outcome = BackendOutcome::Failed;
        result.message = string("CPLEX异常: ") + e.getMessage();
        result.values.clear();
    } catch (const std::exception& e) {
        result.outcome = BackendOutcome::Failed;
        result.message = string("CPLEX后端异常: ") + e.what();
        result.values.clear();
    }
    env.end();

    result.seconds = chrono::duration<double>(chrono::steady_clock::now() - wall_start).count();
    return result;
}
