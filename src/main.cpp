// main.cpp - 补货优化引擎主程序
//
// 每个周期: 读取数据快照 -> 划分分区 -> 工作线程池并发求解 -> 输出策略与批次报告
// 多周期运行时规划区间逐期滚动, 最近可用策略缓存跨周期保留。
//
// 用法: program --data <dir> [options]

#include "replenish.h"
#include "logger.h"
#include "partition.h"
#include "rolling_horizon.h"
#include "solvers/cplex_backend.h"
#include "common.h"

#include <filesystem>

namespace fs = std::filesystem;

using namespace std;

// ============================================================================
// 命令行参数结构
// ============================================================================
struct CommandLineArgs {
    string data_dir = "./data";
    string output_dir = "./results";
    string log_prefix = "";
    int start_period = -1;        // -1: 取预测中最早的周期
    int horizon = 12;
    int cycles = 1;
    int verbosity = 0;            // 0=INFO, 1=DETAIL, 2=DEBUG
    bool show_help = false;
    OptimizerConfig config;
    // CPLEX parameters
    string cplex_workdir = "";
    int cplex_workmem = 4096;
};

// ============================================================================
// 帮助信息
// ============================================================================
void PrintUsage(const char* program) {
    cout << "Usage: " << program << " --data <dir> [options]\n";
    cout << "\nInput (under --data):\n";
    cout << "  products.csv, locations.csv, forecasts.csv   required\n";
    cout << "  inventory.csv, risk.json                     optional\n";
    cout << "\nOptions:\n";
    cout << "  -d, --data <dir>          Input data directory (default: ./data)\n";
    cout << "  -o, --output <dir>        Output directory (default: ./results)\n";
    cout << "  -l, --log <prefix>        Log file prefix (default: ./logs/replenish)\n";
    cout << "  --start <period>          First planning period (default: earliest forecast)\n";
    cout << "  --horizon <H>             Planning horizon length (default: 12)\n";
    cout << "  --cycles <n>              Rolling cycles to run (default: 1)\n";
    cout << "  -t, --time <seconds>      Solver time limit per partition (default: 30)\n";
    cout << "  --det-ticks <ticks>       Deterministic CPLEX limit per solve phase (default: off)\n";
    cout << "  --gap <tol>               Relative MIP gap tolerance (default: 1e-4)\n";
    cout << "  --seed <int>              Solver random seed (default: 20240601)\n";
    cout << "  --workers <num>           Worker threads (default: 4)\n";
    cout << "  --cplex-threads <num>     CPLEX threads per solve (default: 1)\n";
    cout << "  --cplex-workdir <path>    CPLEX node file directory\n";
    cout << "  --cplex-workmem <MB>      CPLEX work memory limit (default: 4096)\n";
    cout << "  --granularity <q>         Minimum sellable unit for orders (default: 1)\n";
    cout << "  --integer-orders          Model order quantities as integers\n";
    cout << "  --service-model=normal|empirical\n";
    cout << "                            Safety stock approximation (default: normal)\n";
    cout << "  --no-tiebreak             Do not minimize order count among equal-cost optima\n";
    cout << "  --fail-threshold <f>      Failed partition fraction that aborts (default: 0.2)\n";
    cout << "  --partition-size <n>      Max product-location pairs per partition (default: 50)\n";
    cout << "  -v, -vv                   Verbose / debug logging\n";
    cout << "  -h, --help                Show this help message\n";
    cout << "\nExamples:\n";
    cout << "  " << program << " --data ./data --horizon 8\n";
    cout << "  " << program << " --data ./data --cycles 4 --workers 8 -t 60\n";
}

// ============================================================================
// 解析命令行参数
// ============================================================================
bool ParseArgs(int argc, char* argv[], CommandLineArgs& args) {
    OptimizerConfig& config = args.config;
    for (int i = 1; i < argc; i++) {
        string arg = argv[i];

        if (arg == "-h" || arg == "--help") {
            args.show_help = true;
            return true;
        } else if ((arg == "-d" || arg == "--data") && i + 1 < argc) {
            args.data_dir = argv[++i];
        } else if ((arg == "-o" || arg == "--output") && i + 1 < argc) {
            args.output_dir = argv[++i];
        } else if ((arg == "-l" || arg == "--log") && i + 1 < argc) {
            args.log_prefix = argv[++i];
        } else if (arg == "--start" && i + 1 < argc) {
            args.start_period = atoi(argv[++i]);
        } else if (arg == "--horizon" && i + 1 < argc) {
            args.horizon = atoi(argv[++i]);
        } else if (arg == "--cycles" && i + 1 < argc) {
            args.cycles = atoi(argv[++i]);
        } else if ((arg == "-t" || arg == "--time") && i + 1 < argc) {
            config.time_limit = atof(argv[++i]);
        } else if (arg == "--det-ticks" && i + 1 < argc) {
            config.det_time_limit = atof(argv[++i]);
        } else if (arg == "--gap" && i + 1 < argc) {
            config.gap_tolerance = atof(argv[++i]);
        } else if (arg == "--seed" && i + 1 < argc) {
            config.random_seed = atoi(argv[++i]);
        } else if (arg == "--workers" && i + 1 < argc) {
            config.workers = atoi(argv[++i]);
        } else if (arg == "--cplex-threads" && i + 1 < argc) {
            config.solver_threads = atoi(argv[++i]);
        } else if (arg == "--cplex-workdir" && i + 1 < argc) {
            args.cplex_workdir = argv[++i];
        } else if (arg == "--cplex-workmem" && i + 1 < argc) {
            args.cplex_workmem = atoi(argv[++i]);
        } else if (arg == "--granularity" && i + 1 < argc) {
            config.granularity = atof(argv[++i]);
        } else if (arg == "--integer-orders") {
            config.integer_orders = true;
        } else if (arg.rfind("--service-model=", 0) == 0) {
            string model = arg.substr(16);
            if (model == "normal") {
                config.service_model = ServiceModel::Normal;
            } else if (model == "empirical") {
                config.service_model = ServiceModel::Empirical;
            } else {
                cerr << "Unknown service model: " << model << "\n";
                cerr << "Valid options: normal, empirical\n";
                return false;
            }
        } else if (arg == "--no-tiebreak") {
            config.order_count_tiebreak = false;
        } else if (arg == "--fail-threshold" && i + 1 < argc) {
            config.failure_threshold = atof(argv[++i]);
        } else if (arg == "--partition-size" && i + 1 < argc) {
            config.partition_size = atoi(argv[++i]);
        } else if (arg == "-v") {
            args.verbosity = 1;
        } else if (arg == "-vv") {
            args.verbosity = 2;
        } else {
            cerr << "Unknown option: " << arg << "\n";
            return false;
        }
    }

    // 参数范围检查
    if (args.horizon <= 0 || args.cycles <= 0) {
        cerr << "--horizon and --cycles must be positive\n";
        return false;
    }
    if (config.granularity <= 0.0) {
        cerr << "--granularity must be positive\n";
        return false;
    }
    if (config.workers <= 0 || config.solver_threads <= 0 || config.partition_size <= 0) {
        cerr << "--workers, --cplex-threads and --partition-size must be positive\n";
        return false;
    }
    if (config.gap_tolerance < 0.0 || config.failure_threshold < 0.0 || config.failure_threshold > 1.0) {
        cerr << "--gap must be >= 0 and --fail-threshold within [0, 1]\n";
        return false;
    }
    return true;
}

// ============================================================================
// 输出状态码 (供调度进程解析)
// ============================================================================
void EmitStatus(const string& status) {
    cout << status << endl;
    cout.flush();
}

static int EarliestForecastPeriod(const MasterSnapshot& snapshot) {
    int earliest = 0;
    bool found = false;
    for (const auto& entry : snapshot.forecasts) {
        int period = get<2>(entry.first);
        if (!found || period < earliest) {
            earliest = period;
            found = true;
        }
    }
    return earliest;
}

// ============================================================================
// 主程序
// ============================================================================
int main(int argc, char* argv[]) {
    // 解析命令行参数
    CommandLineArgs args;
    if (!ParseArgs(argc, argv, args)) {
        PrintUsage(argv[0]);
        return 1;
    }

    if (args.show_help) {
        PrintUsage(argv[0]);
        return 0;
    }

    // 创建输出目录
    string output_dir = args.output_dir;
    string logs_dir = "./logs";

    try {
        fs::create_directories(output_dir);
        fs::create_directories(logs_dir);
    } catch (const std::exception& e) {
        cerr << "[ERROR] Cannot create directories: " << e.what() << "\n";
        return 1;
    }

    // 初始化日志系统
    string log_prefix = args.log_prefix.empty() ? logs_dir + "/replenish" : args.log_prefix;
    LogLevel level = args.verbosity >= 2 ? LogLevel::DEBUG
                   : args.verbosity == 1 ? LogLevel::DETAIL : LogLevel::INFO;
    Logger logger(log_prefix, level);
    const OptimizerConfig& config = args.config;

    LOG("\n========================================");
    LOG("  补货优化引擎");
    LOG("========================================\n");
    LOG_FMT("[系统] 数据目录: %s\n", args.data_dir.c_str());
    LOG_FMT("[系统] 输出目录: %s\n", output_dir.c_str());
    LOG_FMT("[系统] 时间限制: %.1f秒 gap=%.2g 种子=%d 工作线程=%d\n",
            config.time_limit, config.gap_tolerance, config.random_seed, config.workers);
    LOG_FMT("[系统] 服务水平模型: %s 粒度=%.4g 次目标=%s\n",
            config.service_model == ServiceModel::Normal ? "normal" : "empirical",
            config.granularity, config.order_count_tiebreak ? "on" : "off");

    // 读取数据 (周期开始时冻结的快照)
    MasterSnapshot snapshot;
    try {
        snapshot = LoadSnapshot(args.data_dir, config);
    } catch (const std::exception& e) {
        LOG_WARN_FMT("[错误] 数据加载失败: %s\n", e.what());
        EmitStatus("[LOAD:FAIL]");
        return 1;
    }

    EmitStatus("[LOAD:OK:" + to_string(snapshot.products.size()) + ":" +
               to_string(snapshot.locations.size()) + ":" +
               to_string(snapshot.forecasts.size()) + ":" +
               to_string(snapshot.rejected_rows.size()) + "]");

    vector<Partition> partitions = MakePartitions(snapshot, config.partition_size);
    int start_period = args.start_period >= 0 ? args.start_period : EarliestForecastPeriod(snapshot);

    CplexOptions cplex_options;
    cplex_options.workdir = args.cplex_workdir;
    cplex_options.workmem = args.cplex_workmem;
    CplexBackend backend(cplex_options);

    PolicyCache cache;
    RollingHorizonController controller(backend, config, cache);
    auto run_start = chrono::steady_clock::now();

    for (int cycle = 0; cycle < args.cycles; cycle++) {
        Horizon horizon;
        horizon.start_period = start_period + cycle;
        horizon.length = args.horizon;

        EmitStatus("[CYCLE:START:" + to_string(cycle) + ":" + to_string(horizon.start_period) + ":" +
                   to_string(horizon.length) + ":" + to_string(partitions.size()) + "]");

        CycleResult result = controller.RunCycle(snapshot, partitions, horizon, cycle);

        for (const PartitionOutcome& outcome : result.outcomes) {
            EmitStatus("[PARTITION:" + outcome.partition_id + ":" + PartitionStateName(outcome.state) +
                       ":" + SolveStatusName(outcome.solver_status) + ":" +
                       PolicySourceName(outcome.source) + "]");
        }

        // 失败分区也以占位记录输出, 先落盘再判断批次健康度
        string suffix = "_cycle" + to_string(cycle);
        string policy_file = output_dir + "/policies" + suffix + ".csv";
        string report_file = output_dir + "/batch_report" + suffix + ".json";
        try {
            WritePolicyCsv(policy_file, result.AllPolicies());
            WriteBatchReportJson(report_file, result);
        } catch (const std::exception& e) {
            LOG_WARN_FMT("[错误] %s\n", e.what());
            EmitStatus("[DONE:FAIL]");
            return 1;
        }
        LOG_FMT("[保存] 策略: %s\n", policy_file.c_str());
        LOG_FMT("[保存] 报告: %s\n", report_file.c_str());

        const BatchReport& report = result.report;
        EmitStatus("[CYCLE:DONE:" + to_string(cycle) + ":" + to_string(report.persisted) + ":" +
                   to_string(report.failed) + ":" + to_string(report.seconds) + "]");

        try {
            CheckBatchHealth(report, config.failure_threshold);
        } catch (const PartialBatchFailure& e) {
            LOG_WARN_FMT("[周期 %d] %s\n", cycle, e.what());
            EmitStatus("[DONE:PARTIAL:" + to_string(e.failed()) + ":" + to_string(e.total()) + "]");
            return 2;
        }
    }

    double total_duration = chrono::duration<double>(chrono::steady_clock::now() - run_start).count();
    LOG_FMT("[完成] 周期=%d 总耗时=%.3fs\n", args.cycles, total_duration);
    LOG("[系统] 程序正常退出");

    EmitStatus("[DONE:SUCCESS]");
    return 0;
}
