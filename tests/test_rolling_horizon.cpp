// test_rolling_horizon.cpp - 分区状态机、修复阶梯、超时沿用与批次健康度 (脚本化后端)

#include <catch2/catch.hpp>

#include "rolling_horizon.h"
#include "partition.h"
#include "test_fixtures.h"

using namespace fixtures;

namespace {

const map<string, double> kScenarioOrder = {{"q_", 100.0}, {"y_", 1.0}, {"rop_", 100.0}};

PartitionOutcome RunSingle(ScriptedBackend& backend, const MasterSnapshot& snapshot,
                           const OptimizerConfig& config, int length = 1) {
    PolicyCache cache;
    RollingHorizonController controller(backend, config, cache);
    return controller.RunPartition(MakePartition("P-l1-0", {"p1"}, {"l1"}), snapshot,
                                   MakeHorizon(0, length), config.time_limit);
}

}  // namespace

TEST_CASE("A1: RunPartition::NominalSolvePersists", "[controller]") {
    OptimizerConfig config = SinglePhaseConfig();
    ScriptedBackend backend;
    backend.Push(SolvesWith(kScenarioOrder));

    PolicyCache cache;
    RollingHorizonController controller(backend, config, cache);
    PartitionOutcome outcome = controller.RunPartition(MakePartition("P-l1-0", {"p1"}, {"l1"}),
                                                       SingleItemSnapshot(1000.0), MakeHorizon(0, 1),
                                                       config.time_limit);

    CHECK(outcome.state == PartitionState::Persisted);
    CHECK(outcome.source == PolicySource::Solver);
    CHECK(outcome.solver_status == SolveStatus::Optimal);
    REQUIRE(outcome.policies.size() == 1);
    CHECK(outcome.policies[0].order_quantity == 100.0);
    CHECK(outcome.repair_steps.empty());
    CHECK(cache.Size() == 1);
}

TEST_CASE("B1: RepairLadder::BacklogRungAfterInfeasible", "[controller][repair]") {
    OptimizerConfig config = SinglePhaseConfig();
    ScriptedBackend backend;
    backend.Push(Returns(BackendOutcome::Infeasible));
    backend.Push(SolvesWith({{"q_", 50.0}, {"y_", 1.0}, {"s_", 50.0}, {"rop_", 100.0}}));

    PartitionOutcome outcome = RunSingle(backend, SingleItemSnapshot(50.0), config);

    CHECK(outcome.state == PartitionState::Persisted);
    CHECK(outcome.source == PolicySource::RelaxedBacklog);
    CHECK(outcome.solver_status == SolveStatus::Infeasible);
    REQUIRE(outcome.policies.size() == 1);
    CHECK(outcome.policies[0].solver_status == SolveStatus::Infeasible);
    CHECK(outcome.policies[0].source == PolicySource::RelaxedBacklog);
    CHECK(outcome.policies[0].planned_shortage == Approx(50.0));
    CHECK(outcome.repair_steps == vector<string>{"RelaxedBacklog"});

    // 放松模型的缺货上限为全部需求
    REQUIRE(backend.Calls() == 2);
    const LinearModel& relaxed = backend.Models()[1];
    CHECK(relaxed.vars[FindVar(relaxed, "s_p1_l1_0")].upper == Approx(100.0));
}

TEST_CASE("B2: RepairLadder::HeuristicAfterAllRungs", "[controller][repair]") {
    OptimizerConfig config = SinglePhaseConfig();
    ScriptedBackend backend;
    backend.Push(Returns(BackendOutcome::Infeasible));

    PartitionOutcome outcome = RunSingle(backend, SingleItemSnapshot(1000.0), config);

    CHECK(outcome.state == PartitionState::Persisted);
    CHECK(outcome.source == PolicySource::Heuristic);
    CHECK(backend.Calls() == 4);
    REQUIRE(outcome.repair_steps.size() == 4);
    CHECK(outcome.repair_steps[1] == "RelaxedSafetyStock(0.50)");
    CHECK(outcome.repair_steps[2] == "RelaxedSafetyStock(0.00)");
    CHECK(outcome.repair_steps[3] == "Heuristic");
    CHECK(outcome.policies[0].solver_status == SolveStatus::Infeasible);

    // 安全库存放松逐级累加在缺货放松之上
    const LinearModel& last = backend.Models()[3];
    CHECK(last.vars[FindVar(last, "s_p1_l1_0")].upper == Approx(100.0));
}

TEST_CASE("B3: RepairLadder::NegativeCapacityEndsFailed", "[controller][repair]") {
    OptimizerConfig config = SinglePhaseConfig();
    ScriptedBackend backend;
    backend.Push(Returns(BackendOutcome::Infeasible));

    PartitionOutcome outcome;
    REQUIRE_NOTHROW(outcome = RunSingle(backend, SingleItemSnapshot(-5.0), config, 2));

    CHECK(outcome.state == PartitionState::Failed);
    CHECK(outcome.source == PolicySource::None);
    CHECK_FALSE(outcome.message.empty());
    REQUIRE(outcome.policies.size() == 2);
    for (const Policy& p : outcome.policies) {
        CHECK(p.order_quantity == 0.0);
        CHECK(p.source == PolicySource::None);
        CHECK(p.solver_status == SolveStatus::Infeasible);
    }
}

TEST_CASE("B4: RepairLadder::RoundingFailureMovesToNextRung", "[controller][repair]") {
    OptimizerConfig config = SinglePhaseConfig();
    ScriptedBackend backend;
    backend.Push(SolvesWith({{"q_", 100.6}, {"y_", 1.0}, {"rop_", 100.0}}));
    backend.Push(SolvesWith({{"q_", 100.0}, {"y_", 1.0}, {"rop_", 100.0}}));

    PartitionOutcome outcome = RunSingle(backend, SingleItemSnapshot(100.6), config);

    CHECK(outcome.state == PartitionState::Persisted);
    CHECK(outcome.source == PolicySource::RelaxedBacklog);
    CHECK(outcome.solver_status == SolveStatus::Optimal);
    CHECK(outcome.policies[0].order_quantity == 100.0);
}

TEST_CASE("B5: RepairLadder::BackendErrorIsRepaired", "[controller][repair]") {
    OptimizerConfig config = SinglePhaseConfig();
    ScriptedBackend backend;
    backend.Push(Throws("numerical trouble"));
    backend.Push(SolvesWith(kScenarioOrder));

    PartitionOutcome outcome = RunSingle(backend, SingleItemSnapshot(1000.0), config);

    CHECK(outcome.state == PartitionState::Persisted);
    CHECK(outcome.solver_status == SolveStatus::Error);
    CHECK(outcome.source == PolicySource::RelaxedBacklog);
}

TEST_CASE("B6: Validation::FailsWithoutSolving", "[controller][validation]") {
    OptimizerConfig config = SinglePhaseConfig();
    ScriptedBackend backend;
    backend.Push(SolvesWith(kScenarioOrder));

    PartitionOutcome outcome = RunSingle(backend, SingleItemSnapshot(1000.0, 1), config, 3);

    CHECK(outcome.state == PartitionState::Failed);
    CHECK(outcome.solver_status == SolveStatus::Error);
    CHECK(outcome.message.find("ValidationError") != string::npos);
    CHECK(outcome.policies.size() == 3);
    CHECK(backend.Calls() == 0);
}

TEST_CASE("C1: Timeout::ReusesPriorCycleAndPrioritizesResolve", "[controller][timeout]") {
    OptimizerConfig config = SinglePhaseConfig();
    config.time_limit = 5.0;
    config.resolve_time_factor = 3.0;
    MasterSnapshot snapshot = SingleItemSnapshot(1000.0, 4);
    vector<Partition> partitions = MakePartitions(snapshot, 10);
    REQUIRE(partitions.size() == 1);

    ScriptedBackend backend;
    backend.Push(SolvesWith(kScenarioOrder));
    backend.Push(Returns(BackendOutcome::TimeLimitNoSolution));
    backend.Push(SolvesWith(kScenarioOrder));

    PolicyCache cache;
    RollingHorizonController controller(backend, config, cache);

    CycleResult first = controller.RunCycle(snapshot, partitions, MakeHorizon(0, 2), 0);
    REQUIRE(first.outcomes[0].source == PolicySource::Solver);

    CycleResult second = controller.RunCycle(snapshot, partitions, MakeHorizon(1, 2), 1);
    const PartitionOutcome& reused = second.outcomes[0];
    CHECK(reused.state == PartitionState::Persisted);
    CHECK(reused.source == PolicySource::PriorCycle);
    CHECK(reused.solver_status == SolveStatus::TimedOut);
    CHECK(reused.flagged_for_resolve);
    REQUIRE(reused.policies.size() == 2);
    CHECK(reused.policies[0].period == 1);
    CHECK(reused.policies[0].order_quantity == 100.0);
    CHECK(reused.policies[0].source == PolicySource::PriorCycle);
    CHECK(reused.policies[0].solver_status == SolveStatus::TimedOut);
    CHECK(reused.policies[1].period == 2);
    CHECK(reused.policies[1].order_quantity == 0.0);
    CHECK(reused.policies[1].reorder_point == 100.0);
    CHECK(second.report.flagged_partitions == vector<string>{partitions[0].partition_id});

    CycleResult third = controller.RunCycle(snapshot, partitions, MakeHorizon(2, 2), 2);
    CHECK(third.outcomes[0].source == PolicySource::Solver);
    CHECK(third.outcomes[0].resolved_with_priority);
    REQUIRE(backend.Calls() == 3);
    CHECK(backend.Settings()[0].time_limit == Approx(5.0));
    CHECK(backend.Settings()[2].time_limit == Approx(15.0));
}

TEST_CASE("C2: Timeout::WithoutCacheRunsLadder", "[controller][timeout]") {
    OptimizerConfig config = SinglePhaseConfig();
    ScriptedBackend backend;
    backend.Push(Returns(BackendOutcome::TimeLimitNoSolution));
    backend.Push(SolvesWith(kScenarioOrder));

    PartitionOutcome outcome = RunSingle(backend, SingleItemSnapshot(1000.0), config);

    CHECK(outcome.state == PartitionState::Persisted);
    CHECK(outcome.source == PolicySource::RelaxedBacklog);
    CHECK(outcome.solver_status == SolveStatus::TimedOut);
    CHECK(outcome.flagged_for_resolve);
}

TEST_CASE("D1: RunCycle::WorkerPoolKeepsPartitionOrder", "[controller][concurrency]") {
    MasterSnapshot snapshot;
    snapshot.products["p1"] = MakeProduct("p1", 1.0, 10.0, 50.0, 0.0, 0);
    snapshot.products["p2"] = MakeProduct("p2", 1.0, 10.0, 50.0, 0.0, 0);
    for (int k = 0; k < 6; ++k) {
        string l = "l" + ToString(k);
        snapshot.locations[l] = MakeLocation(l, 1000.0, 0.95);
        for (const string p : {"p1", "p2"}) {
            AddForecast(snapshot, p, l, 0, 100.0, 0.0);
            AddForecast(snapshot, p, l, 1, 100.0, 0.0);
        }
    }

    OptimizerConfig config = SinglePhaseConfig();
    config.workers = 4;
    vector<Partition> partitions = MakePartitions(snapshot, 1);
    REQUIRE(partitions.size() == 12);
    CHECK(partitions[0].partition_id == "P-l0-0");
    CHECK(partitions[1].partition_id == "P-l0-1");

    auto run = [&]() {
        ScriptedBackend backend;
        backend.Push(SolvesWith(kScenarioOrder));
        PolicyCache cache;
        RollingHorizonController controller(backend, config, cache);
        return controller.RunCycle(snapshot, partitions, MakeHorizon(0, 2), 0);
    };

    CycleResult a = run();
    CycleResult b = run();

    REQUIRE(a.outcomes.size() == partitions.size());
    for (size_t i = 0; i < partitions.size(); ++i) {
        CHECK(a.outcomes[i].partition_id == partitions[i].partition_id);
        CHECK(a.outcomes[i].state == PartitionState::Persisted);
    }
    CHECK(a.report.persisted == 12);
    CHECK(a.report.failed == 0);
    CHECK(a.report.by_source.at("Solver") == 12);

    vector<Policy> pa = a.AllPolicies();
    vector<Policy> pb = b.AllPolicies();
    REQUIRE(pa.size() == 24);
    REQUIRE(pa.size() == pb.size());
    for (size_t i = 0; i < pa.size(); ++i) {
        CHECK(pa[i].product_id == pb[i].product_id);
        CHECK(pa[i].location_id == pb[i].location_id);
        CHECK(pa[i].period == pb[i].period);
        CHECK(pa[i].order_quantity == pb[i].order_quantity);
    }
}

TEST_CASE("E1: CheckBatchHealth::Threshold", "[controller]") {
    BatchReport report;
    report.partitions = 10;
    report.failed = 2;
    report.failed_fraction = 0.2;
    CHECK_NOTHROW(CheckBatchHealth(report, 0.2));

    report.failed = 3;
    report.failed_fraction = 0.3;
    CHECK_THROWS_AS(CheckBatchHealth(report, 0.2), PartialBatchFailure);
    try {
        CheckBatchHealth(report, 0.2);
    } catch (const PartialBatchFailure& e) {
        CHECK(e.failed() == 3);
        CHECK(e.total() == 10);
    }

    BatchReport empty;
    CHECK_NOTHROW(CheckBatchHealth(empty, 0.0));
}

TEST_CASE("E2: RunCycle::FailedPartitionsReported", "[controller]") {
    MasterSnapshot snapshot = SingleItemSnapshot(1000.0, 1);
    snapshot.locations["l2"] = MakeLocation("l2", -1.0, 0.9);
    AddForecast(snapshot, "p1", "l2", 0, 100.0, 0.0);

    OptimizerConfig config = SinglePhaseConfig();
    config.workers = 2;
    ScriptedBackend backend;
    backend.Push([](const LinearModel& model, const vector<ModelTerm>& objective, const SolveSettings& settings) {
        // 负库容库位的模型不可行
        for (const ModelRow& row : model.rows) {
            if (row.family == RowFamily::SafetyCapacity && row.rhs < 0.0) {
                BackendResult r;
                r.outcome = BackendOutcome::Infeasible;
                return r;
            }
        }
        return SolvesWith(kScenarioOrder)(model, objective, settings);
    });

    PolicyCache cache;
    RollingHorizonController controller(backend, config, cache);
    CycleResult result = controller.RunCycle(snapshot, MakePartitions(snapshot, 10), MakeHorizon(0, 1), 0);

    CHECK(result.report.partitions == 2);
    CHECK(result.report.failed == 1);
    CHECK(result.report.failed_fraction == Approx(0.5));
    CHECK(result.report.failed_partitions == vector<string>{"P-l2-0"});
    CHECK(result.AllPolicies().size() == 2);
    CHECK_THROWS_AS(CheckBatchHealth(result.report, config.failure_threshold), PartialBatchFailure);
}

TEST_CASE("F1: SolvePartition::RawStatusWithoutRepair", "[query]") {
    OptimizerConfig config = SinglePhaseConfig();

    SECTION("accepted") {
        ScriptedBackend backend;
        backend.Push(SolvesWith(kScenarioOrder));
        vector<Policy> policies = SolvePartition({"p1"}, {"l1"}, MakeHorizon(0, 1),
                                                 SingleItemSnapshot(1000.0), backend, config);
        REQUIRE(policies.size() == 1);
        CHECK(policies[0].solver_status == SolveStatus::Optimal);
        CHECK(policies[0].source == PolicySource::Solver);
    }

    SECTION("infeasible is returned as-is") {
        ScriptedBackend backend;
        backend.Push(Returns(BackendOutcome::Infeasible));
        vector<Policy> policies = SolvePartition({"p1"}, {"l1"}, MakeHorizon(0, 1),
                                                 SingleItemSnapshot(50.0), backend, config);
        REQUIRE(policies.size() == 1);
        CHECK(policies[0].solver_status == SolveStatus::Infeasible);
        CHECK(policies[0].order_quantity == 0.0);
        CHECK(backend.Calls() == 1);
    }

    SECTION("validation error propagates") {
        ScriptedBackend backend;
        backend.Push(SolvesWith(kScenarioOrder));
        CHECK_THROWS_AS(SolvePartition({"p1"}, {"l1"}, MakeHorizon(0, 5), SingleItemSnapshot(1000.0),
                                       backend, config), ValidationError);
    }
}

TEST_CASE("E3: RunCycle::IncompleteMasterDataFailsOwnPartition", "[controller][validation]") {
    MasterSnapshot snapshot = SingleItemSnapshot(1000.0, 1);
    Product incomplete;
    incomplete.product_id = "p2";
    snapshot.products["p2"] = incomplete;
    AddForecast(snapshot, "p2", "l1", 0, 100.0, 0.0);

    vector<Partition> partitions = MakePartitions(snapshot, 10);
    REQUIRE(partitions.size() == 2);
    CHECK(partitions[0].partition_id == "P-l1-0");
    CHECK(partitions[0].product_ids == vector<string>{"p1"});
    CHECK(partitions[1].partition_id == "P-l1-1");
    CHECK(partitions[1].product_ids == vector<string>{"p2"});

    OptimizerConfig config = SinglePhaseConfig();
    ScriptedBackend backend;
    backend.Push(SolvesWith(kScenarioOrder));
    PolicyCache cache;
    RollingHorizonController controller(backend, config, cache);
    CycleResult result = controller.RunCycle(snapshot, partitions, MakeHorizon(0, 1), 0);

    REQUIRE(result.outcomes.size() == 2);
    CHECK(result.outcomes[0].state == PartitionState::Persisted);
    CHECK(result.outcomes[1].state == PartitionState::Failed);
    CHECK(result.outcomes[1].message.find("ValidationError") != string::npos);
    REQUIRE(result.outcomes[1].policies.size() == 1);
    CHECK(result.outcomes[1].policies[0].product_id == "p2");
    CHECK(result.outcomes[1].policies[0].source == PolicySource::None);
    CHECK(result.report.failed == 1);
    CHECK(result.report.failed_partitions == vector<string>{"P-l1-1"});
    CHECK(backend.Calls() == 1);
}

TEST_CASE("E4: RunCycle::InvalidRiskEventFailsOnlyItsPair", "[controller][validation][risk]") {
    MasterSnapshot snapshot = SingleItemSnapshot(1000.0, 1);
    snapshot.products["p2"] = MakeProduct("p2", 1.0, 10.0, 50.0, 0.0, 0);
    AddForecast(snapshot, "p2", "l1", 0, 100.0, 0.0);
    snapshot.invalid_pairs[PairKey("p1", "l1")] = "lead_time_multiplier 必须为正数";

    vector<Partition> partitions = MakePartitions(snapshot, 10);
    REQUIRE(partitions.size() == 2);
    CHECK(partitions[0].product_ids == vector<string>{"p2"});
    CHECK(partitions[1].product_ids == vector<string>{"p1"});

    OptimizerConfig config = SinglePhaseConfig();
    ScriptedBackend backend;
    backend.Push(SolvesWith(kScenarioOrder));
    PolicyCache cache;
    RollingHorizonController controller(backend, config, cache);
    CycleResult result = controller.RunCycle(snapshot, partitions, MakeHorizon(0, 1), 0);

    CHECK(result.outcomes[0].state == PartitionState::Persisted);
    CHECK(result.outcomes[1].state == PartitionState::Failed);
    CHECK(result.report.failed == 1);
}
