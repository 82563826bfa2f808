// test_policy_extractor.cpp - 舍入、MOQ/库容复核、审计成本与启发式

#include <catch2/catch.hpp>

#include "policy_extractor.h"
#include "test_fixtures.h"

using namespace fixtures;

namespace {

Solution MakeSolution(const OptimizationProblem& problem, const map<string, double>& by_prefix) {
    Solution solution;
    solution.partition_id = problem.partition_id;
    solution.status = SolveStatus::Optimal;
    solution.values = ValuesByPrefix(problem.model, by_prefix);
    solution.objective = EvaluateTerms(problem.model.objective, solution.values);
    return solution;
}

}  // namespace

TEST_CASE("A1: RoundOrderQuantity::GranularityAndMoq", "[extractor]") {
    CHECK(RoundOrderQuantity(99.9999999, 1.0, 0.0) == 100.0);
    CHECK(RoundOrderQuantity(12.4, 5.0, 0.0) == 10.0);
    CHECK(RoundOrderQuantity(12.5, 5.0, 0.0) == 15.0);
    CHECK(RoundOrderQuantity(-3.0, 1.0, 0.0) == 0.0);
    CHECK(RoundOrderQuantity(1e-9, 1.0, 20.0) == 0.0);

    // 正订货量低于 MOQ 时上调到 MOQ 之上的最小粒度倍数
    CHECK(RoundOrderQuantity(8.0, 1.0, 20.0) == 20.0);
    CHECK(RoundOrderQuantity(8.0, 6.0, 20.0) == 24.0);
    CHECK(RoundOrderQuantity(30.2, 0.0, 20.0) == Approx(30.2));
}

TEST_CASE("B1: ExtractPolicies::ScenarioRecord", "[extractor]") {
    MasterSnapshot snapshot = SingleItemSnapshot(1000.0);
    AddForecast(snapshot, "p1", "l1", 7, 100.0, 0.0);
    OptimizerConfig config;
    OptimizationProblem problem = BuildProblem(MakePartition("P", {"p1"}, {"l1"}), snapshot,
                                               MakeHorizon(7, 1), config);
    Solution solution = MakeSolution(problem, {{"q_", 100.0000004}, {"y_", 1.0}, {"rop_", 100.0}});

    ExtractedPlan plan = ExtractPolicies(problem, solution, config, solution.status, PolicySource::Solver);

    REQUIRE(plan.policies.size() == 1);
    const Policy& p = plan.policies[0];
    CHECK(p.product_id == "p1");
    CHECK(p.location_id == "l1");
    CHECK(p.period == 7);
    CHECK(p.order_quantity == 100.0);
    CHECK(p.safety_stock == 0.0);
    CHECK(p.reorder_point == 100.0);
    CHECK(p.solver_status == SolveStatus::Optimal);
    CHECK(p.source == PolicySource::Solver);
    CHECK(p.objective_value == Approx(50.0));
    CHECK(p.planned_inventory == 0.0);
    CHECK(p.planned_shortage == 0.0);

    CHECK(plan.audit.orders == 1);
    CHECK(plan.audit.ordering_cost == Approx(50.0));
    CHECK(plan.audit.Total() == Approx(50.0));
}

TEST_CASE("B2: ExtractPolicies::ReorderPointNotBelowSafetyStock", "[extractor]") {
    MasterSnapshot snapshot = SingleItemSnapshot(1000.0);
    OptimizerConfig config;
    OptimizationProblem problem = BuildProblem(MakePartition("P", {"p1"}, {"l1"}), snapshot,
                                               MakeHorizon(0, 1), config);
    Solution solution = MakeSolution(problem, {{"q_", 100.0}, {"y_", 1.0}, {"ss_", 12.0}, {"rop_", 11.9999}});

    ExtractedPlan plan = ExtractPolicies(problem, solution, config, SolveStatus::Optimal, PolicySource::Solver);
    CHECK(plan.policies[0].safety_stock == 12.0);
    CHECK(plan.policies[0].reorder_point >= plan.policies[0].safety_stock);
}

TEST_CASE("C1: ExtractPolicies::MoqSnapRespectsCapacity", "[extractor]") {
    MasterSnapshot snapshot = SingleItemSnapshot(1000.0);
    snapshot.products["p1"].moq = 120.0;
    OptimizerConfig config;
    OptimizationProblem problem = BuildProblem(MakePartition("P", {"p1"}, {"l1"}), snapshot,
                                               MakeHorizon(0, 1), config);

    SECTION("snap up within capacity") {
        Solution solution = MakeSolution(problem, {{"q_", 100.0}, {"y_", 1.0}, {"rop_", 100.0}});
        ExtractedPlan plan = ExtractPolicies(problem, solution, config, SolveStatus::Optimal, PolicySource::Solver);
        CHECK(plan.policies[0].order_quantity == 120.0);
        CHECK(plan.policies[0].planned_inventory == Approx(20.0));
        CHECK(plan.audit.holding_cost == Approx(20.0));
    }

    SECTION("snap up beyond capacity raises") {
        snapshot.locations["l1"].capacity = 110.0;
        OptimizationProblem tight = BuildProblem(MakePartition("P", {"p1"}, {"l1"}), snapshot,
                                                 MakeHorizon(0, 1), config);
        Solution solution = MakeSolution(tight, {{"q_", 100.0}, {"y_", 1.0}, {"rop_", 100.0}});
        CHECK_THROWS_AS(ExtractPolicies(tight, solution, config, SolveStatus::Optimal, PolicySource::Solver),
                        PolicyRoundingError);
    }
}

TEST_CASE("C2: ExtractPolicies::RoundingPastCapacityRaises", "[extractor]") {
    MasterSnapshot snapshot = SingleItemSnapshot(100.6);
    OptimizerConfig config;
    OptimizationProblem problem = BuildProblem(MakePartition("P", {"p1"}, {"l1"}), snapshot,
                                               MakeHorizon(0, 1), config);
    Solution solution = MakeSolution(problem, {{"q_", 100.6}, {"y_", 1.0}, {"rop_", 100.0}});

    CHECK_THROWS_AS(ExtractPolicies(problem, solution, config, SolveStatus::Optimal, PolicySource::Solver),
                    PolicyRoundingError);
}

TEST_CASE("C3: ExtractPolicies::RejectsUnacceptedSolution", "[extractor]") {
    MasterSnapshot snapshot = SingleItemSnapshot(1000.0);
    OptimizerConfig config;
    OptimizationProblem problem = BuildProblem(MakePartition("P", {"p1"}, {"l1"}), snapshot,
                                               MakeHorizon(0, 1), config);
    Solution solution;
    solution.status = SolveStatus::Infeasible;
    CHECK_THROWS_AS(ExtractPolicies(problem, solution, config, solution.status, PolicySource::Solver),
                    std::invalid_argument);
}

TEST_CASE("D1: SimulatePlan::LeadTimeAndPipeline", "[extractor]") {
    MasterSnapshot snapshot = SingleItemSnapshot(1000.0, 3);
    snapshot.products["p1"].lead_time = 1;
    StartingPosition pos;
    pos.on_hand = 150.0;
    pos.pipeline[2] = 30.0;
    snapshot.positions[PairKey("p1", "l1")] = pos;
    OptimizerConfig config;

    vector<PairData> pairs = DerivePairData(MakePartition("P", {"p1"}, {"l1"}), snapshot,
                                            MakeHorizon(0, 3), config);
    PlanSimulation sim = SimulatePlan(pairs[0], {80.0, 0.0, 0.0});

    // t0: 150 -> 50; t1: 50 + 80 -> 30; t2: 30 + 30 -> 0, 缺货 40
    CHECK(sim.capacity_ok);
    CHECK(sim.inventory[0] == Approx(50.0));
    CHECK(sim.inventory[1] == Approx(30.0));
    CHECK(sim.inventory[2] == Approx(0.0));
    CHECK(sim.shortage[2] == Approx(40.0));
    CHECK(sim.audit.shortage_cost == Approx(400.0));
    CHECK(sim.audit.holding_cost == Approx(80.0));
    CHECK(sim.audit.orders == 1);
}

TEST_CASE("E1: Heuristic::ReorderPointPlan", "[extractor][heuristic]") {
    MasterSnapshot snapshot = SingleItemSnapshot(1000.0, 3);
    snapshot.products["p1"].moq = 150.0;
    OptimizerConfig config;
    vector<PairData> pairs = DerivePairData(MakePartition("P", {"p1"}, {"l1"}), snapshot,
                                            MakeHorizon(0, 3), config);

    ExtractedPlan plan;
    string reason;
    REQUIRE(RunReorderPointHeuristic(pairs, MakeHorizon(0, 3), config, 1.0, SolveStatus::Infeasible,
                                     plan, reason));
    REQUIRE(plan.policies.size() == 3);
    for (const Policy& p : plan.policies) {
        CHECK(p.source == PolicySource::Heuristic);
        CHECK(p.solver_status == SolveStatus::Infeasible);
        CHECK(p.reorder_point >= p.safety_stock);
        CHECK(p.safety_stock >= 0.0);
        bool moq_ok = p.order_quantity == 0.0 || p.order_quantity >= 150.0;
        CHECK(moq_ok);
    }
    // t0 订货至 ROP + d = 200
    CHECK(plan.policies[0].order_quantity == 200.0);
    CHECK(plan.audit.total_shortage == Approx(0.0));
}

TEST_CASE("E2: Heuristic::CapacityLimitsOrders", "[extractor][heuristic]") {
    MasterSnapshot snapshot = SingleItemSnapshot(50.0, 2);
    OptimizerConfig config;
    vector<PairData> pairs = DerivePairData(MakePartition("P", {"p1"}, {"l1"}), snapshot,
                                            MakeHorizon(0, 2), config);

    ExtractedPlan plan;
    string reason;
    REQUIRE(RunReorderPointHeuristic(pairs, MakeHorizon(0, 2), config, 1.0, SolveStatus::Infeasible,
                                     plan, reason));
    CHECK(plan.policies[0].order_quantity == 50.0);
    CHECK(plan.policies[0].planned_shortage == Approx(50.0));
    CHECK(plan.audit.total_shortage == Approx(100.0));
}

TEST_CASE("E3: Heuristic::NegativeCapacityFails", "[extractor][heuristic]") {
    MasterSnapshot snapshot = SingleItemSnapshot(-10.0);
    OptimizerConfig config;
    vector<PairData> pairs = DerivePairData(MakePartition("P", {"p1"}, {"l1"}), snapshot,
                                            MakeHorizon(0, 1), config);

    ExtractedPlan plan;
    string reason;
    CHECK_FALSE(RunReorderPointHeuristic(pairs, MakeHorizon(0, 1), config, 1.0, SolveStatus::Infeasible,
                                         plan, reason));
    CHECK(reason.find("库容") != string::npos);
    CHECK(plan.policies.empty());
}

TEST_CASE("D2: SimulatePlan::CapacityOnlyWhereOrdersLand", "[extractor][capacity]") {
    MasterSnapshot snapshot = SingleItemSnapshot(1000.0, 2);
    StartingPosition pos;
    pos.on_hand = 1500.0;
    snapshot.positions[PairKey("p1", "l1")] = pos;
    OptimizerConfig config;
    vector<PairData> pairs = DerivePairData(MakePartition("P", {"p1"}, {"l1"}), snapshot,
                                            MakeHorizon(0, 2), config);

    PlanSimulation idle = SimulatePlan(pairs[0], {0.0, 0.0});
    CHECK(idle.capacity_ok);
    CHECK(idle.available[0] == Approx(1500.0));
    CHECK_FALSE(idle.receives_order[0]);

    // t1: 1400 + 10 > 1000
    PlanSimulation ordered = SimulatePlan(pairs[0], {0.0, 10.0});
    CHECK_FALSE(ordered.capacity_ok);
    CHECK(ordered.violation_period == 1);
    CHECK(ordered.receives_order[1]);
}

TEST_CASE("E4: Heuristic::HeadroomCountsLaterArrivals", "[extractor][heuristic]") {
    // 第 0 期订单因供应延迟在第 3 期到货, 第 1 期订单在第 2 期先到
    MasterSnapshot snapshot = SingleItemSnapshot(200.0, 5);
    snapshot.products["p1"].lead_time = 1;
    double means[] = {100.0, 100.0, 0.0, 100.0, 100.0};
    double stddevs[] = {0.0, 50.0, 50.0, 0.0, 0.0};
    for (int t = 0; t < 5; ++t) {
        AddForecast(snapshot, "p1", "l1", t, means[t], stddevs[t]);
    }
    RiskAdjustment delay;
    delay.lead_time_multiplier = 3.0;
    snapshot.risk[PeriodKey("p1", "l1", 0)] = delay;
    OptimizerConfig config;
    vector<PairData> pairs = DerivePairData(MakePartition("P", {"p1"}, {"l1"}), snapshot,
                                            MakeHorizon(0, 5), config);
    REQUIRE(pairs[0].lead_time[0] == 3);

    ExtractedPlan plan;
    string reason;
    REQUIRE(RunReorderPointHeuristic(pairs, MakeHorizon(0, 5), config, 1.0, SolveStatus::Infeasible,
                                     plan, reason));
    REQUIRE(plan.policies.size() == 5);
    CHECK(plan.policies[0].order_quantity == 200.0);
    // 第 2 期到货的订单会让第 3 期超库容, 不下
    CHECK(plan.policies[1].order_quantity == 0.0);
    CHECK(plan.policies[3].order_quantity == 100.0);

    vector<double> orders;
    for (const Policy& p : plan.policies) orders.push_back(p.order_quantity);
    CHECK(SimulatePlan(pairs[0], orders).capacity_ok);
}
