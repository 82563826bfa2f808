// test_output.cpp - 批次报告 JSON

#include <catch2/catch.hpp>

#include "rolling_horizon.h"

#include <filesystem>
#include <nlohmann/json.hpp>

namespace fs = std::filesystem;
using json = nlohmann::json;

TEST_CASE("A1: WriteBatchReportJson::EscapesControlCharacters", "[output]") {
    CycleResult result;
    PartitionOutcome outcome;
    outcome.partition_id = "P-l1-0";
    outcome.state = PartitionState::Failed;
    outcome.message = string("求解器错误:\x01 code=7\x1f\tline\n\"quoted\"");
    outcome.repair_steps.push_back("backlog\x02");
    result.outcomes.push_back(outcome);
    result.report.partitions = 1;
    result.report.failed = 1;
    result.report.failed_partitions.push_back("P-l1-0");

    fs::path path = fs::temp_directory_path() / "replenish_test_report" / "batch_report.json";
    fs::remove_all(path.parent_path());
    WriteBatchReportJson(path.string(), result);

    ifstream in(path.string());
    REQUIRE(in.is_open());
    json report;
    REQUIRE_NOTHROW(report = json::parse(in));
    in.close();

    REQUIRE(report["partitions"].size() == 1);
    CHECK(report["partitions"][0]["message"].get<string>() == outcome.message);
    CHECK(report["partitions"][0]["repair_steps"][0].get<string>() == "backlog\x02");
    CHECK(report["summary"]["failed"].get<int>() == 1);

    std::error_code ec;
    fs::remove_all(path.parent_path(), ec);
}
