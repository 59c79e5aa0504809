#include <gtest/gtest.h>

#include "../../common/test_helpers.h"

#include <vectra/benchmark/result_store.h>

#include <sstream>

namespace vectra::benchmark::test {

namespace {

BenchmarkResult makeResult(const std::string& name, double avg) {
    BenchmarkResult r;
    r.name = name;
    r.avgMs = avg;
    r.samples = 10;
    return r;
}

} // namespace

TEST(LatencySamplesTest, MeanOverSuccessfulSamplesOnly) {
    LatencySamples s;
    s.add(2.0);
    s.add(4.0);
    s.fail();
    s.add(-1.0);
    EXPECT_EQ(s.count(), 3u);
    EXPECT_EQ(s.failures(), 1u);
    EXPECT_DOUBLE_EQ(s.mean(), 2.0);
    EXPECT_DOUBLE_EQ(s.min(), 0.0);
    EXPECT_DOUBLE_EQ(s.max(), 4.0);

    auto plain = s.toResult("x");
    EXPECT_FALSE(plain.minMs.has_value());
    auto ranged = s.toResult("x", true);
    ASSERT_TRUE(ranged.minMs.has_value());
    EXPECT_DOUBLE_EQ(*ranged.maxMs, 4.0);
    EXPECT_EQ(ranged.failures, 1u);
}

TEST(ResultStoreTest, RecordOverwritesSameName) {
    ResultStore store;
    store.record(makeResult("query_1", 1.0));
    store.record(makeResult("query_1", 7.5));
    ASSERT_EQ(store.size(), 1u);
    EXPECT_DOUBLE_EQ(store.find("query_1")->avgMs, 7.5);
}

TEST(ResultStoreTest, RecordUnderExplicitName) {
    ResultStore store;
    store.record("renamed", makeResult("as_measured", 1.0));
    EXPECT_TRUE(store.contains("renamed"));
    EXPECT_FALSE(store.contains("as_measured"));
    EXPECT_EQ(store.find("renamed")->name, "renamed");
}

TEST(ResultStoreTest, SerializeThenLoadPreservesResults) {
    ResultStore store;
    auto conn = makeResult("connection", 1.25);
    conn.minMs = 0.5;
    conn.maxMs = 3.0;
    conn.failures = 2;
    store.record(conn);
    auto ins = makeResult("data_insertion_100b", 0.75);
    ins.extra["throughput_kbs"] = 130.2;
    ins.extra["size_bytes"] = 100;
    store.record(ins);
    auto q = makeResult("query_1", 2.0);
    q.extra["query"] = "SELECT 1";
    store.record(q);

    std::stringstream ss;
    store.serialize(ss);
    auto loaded = ResultStore::load(ss);
    ASSERT_TRUE(loaded) << loaded.error().message;
    EXPECT_EQ(loaded.value().results(), store.results());
}

TEST(ResultStoreTest, SerializationIsStable) {
    ResultStore a;
    a.record(makeResult("b", 1.0));
    a.record(makeResult("a", 2.0));
    ResultStore b;
    b.record(makeResult("a", 2.0));
    b.record(makeResult("b", 1.0));

    std::ostringstream sa, sb;
    a.serialize(sa);
    b.serialize(sb);
    EXPECT_EQ(sa.str(), sb.str());
    EXPECT_NE(sa.str().find("\"avg_time_ms\""), std::string::npos);
}

TEST(ResultStoreTest, LoadRejectsBadDocuments) {
    std::istringstream notJson("{ nope");
    auto r = ResultStore::load(notJson);
    ASSERT_FALSE(r);
    EXPECT_EQ(r.error().code, ErrorCode::InvalidData);

    std::istringstream missingAvg(R"({"connection": {"samples": 3}})");
    auto m = ResultStore::load(missingAvg);
    ASSERT_FALSE(m);
    EXPECT_EQ(m.error().code, ErrorCode::InvalidData);

    std::istringstream array("[1, 2]");
    EXPECT_FALSE(ResultStore::load(array));
}

TEST(ResultStoreTest, SaveAndLoadFile) {
    auto dir = vectra::tests::make_temp_dir("vectra_results_");
    auto path = dir / "performance_results.json";

    ResultStore store;
    store.record(makeResult("stress_rapid_operations", 0.1));
    ASSERT_TRUE(store.save(path));

    auto loaded = ResultStore::loadFile(path);
    ASSERT_TRUE(loaded);
    EXPECT_TRUE(loaded.value().contains("stress_rapid_operations"));

    auto missing = ResultStore::loadFile(dir / "absent.json");
    ASSERT_FALSE(missing);
    EXPECT_EQ(missing.error().code, ErrorCode::NotFound);

    std::filesystem::remove_all(dir);
}

TEST(ResultStoreTest, SaveToUnwritablePathFails) {
    ResultStore store;
    auto r = store.save("/nonexistent-dir/for/results.json");
    ASSERT_FALSE(r);
    EXPECT_EQ(r.error().code, ErrorCode::WriteError);
}

TEST(ResultStoreTest, SummaryOrderIsFixedAndSkipsCustomNames) {
    ResultStore store;
    store.record(makeResult("stress_large_data", 5.0));
    store.record(makeResult("vector_search_50", 1.0));
    store.record(makeResult("vector_search_5", 1.0));
    store.record(makeResult("data_insertion_10000b", 1.0));
    store.record(makeResult("data_insertion_100b", 1.0));
    store.record(makeResult("my_custom_metric", 1.0));
    store.record(makeResult("concurrent_10", 1.0));
    store.record(makeResult("query_1", 1.0));
    store.record(makeResult("connection", 1.0));
    store.record(makeResult("table_creation", 1.0));
    store.record(makeResult("stress_rapid_operations", 1.0));

    auto lines = store.summarize();
    ASSERT_EQ(lines.size(), 10u);
    EXPECT_EQ(lines[0].rfind("Connection", 0), 0u);
    EXPECT_EQ(lines[1].rfind("Table creation", 0), 0u);
    EXPECT_EQ(lines[2].rfind("Insertion 100 B", 0), 0u);
    EXPECT_EQ(lines[3].rfind("Insertion 10000 B", 0), 0u);
    EXPECT_EQ(lines[4].rfind("Query 1", 0), 0u);
    EXPECT_EQ(lines[5].rfind("Vector search (limit 5)", 0), 0u);
    EXPECT_EQ(lines[6].rfind("Vector search (limit 50)", 0), 0u);
    EXPECT_EQ(lines[7].rfind("Concurrency 10", 0), 0u);
    EXPECT_EQ(lines[8].rfind("Stress rapid", 0), 0u);
    EXPECT_EQ(lines[9].rfind("Stress large", 0), 0u);
    for (const auto& line : lines)
        EXPECT_EQ(line.find("my_custom_metric"), std::string::npos);

    // Still serialized.
    std::ostringstream out;
    store.serialize(out);
    EXPECT_NE(out.str().find("my_custom_metric"), std::string::npos);
}

} // namespace vectra::benchmark::test
