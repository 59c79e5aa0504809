#include <gtest/gtest.h>

#include <vectra/client/in_memory_engine.h>

#include <thread>
#include <vector>

namespace vectra::test {

class InMemoryEngineTest : public ::testing::Test {
protected:
    InMemoryEngine engine_;
};

TEST_F(InMemoryEngineTest, QueryCountsRowsOfReferencedTable) {
    ASSERT_TRUE(engine_.createTable("items", "id INT"));
    ASSERT_TRUE(engine_.insert("items", {{"id", 1}}));
    ASSERT_TRUE(engine_.insert("items", {{"id", 2}}));

    auto r = engine_.executeQuery("select id from items where id > 0");
    ASSERT_TRUE(r);
    EXPECT_EQ(r.value()["rows"], 2);

    auto unknown = engine_.executeQuery("SELECT * FROM nowhere");
    ASSERT_TRUE(unknown);
    EXPECT_EQ(unknown.value()["rows"], 0);
}

TEST_F(InMemoryEngineTest, InsertCreatesMissingTable) {
    ASSERT_TRUE(engine_.insert("auto", {{"id", 1}}));
    auto info = engine_.tableInfo("auto");
    ASSERT_TRUE(info);
    EXPECT_EQ(info.value().rows, 1u);
    EXPECT_GT(info.value().sizeBytes, 0u);
    EXPECT_FALSE(info.value().createdAt.empty());
}

TEST_F(InMemoryEngineTest, UnknownTableInfoIsNotFound) {
    auto info = engine_.tableInfo("missing");
    ASSERT_FALSE(info);
    EXPECT_EQ(info.error().code, ErrorCode::NotFound);
}

TEST_F(InMemoryEngineTest, VectorSearchIsCapped) {
    auto hits = engine_.vectorSearch("anything", 50);
    ASSERT_TRUE(hits);
    EXPECT_EQ(hits.value().size(), 3u);
    auto one = engine_.vectorSearch("anything", 1);
    ASSERT_TRUE(one);
    EXPECT_EQ(one.value().size(), 1u);
}

TEST_F(InMemoryEngineTest, IndexLifecycle) {
    auto missing = engine_.createIndex("nope", "v");
    ASSERT_FALSE(missing);
    EXPECT_EQ(missing.error().code, ErrorCode::NotFound);

    ASSERT_TRUE(engine_.createTable("docs", "v VECTOR"));
    auto id = engine_.createIndex("docs", "v");
    ASSERT_TRUE(id);
    EXPECT_EQ(id.value(), "idx_docs_v");

    EXPECT_TRUE(engine_.dropIndex(id.value()));
    EXPECT_TRUE(engine_.dropIndex(id.value()));
    EXPECT_FALSE(engine_.searchIndex(id.value(), {1.0f}, 3));
}

TEST_F(InMemoryEngineTest, InsertVectorStoresByIdAndChecksDimensions) {
    auto unknown = engine_.insertVector("idx_none", 1, {1.0f});
    ASSERT_FALSE(unknown);
    EXPECT_EQ(unknown.error().code, ErrorCode::NotFound);

    ASSERT_TRUE(engine_.createTable("docs", "v VECTOR"));
    auto id = engine_.createIndex("docs", "v");
    ASSERT_TRUE(id);

    EXPECT_TRUE(engine_.insertVector(id.value(), 1, {0.1f, 0.2f, 0.3f}));
    EXPECT_TRUE(engine_.insertVector(id.value(), 2, {0.4f, 0.5f, 0.6f}));
    EXPECT_TRUE(engine_.insertVector(id.value(), 1, {0.7f, 0.8f, 0.9f}));
    EXPECT_EQ(engine_.vectorCount(id.value()), 2u);

    auto empty = engine_.insertVector(id.value(), 3, {});
    ASSERT_FALSE(empty);
    EXPECT_EQ(empty.error().code, ErrorCode::InvalidArgument);

    auto wrongDim = engine_.insertVector(id.value(), 3, {1.0f});
    ASSERT_FALSE(wrongDim);
    EXPECT_EQ(wrongDim.error().code, ErrorCode::InvalidArgument);
    EXPECT_EQ(engine_.vectorCount(id.value()), 2u);

    ASSERT_TRUE(engine_.dropIndex(id.value()));
    EXPECT_EQ(engine_.vectorCount(id.value()), 0u);
}

TEST_F(InMemoryEngineTest, StatsAggregateTables) {
    ASSERT_TRUE(engine_.createTable("a", ""));
    ASSERT_TRUE(engine_.createTable("b", ""));
    ASSERT_TRUE(engine_.insert("a", {{"id", 1}}));

    auto tables = engine_.listTables();
    ASSERT_TRUE(tables);
    EXPECT_EQ(tables.value(), (std::vector<std::string>{"a", "b"}));

    auto stats = engine_.stats();
    ASSERT_TRUE(stats);
    EXPECT_EQ(stats.value().totalTables, 2u);
    EXPECT_EQ(stats.value().totalRows, 1u);
}

TEST_F(InMemoryEngineTest, ConcurrentInsertsAreAllKept) {
    std::vector<std::thread> threads;
    for (int t = 0; t < 8; ++t) {
        threads.emplace_back([this, t] {
            for (int i = 0; i < 100; ++i)
                (void)engine_.insert("shared", {{"t", t}, {"i", i}});
        });
    }
    for (auto& th : threads)
        th.join();
    auto info = engine_.tableInfo("shared");
    ASSERT_TRUE(info);
    EXPECT_EQ(info.value().rows, 800u);
}

TEST_F(InMemoryEngineTest, HealthReportsHealthy) {
    auto h = engine_.health();
    ASSERT_TRUE(h);
    EXPECT_EQ(h.value().status, "healthy");
    EXPECT_FALSE(h.value().version.empty());
}

} // namespace vectra::test
