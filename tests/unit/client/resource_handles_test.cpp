#include <gtest/gtest.h>

#include "../../common/fake_transports.h"

#include <vectra/client/in_memory_engine.h>
#include <vectra/client/in_process_transport.h>
#include <vectra/client/placeholder_transport.h>
#include <vectra/client/vectra_client.h>

namespace vectra::test {

using vectra::tests::FakeTransport;

class ResourceHandlesTest : public ::testing::Test {
protected:
    VectraClient placeholderClient() {
        ClientConfig cfg;
        cfg.transportMode = TransportMode::Placeholder;
        return VectraClient(cfg, std::make_shared<PlaceholderTransport>());
    }
};

TEST_F(ResourceHandlesTest, CreateIndexReturnsHandle) {
    auto client = placeholderClient();
    auto index = client.createVectorIndex("docs", "embedding");
    ASSERT_TRUE(index);
    EXPECT_EQ(index.value().id(), "idx_docs_embedding");
    EXPECT_EQ(index.value().table(), "docs");
    EXPECT_EQ(index.value().column(), "embedding");
}

TEST_F(ResourceHandlesTest, IndexSearchEchoesLimit) {
    auto client = placeholderClient();
    auto index = client.createVectorIndex("docs", "embedding");
    ASSERT_TRUE(index);

    auto r = index.value().search({0.1f, 0.2f, 0.3f}, 5);
    ASSERT_TRUE(r);
    EXPECT_EQ(r.value().limit, 5u);
    EXPECT_GT(r.value().results.size(), 0u);
    EXPECT_LE(r.value().results.size(), 5u);
}

TEST_F(ResourceHandlesTest, IndexSearchNeverExceedsLimit) {
    auto client = placeholderClient();
    auto index = client.createVectorIndex("docs", "embedding");
    ASSERT_TRUE(index);

    auto r = index.value().search({0.1f, 0.2f}, 1);
    ASSERT_TRUE(r);
    EXPECT_EQ(r.value().limit, 1u);
    EXPECT_EQ(r.value().results.size(), 1u);
}

TEST_F(ResourceHandlesTest, PlaceholderInsertVectorSucceeds) {
    auto client = placeholderClient();
    auto index = client.createVectorIndex("docs", "embedding");
    ASSERT_TRUE(index);
    EXPECT_TRUE(index.value().insertVector(42, {0.1f, 0.2f, 0.3f}));
}

TEST_F(ResourceHandlesTest, IndexSearchDefaultsToTen) {
    auto client = placeholderClient();
    auto index = client.createVectorIndex("docs", "embedding");
    ASSERT_TRUE(index);
    auto r = index.value().search({1.0f});
    ASSERT_TRUE(r);
    EXPECT_EQ(r.value().limit, 10u);
}

TEST_F(ResourceHandlesTest, IndexSearchRejectsZeroLimit) {
    auto client = placeholderClient();
    auto index = client.createVectorIndex("docs", "embedding");
    ASSERT_TRUE(index);
    auto r = index.value().search({1.0f}, 0);
    ASSERT_FALSE(r);
    EXPECT_EQ(r.error().code, ErrorCode::ValidationError);
}

TEST_F(ResourceHandlesTest, UnsubscribeTwiceSucceeds) {
    auto client = placeholderClient();
    auto sub = client.subscribeStream("news");
    ASSERT_TRUE(sub);
    EXPECT_EQ(sub.value().topic(), "news");
    EXPECT_TRUE(sub.value().unsubscribe());
    EXPECT_TRUE(sub.value().unsubscribe());
}

TEST_F(ResourceHandlesTest, EmbeddedHandlesDispatchThroughEngine) {
    auto engine = std::make_shared<InMemoryEngine>();
    VectraClient client(ClientConfig{}, std::make_shared<InProcessTransport>(engine));

    ASSERT_TRUE(client.createTable("docs", "id INT, embedding VECTOR"));
    for (int i = 0; i < 4; ++i)
        ASSERT_TRUE(client.insertData("docs", {{"id", i}}));

    auto index = client.createVectorIndex("docs", "embedding");
    ASSERT_TRUE(index) << index.error().message;
    auto r = index.value().search({0.5f, 0.5f}, 5);
    ASSERT_TRUE(r) << r.error().message;
    EXPECT_EQ(r.value().limit, 5u);
    EXPECT_GT(r.value().results.size(), 0u);
    EXPECT_LE(r.value().results.size(), 5u);

    EXPECT_TRUE(index.value().insertVector(7, {0.5f, 0.5f}));
    EXPECT_TRUE(index.value().insertVector(8, {0.25f, 0.75f}));
    EXPECT_EQ(engine->vectorCount(index.value().id()), 2u);

    EXPECT_TRUE(index.value().deleteIndex());
    auto afterDelete = index.value().insertVector(9, {1.0f, 0.0f});
    ASSERT_FALSE(afterDelete);
    EXPECT_EQ(afterDelete.error().code, ErrorCode::TransportError);
    EXPECT_EQ(afterDelete.error().message.rfind("Failed to insert vector: ", 0), 0u);

    EXPECT_TRUE(index.value().deleteIndex());

    auto sub = client.subscribeStream("updates");
    ASSERT_TRUE(sub);
    EXPECT_EQ(engine->subscriptionCount(), 1u);
    EXPECT_TRUE(sub.value().unsubscribe());
    EXPECT_TRUE(sub.value().unsubscribe());
    EXPECT_EQ(engine->subscriptionCount(), 0u);
}

TEST_F(ResourceHandlesTest, HandleErrorsPropagateUnchanged) {
    auto fake = std::make_shared<FakeTransport>(true);
    VectraClient client(ClientConfig{}, fake);
    auto index = client.createVectorIndex("t", "v");
    auto sub = client.subscribeStream("topic");
    ASSERT_TRUE(index);
    ASSERT_TRUE(sub);

    fake->setSucceed(false);
    auto r = index.value().search({1.0f}, 3);
    ASSERT_FALSE(r);
    EXPECT_EQ(r.error().code, ErrorCode::TransportError);
    EXPECT_EQ(r.error().message, "Failed to search index: simulated failure");

    auto v = index.value().insertVector(1, {1.0f});
    ASSERT_FALSE(v);
    EXPECT_EQ(v.error().message, "Failed to insert vector: simulated failure");

    auto u = sub.value().unsubscribe();
    ASSERT_FALSE(u);
    EXPECT_EQ(u.error().message, "Failed to unsubscribe: simulated failure");
}

TEST_F(ResourceHandlesTest, HandleWithoutTransportFails) {
    IndexHandle index(IndexRef{"idx", "t", "c", "created"}, nullptr);
    auto r = index.search({1.0f});
    ASSERT_FALSE(r);
    EXPECT_EQ(r.error().code, ErrorCode::TransportError);
    auto v = index.insertVector(1, {1.0f});
    ASSERT_FALSE(v);
    EXPECT_EQ(v.error().code, ErrorCode::TransportError);
}

TEST_F(ResourceHandlesTest, FakeTransportSeesInsertedVectorIds) {
    auto fake = std::make_shared<FakeTransport>(true);
    VectraClient client(ClientConfig{}, fake);
    auto index = client.createVectorIndex("t", "v");
    ASSERT_TRUE(index);
    ASSERT_TRUE(index.value().insertVector(3, {1.0f}));
    ASSERT_TRUE(index.value().insertVector(5, {2.0f}));
    EXPECT_EQ(fake->insertedVectors(), (std::vector<std::uint64_t>{3, 5}));
}

} // namespace vectra::test
