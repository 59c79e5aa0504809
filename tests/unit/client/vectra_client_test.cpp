#include <gtest/gtest.h>

#include "../../common/fake_transports.h"

#include <vectra/client/placeholder_transport.h>
#include <vectra/client/vectra_client.h>

namespace vectra::test {

using vectra::tests::FakeTransport;

TEST(TransportModeTest, ParsesNamesAndAliases) {
    EXPECT_EQ(parseTransportMode("remote"), TransportMode::Remote);
    EXPECT_EQ(parseTransportMode("HTTP"), TransportMode::Remote);
    EXPECT_EQ(parseTransportMode("embedded"), TransportMode::Embedded);
    EXPECT_EQ(parseTransportMode("native"), TransportMode::Embedded);
    EXPECT_EQ(parseTransportMode("placeholder"), TransportMode::Placeholder);
    EXPECT_FALSE(parseTransportMode("carrier-pigeon").has_value());
    EXPECT_STREQ(transportModeName(TransportMode::Remote), "remote");
}

TEST(VectraClientTest, RemoteClientUsesHttpTransport) {
    ClientConfig cfg;
    cfg.host = "127.0.0.1";
    cfg.port = 1;
    auto client = VectraClient::create(cfg);
    ASSERT_TRUE(client);
    EXPECT_EQ(client.value().transport().name(), "remote");
    EXPECT_EQ(client.value().baseAddress(), "http://127.0.0.1:1");
}

TEST(VectraClientTest, PlaceholderClientReturnsFixedData) {
    ClientConfig cfg;
    cfg.transportMode = TransportMode::Placeholder;
    auto client = VectraClient::create(cfg);
    ASSERT_TRUE(client);

    EXPECT_TRUE(client.value().createTable("docs", "id INT"));
    EXPECT_TRUE(client.value().insertData("docs", {{"id", 1}}));

    auto info = client.value().getTableInfo("users");
    ASSERT_TRUE(info);
    EXPECT_EQ(info.value().name, "users");
    EXPECT_EQ(info.value().rows, 1000u);
    EXPECT_EQ(info.value().sizeBytes, 1024000u);
    EXPECT_EQ(info.value().createdAt, "2024-01-01T00:00:00Z");

    auto stats = client.value().getStats();
    ASSERT_TRUE(stats);
    EXPECT_EQ(stats.value().totalRows, 5000u);
    EXPECT_EQ(stats.value().totalSizeBytes, 5120000u);

    auto health = client.value().healthCheck();
    ASSERT_TRUE(health);
    EXPECT_EQ(health.value().status, "healthy");
}

TEST(VectraClientTest, VectorSearchDefaultsAndValidatesLimit) {
    VectraClient client(ClientConfig{}, std::make_shared<FakeTransport>(true));
    auto r = client.vectorSearch("q");
    ASSERT_TRUE(r);
    EXPECT_EQ(r.value().limit, 10u);

    auto zero = client.vectorSearch("q", 0);
    ASSERT_FALSE(zero);
    EXPECT_EQ(zero.error().code, ErrorCode::ValidationError);
}

TEST(VectraClientTest, FailuresAreReturnedNotRetried) {
    auto fake = std::make_shared<FakeTransport>(false);
    VectraClient client(ClientConfig{}, fake);
    auto r = client.executeQuery("SELECT * FROM test");
    ASSERT_FALSE(r);
    EXPECT_EQ(r.error().code, ErrorCode::TransportError);
    EXPECT_NE(r.error().message.find("Failed to execute query"), std::string::npos);
    EXPECT_EQ(fake->calls(), 1u);
}

} // namespace vectra::test
