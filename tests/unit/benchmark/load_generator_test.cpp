#include <gtest/gtest.h>

#include "../../common/fake_transports.h"

#include <vectra/benchmark/load_generator.h>

namespace vectra::benchmark::test {

using vectra::tests::FakeTransport;

TEST(LoadGeneratorTest, AllWorkersCompleteAgainstHealthyTransport) {
    auto fake = std::make_shared<FakeTransport>(true);
    VectraClient client(ClientConfig{}, fake);
    ConcurrentLoadGenerator generator(client);

    auto r = generator.run(10);
    ASSERT_TRUE(r) << r.error().message;
    EXPECT_EQ(r.value().level, 10u);
    EXPECT_EQ(r.value().completed, 10u);
    EXPECT_EQ(r.value().failed, 0u);
    EXPECT_GT(r.value().throughput, 0.0);
    EXPECT_GT(r.value().elapsedSeconds, 0.0);
    EXPECT_EQ(fake->calls(), 10u);
}

TEST(LoadGeneratorTest, AllWorkersFailAgainstBrokenTransport) {
    VectraClient client(ClientConfig{}, std::make_shared<FakeTransport>(false));
    ConcurrentLoadGenerator generator(client);

    for (std::size_t level : {1u, 5u, 20u}) {
        auto r = generator.run(level);
        ASSERT_TRUE(r);
        EXPECT_EQ(r.value().completed, 0u);
        EXPECT_EQ(r.value().failed, level);
        EXPECT_DOUBLE_EQ(r.value().throughput, 0.0);
    }
}

TEST(LoadGeneratorTest, CountsAlwaysAddUpToLevel) {
    VectraClient client(ClientConfig{}, std::make_shared<FakeTransport>(true));
    ConcurrentLoadGenerator generator(client);
    for (std::size_t level = 1; level <= 32; level *= 2) {
        auto r = generator.run(level);
        ASSERT_TRUE(r);
        EXPECT_EQ(r.value().completed + r.value().failed, level);
    }
}

TEST(LoadGeneratorTest, ZeroLevelIsRejected) {
    VectraClient client(ClientConfig{}, std::make_shared<FakeTransport>(true));
    ConcurrentLoadGenerator generator(client);
    auto r = generator.run(0);
    ASSERT_FALSE(r);
    EXPECT_EQ(r.error().code, ErrorCode::ValidationError);
}

} // namespace vectra::benchmark::test
