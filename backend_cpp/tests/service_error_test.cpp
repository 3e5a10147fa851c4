#include <gtest/gtest.h>
#include <cstdlib>
#include "app_config.hpp"
#include "cache_manager.hpp"
#include "service_error.hpp"

using namespace concierge;

TEST(ServiceError, HttpStatusMapping) {
    EXPECT_EQ(http_status_for(ErrorKind::InvalidInput), 400);
    EXPECT_EQ(http_status_for(ErrorKind::SessionNotFound), 400);
    EXPECT_EQ(http_status_for(ErrorKind::ConfigurationError), 500);
    EXPECT_EQ(http_status_for(ErrorKind::AgentInvocationError), 500);
    EXPECT_EQ(http_status_for(ErrorKind::UpstreamError), 502);
}

TEST(ServiceError, DescribeIncludesCauseWhenPresent) {
    EXPECT_EQ(make_error(ErrorKind::InvalidInput, "No user query").describe(), "InvalidInput: No user query");
    EXPECT_EQ(make_error(ErrorKind::AgentInvocationError, "Error invoking agent", "timeout").describe(),
              "AgentInvocationError: Error invoking agent (timeout)");
}

TEST(ServiceError, ResultHoldsValueOrError) {
    Result<int> good(7);
    ASSERT_TRUE(good.ok());
    EXPECT_EQ(good.value(), 7);

    Result<int> bad(make_error(ErrorKind::UpstreamError, "down"));
    EXPECT_FALSE(bad);
    EXPECT_EQ(bad.error().message, "down");

    Result<void> done;
    EXPECT_TRUE(done.ok());
}

TEST(AppConfig, ReadsEnvironmentAndKeepsDefaultsForBadValues) {
    setenv("PORT", "9090", 1);
    setenv("AGENT_MAX_STEPS", "many", 1);
    setenv("RETRIEVAL_SERVICE_URL", "http://retrieval:8080", 1);
    unsetenv("SHUTDOWN_GRACE_MS");

    AppConfig config = AppConfig::from_env();
    EXPECT_EQ(config.port, 9090);
    EXPECT_EQ(config.agent_max_steps, 6);
    EXPECT_EQ(config.retrieval_service_url, "http://retrieval:8080");
    EXPECT_EQ(config.shutdown_grace_ms, 2000);

    unsetenv("PORT");
    unsetenv("AGENT_MAX_STEPS");
    unsetenv("RETRIEVAL_SERVICE_URL");
}

TEST(EmbeddingCache, EvictsLeastRecentlyUsed) {
    CacheManager cache(2);
    cache.set_embedding("text-embedding-004", "a", {1.0f});
    cache.set_embedding("text-embedding-004", "b", {2.0f});
    ASSERT_TRUE(cache.get_embedding("text-embedding-004", "a").has_value()); // "b" is now least recent
    cache.set_embedding("text-embedding-004", "c", {3.0f});

    EXPECT_TRUE(cache.get_embedding("text-embedding-004", "a").has_value());
    EXPECT_FALSE(cache.get_embedding("text-embedding-004", "b").has_value());
    EXPECT_EQ(cache.embedding_count(), 2u);
    EXPECT_EQ(cache.embedding_stats().first, 2u);
    EXPECT_EQ(cache.embedding_stats().second, 1u);
}

TEST(EmbeddingCache, ModelIsPartOfTheKey) {
    CacheManager cache;
    cache.set_embedding("model-a", "coffee", {1.0f, 0.0f});
    EXPECT_FALSE(cache.get_embedding("model-b", "coffee").has_value());
    EXPECT_EQ(cache.get_embedding("model-a", "coffee").value(), std::vector<float>({1.0f, 0.0f}));
}
