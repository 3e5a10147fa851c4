#include <gtest/gtest.h>
#include <httplib.h>
#include <mutex>
#include <thread>
#include "agent/AgentFactory.hpp"
#include "test_doubles.hpp"

using namespace concierge;
using namespace concierge::fakes;

namespace {

std::shared_ptr<SimilaritySearch> local_search_over(std::shared_ptr<RecordingVectorStore> store) {
    return std::make_shared<SimilaritySearch>(std::make_shared<FixedEmbedder>(std::vector<float>{1.0f}), store);
}

// Stand-in retrieval service on an ephemeral port that records the
// Authorization header of every request.
class RecordingRetrievalService {
public:
    RecordingRetrievalService() {
        server_.Get("/", [this](const httplib::Request& req, httplib::Response& res) {
            record(req);
            res.set_content(R"({"message": "Hello World"})", "application/json");
        });
        server_.Get("/semantic_similarity_search", [this](const httplib::Request& req, httplib::Response& res) {
            record(req);
            res.set_content(R"([{"id": 9, "name": "Bean Bar", "similarity": 0.91}])", "application/json");
        });
        port_ = server_.bind_to_any_port("127.0.0.1");
        if (port_ <= 0) return;
        listener_ = std::thread([this] { server_.listen_after_bind(); });
        while (!server_.is_running()) std::this_thread::sleep_for(std::chrono::milliseconds(5));
    }

    ~RecordingRetrievalService() {
        if (!listener_.joinable()) return;
        server_.stop();
        listener_.join();
    }

    std::string url() const { return "http://127.0.0.1:" + std::to_string(port_); }
    int port() const { return port_; }

    std::vector<std::string> authorizations() {
        std::lock_guard<std::mutex> lock(mutex_);
        return authorizations_;
    }

private:
    httplib::Server server_;
    std::thread listener_;
    int port_ = -1;
    std::mutex mutex_;
    std::vector<std::string> authorizations_;

    void record(const httplib::Request& req) {
        std::lock_guard<std::mutex> lock(mutex_);
        authorizations_.push_back(req.get_header_value("Authorization"));
    }
};

} // namespace

TEST(AgentFactory, BuildsWorkingAgentOverLocalSearch) {
    auto store = std::make_shared<RecordingVectorStore>();
    store->primed = {{make_amenity(5, "Sleep Pods"), 0.82f}};
    auto llm = std::make_shared<ScriptedLanguageModel>(std::vector<std::string>{
        R"({"tool": "semantic_similarity_search", "parameters": {"query": "nap"}})",
        "FINAL_ANSWER: Sleep Pods, gate 5."
    });

    AgentFactoryOptions options;
    options.local_search = local_search_over(store);
    AgentFactory factory(llm, options);

    auto agent = factory.create(std::nullopt);
    ASSERT_TRUE(agent.ok()) << agent.error().describe();
    EXPECT_EQ(agent.value()->invoke("where can I nap"), "Sleep Pods, gate 5.");
    EXPECT_EQ(store->last_top_k, 5);
    EXPECT_FLOAT_EQ(store->last_threshold, 0.7f);
}

TEST(AgentFactory, NoBackendIsConfigurationError) {
    AgentFactory factory(std::make_shared<ScriptedLanguageModel>(std::vector<std::string>{"FINAL_ANSWER: x"}), {});
    auto agent = factory.create(std::nullopt);
    ASSERT_FALSE(agent.ok());
    EXPECT_EQ(agent.error().kind, ErrorKind::ConfigurationError);
}

TEST(AgentFactory, NoLanguageModelIsConfigurationError) {
    AgentFactoryOptions options;
    options.local_search = local_search_over(std::make_shared<RecordingVectorStore>());
    AgentFactory factory(nullptr, options);
    auto agent = factory.create(std::string("token"));
    ASSERT_FALSE(agent.ok());
    EXPECT_EQ(agent.error().kind, ErrorKind::ConfigurationError);
}

TEST(AgentFactory, UnreachableRetrievalServiceFailsFast) {
    AgentFactoryOptions options;
    options.retrieval_base_url = "http://127.0.0.1:1";
    options.retrieval_timeout_ms = 500;
    AgentFactory factory(std::make_shared<ScriptedLanguageModel>(std::vector<std::string>{"FINAL_ANSWER: x"}), options);

    auto agent = factory.create(std::string("id-token"));
    ASSERT_FALSE(agent.ok());
    EXPECT_EQ(agent.error().kind, ErrorKind::ConfigurationError);
    EXPECT_EQ(http_status_for(agent.error().kind), 500);
}

TEST(HttpRetrievalClient, CarriesIdentityAndClosesOnce) {
    HttpRetrievalClient anonymous("http://127.0.0.1:1", std::nullopt, 200);
    HttpRetrievalClient signed_in("http://127.0.0.1:1/", std::string("abc"), 200);
    EXPECT_FALSE(anonymous.has_identity());
    EXPECT_TRUE(signed_in.has_identity());

    signed_in.close();
    signed_in.close();
    EXPECT_TRUE(signed_in.is_closed());
    auto result = signed_in.search("coffee", 3);
    ASSERT_FALSE(result.ok());
    EXPECT_EQ(result.error().kind, ErrorKind::UpstreamError);
}

TEST(HttpRetrievalClient, SendsBearerIdentityOnEveryRequest) {
    RecordingRetrievalService service;
    ASSERT_GT(service.port(), 0);

    HttpRetrievalClient signed_in(service.url(), std::string("google-id-token"), 2000);
    ASSERT_TRUE(signed_in.ping().ok());
    auto result = signed_in.search("coffee", 3);
    ASSERT_TRUE(result.ok()) << result.error().describe();
    ASSERT_EQ(result.value().size(), 1u);
    EXPECT_EQ(result.value()[0].record.name, "Bean Bar");

    auto seen = service.authorizations();
    ASSERT_EQ(seen.size(), 2u);
    EXPECT_EQ(seen[0], "Bearer google-id-token");
    EXPECT_EQ(seen[1], "Bearer google-id-token");
}

TEST(HttpRetrievalClient, AnonymousClientSendsNoAuthorization) {
    RecordingRetrievalService service;
    ASSERT_GT(service.port(), 0);

    HttpRetrievalClient anonymous(service.url(), std::nullopt, 2000);
    ASSERT_TRUE(anonymous.ping().ok());

    auto seen = service.authorizations();
    ASSERT_EQ(seen.size(), 1u);
    EXPECT_EQ(seen[0], "");
}

TEST(LocalRetrievalClient, StopsServingAfterClose) {
    auto store = std::make_shared<RecordingVectorStore>();
    LocalRetrievalClient client(local_search_over(store));
    EXPECT_TRUE(client.ping().ok());
    EXPECT_TRUE(client.search("coffee", 2).ok());

    client.close();
    EXPECT_TRUE(client.is_closed());
    EXPECT_FALSE(client.search("coffee", 2).ok());
    EXPECT_EQ(store->calls.load(), 1);
}
