#include <gtest/gtest.h>
#include "agent/ConversationalAgent.hpp"
#include "tools/SimilaritySearchTool.hpp"
#include "test_doubles.hpp"

using namespace concierge;
using namespace concierge::fakes;

namespace {

struct AgentRig {
    std::shared_ptr<ScriptedLanguageModel> llm;
    std::shared_ptr<FakeRetrievalClient> client = std::make_shared<FakeRetrievalClient>();
    std::unique_ptr<ConversationalAgent> agent;

    explicit AgentRig(std::vector<std::string> replies, int max_steps = 6)
        : llm(std::make_shared<ScriptedLanguageModel>(std::move(replies))) {
        auto tools = std::make_unique<ToolRegistry>();
        tools->register_tool(std::make_unique<SimilaritySearchTool>(client));
        AgentOptions options;
        options.max_steps = max_steps;
        agent = std::make_unique<ConversationalAgent>(llm, client, std::move(tools), options);
    }
};

} // namespace

TEST(ConversationalAgent, ReturnsFinalAnswerText) {
    AgentRig rig({"FINAL_ANSWER:  The nearest pharmacy is by gate A3.  "});
    EXPECT_EQ(rig.agent->invoke("pharmacy?"), "The nearest pharmacy is by gate A3.");
    ASSERT_EQ(rig.llm->prompts.size(), 1u);
    EXPECT_NE(rig.llm->prompts[0].find("pharmacy?"), std::string::npos);
    EXPECT_NE(rig.llm->prompts[0].find("semantic_similarity_search"), std::string::npos);
}

TEST(ConversationalAgent, RunsToolCallThenAnswers) {
    AgentRig rig({
        "```json\n{\"tool\": \"semantic_similarity_search\", \"parameters\": {\"query\": \"vegan food\", \"top_k\": 2}}\n```",
        "FINAL_ANSWER: Try Green Leaf near gate C4."
    });
    rig.client->primed = {{make_amenity(11, "Green Leaf"), 0.93f}};

    EXPECT_EQ(rig.agent->invoke("anything vegan?"), "Try Green Leaf near gate C4.");
    EXPECT_EQ(rig.client->last_query, "vegan food");
    EXPECT_EQ(rig.client->last_top_k, 2);
    ASSERT_EQ(rig.llm->prompts.size(), 2u);
    EXPECT_NE(rig.llm->prompts[1].find("Green Leaf"), std::string::npos);
}

TEST(ConversationalAgent, FinalAnswerAsToolCallIsAccepted) {
    AgentRig rig({R"({"tool": "FINAL_ANSWER", "parameters": {"answer": "Lounge is on level 2."}})"});
    EXPECT_EQ(rig.agent->invoke("lounge?"), "Lounge is on level 2.");
}

TEST(ConversationalAgent, MalformedReplyGetsCorrectiveFeedback) {
    AgentRig rig({"I think I should search.", "FINAL_ANSWER: done"});
    EXPECT_EQ(rig.agent->invoke("q"), "done");
    ASSERT_EQ(rig.llm->prompts.size(), 2u);
    EXPECT_NE(rig.llm->prompts[1].find("not a valid JSON tool call"), std::string::npos);
}

TEST(ConversationalAgent, ThrowsWhenStepsRunOut) {
    AgentRig rig({R"({"tool": "semantic_similarity_search", "parameters": {"query": "x"}})"}, 3);
    EXPECT_THROW(rig.agent->invoke("loop forever"), std::runtime_error);
    EXPECT_EQ(rig.llm->prompts.size(), 3u);
}

TEST(ConversationalAgent, EmptyModelReplyThrows) {
    AgentRig rig({"   "});
    EXPECT_THROW(rig.agent->invoke("hello"), std::runtime_error);
}

TEST(ConversationalAgent, ModelFailurePropagates) {
    AgentRig rig(std::vector<std::string>{});
    EXPECT_THROW(rig.agent->invoke("hello"), std::runtime_error);
}

TEST(ConversationalAgent, CloseReleasesClientOnceAndBlocksInvoke) {
    AgentRig rig({"FINAL_ANSWER: hi"});
    rig.agent->close();
    rig.agent->close();
    EXPECT_TRUE(rig.agent->is_closed());
    EXPECT_EQ(rig.client->close_calls.load(), 1);
    EXPECT_THROW(rig.agent->invoke("hello"), std::runtime_error);
}

TEST(ConversationalAgent, DestructorReleasesUnclosedClient) {
    auto client = std::make_shared<FakeRetrievalClient>();
    {
        ConversationalAgent agent(std::make_shared<ScriptedLanguageModel>(std::vector<std::string>{"FINAL_ANSWER: x"}),
                                  client, nullptr);
    }
    EXPECT_TRUE(client->is_closed());
}

TEST(ConversationalAgent, ExtractsToolCallFromSurroundingText) {
    auto call = ConversationalAgent::extract_tool_call(
        "Let me look that up.\n{\"tool\": \"semantic_similarity_search\", \"parameters\": {\"query\": \"atm\"}}\nThanks");
    EXPECT_EQ(call["tool"], "semantic_similarity_search");
    EXPECT_EQ(call["parameters"]["query"], "atm");

    EXPECT_TRUE(ConversationalAgent::extract_tool_call("no json here").empty());
    EXPECT_TRUE(ConversationalAgent::extract_tool_call("{broken").empty());
}
