#pragma once
#include <atomic>
#include <memory>
#include <string>
#include <nlohmann/json.hpp>
#include "agent/AgentTypes.hpp"
#include "providers.hpp"
#include "retrieval_client.hpp"
#include "tools/ToolRegistry.hpp"

namespace concierge {

struct AgentOptions {
    int max_steps = 6;
    size_t observation_cap = 5000; // bytes of tool output kept per step
};

// Reason/act loop: the model either answers with FINAL_ANSWER or asks for a
// JSON tool call, whose observation is fed back on the next step.
class ConversationalAgent : public IAgent {
public:
    ConversationalAgent(
        std::shared_ptr<ILanguageModel> llm,
        std::shared_ptr<IRetrievalClient> client,
        std::unique_ptr<ToolRegistry> tool_registry,
        AgentOptions options = {}
    );
    ~ConversationalAgent() override;

    std::string invoke(const std::string& input) override;
    void close() override;

    bool is_closed() const { return closed_.load(); }

    // Pulls the JSON object out of a model reply (fenced ```json block first,
    // then the outermost braces). Returns an empty object when there is none.
    static nlohmann::json extract_tool_call(const std::string& raw);

private:
    std::shared_ptr<ILanguageModel> llm_;
    std::shared_ptr<IRetrievalClient> client_;
    std::unique_ptr<ToolRegistry> tool_registry_;
    AgentOptions options_;
    std::atomic<bool> closed_{false};

    std::string build_prompt(const std::string& input, const std::string& scratchpad) const;
};

} // namespace concierge
