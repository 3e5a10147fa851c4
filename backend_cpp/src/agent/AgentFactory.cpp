#include "agent/AgentFactory.hpp"
#include "tools/SimilaritySearchTool.hpp"
#include <spdlog/spdlog.h>

namespace concierge {

AgentFactory::AgentFactory(std::shared_ptr<ILanguageModel> llm, AgentFactoryOptions options)
    : llm_(std::move(llm)), options_(std::move(options)) {}

Result<std::shared_ptr<IRetrievalClient>> AgentFactory::connect(const IdentityToken& identity) const {
    std::shared_ptr<IRetrievalClient> client;
    if (!options_.retrieval_base_url.empty()) {
        client = std::make_shared<HttpRetrievalClient>(
            options_.retrieval_base_url, identity, options_.retrieval_timeout_ms);
    } else if (options_.local_search) {
        client = std::make_shared<LocalRetrievalClient>(options_.local_search);
    } else {
        return make_error(ErrorKind::ConfigurationError, "no retrieval backend configured");
    }

    // Fail here rather than on the first chat turn.
    auto reachable = client->ping();
    if (!reachable) {
        client->close();
        return reachable.error();
    }
    return client;
}

Result<AgentPtr> AgentFactory::create(const IdentityToken& identity) {
    if (!llm_) {
        return make_error(ErrorKind::ConfigurationError, "no language model configured");
    }

    try {
        auto client = connect(identity);
        if (!client) {
            spdlog::error("❌ Agent construction failed: {}", client.error().describe());
            return client.error();
        }

        auto tools = std::make_unique<ToolRegistry>();
        tools->register_tool(std::make_unique<SimilaritySearchTool>(client.value()));

        AgentPtr agent = std::make_shared<ConversationalAgent>(
            llm_, client.value(), std::move(tools), options_.agent);

        spdlog::info("🤖 Agent ready ({})", identity ? "authenticated" : "anonymous");
        return agent;
    } catch (const std::exception& e) {
        spdlog::error("❌ Agent construction threw: {}", e.what());
        return make_error(ErrorKind::ConfigurationError, "agent construction failed", e.what());
    }
}

} // namespace concierge
