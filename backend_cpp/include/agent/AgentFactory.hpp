#pragma once
#include <memory>
#include <string>
#include "agent/AgentTypes.hpp"
#include "agent/ConversationalAgent.hpp"
#include "providers.hpp"
#include "service_error.hpp"
#include "similarity_search.hpp"

namespace concierge {

class IAgentFactory {
public:
    virtual ~IAgentFactory() = default;
    // ConfigurationError when an upstream the agent depends on is unreachable.
    virtual Result<AgentPtr> create(const IdentityToken& identity) = 0;
};

struct AgentFactoryOptions {
    // Retrieval service base URL. When empty, local_search is used in-process.
    std::string retrieval_base_url;
    std::shared_ptr<SimilaritySearch> local_search;
    int retrieval_timeout_ms = 10000;
    AgentOptions agent;
};

class AgentFactory : public IAgentFactory {
public:
    AgentFactory(std::shared_ptr<ILanguageModel> llm, AgentFactoryOptions options);

    Result<AgentPtr> create(const IdentityToken& identity) override;

private:
    std::shared_ptr<ILanguageModel> llm_;
    AgentFactoryOptions options_;

    Result<std::shared_ptr<IRetrievalClient>> connect(const IdentityToken& identity) const;
};

} // namespace concierge
