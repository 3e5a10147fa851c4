#pragma once
#include <memory>
#include <string>
#include "retrieval_client.hpp"
#include "tools/ToolRegistry.hpp"

namespace concierge {

// Human-readable listing of matches, used as the tool observation.
std::string format_matches(const std::string& query, const SimilarityResult& matches);

class SimilaritySearchTool : public ITool {
public:
    static constexpr int kDefaultTopK = 5;

    explicit SimilaritySearchTool(std::shared_ptr<IRetrievalClient> client) : client_(std::move(client)) {}

    ToolMetadata get_metadata() override {
        return {"semantic_similarity_search",
                "Finds airport amenities (restaurants, shops, lounges, services) relevant to a "
                "free-text question. Input: {'query': 'string', 'top_k': number}",
                "{\"type\":\"object\",\"properties\":{\"query\":{\"type\":\"string\"},"
                "\"top_k\":{\"type\":\"number\"}},\"required\":[\"query\"]}"};
    }
    std::string execute(const std::string& args_json) override;

private:
    std::shared_ptr<IRetrievalClient> client_;
};

} // namespace concierge
