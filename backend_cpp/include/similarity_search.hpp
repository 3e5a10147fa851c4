#pragma once
#include <memory>
#include <optional>
#include <string>
#include "providers.hpp"
#include "service_error.hpp"
#include "vector_store.hpp"

namespace concierge {

// Recall/precision cut-off handed to the vector store with every query.
constexpr float kSimilarityThreshold = 0.7f;

// Strict decimal parse of a top_k request parameter. Trailing characters
// make it invalid; range checks are left to SimilaritySearch::search.
std::optional<int> parse_top_k(const std::string& raw);

// Free text -> embedding -> thresholded, bounded vector store query.
// Ordering is whatever the store returns; nothing is re-ranked here.
class SimilaritySearch {
public:
    SimilaritySearch(std::shared_ptr<IEmbeddingProvider> embedder, std::shared_ptr<IVectorStore> store);

    Result<SimilarityResult> search(const std::string& query_text, int top_k);

private:
    std::shared_ptr<IEmbeddingProvider> embedder_;
    std::shared_ptr<IVectorStore> vector_store_;
};

} // namespace concierge
