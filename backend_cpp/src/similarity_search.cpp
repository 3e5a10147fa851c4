#include "similarity_search.hpp"
#include <chrono>
#include <stdexcept>
#include <spdlog/spdlog.h>

namespace concierge {

std::optional<int> parse_top_k(const std::string& raw) {
    try {
        size_t used = 0;
        int value = std::stoi(raw, &used);
        if (used != raw.size()) return std::nullopt;
        return value;
    } catch (const std::exception&) {
        return std::nullopt;
    }
}

SimilaritySearch::SimilaritySearch(std::shared_ptr<IEmbeddingProvider> embedder, std::shared_ptr<IVectorStore> store)
    : embedder_(std::move(embedder)), vector_store_(std::move(store)) {
    if (!embedder_ || !vector_store_) {
        throw std::invalid_argument("SimilaritySearch needs an embedding provider and a vector store");
    }
}

Result<SimilarityResult> SimilaritySearch::search(const std::string& query_text, int top_k) {
    if (top_k <= 0) {
        return make_error(ErrorKind::InvalidInput, "top_k must be positive, got " + std::to_string(top_k));
    }

    auto start = std::chrono::steady_clock::now();

    std::vector<float> query_embedding;
    try {
        query_embedding = embedder_->generate_embedding(query_text);
    } catch (const std::exception& e) {
        spdlog::error("❌ Embedding failed for query '{}': {}", query_text, e.what());
        return make_error(ErrorKind::UpstreamError, "embedding provider failed", e.what());
    }

    SimilarityResult results;
    try {
        results = vector_store_->semantic_similarity_search(query_embedding, kSimilarityThreshold, top_k);
    } catch (const std::exception& e) {
        spdlog::error("❌ Vector store query failed: {}", e.what());
        return make_error(ErrorKind::UpstreamError, "vector store query failed", e.what());
    }

    double duration = std::chrono::duration<double, std::milli>(std::chrono::steady_clock::now() - start).count();
    spdlog::info("⏱️ Similarity search '{}' (top_k={}): {} hits in {:.2f} ms",
                 query_text, top_k, results.size(), duration);
    return results;
}

} // namespace concierge
