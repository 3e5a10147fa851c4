#pragma once
#include <vector>
#include "models/amenity.hpp"

namespace concierge {

struct SimilarityMatch {
    Amenity record;
    float similarity; // cosine similarity in [-1, 1]
};

using SimilarityResult = std::vector<SimilarityMatch>;

class IVectorStore {
public:
    virtual ~IVectorStore() = default;

    // Returns at most top_k records whose similarity is >= similarity_threshold,
    // most similar first.
    virtual SimilarityResult semantic_similarity_search(
        const std::vector<float>& query_embedding,
        float similarity_threshold,
        int top_k) = 0;
};

} // namespace concierge
