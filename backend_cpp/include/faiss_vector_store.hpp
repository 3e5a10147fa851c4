#pragma once

#include <memory>
#include <shared_mutex>
#include <string>
#include <vector>
#include "vector_store.hpp"

// Forward declare FAISS Index
namespace faiss { struct Index; }

namespace concierge {

// Amenity records in an inner-product HNSW index. Vectors are L2-normalized
// on the way in, so index scores are cosine similarities.
class FaissVectorStore : public IVectorStore {
public:
    explicit FaissVectorStore(int dimension);
    ~FaissVectorStore() override; // faiss::Index is incomplete here

    void add_records(const std::vector<Amenity>& records);

    SimilarityResult semantic_similarity_search(
        const std::vector<float>& query_embedding,
        float similarity_threshold,
        int top_k) override;

    // JSON array of amenity objects (or {"amenities": [...]}) as exported
    // from the amenities table. Returns the number of records indexed.
    size_t load_dataset(const std::string& json_path);

    void save(const std::string& dir) const;
    void load(const std::string& dir);

    size_t size() const;
    int dimension() const { return dimension_; }

private:
    int dimension_;
    std::unique_ptr<faiss::Index> index_;
    std::vector<Amenity> records_; // position == faiss id
    mutable std::shared_mutex mutex_;

    static std::unique_ptr<faiss::Index> make_index(int dimension);
};

} // namespace concierge
