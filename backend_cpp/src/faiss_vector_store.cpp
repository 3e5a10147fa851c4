#include "faiss_vector_store.hpp"
#include <faiss/IndexHNSW.h>
#include <faiss/index_io.h>
#include <faiss/utils/distances.h>
#include <algorithm>
#include <filesystem>
#include <fstream>
#include <mutex>
#include <stdexcept>
#include <nlohmann/json.hpp>
#include <spdlog/spdlog.h>

namespace fs = std::filesystem;
using json = nlohmann::json;

namespace concierge {

std::unique_ptr<faiss::Index> FaissVectorStore::make_index(int dimension) {
    if (dimension <= 0) throw std::invalid_argument("vector store dimension must be positive");
    auto idx = std::make_unique<faiss::IndexHNSWFlat>(dimension, 32, faiss::METRIC_INNER_PRODUCT);
    idx->hnsw.efConstruction = 40;
    idx->hnsw.efSearch = 64;
    return idx;
}

FaissVectorStore::FaissVectorStore(int dimension)
    : dimension_(dimension), index_(make_index(dimension)) {
}

FaissVectorStore::~FaissVectorStore() {
}

void FaissVectorStore::add_records(const std::vector<Amenity>& records) {
    if (records.empty()) return;

    std::vector<float> vectors_flat;
    std::vector<const Amenity*> accepted;

    for (const auto& record : records) {
        if (record.embedding.size() != static_cast<size_t>(dimension_)) {
            spdlog::warn("⚠️ Skipping amenity {} ({}): embedding has {} values, index expects {}",
                         record.id, record.name, record.embedding.size(), dimension_);
            continue;
        }
        vectors_flat.insert(vectors_flat.end(), record.embedding.begin(), record.embedding.end());
        accepted.push_back(&record);
    }

    if (accepted.empty()) return;

    const auto num_to_add = static_cast<faiss::idx_t>(accepted.size());
    faiss::fvec_renorm_L2(dimension_, num_to_add, vectors_flat.data());

    std::unique_lock lock(mutex_);
    index_->add(num_to_add, vectors_flat.data());
    for (const auto* record : accepted) {
        records_.push_back(*record);
    }

    spdlog::info("✅ Added {} amenities to FAISS. Total: {}", num_to_add, index_->ntotal);
}

SimilarityResult FaissVectorStore::semantic_similarity_search(
    const std::vector<float>& query_embedding,
    float similarity_threshold,
    int top_k)
{
    if (query_embedding.size() != static_cast<size_t>(dimension_)) {
        throw std::invalid_argument("query embedding has " + std::to_string(query_embedding.size()) +
                                    " values, index expects " + std::to_string(dimension_));
    }

    std::shared_lock lock(mutex_);
    if (index_->ntotal == 0 || top_k <= 0) return {};

    const auto k = std::min<faiss::idx_t>(top_k, index_->ntotal);

    std::vector<float> query_copy = query_embedding;
    faiss::fvec_renorm_L2(dimension_, 1, query_copy.data());

    std::vector<float> scores(k);
    std::vector<faiss::idx_t> indices(k);
    index_->search(1, query_copy.data(), k, scores.data(), indices.data());

    SimilarityResult results;
    for (faiss::idx_t i = 0; i < k; ++i) {
        if (indices[i] < 0 || static_cast<size_t>(indices[i]) >= records_.size()) continue;
        if (scores[i] < similarity_threshold) continue;
        results.push_back({records_[indices[i]], scores[i]});
    }

    std::stable_sort(results.begin(), results.end(), [](const auto& a, const auto& b) {
        return a.similarity > b.similarity;
    });
    return results;
}

size_t FaissVectorStore::load_dataset(const std::string& json_path) {
    std::ifstream in(json_path);
    if (!in) throw std::runtime_error("Amenity dataset not found: " + json_path);

    json data = json::parse(in);
    const json& rows = data.is_object() ? data.at("amenities") : data;
    if (!rows.is_array()) throw std::runtime_error("Amenity dataset must be a JSON array: " + json_path);

    std::vector<Amenity> records;
    records.reserve(rows.size());
    for (const auto& row : rows) {
        records.push_back(Amenity::from_json(row));
    }

    const size_t before = size();
    add_records(records);
    const size_t indexed = size() - before;
    spdlog::info("📂 Indexed {} of {} amenities from {}", indexed, records.size(), json_path);
    return indexed;
}

void FaissVectorStore::save(const std::string& dir_path) const {
    fs::path dir(dir_path);
    fs::create_directories(dir);

    std::shared_lock lock(mutex_);
    faiss::write_index(index_.get(), (dir / "faiss.index").string().c_str());

    json metadata = json::array();
    for (const auto& record : records_) {
        metadata.push_back(record.to_json(true));
    }

    std::ofstream meta_file(dir / "metadata.json");
    meta_file << metadata.dump(2);
}

void FaissVectorStore::load(const std::string& dir_path) {
    fs::path dir(dir_path);

    std::unique_ptr<faiss::Index> loaded(faiss::read_index((dir / "faiss.index").string().c_str()));
    if (loaded->d != dimension_) {
        throw std::runtime_error("Index at " + dir_path + " has dimension " + std::to_string(loaded->d) +
                                 ", expected " + std::to_string(dimension_));
    }

    std::ifstream meta_file(dir / "metadata.json");
    if (!meta_file) throw std::runtime_error("metadata.json missing in " + dir_path);
    json metadata = json::parse(meta_file);

    std::vector<Amenity> records;
    for (const auto& j_record : metadata) {
        records.push_back(Amenity::from_json(j_record));
    }
    if (static_cast<faiss::idx_t>(records.size()) != loaded->ntotal) {
        throw std::runtime_error("metadata.json lists " + std::to_string(records.size()) +
                                 " records but the index holds " + std::to_string(loaded->ntotal));
    }

    std::unique_lock lock(mutex_);
    index_ = std::move(loaded);
    records_ = std::move(records);
    spdlog::info("✅ Loaded FAISS index with {} amenities from {}", index_->ntotal, dir_path);
}

size_t FaissVectorStore::size() const {
    std::shared_lock lock(mutex_);
    return records_.size();
}

} // namespace concierge
