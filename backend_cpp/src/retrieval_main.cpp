#include <httplib.h>
#include <spdlog/spdlog.h>
#include <nlohmann/json.hpp>
#include <filesystem>
#include <memory>

#include "app_config.hpp"
#include "cache_manager.hpp"
#include "faiss_vector_store.hpp"
#include "gemini_service.hpp"
#include "KeyManager.hpp"
#include "similarity_search.hpp"

namespace fs = std::filesystem;
using json = nlohmann::json;

// Serves semantic similarity search over the amenity dataset. Agents in the
// chat server reach it through HttpRetrievalClient.
class RetrievalServer {
public:
    RetrievalServer(int port, std::shared_ptr<concierge::SimilaritySearch> search)
        : port_(port), search_(std::move(search)) {
        setup_routes();
    }

    void run() {
        spdlog::info("🚀 Starting amenity retrieval service on port {}", port_);
        if (!server_.listen("0.0.0.0", port_)) {
            throw std::runtime_error("could not bind port " + std::to_string(port_));
        }
    }

private:
    int port_;
    httplib::Server server_;
    std::shared_ptr<concierge::SimilaritySearch> search_;

    void setup_routes() {
        server_.Get("/", [](const httplib::Request&, httplib::Response& res) {
            res.set_content(R"({"message": "Hello World"})", "application/json");
        });

        server_.Get("/semantic_similarity_search", [this](const httplib::Request& req, httplib::Response& res) {
            this->handle_search(req, res);
        });
    }

    void handle_search(const httplib::Request& req, httplib::Response& res) {
        std::string query = req.get_param_value("query");
        auto top_k = concierge::parse_top_k(req.get_param_value("top_k"));
        if (!top_k) {
            res.status = 400;
            res.set_content(json{{"error", "top_k must be an integer"}}.dump(), "application/json");
            return;
        }
        if (query.empty()) {
            res.status = 400;
            res.set_content(json{{"error", "query must not be empty"}}.dump(), "application/json");
            return;
        }

        auto result = search_->search(query, *top_k);
        if (!result) {
            res.status = concierge::http_status_for(result.error().kind);
            res.set_content(json{{"error", result.error().describe()}}.dump(), "application/json");
            return;
        }

        json rows = json::array();
        for (const auto& match : result.value()) {
            json row = match.record.to_json(false);
            row["similarity"] = match.similarity;
            rows.push_back(row);
        }
        res.set_content(rows.dump(), "application/json");
    }
};

int main() {
    auto config = concierge::AppConfig::from_env();
    concierge::configure_logging(config);

    try {
        auto store = std::make_shared<concierge::FaissVectorStore>(config.embedding_dimension);

        // A directory holds a saved index (faiss.index + metadata.json); a file is the raw dataset.
        fs::path dataset(config.amenity_dataset);
        if (fs::is_directory(dataset)) {
            store->load(dataset.string());
        } else {
            store->load_dataset(dataset.string());
        }
        spdlog::info("📂 {} amenities indexed from {} ({}-dimensional embeddings)",
                     store->size(), dataset.string(), store->dimension());

        auto key_manager = std::make_shared<concierge::KeyManager>();
        if (key_manager->get_active_key_count() == 0) {
            spdlog::warn("⚠️ No Gemini API key available; model calls will fail");
        }
        auto gemini = std::make_shared<concierge::GeminiService>(key_manager);
        auto search = std::make_shared<concierge::SimilaritySearch>(gemini, store);

        RetrievalServer server(config.retrieval_port, search);
        server.run();
    } catch (const std::exception& e) {
        spdlog::critical("💥 Retrieval service failed: {}", e.what());
        return 1;
    }
    return 0;
}
