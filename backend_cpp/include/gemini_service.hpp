#pragma once
#include <string>
#include <memory>
#include "cache_manager.hpp"
#include "KeyManager.hpp"
#include "providers.hpp"

namespace concierge {

// Truncates without splitting a UTF-8 sequence.
std::string utf8_safe_substr(const std::string& str, size_t length);

// Embeddings and completions over the Gemini REST API.
class GeminiService : public IEmbeddingProvider, public ILanguageModel {
public:
    explicit GeminiService(std::shared_ptr<KeyManager> key_manager,
                           std::shared_ptr<CacheManager> cache_manager = std::make_shared<CacheManager>());

    std::vector<float> generate_embedding(const std::string& text) override;
    std::string generate_text(const std::string& prompt) override;

private:
    std::shared_ptr<KeyManager> key_manager_;
    std::shared_ptr<CacheManager> cache_manager_;
    const std::string base_url_ = "https://generativelanguage.googleapis.com/v1beta/models/";
    std::string get_endpoint_url(const std::string& action);
};

} // namespace concierge
