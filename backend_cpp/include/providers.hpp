#pragma once
#include <string>
#include <vector>

namespace concierge {

// Text -> fixed-length vector. Implementations throw std::runtime_error
// when the provider cannot be reached.
class IEmbeddingProvider {
public:
    virtual ~IEmbeddingProvider() = default;
    virtual std::vector<float> generate_embedding(const std::string& text) = 0;
};

// Single prompt -> single completion. Throws on transport or API failure.
class ILanguageModel {
public:
    virtual ~ILanguageModel() = default;
    virtual std::string generate_text(const std::string& prompt) = 0;
};

} // namespace concierge
