#pragma once
#include <cstdint>
#include <stdexcept>
#include <string>
#include <vector>
#include <nlohmann/json.hpp>

namespace concierge {

// Raised when a stored embedding is neither a numeric array nor a
// string holding one.
class EmbeddingParseError : public std::runtime_error {
public:
    explicit EmbeddingParseError(const std::string& what) : std::runtime_error(what) {}
};

struct Amenity {
    int64_t id = 0;
    std::string name;
    std::string description;
    std::string location;
    std::string terminal;
    std::string category;
    std::string hour;
    std::string content;
    std::vector<float> embedding; // empty when the record was served without one

    // include_embedding=false is what the search endpoint returns to clients.
    nlohmann::json to_json(bool include_embedding = true) const;
    static Amenity from_json(const nlohmann::json& j);
};

// Decodes the embedding column: a native numeric array first, then a
// string-encoded array ("[0.1, 0.2]"). Anything else throws.
std::vector<float> parse_embedding(const nlohmann::json& value);

// Textual form written to metadata files. parse_embedding() on the result
// yields the same float values bit for bit.
std::string serialize_embedding(const std::vector<float>& embedding);

} // namespace concierge
