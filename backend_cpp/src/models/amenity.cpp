#include "models/amenity.hpp"
#include <spdlog/fmt/fmt.h>
#include <spdlog/fmt/ranges.h>

namespace concierge {

using json = nlohmann::json;

namespace {

std::vector<float> decode_numeric_array(const json& arr, const char* origin) {
    std::vector<float> out;
    out.reserve(arr.size());
    for (size_t i = 0; i < arr.size(); ++i) {
        const auto& element = arr[i];
        if (!element.is_number()) {
            throw EmbeddingParseError(fmt::format(
                "embedding {} element {} is a {}, expected a number", origin, i, element.type_name()));
        }
        out.push_back(static_cast<float>(element.get<double>()));
    }
    return out;
}

std::string string_field(const json& j, const char* key) {
    if (!j.contains(key) || j[key].is_null()) return "";
    return j[key].get<std::string>();
}

} // namespace

std::vector<float> parse_embedding(const json& value) {
    if (value.is_array()) {
        return decode_numeric_array(value, "array");
    }

    if (value.is_string()) {
        const auto& text = value.get_ref<const std::string&>();
        json decoded = json::parse(text, nullptr, false);
        if (decoded.is_discarded() || !decoded.is_array()) {
            throw EmbeddingParseError("embedding string is not a serialized list: " + text.substr(0, 64));
        }
        return decode_numeric_array(decoded, "string");
    }

    throw EmbeddingParseError(std::string("embedding must be a list or a string-encoded list, got ") +
                              value.type_name());
}

std::string serialize_embedding(const std::vector<float>& embedding) {
    // fmt prints the shortest text that reads back as the same float.
    return fmt::format("[{}]", fmt::join(embedding, ", "));
}

json Amenity::to_json(bool include_embedding) const {
    json j = {
        {"id", id},
        {"name", name},
        {"description", description},
        {"location", location},
        {"terminal", terminal},
        {"category", category},
        {"hour", hour},
        {"content", content}
    };
    if (include_embedding) {
        j["embedding"] = serialize_embedding(embedding);
    }
    return j;
}

Amenity Amenity::from_json(const json& j) {
    Amenity a;
    a.id = j.at("id").get<int64_t>();
    a.name = string_field(j, "name");
    a.description = string_field(j, "description");
    a.location = string_field(j, "location");
    a.terminal = string_field(j, "terminal");
    a.category = string_field(j, "category");
    a.hour = string_field(j, "hour");
    a.content = string_field(j, "content");
    if (j.contains("embedding") && !j["embedding"].is_null()) {
        a.embedding = parse_embedding(j["embedding"]);
    }
    return a;
}

} // namespace concierge
