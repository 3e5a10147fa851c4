#include "tools/SimilaritySearchTool.hpp"
#include <nlohmann/json.hpp>
#include <spdlog/spdlog.h>
#include <spdlog/fmt/fmt.h>

namespace concierge {

std::string format_matches(const std::string& query, const SimilarityResult& matches) {
    if (matches.empty()) {
        return "No amenities matched '" + query + "'.";
    }

    std::string out = "### AMENITIES MATCHING: " + query + "\n";
    for (const auto& match : matches) {
        const auto& a = match.record;
        out += fmt::format("- **{}** (similarity {:.2f})\n", a.name, match.similarity);
        out += fmt::format("  Category: {} | Terminal: {} | Location: {}\n", a.category, a.terminal, a.location);
        if (!a.hour.empty()) out += "  Hours: " + a.hour + "\n";
        if (!a.description.empty()) out += "  " + a.description + "\n";
    }
    return out;
}

std::string SimilaritySearchTool::execute(const std::string& args_json) {
    auto args = nlohmann::json::parse(args_json, nullptr, false);
    if (args.is_discarded() || !args.is_object()) return "ERROR: Invalid JSON arguments.";

    std::string query = args.value("query", "");
    if (query.empty()) return "ERROR: Search query is empty.";

    int top_k = kDefaultTopK;
    if (args.contains("top_k") && args["top_k"].is_number()) {
        top_k = args["top_k"].get<int>();
    }

    spdlog::info("🔎 Retrieval tool: '{}' (top_k={})", query, top_k);
    auto result = client_->search(query, top_k);
    if (!result) {
        return "ERROR: " + result.error().describe();
    }
    return format_matches(query, result.value());
}

} // namespace concierge
