#include "agent/ConversationalAgent.hpp"
#include "gemini_service.hpp"
#include <regex>
#include <stdexcept>
#include <spdlog/spdlog.h>

namespace concierge {

namespace {

const std::string kFinalAnswerMarker = "FINAL_ANSWER:";

std::string trim(const std::string& s) {
    const auto first = s.find_first_not_of(" \t\r\n");
    if (first == std::string::npos) return "";
    const auto last = s.find_last_not_of(" \t\r\n");
    return s.substr(first, last - first + 1);
}

} // namespace

// --- 1. CONSTRUCTOR ---

ConversationalAgent::ConversationalAgent(
    std::shared_ptr<ILanguageModel> llm,
    std::shared_ptr<IRetrievalClient> client,
    std::unique_ptr<ToolRegistry> tool_registry,
    AgentOptions options
) : llm_(std::move(llm)), client_(std::move(client)), tool_registry_(std::move(tool_registry)), options_(options) {
    if (!llm_) throw std::invalid_argument("ConversationalAgent requires a language model");
    if (!tool_registry_) tool_registry_ = std::make_unique<ToolRegistry>();
    if (options_.max_steps <= 0) options_.max_steps = 1;
}

ConversationalAgent::~ConversationalAgent() {
    // Registry disposal normally closes first; this covers agents dropped without it.
    if (client_ && !client_->is_closed()) client_->close();
}

// --- 2. HELPERS ---

nlohmann::json ConversationalAgent::extract_tool_call(const std::string& raw) {
    static const std::regex md_regex(R"(```json\s*(\{[\s\S]*?\})\s*```)");
    static const std::regex plain_regex(R"(\{[\s\S]*\})");

    std::smatch match;
    std::string payload;
    if (std::regex_search(raw, match, md_regex)) {
        payload = match.str(1);
    } else if (std::regex_search(raw, match, plain_regex)) {
        payload = match.str();
    }
    if (payload.empty()) return nlohmann::json::object();

    auto parsed = nlohmann::json::parse(payload, nullptr, false);
    if (parsed.is_discarded() || !parsed.is_object()) return nlohmann::json::object();
    return parsed;
}

std::string ConversationalAgent::build_prompt(const std::string& input, const std::string& scratchpad) const {
    return
        "### ROLE\n"
        "You are a helpful airport concierge. You help travellers find amenities such as "
        "restaurants, shops, lounges and services. Answer only from tool results; if nothing "
        "relevant is found, say so.\n\n"

        "### TOOLS\n" + tool_registry_->get_manifest() + "\n\n"

        "### RESPONSE FORMAT (STRICT)\n"
        "To use a tool, reply with exactly one JSON block:\n"
        "```json\n"
        "{\n"
        "  \"tool\": \"tool_name\",\n"
        "  \"parameters\": { \"key\": \"value\" }\n"
        "}\n"
        "```\n"
        "When you can answer, reply with FINAL_ANSWER: followed by the answer for the traveller.\n"
        "If a tool returns \"ERROR:\", do not repeat the same call with the same parameters.\n\n"

        "### QUESTION\n" + input + "\n\n"

        "### SCRATCHPAD\n" + (scratchpad.empty() ? std::string("(empty)") : scratchpad) + "\n\n"

        "### YOUR NEXT STEP\n";
}

// --- 3. THE LOOP ---

std::string ConversationalAgent::invoke(const std::string& input) {
    if (closed_) throw std::runtime_error("agent has been closed");

    std::string scratchpad;

    for (int step = 0; step < options_.max_steps; ++step) {
        std::string thought = llm_->generate_text(build_prompt(input, scratchpad));
        spdlog::debug("🧠 Step {} reply: [{}]", step, thought);

        if (trim(thought).empty()) {
            throw std::runtime_error("language model returned an empty reply");
        }

        auto marker = thought.find(kFinalAnswerMarker);
        if (marker != std::string::npos) {
            return trim(thought.substr(marker + kFinalAnswerMarker.size()));
        }

        nlohmann::json action = extract_tool_call(thought);
        if (!action.contains("tool") || !action["tool"].is_string()) {
            spdlog::warn("⚠️ Step {}: reply was neither a tool call nor a final answer", step);
            scratchpad += "\nSYSTEM: Your previous reply was not a valid JSON tool call. Use "
                          "{\"tool\": \"...\", \"parameters\": {...}} or FINAL_ANSWER: <answer>.";
            continue;
        }

        std::string tool_name = action["tool"].get<std::string>();
        nlohmann::json params = action.value("parameters", nlohmann::json::object());
        if (!params.is_object()) params = nlohmann::json::object();

        if (tool_name == "FINAL_ANSWER") {
            return trim(params.value("answer", ""));
        }

        if (closed_) throw std::runtime_error("agent was closed during invocation");

        std::string observation = tool_registry_->dispatch(tool_name, params);
        if (observation.rfind("ERROR:", 0) == 0) {
            scratchpad += "\nSYSTEM: The tool returned an error. Adapt your plan.";
        }

        scratchpad += "\n[STEP " + std::to_string(step) + " RESULT]\n";
        scratchpad += "TOOL USED: " + tool_name + " " + params.dump() + "\n";
        scratchpad += "OUTPUT:\n" + utf8_safe_substr(observation, options_.observation_cap);
        scratchpad += "\n[END OF RESULT]";
    }

    throw std::runtime_error("agent gave no final answer within " + std::to_string(options_.max_steps) + " steps");
}

void ConversationalAgent::close() {
    if (closed_.exchange(true)) return;
    if (client_) client_->close();
    spdlog::debug("Agent closed");
}

} // namespace concierge
