#include "gemini_service.hpp"
#include <cpr/cpr.h>
#include <nlohmann/json.hpp>
#include <spdlog/spdlog.h>
#include <stdexcept>
#include <thread>
#include <chrono>

namespace concierge {

using json = nlohmann::json;

namespace {

constexpr int kMaxRetries = 4;
constexpr int kRequestTimeoutMs = 30000;

template<typename Func>
cpr::Response perform_request_with_retry(Func request_factory, const std::shared_ptr<KeyManager>& km) {
    cpr::Response r;
    for (int i = 0; i < kMaxRetries; ++i) {
        r = request_factory();
        if (r.status_code == 200) return r;
        if ((r.status_code == 429 || r.status_code == 503) && km) {
            spdlog::warn("⚠️ Gemini API {} ({}). Rotating key and cooling down (attempt {}/{})...",
                         r.status_code, (r.status_code == 429 ? "quota" : "overload"), i + 1, kMaxRetries);
            km->report_rate_limit();
            // 2s, 3s, 4s...
            std::this_thread::sleep_for(std::chrono::milliseconds(2000 + (i * 1000)));
            continue;
        }
        break;
    }
    return r;
}

std::string describe_failure(const cpr::Response& r) {
    if (r.error) return "transport error: " + r.error.message;
    return "HTTP " + std::to_string(r.status_code) + ": " + utf8_safe_substr(r.text, 300);
}

} // namespace

std::string utf8_safe_substr(const std::string& str, size_t length) {
    if (str.length() <= length) return str;
    std::string sub = str.substr(0, length);
    while (!sub.empty()) {
        unsigned char c = static_cast<unsigned char>(sub.back());
        if (c < 0x80) break;
        if (c >= 0xC0) { sub.pop_back(); break; }
        sub.pop_back();
    }
    return sub;
}

GeminiService::GeminiService(std::shared_ptr<KeyManager> key_manager, std::shared_ptr<CacheManager> cache_manager)
    : key_manager_(std::move(key_manager)), cache_manager_(std::move(cache_manager)) {
    if (!key_manager_) throw std::invalid_argument("GeminiService requires a KeyManager");
}

std::string GeminiService::get_endpoint_url(const std::string& action) {
    const std::string key = key_manager_->get_current_key();
    if (key.empty()) throw std::runtime_error("No active Gemini API key configured");

    std::string model = (action == "embedContent")
        ? key_manager_->get_embedding_model()
        : key_manager_->get_current_model();

    return base_url_ + model + ":" + action + "?key=" + key;
}

std::vector<float> GeminiService::generate_embedding(const std::string& text) {
    const std::string model = key_manager_->get_embedding_model();
    if (cache_manager_) {
        if (auto cached = cache_manager_->get_embedding(model, text)) return *cached;
    }

    auto r = perform_request_with_retry([&]() {
        // Fresh URL per attempt so a rotated key is picked up.
        return cpr::Post(cpr::Url{get_endpoint_url("embedContent")},
                         cpr::Body(json{
                             {"model", "models/" + model},
                             {"content", {{"parts", {{{"text", text}}}}}}
                         }.dump()),
                         cpr::Header{{"Content-Type", "application/json"}},
                         cpr::Timeout{kRequestTimeoutMs});
    }, key_manager_);

    if (r.status_code != 200) {
        spdlog::error("❌ Embedding API error: {}", describe_failure(r));
        throw std::runtime_error("Failed to generate embedding: " + describe_failure(r));
    }

    auto response_json = json::parse(r.text);
    std::vector<float> embedding = response_json.at("embedding").at("values").get<std::vector<float>>();
    if (embedding.empty()) throw std::runtime_error("Embedding API returned an empty vector");

    if (cache_manager_) cache_manager_->set_embedding(model, text, embedding);
    return embedding;
}

std::string GeminiService::generate_text(const std::string& prompt) {
    json payload = {
        {"contents", {{ {"parts", {{{"text", prompt}}}} }}}
    };
    const std::string body = payload.dump(-1, ' ', false, json::error_handler_t::replace);

    auto start = std::chrono::steady_clock::now();
    auto r = perform_request_with_retry([&]() {
        return cpr::Post(cpr::Url{get_endpoint_url("generateContent")},
                         cpr::Body{body},
                         cpr::Header{{"Content-Type", "application/json"}},
                         cpr::Timeout{kRequestTimeoutMs});
    }, key_manager_);

    if (r.status_code != 200) {
        spdlog::error("❌ Generation API error: {}", describe_failure(r));
        throw std::runtime_error("Language model call failed: " + describe_failure(r));
    }

    auto response_json = json::parse(r.text);
    const auto& candidates = response_json.value("candidates", json::array());
    if (candidates.empty()) {
        throw std::runtime_error("Language model returned no candidates");
    }

    std::string text = candidates[0].at("content").at("parts").at(0).at("text").get<std::string>();
    double duration = std::chrono::duration<double, std::milli>(std::chrono::steady_clock::now() - start).count();
    spdlog::debug("Generation took {:.1f} ms ({} chars)", duration, text.size());
    return text;
}

} // namespace concierge
