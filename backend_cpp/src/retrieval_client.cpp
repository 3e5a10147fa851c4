#include "retrieval_client.hpp"
#include <cpr/cpr.h>
#include <nlohmann/json.hpp>
#include <spdlog/spdlog.h>

namespace concierge {

using json = nlohmann::json;

namespace {

std::string trim_trailing_slash(std::string url) {
    while (!url.empty() && url.back() == '/') url.pop_back();
    return url;
}

std::string error_text(const cpr::Response& r) {
    if (r.error) return r.error.message;
    try {
        auto body = json::parse(r.text);
        if (body.is_object() && body.contains("error")) return body["error"].get<std::string>();
    } catch (const std::exception&) {
        // not JSON, fall through to the raw body
    }
    return "HTTP " + std::to_string(r.status_code) + ": " + r.text.substr(0, 200);
}

} // namespace

// --- HTTP CLIENT ---

HttpRetrievalClient::HttpRetrievalClient(std::string base_url, std::optional<std::string> identity_token, int timeout_ms)
    : base_url_(trim_trailing_slash(std::move(base_url))),
      identity_token_(std::move(identity_token)),
      timeout_ms_(timeout_ms),
      session_(std::make_unique<cpr::Session>()) {
    cpr::Header headers{{"Accept", "application/json"}};
    if (identity_token_) {
        headers["Authorization"] = "Bearer " + *identity_token_;
    }
    session_->SetHeader(headers);
    session_->SetTimeout(cpr::Timeout{timeout_ms_});
}

HttpRetrievalClient::~HttpRetrievalClient() = default;

Result<void> HttpRetrievalClient::ping() {
    std::lock_guard<std::mutex> lock(mutex_);
    if (!session_) return make_error(ErrorKind::ConfigurationError, "retrieval client already closed");

    session_->SetUrl(cpr::Url{base_url_ + "/"});
    session_->SetParameters(cpr::Parameters{});
    cpr::Response r = session_->Get();
    if (r.error || r.status_code != 200) {
        return make_error(ErrorKind::ConfigurationError,
                          "retrieval service unreachable at " + base_url_, error_text(r));
    }
    return {};
}

Result<SimilarityResult> HttpRetrievalClient::search(const std::string& query, int top_k) {
    std::lock_guard<std::mutex> lock(mutex_);
    if (!session_) return make_error(ErrorKind::UpstreamError, "retrieval client is closed");

    session_->SetUrl(cpr::Url{base_url_ + "/semantic_similarity_search"});
    session_->SetParameters(cpr::Parameters{{"query", query}, {"top_k", std::to_string(top_k)}});
    cpr::Response r = session_->Get();

    if (r.status_code == 400) {
        return make_error(ErrorKind::InvalidInput, "retrieval service rejected the query", error_text(r));
    }
    if (r.error || r.status_code != 200) {
        return make_error(ErrorKind::UpstreamError, "retrieval service call failed", error_text(r));
    }

    try {
        auto rows = json::parse(r.text);
        SimilarityResult out;
        for (const auto& row : rows) {
            out.push_back({Amenity::from_json(row), row.value("similarity", 0.0f)});
        }
        return out;
    } catch (const std::exception& e) {
        return make_error(ErrorKind::UpstreamError, "malformed retrieval response", e.what());
    }
}

void HttpRetrievalClient::close() {
    std::lock_guard<std::mutex> lock(mutex_);
    if (!session_) return;
    session_.reset();
    spdlog::debug("Released retrieval session to {}", base_url_);
}

bool HttpRetrievalClient::is_closed() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return !session_;
}

// --- IN-PROCESS CLIENT ---

LocalRetrievalClient::LocalRetrievalClient(std::shared_ptr<SimilaritySearch> search)
    : search_(std::move(search)) {}

Result<void> LocalRetrievalClient::ping() {
    if (!search_) return make_error(ErrorKind::ConfigurationError, "no similarity search configured");
    if (closed_) return make_error(ErrorKind::ConfigurationError, "retrieval client already closed");
    return {};
}

Result<SimilarityResult> LocalRetrievalClient::search(const std::string& query, int top_k) {
    if (closed_) return make_error(ErrorKind::UpstreamError, "retrieval client is closed");
    return search_->search(query, top_k);
}

void LocalRetrievalClient::close() {
    closed_ = true;
}

} // namespace concierge
