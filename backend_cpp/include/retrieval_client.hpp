#pragma once
#include <atomic>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include "service_error.hpp"
#include "similarity_search.hpp"

namespace cpr { class Session; }

namespace concierge {

// The network client an agent holds for its retrieval tool. Owned by exactly
// one agent and released with close().
class IRetrievalClient {
public:
    virtual ~IRetrievalClient() = default;

    // Reachability check done once while the agent is built.
    virtual Result<void> ping() = 0;
    virtual Result<SimilarityResult> search(const std::string& query, int top_k) = 0;
    virtual void close() = 0;
    virtual bool is_closed() const = 0;
};

// Talks to the retrieval service over HTTP. When an identity token is given
// every request carries it as a bearer credential.
class HttpRetrievalClient : public IRetrievalClient {
public:
    HttpRetrievalClient(std::string base_url, std::optional<std::string> identity_token, int timeout_ms = 10000);
    ~HttpRetrievalClient() override;

    Result<void> ping() override;
    Result<SimilarityResult> search(const std::string& query, int top_k) override;
    void close() override;
    bool is_closed() const override;

    bool has_identity() const { return identity_token_.has_value(); }

private:
    std::string base_url_;
    std::optional<std::string> identity_token_;
    int timeout_ms_;
    mutable std::mutex mutex_; // cpr::Session is not thread-safe
    std::unique_ptr<cpr::Session> session_;
};

// Same contract, served in-process by a SimilaritySearch.
class LocalRetrievalClient : public IRetrievalClient {
public:
    explicit LocalRetrievalClient(std::shared_ptr<SimilaritySearch> search);

    Result<void> ping() override;
    Result<SimilarityResult> search(const std::string& query, int top_k) override;
    void close() override;
    bool is_closed() const override { return closed_.load(); }

private:
    std::shared_ptr<SimilaritySearch> search_;
    std::atomic<bool> closed_{false};
};

} // namespace concierge
