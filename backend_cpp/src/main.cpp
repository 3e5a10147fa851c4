#include <httplib.h>
#include <spdlog/spdlog.h>
#include <nlohmann/json.hpp>
#include <chrono>
#include <csignal>
#include <memory>
#include <pthread.h>
#include <signal.h>
#include <unistd.h>
#include <thread>

#include "app_config.hpp"
#include "chat_pipeline.hpp"
#include "gemini_service.hpp"
#include "KeyManager.hpp"
#include "LogManager.hpp"
#include "session_cookie.hpp"
#include "agent/AgentFactory.hpp"
#include "session/SessionRegistry.hpp"

using json = nlohmann::json;

class ConciergeServer {
public:
    explicit ConciergeServer(concierge::AppConfig config)
        : config_(std::move(config)),
          cookie_(config_.secret_key),
          registry_(make_factory(config_)),
          pipeline_(registry_)
    {
        setup_routes();
    }

    bool run() {
        spdlog::info("🚀 Starting concierge chat server on port {}", config_.port);
        if (!server_.listen("0.0.0.0", config_.port)) {
            spdlog::error("❌ Could not bind port {}", config_.port);
            return false;
        }
        return true;
    }

    void stop() { server_.stop(); }

    // Releases every session's agent, waiting at most SHUTDOWN_GRACE_MS.
    void shutdown() {
        registry_.dispose_all(std::chrono::milliseconds(config_.shutdown_grace_ms));
    }

private:
    concierge::AppConfig config_;
    httplib::Server server_;
    concierge::SessionCookie cookie_;
    concierge::SessionRegistry registry_;
    concierge::ChatPipeline pipeline_;

    static std::shared_ptr<concierge::IAgentFactory> make_factory(const concierge::AppConfig& config) {
        auto key_manager = std::make_shared<concierge::KeyManager>();
        if (key_manager->get_active_key_count() == 0) {
            spdlog::warn("⚠️ No Gemini API key available; model calls will fail");
        }
        auto gemini = std::make_shared<concierge::GeminiService>(key_manager);

        concierge::AgentFactoryOptions options;
        options.retrieval_base_url = config.retrieval_service_url;
        options.agent.max_steps = config.agent_max_steps;
        return std::make_shared<concierge::AgentFactory>(gemini, options);
    }

    static void send_error(httplib::Response& res, const concierge::ServiceError& error) {
        res.status = concierge::http_status_for(error.kind);
        res.set_content(json{{"error", error.describe()}}.dump(), "application/json");
    }

    // Session id from a correctly signed cookie; a tampered cookie counts as none.
    std::optional<std::string> session_from(const httplib::Request& req) const {
        auto raw = concierge::SessionCookie::extract(req.get_header_value("Cookie"));
        if (!raw) return std::nullopt;
        auto id = cookie_.verify(*raw);
        if (!id) spdlog::warn("⚠️ Rejected session cookie with a bad signature");
        return id;
    }

    void set_session_cookie(httplib::Response& res, const std::string& session_id) const {
        res.set_header("Set-Cookie", std::string(concierge::SessionCookie::kName) + "=" +
                       cookie_.sign(session_id) + "; Path=/; HttpOnly; SameSite=Lax");
    }

    void setup_routes() {
        server_.Get("/", [this](const httplib::Request& req, httplib::Response& res) {
            this->handle_index(req, res);
        });

        server_.Post("/login/google", [this](const httplib::Request& req, httplib::Response& res) {
            this->handle_login(req, res);
        });

        server_.Post("/chat", [this](const httplib::Request& req, httplib::Response& res) {
            this->handle_chat(req, res);
        });

        server_.Post("/reset", [this](const httplib::Request& req, httplib::Response& res) {
            this->handle_reset(req, res);
        });

        server_.Get("/api/admin/logs", [](const httplib::Request&, httplib::Response& res) {
            auto& log = concierge::LogManager::instance();
            json response = {{"summary", log.summary_json()}, {"logs", log.get_logs_json()}};
            res.set_content(response.dump(), "application/json");
        });
    }

    void handle_index(const httplib::Request& req, httplib::Response& res) {
        auto session_id = session_from(req);
        bool fresh = !session_id.has_value();
        std::string id = fresh ? concierge::new_session_id() : *session_id;

        auto session = registry_.resolve_or_create(id, std::nullopt);
        if (!session) {
            send_error(res, session.error());
            return;
        }
        if (fresh) set_session_cookie(res, id);

        json response = {
            {"client_id", config_.client_id},
            {"authenticated", session.value()->is_authenticated()},
            {"messages", session.value()->history_json()}
        };
        res.set_content(response.dump(), "application/json");
    }

    void handle_login(const httplib::Request& req, httplib::Response& res) {
        if (!req.has_param("credential") || req.get_param_value("credential").empty()) {
            res.status = 401;
            res.set_content(json{{"error", "No user credentials found"}}.dump(), "application/json");
            return;
        }

        std::string id = concierge::new_session_id();
        auto session = registry_.replace(session_from(req), id, req.get_param_value("credential"));
        if (!session) {
            send_error(res, session.error());
            return;
        }
        spdlog::info("🔐 Logged in to Google, session {}", id);

        set_session_cookie(res, id);
        std::string source_url = req.get_header_value("Referer");
        res.set_redirect(source_url.empty() ? "/" : source_url, 303);
    }

    void handle_chat(const httplib::Request& req, httplib::Response& res) {
        std::string prompt;
        try {
            auto body = json::parse(req.body);
            if (body.contains("prompt") && body["prompt"].is_string()) prompt = body["prompt"].get<std::string>();
        } catch (const std::exception& e) {
            spdlog::debug("Unparsable chat body: {}", e.what());
        }

        auto reply = pipeline_.chat(session_from(req).value_or(""), prompt);
        if (!reply) {
            send_error(res, reply.error());
            return;
        }
        res.set_content(reply.value(), "text/plain");
    }

    void handle_reset(const httplib::Request& req, httplib::Response& res) {
        auto session_id = session_from(req);
        if (!session_id) {
            res.status = 500;
            res.set_content(json{{"error", "Current agent not found"}}.dump(), "application/json");
            return;
        }

        auto disposed = registry_.dispose(*session_id);
        if (!disposed) {
            res.status = 500;
            res.set_content(json{{"error", "Current agent not found"}}.dump(), "application/json");
            return;
        }

        res.set_header("Set-Cookie", std::string(concierge::SessionCookie::kName) +
                       "=; Path=/; Max-Age=0; HttpOnly; SameSite=Lax");
        res.set_content(json{{"status", "reset"}}.dump(), "application/json");
    }
};

int main() {
    auto config = concierge::AppConfig::from_env();
    concierge::configure_logging(config);

    // SIGINT/SIGTERM are taken synchronously below; block them before any
    // worker thread starts so every thread inherits the mask.
    sigset_t signals;
    sigemptyset(&signals);
    sigaddset(&signals, SIGINT);
    sigaddset(&signals, SIGTERM);
    pthread_sigmask(SIG_BLOCK, &signals, nullptr);

    try {
        ConciergeServer server(config);
        std::thread listener([&server] {
            // Wake the signal wait below when the listener dies on its own.
            if (!server.run()) kill(getpid(), SIGTERM);
        });

        int received = 0;
        sigwait(&signals, &received);
        spdlog::info("🛑 Signal {} received, shutting down", received);

        server.stop();
        listener.join();
        server.shutdown();
    } catch (const std::exception& e) {
        spdlog::critical("💥 Chat server failed: {}", e.what());
        return 1;
    }
    return 0;
}
