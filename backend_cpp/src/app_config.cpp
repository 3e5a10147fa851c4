#include "app_config.hpp"
#include <cstdlib>
#include <spdlog/spdlog.h>

namespace concierge {
namespace {

std::string get_env_str(const char* name) {
    const char* v = std::getenv(name);
    return v ? std::string(v) : std::string();
}

int get_env_int(const char* name, int fallback) {
    std::string raw = get_env_str(name);
    if (raw.empty()) return fallback;
    try {
        size_t used = 0;
        int value = std::stoi(raw, &used);
        if (used != raw.size() || value <= 0) throw std::invalid_argument(raw);
        return value;
    } catch (const std::exception&) {
        spdlog::warn("⚠️ Ignoring {}={}: expected a positive integer", name, raw);
        return fallback;
    }
}

} // namespace

AppConfig AppConfig::from_env() {
    AppConfig config;
    config.port = get_env_int("PORT", config.port);
    config.retrieval_port = get_env_int("RETRIEVAL_PORT", config.retrieval_port);
    config.client_id = get_env_str("CLIENT_ID");

    std::string secret = get_env_str("SECRET_KEY");
    if (secret.empty()) {
        spdlog::warn("⚠️ SECRET_KEY is not set; session cookies are signed with a placeholder key");
    } else {
        config.secret_key = secret;
    }

    if (const char* url = std::getenv("RETRIEVAL_SERVICE_URL")) config.retrieval_service_url = url;
    std::string dataset = get_env_str("AMENITY_DATASET");
    if (!dataset.empty()) config.amenity_dataset = dataset;

    config.embedding_dimension = get_env_int("EMBEDDING_DIMENSION", config.embedding_dimension);
    config.agent_max_steps = get_env_int("AGENT_MAX_STEPS", config.agent_max_steps);
    config.shutdown_grace_ms = get_env_int("SHUTDOWN_GRACE_MS", config.shutdown_grace_ms);

    std::string level = get_env_str("LOG_LEVEL");
    if (!level.empty()) config.log_level = level;
    return config;
}

void configure_logging(const AppConfig& config) {
    spdlog::set_pattern("[%H:%M:%S] [%^%l%$] %v");
    auto level = spdlog::level::from_str(config.log_level);
    // from_str maps unknown names to "off"
    if (level == spdlog::level::off && config.log_level != "off") {
        spdlog::warn("⚠️ Unknown LOG_LEVEL '{}', using info", config.log_level);
        level = spdlog::level::info;
    }
    spdlog::set_level(level);
}

} // namespace concierge
