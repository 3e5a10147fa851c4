#pragma once
#include <string>

namespace concierge {

struct AppConfig {
    int port = 8081;
    int retrieval_port = 8080;
    std::string client_id;
    std::string secret_key = "SECRET_KEY";
    std::string retrieval_service_url = "http://127.0.0.1:8080";
    std::string amenity_dataset = "data/amenities.json";
    int embedding_dimension = 768;
    int agent_max_steps = 6;
    int shutdown_grace_ms = 2000;
    std::string log_level = "info";

    // Unset or unparsable variables keep the defaults above.
    static AppConfig from_env();
};

// Applies LOG_LEVEL to the default spdlog logger and sets the shared pattern.
void configure_logging(const AppConfig& config);

} // namespace concierge
