#include "slate_tray/health_probe.h"
#include <slate/utils/network_utils.h>
#include <nlohmann/json.hpp>
#include <iostream>
#include <limits>

// Use cpp-httplib for HTTP client
// Note: Not using OpenSSL support since we only connect to localhost
#include <httplib.h>

// Helper macro for debug logging
#define DEBUG_LOG(probe, msg) \
    if ((probe)->log_level_ == "debug") { \
        std::cout << "DEBUG: " << msg << std::endl; \
    }

namespace slate_tray {

using json = nlohmann::json;

std::optional<HealthResponse> parse_health_response(const std::string& body) {
    json j = json::parse(body, nullptr, false);
    if (j.is_discarded() || !j.is_object()) {
        return std::nullopt;
    }
    
    for (const char* key : {"status", "app", "owner", "env"}) {
        if (!j.contains(key) || !j[key].is_string()) {
            return std::nullopt;
        }
    }
    if (!j.contains("pid") || !j["pid"].is_number_integer()) {
        return std::nullopt;
    }
    long long pid = j["pid"].get<long long>();
    if (pid < 0 || pid > std::numeric_limits<int>::max()) {
        return std::nullopt;
    }
    
    HealthResponse health;
    health.status = j["status"].get<std::string>();
    health.app_name = j["app"].get<std::string>();
    health.owner = j["owner"].get<std::string>();
    health.env = j["env"].get<std::string>();
    health.pid = static_cast<int>(pid);
    return health;
}

HttpHealthProbe::HttpHealthProbe(const std::string& host,
                                 int port,
                                 std::chrono::milliseconds probe_timeout,
                                 std::chrono::milliseconds connect_timeout,
                                 const std::string& log_level)
    : host_(host)
    , port_(port)
    , probe_timeout_(probe_timeout)
    , connect_timeout_(connect_timeout)
    , log_level_(log_level)
{
}

std::optional<HealthResponse> HttpHealthProbe::probe() {
    try {
        // httplib times each phase separately; connect and response share the budget
        auto connect_budget = probe_timeout_ / 2;
        auto response_budget = probe_timeout_ - connect_budget;
        
        httplib::Client cli(host_, port_);
        cli.set_connection_timeout(connect_budget);
        cli.set_read_timeout(response_budget);
        cli.set_write_timeout(response_budget);
        
        DEBUG_LOG(this, "Probing " << get_base_url() << "/health");
        auto res = cli.Get("/health");
        if (!res) {
            DEBUG_LOG(this, "Health probe connection error: " << httplib::to_string(res.error()));
            return std::nullopt;
        }
        
        if (res->status < 200 || res->status >= 300) {
            DEBUG_LOG(this, "Health probe returned status " << res->status);
            return std::nullopt;
        }
        
        auto health = parse_health_response(res->body);
        if (!health) {
            DEBUG_LOG(this, "Health probe body is not a valid health response: " << res->body);
        }
        return health;
    } catch (const std::exception& e) {
        DEBUG_LOG(this, "Health probe failed: " << e.what());
        return std::nullopt;
    }
}

bool HttpHealthProbe::is_port_connectable() {
    return slate::utils::NetworkUtils::can_connect(
        host_, port_, static_cast<int>(connect_timeout_.count()));
}

std::string HttpHealthProbe::get_base_url() const {
    return "http://" + host_ + ":" + std::to_string(port_);
}

} // namespace slate_tray
