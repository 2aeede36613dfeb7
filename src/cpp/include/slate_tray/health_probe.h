#pragma once

#include <string>
#include <optional>
#include <chrono>

namespace slate_tray {

// Self-reported identity of whatever answers GET /health
struct HealthResponse {
    std::string status;
    std::string app_name;  // "app" on the wire
    std::string owner;
    std::string env;
    int pid = 0;
};

// Decode a /health body. Every field is required with its JSON type;
// anything else is treated as "no compatible server".
std::optional<HealthResponse> parse_health_response(const std::string& body);

class HealthProbe {
public:
    virtual ~HealthProbe() = default;
    
    // Structured probe. Never throws: unreachable, timeout, non-2xx or
    // malformed body all yield nullopt.
    virtual std::optional<HealthResponse> probe() = 0;
    
    // Raw TCP connect to the same port. Only meaningful after probe()
    // failed, to tell "nothing listening" from "something that won't answer".
    virtual bool is_port_connectable() = 0;
};

class HttpHealthProbe : public HealthProbe {
public:
    HttpHealthProbe(const std::string& host,
                    int port,
                    std::chrono::milliseconds probe_timeout = std::chrono::milliseconds(500),
                    std::chrono::milliseconds connect_timeout = std::chrono::milliseconds(100),
                    const std::string& log_level = "info");
    
    std::optional<HealthResponse> probe() override;
    bool is_port_connectable() override;
    
    std::string get_base_url() const;
    
private:
    std::string host_;
    int port_;
    std::chrono::milliseconds probe_timeout_;
    std::chrono::milliseconds connect_timeout_;
    std::string log_level_;
};

} // namespace slate_tray
