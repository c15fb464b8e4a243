#pragma once

#include <chrono>
#include <filesystem>
#include <memory>
#include <optional>
#include <string>
#include <vector>

namespace beamdrop::network {

// A public URL forwarding to a local HTTP server while open.
class Tunnel {
public:
    virtual ~Tunnel() = default;
    
    virtual const std::string& public_url() const = 0;
    virtual void close() = 0;
};

class TunnelConnector {
public:
    virtual ~TunnelConnector() = default;
    
    // Throws TransferError(TunnelAuthError) without credentials and
    // TransferError(TunnelError) if the tunnel cannot be established.
    virtual std::unique_ptr<Tunnel> open(const std::string& local_url) = 0;
};

struct NgrokOptions {
    std::string binary = "ngrok";
    std::chrono::milliseconds start_timeout{15000};
    // Overrides environment and config file lookup when set
    std::optional<std::string> authtoken;
};

// Candidate ngrok agent config files, most specific first.
std::vector<std::filesystem::path> ngrok_config_paths();

// Reads the authtoken entry of an ngrok agent config file.
std::optional<std::string> read_ngrok_config_token(const std::filesystem::path& path);

// NGROK_AUTHTOKEN, then the agent config files.
std::optional<std::string> resolve_ngrok_authtoken();

// Runs the ngrok agent as a child process and reads the public URL from its
// structured log output.
class NgrokTunnelConnector : public TunnelConnector {
public:
    explicit NgrokTunnelConnector(NgrokOptions options = {});
    
    std::unique_ptr<Tunnel> open(const std::string& local_url) override;

private:
    NgrokOptions options_;
};

// Extracts the url field of an ngrok logfmt "started tunnel" line.
std::optional<std::string> parse_ngrok_log_line(const std::string& line);

}
