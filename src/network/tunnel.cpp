#include "beamdrop/network/tunnel.hpp"
#include "beamdrop/core/error.hpp"
#include "beamdrop/core/logger.hpp"
#include "beamdrop/core/utils.hpp"
#include <boost/process.hpp>
#include <cstdlib>
#include <fstream>
#include <future>
#include <mutex>
#include <thread>

namespace beamdrop::network {

namespace bp = boost::process;

using core::ErrorCode;
using core::TransferError;
using core::utils::StringUtils;

namespace {
    std::string strip_quotes(const std::string& value) {
        if (value.size() >= 2 &&
            ((value.front() == '"' && value.back() == '"') || (value.front() == '\'' && value.back() == '\''))) {
            return value.substr(1, value.size() - 2);
        }
        return value;
    }
    
    std::optional<std::string> logfmt_field(const std::string& line, const std::string& key) {
        auto needle = key + "=";
        std::string::size_type pos = 0;
        while ((pos = line.find(needle, pos)) != std::string::npos) {
            if (pos == 0 || line[pos - 1] == ' ') {
                auto start = pos + needle.size();
                if (start < line.size() && line[start] == '"') {
                    auto end = line.find('"', start + 1);
                    return line.substr(start + 1, end == std::string::npos ? std::string::npos : end - start - 1);
                }
                auto end = line.find(' ', start);
                return line.substr(start, end == std::string::npos ? std::string::npos : end - start);
            }
            pos += needle.size();
        }
        return std::nullopt;
    }
    
    class NgrokTunnel : public Tunnel {
    public:
        NgrokTunnel(const NgrokOptions& options, const std::string& token, const std::string& local_url) {
            auto binary = options.binary.find('/') != std::string::npos
                ? boost::filesystem::path(options.binary)
                : bp::search_path(options.binary);
            if (binary.empty()) {
                throw TransferError(ErrorCode::TunnelError,
                                    "ngrok agent binary '" + options.binary + "' not found on PATH");
            }
            
            auto env = boost::this_process::environment();
            env["NGROK_AUTHTOKEN"] = token;
            
            try {
                child_ = bp::child(binary, "http", local_url, "--log", "stdout", "--log-format", "logfmt",
                                   env, bp::std_in < bp::null, bp::std_out > output_, bp::std_err > bp::null);
            } catch (const bp::process_error& e) {
                throw TransferError(ErrorCode::TunnelError, std::string("failed to start ngrok: ") + e.what());
            }
            
            auto url_future = url_promise_.get_future();
            reader_ = std::thread([this]() { read_output(); });
            
            if (url_future.wait_for(options.start_timeout) != std::future_status::ready) {
                close();
                throw TransferError(ErrorCode::TunnelError,
                                    "ngrok did not report a public url within " +
                                    std::to_string(options.start_timeout.count()) + " ms");
            }
            
            try {
                url_ = url_future.get();
            } catch (const TransferError&) {
                close();
                throw;
            }
            LOG_INFO("ngrok tunnel started at {}", url_);
        }
        
        ~NgrokTunnel() override {
            close();
        }
        
        const std::string& public_url() const override { return url_; }
        
        void close() override {
            std::lock_guard<std::mutex> lock(close_mutex_);
            if (closed_) {
                return;
            }
            closed_ = true;
            
            std::error_code ec;
            if (child_.valid() && child_.running(ec)) {
                child_.terminate(ec);
                if (ec) {
                    LOG_WARN("Failed to stop ngrok agent: {}", ec.message());
                }
            }
            if (reader_.joinable()) {
                reader_.join();
            }
            LOG_INFO("ngrok tunnel closed");
        }
    
    private:
        void read_output() {
            bool reported = false;
            std::string line;
            while (std::getline(output_, line)) {
                LOG_TRACE("ngrok: {}", line);
                if (reported) {
                    continue;
                }
                
                if (auto url = parse_ngrok_log_line(line)) {
                    url_promise_.set_value(*url);
                    reported = true;
                    continue;
                }
                
                auto level = logfmt_field(line, "lvl");
                if (level && (*level == "eror" || *level == "crit")) {
                    auto message = logfmt_field(line, "err").value_or(line);
                    auto code = (message.find("ERR_NGROK_105") != std::string::npos ||
                                 message.find("authentication failed") != std::string::npos)
                        ? ErrorCode::TunnelAuthError : ErrorCode::TunnelError;
                    url_promise_.set_exception(std::make_exception_ptr(
                        TransferError(code, "ngrok: " + message)));
                    reported = true;
                }
            }
            
            if (!reported) {
                url_promise_.set_exception(std::make_exception_ptr(
                    TransferError(ErrorCode::TunnelError, "ngrok exited before reporting a public url")));
            }
        }
        
        bp::ipstream output_;
        bp::child child_;
        std::thread reader_;
        std::promise<std::string> url_promise_;
        std::string url_;
        std::mutex close_mutex_;
        bool closed_ = false;
    };
}

std::vector<std::filesystem::path> ngrok_config_paths() {
    std::vector<std::filesystem::path> paths;
    
    if (const char* xdg = std::getenv("XDG_CONFIG_HOME"); xdg && *xdg) {
        paths.push_back(std::filesystem::path(xdg) / "ngrok" / "ngrok.yml");
    }
    auto home = core::utils::FileUtils::get_home_dir();
    if (!home.empty()) {
        auto default_path = home / ".config" / "ngrok" / "ngrok.yml";
        if (paths.empty() || paths.front() != default_path) {
            paths.push_back(default_path);
        }
    }
    return paths;
}

std::optional<std::string> read_ngrok_config_token(const std::filesystem::path& path) {
    std::ifstream file(path);
    if (!file.is_open()) {
        return std::nullopt;
    }
    
    // Matches both the top-level key and the v3 "agent:" section
    std::string line;
    while (std::getline(file, line)) {
        auto trimmed = StringUtils::trim(line);
        if (trimmed.empty() || trimmed[0] == '#' || !StringUtils::starts_with(trimmed, "authtoken:")) {
            continue;
        }
        auto value = StringUtils::trim(trimmed.substr(10));
        auto comment = value.find(" #");
        if (comment != std::string::npos) {
            value = StringUtils::trim(value.substr(0, comment));
        }
        value = strip_quotes(value);
        if (!value.empty()) {
            return value;
        }
    }
    return std::nullopt;
}

std::optional<std::string> resolve_ngrok_authtoken() {
    if (const char* token = std::getenv("NGROK_AUTHTOKEN"); token && *token) {
        LOG_DEBUG("Using ngrok authtoken from NGROK_AUTHTOKEN");
        return std::string(token);
    }
    
    for (const auto& path : ngrok_config_paths()) {
        if (auto token = read_ngrok_config_token(path)) {
            LOG_DEBUG("Using ngrok authtoken from {}", path.string());
            return token;
        }
    }
    return std::nullopt;
}

std::optional<std::string> parse_ngrok_log_line(const std::string& line) {
    auto message = logfmt_field(line, "msg");
    if (!message || *message != "started tunnel") {
        return std::nullopt;
    }
    auto url = logfmt_field(line, "url");
    if (!url || url->empty()) {
        return std::nullopt;
    }
    return url;
}

NgrokTunnelConnector::NgrokTunnelConnector(NgrokOptions options)
    : options_(std::move(options)) {
}

std::unique_ptr<Tunnel> NgrokTunnelConnector::open(const std::string& local_url) {
    auto token = options_.authtoken ? options_.authtoken : resolve_ngrok_authtoken();
    if (!token) {
        throw TransferError(ErrorCode::TunnelAuthError,
                            "no ngrok authtoken found; set NGROK_AUTHTOKEN or add one to the ngrok config file");
    }
    
    LOG_INFO("Opening ngrok tunnel to {}", local_url);
    return std::make_unique<NgrokTunnel>(options_, *token, local_url);
}

}
