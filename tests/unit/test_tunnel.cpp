#include <gtest/gtest.h>
#include "beamdrop/core/error.hpp"
#include "beamdrop/network/tunnel.hpp"
#include "test_support.hpp"
#include <cstdlib>

using namespace beamdrop::network;
using beamdrop::core::ErrorCode;
using beamdrop::core::TransferError;
using beamdrop::testing::TempDirectory;
using beamdrop::testing::write_file;

namespace {

// Restores an environment variable when the test ends.
class ScopedEnv {
public:
    ScopedEnv(const char* name, const char* value) : name_(name) {
        if (const char* old = std::getenv(name)) {
            previous_ = old;
        }
        if (value) {
            setenv(name, value, 1);
        } else {
            unsetenv(name);
        }
    }
    
    ~ScopedEnv() {
        if (previous_) {
            setenv(name_.c_str(), previous_->c_str(), 1);
        } else {
            unsetenv(name_.c_str());
        }
    }

private:
    std::string name_;
    std::optional<std::string> previous_;
};

std::filesystem::path write_script(const std::filesystem::path& path, const std::string& body) {
    write_file(path, "#!/bin/sh\n" + body);
    std::filesystem::permissions(path, std::filesystem::perms::owner_all);
    return path;
}

}

class NgrokTokenTest : public ::testing::Test {
protected:
    TempDirectory dir_{"beamdrop_tunnel"};
    ScopedEnv token_{"NGROK_AUTHTOKEN", nullptr};
    ScopedEnv home_{"HOME", (dir_ / "home").c_str()};
    ScopedEnv xdg_{"XDG_CONFIG_HOME", (dir_ / "xdg").c_str()};
};

TEST_F(NgrokTokenTest, ConfigPathsPreferXdg) {
    auto paths = ngrok_config_paths();
    ASSERT_EQ(paths.size(), 2u);
    EXPECT_EQ(paths[0], dir_ / "xdg" / "ngrok" / "ngrok.yml");
    EXPECT_EQ(paths[1], dir_ / "home" / ".config" / "ngrok" / "ngrok.yml");
}

TEST_F(NgrokTokenTest, NoTokenAnywhere) {
    EXPECT_FALSE(resolve_ngrok_authtoken().has_value());
}

TEST_F(NgrokTokenTest, ReadsTokenFromConfigFile) {
    write_file(dir_ / "home" / ".config" / "ngrok" / "ngrok.yml",
               "version: \"2\"\n"
               "# authtoken: commented-out\n"
               "authtoken: \"2abcDEF_token\"  # personal\n");
    EXPECT_EQ(resolve_ngrok_authtoken().value_or(""), "2abcDEF_token");
}

TEST_F(NgrokTokenTest, ReadsAgentSectionToken) {
    write_file(dir_ / "xdg" / "ngrok" / "ngrok.yml",
               "version: 3\n"
               "agent:\n"
               "    authtoken: v3-token\n");
    EXPECT_EQ(resolve_ngrok_authtoken().value_or(""), "v3-token");
}

TEST_F(NgrokTokenTest, EnvironmentWins) {
    write_file(dir_ / "xdg" / "ngrok" / "ngrok.yml", "authtoken: from-file\n");
    ScopedEnv token("NGROK_AUTHTOKEN", "from-env");
    EXPECT_EQ(resolve_ngrok_authtoken().value_or(""), "from-env");
}

TEST_F(NgrokTokenTest, EmptyTokenIsIgnored) {
    write_file(dir_ / "xdg" / "ngrok" / "ngrok.yml", "authtoken: \"\"\n");
    EXPECT_FALSE(read_ngrok_config_token(dir_ / "xdg" / "ngrok" / "ngrok.yml").has_value());
}

TEST_F(NgrokTokenTest, ConnectorWithoutTokenIsAuthError) {
    NgrokTunnelConnector connector;
    try {
        connector.open("http://127.0.0.1:8080");
        FAIL() << "expected TunnelAuthError";
    } catch (const TransferError& e) {
        EXPECT_EQ(e.code(), ErrorCode::TunnelAuthError);
    }
}

TEST(NgrokLogTest, ParsesStartedTunnelLine) {
    auto url = parse_ngrok_log_line(
        "t=2024-05-01T10:00:00+0000 lvl=info msg=\"started tunnel\" obj=tunnels name=command_line "
        "addr=http://127.0.0.1:8080 url=https://f00d.ngrok-free.app");
    ASSERT_TRUE(url.has_value());
    EXPECT_EQ(*url, "https://f00d.ngrok-free.app");
}

TEST(NgrokLogTest, IgnoresOtherLines) {
    EXPECT_FALSE(parse_ngrok_log_line("t=2024 lvl=info msg=\"client session established\"").has_value());
    EXPECT_FALSE(parse_ngrok_log_line("lvl=info msg=\"started tunnel\" url=").has_value());
    EXPECT_FALSE(parse_ngrok_log_line("not logfmt at all").has_value());
    // A key that merely ends in "url" is not the url field
    EXPECT_FALSE(parse_ngrok_log_line("msg=\"started tunnel\" public_url=https://x").has_value());
}

class NgrokProcessTest : public ::testing::Test {
protected:
    std::unique_ptr<Tunnel> open_with(const std::string& script_body,
                                      std::chrono::milliseconds timeout = std::chrono::seconds(10)) {
        NgrokOptions options;
        options.binary = write_script(dir_ / "fake-ngrok", script_body).string();
        options.authtoken = "test-token";
        options.start_timeout = timeout;
        NgrokTunnelConnector connector(options);
        return connector.open("http://127.0.0.1:9");
    }
    
    TempDirectory dir_{"beamdrop_ngrok"};
};

TEST_F(NgrokProcessTest, ReportsPublicUrl) {
    auto tunnel = open_with(
        "[ \"$NGROK_AUTHTOKEN\" = test-token ] || exit 1\n"
        "echo 'lvl=info msg=\"started tunnel\" url=https://beam.ngrok.app'\n"
        "exec sleep 30\n");
    EXPECT_EQ(tunnel->public_url(), "https://beam.ngrok.app");
    tunnel->close();
    tunnel->close();
}

TEST_F(NgrokProcessTest, AuthenticationFailure) {
    try {
        open_with("echo 'lvl=eror msg=\"session closing\" err=\"authentication failed: ERR_NGROK_105\"'\n"
                  "exec sleep 30\n");
        FAIL() << "expected TunnelAuthError";
    } catch (const TransferError& e) {
        EXPECT_EQ(e.code(), ErrorCode::TunnelAuthError);
    }
}

TEST_F(NgrokProcessTest, EarlyExitIsTunnelError) {
    try {
        open_with("exit 3\n");
        FAIL() << "expected TunnelError";
    } catch (const TransferError& e) {
        EXPECT_EQ(e.code(), ErrorCode::TunnelError);
    }
}

TEST_F(NgrokProcessTest, SilentAgentTimesOut) {
    try {
        open_with("exec sleep 30\n", std::chrono::milliseconds(300));
        FAIL() << "expected TunnelError";
    } catch (const TransferError& e) {
        EXPECT_EQ(e.code(), ErrorCode::TunnelError);
    }
}

TEST_F(NgrokProcessTest, MissingBinary) {
    NgrokOptions options;
    options.binary = "beamdrop-no-such-ngrok-binary";
    options.authtoken = "token";
    NgrokTunnelConnector connector(options);
    EXPECT_THROW(connector.open("http://127.0.0.1:9"), TransferError);
}
