#include <gtest/gtest.h>
#include "beamdrop/core/cli.hpp"
#include "beamdrop/core/command_handler.hpp"
#include "beamdrop/core/command_registry.hpp"
#include "beamdrop/core/utils.hpp"
#include "test_support.hpp"
#include <sstream>

using namespace beamdrop::core;
using beamdrop::testing::TempDirectory;

namespace {

// Owns argv storage for the parser.
class Args {
public:
    Args(std::initializer_list<std::string> args) : storage_(args) {
        for (auto& arg : storage_) {
            pointers_.push_back(arg.data());
        }
    }
    
    int argc() const { return static_cast<int>(pointers_.size()); }
    char** argv() { return pointers_.data(); }

private:
    std::vector<std::string> storage_;
    std::vector<char*> pointers_;
};

}

TEST(CommandLineParserTest, ParsesCommandAndOptions) {
    CommandLineParser parser("beamdrop");
    Args args{"beamdrop", "--relay", "disabled", "-v", "receive", "blobabc", "--output=/tmp/in"};
    
    ASSERT_TRUE(parser.parse(args.argc(), args.argv())) << parser.get_error();
    EXPECT_EQ(parser.get_option("relay"), "disabled");
    EXPECT_TRUE(parser.get_bool_option("verbose"));
    EXPECT_EQ(parser.get_path_option("output"), std::filesystem::path("/tmp/in"));
    
    const auto& positional = parser.get_positional_args();
    ASSERT_EQ(positional.size(), 2u);
    EXPECT_EQ(positional[0], "receive");
    EXPECT_EQ(positional[1], "blobabc");
}

TEST(CommandLineParserTest, ShortOptionValues) {
    CommandLineParser parser("beamdrop");
    Args args{"beamdrop", "-o", "out", "-rdefault", "send", "file.txt"};
    
    ASSERT_TRUE(parser.parse(args.argc(), args.argv()));
    EXPECT_EQ(parser.get_option("o"), "out");
    EXPECT_EQ(parser.get_option("relay"), "default");
}

TEST(CommandLineParserTest, GroupedFlags) {
    CommandLineParser parser("beamdrop");
    Args args{"beamdrop", "-hv"};
    
    ASSERT_TRUE(parser.parse(args.argc(), args.argv()));
    EXPECT_TRUE(parser.has_option("help"));
    EXPECT_TRUE(parser.has_option("v"));
}

TEST(CommandLineParserTest, DefaultsAndHomeExpansion) {
    CommandLineParser parser("beamdrop");
    Args args{"beamdrop"};
    
    ASSERT_TRUE(parser.parse(args.argc(), args.argv()));
    EXPECT_FALSE(parser.has_option("config"));
    EXPECT_EQ(parser.get_option("config"), "~/.beamdrop.conf");
    EXPECT_EQ(parser.get_path_option("config"), beamdrop::core::utils::FileUtils::get_home_dir() / ".beamdrop.conf");
    EXPECT_TRUE(parser.get_path_option("output").empty());
    EXPECT_FALSE(parser.get_bool_option("verbose"));
}

TEST(CommandLineParserTest, DoubleDashEndsOptions) {
    CommandLineParser parser("beamdrop");
    Args args{"beamdrop", "send", "--", "--odd-name.txt"};
    
    ASSERT_TRUE(parser.parse(args.argc(), args.argv()));
    ASSERT_EQ(parser.get_positional_args().size(), 2u);
    EXPECT_EQ(parser.get_positional_args()[1], "--odd-name.txt");
}

TEST(CommandLineParserTest, IntOptionFallsBackOnGarbage) {
    CommandLineParser parser("beamdrop");
    parser.add_option("", "workers", "Worker threads", true);
    Args good{"beamdrop", "--workers", "8"};
    ASSERT_TRUE(parser.parse(good.argc(), good.argv()));
    EXPECT_EQ(parser.get_int_option("workers", 4), 8);
    
    Args bad{"beamdrop", "--workers", "8x"};
    ASSERT_TRUE(parser.parse(bad.argc(), bad.argv()));
    EXPECT_EQ(parser.get_int_option("workers", 4), 4);
}

TEST(CommandLineParserTest, Errors) {
    CommandLineParser parser("beamdrop");
    
    Args unknown{"beamdrop", "--bogus"};
    EXPECT_FALSE(parser.parse(unknown.argc(), unknown.argv()));
    EXPECT_NE(parser.get_error().find("--bogus"), std::string::npos);
    
    Args missing{"beamdrop", "--relay"};
    EXPECT_FALSE(parser.parse(missing.argc(), missing.argv()));
    
    Args flag_value{"beamdrop", "--verbose=yes"};
    EXPECT_FALSE(parser.parse(flag_value.argc(), flag_value.argv()));
    
    Args short_unknown{"beamdrop", "-x"};
    EXPECT_FALSE(parser.parse(short_unknown.argc(), short_unknown.argv()));
}

TEST(CommandLineParserTest, HelpListsOptions) {
    CommandLineParser parser("beamdrop");
    std::ostringstream out;
    parser.print_help(out);
    
    auto text = out.str();
    EXPECT_NE(text.find("Usage: beamdrop"), std::string::npos);
    EXPECT_NE(text.find("--relay <value>"), std::string::npos);
    EXPECT_NE(text.find("(default: ~/.beamdrop.conf)"), std::string::npos);
}

class CommandRegistryTest : public ::testing::Test {
protected:
    void SetUp() override {
        options_.relay_mode = beamdrop::network::RelayMode::Disabled;
        options_.temp_dir = dir_.path();
        options_.output_dir = dir_ / "received";
    }
    
    TempDirectory dir_{"beamdrop_cli"};
    beamdrop::transfer::TransferOptions options_;
};

TEST_F(CommandRegistryTest, KnowsTransferCommands) {
    CommandRegistry registry(options_);
    EXPECT_TRUE(registry.has_command("send"));
    EXPECT_TRUE(registry.has_command("share"));
    EXPECT_TRUE(registry.has_command("receive"));
    EXPECT_FALSE(registry.has_command("list"));
    
    auto result = registry.execute_command("list", {"list"});
    EXPECT_FALSE(result.success);
    EXPECT_EQ(result.exit_code, 2);
}

TEST_F(CommandRegistryTest, MissingArgumentsShowUsage) {
    CommandRegistry registry(options_);
    auto result = registry.execute_command("send", {"send"});
    EXPECT_FALSE(result.success);
    EXPECT_NE(result.message.find("beamdrop send <path>"), std::string::npos);
}

TEST_F(CommandRegistryTest, ReceiveWithBadTicketFails) {
    ReceiveCommandHandler handler(options_);
    auto result = handler.execute({"receive", "not-a-ticket"});
    
    EXPECT_FALSE(result.success);
    EXPECT_EQ(result.exit_code, 1);
    EXPECT_TRUE(std::filesystem::is_directory(options_.output_dir));
}

TEST_F(CommandRegistryTest, ShareRejectsDirectory) {
    beamdrop::testing::write_file(dir_ / "folder" / "a.txt", "a");
    ShareCommandHandler handler(options_, std::make_shared<beamdrop::testing::LoopbackTunnelConnector>());
    
    auto result = handler.execute({"share", (dir_ / "folder").string()});
    EXPECT_FALSE(result.success);
    EXPECT_NE(result.message.find("single file"), std::string::npos);
}

TEST(ProgressPrinterTest, PrintsTicketAndErrors) {
    std::ostringstream out;
    ProgressPrinter printer(out);
    printer.print(beamdrop::transfer::SendStatus{beamdrop::transfer::send_status::ReadyToSend{"blobxyz"}});
    printer.print(beamdrop::transfer::ReceiveStatus{beamdrop::transfer::receive_status::Error{"peer went away"}});
    
    EXPECT_NE(out.str().find("blobxyz"), std::string::npos);
    EXPECT_NE(out.str().find("peer went away"), std::string::npos);
}
