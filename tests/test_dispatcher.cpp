#include <gtest/gtest.h>
#include <cli/dispatcher.hpp>
#include <filesystem>
#include <fstream>
#include <sstream>

namespace fs = std::filesystem;

// Records every launch instead of spawning anything
class RecordingLauncher : public ProcessLauncher {
public:
    LaunchResult next = LaunchResult::completed(0);
    std::vector<std::vector<std::string>> calls;

    LaunchResult launch(const std::vector<std::string>& argv) override {
        calls.push_back(argv);
        return next;
    }
};

class FakeResolver : public HostResolver {
public:
    bool fail = false;
    std::vector<std::string> lookups;

    ResolvedAddress resolve(const std::string& host) override {
        lookups.push_back(host);
        return fail ? ResolvedAddress::unknown() : ResolvedAddress::of("203.0.113.10");
    }
};

class DispatcherTest : public ::testing::Test {
protected:
    fs::path test_dir;
    fs::path config_path;
    FakeResolver resolver;
    RecordingLauncher launcher;
    std::ostringstream out;
    std::ostringstream err;

    void SetUp() override {
        test_dir = fs::temp_directory_path() /
                   ("rcr_dispatch_test_" + std::string(
                       ::testing::UnitTest::GetInstance()->current_test_info()->name()));
        fs::create_directories(test_dir);
        config_path = test_dir / "remote.ini";
    }

    void TearDown() override {
        fs::remove_all(test_dir);
    }

    void write_config(const std::string& content) {
        std::ofstream(config_path) << content;
    }

    void write_valid_config() {
        write_config("[remote]\nhost = gateway.lan\nuser = ops\nkey = /keys/ops\nport = 2022\n");
    }

    Dispatcher make_dispatcher() {
        return Dispatcher(ConfigStore(config_path), resolver, launcher, out, err);
    }

    static std::vector<std::string> tail(const std::vector<std::string>& v, size_t n) {
        return std::vector<std::string>(v.end() - n, v.end());
    }
};

// ── parse_command_line ──────────────────────────────────────

TEST(ParseCommandLine, NoArgumentsIsUsageFailure) {
    auto parsed = parse_command_line({});
    EXPECT_EQ(parsed.action, ParsedArgs::Action::Usage);
    EXPECT_EQ(parsed.exit_code, 1);
}

TEST(ParseCommandLine, HelpFlags) {
    for (const char* flag : {"-h", "--help"}) {
        auto parsed = parse_command_line({flag});
        EXPECT_EQ(parsed.action, ParsedArgs::Action::Usage) << flag;
        EXPECT_EQ(parsed.exit_code, 0) << flag;
    }
}

TEST(ParseCommandLine, PingNeedsArguments) {
    auto parsed = parse_command_line({"ping"});
    EXPECT_EQ(parsed.action, ParsedArgs::Action::Guidance);
    EXPECT_EQ(parsed.exit_code, 1);
    EXPECT_EQ(parsed.subcommand, "ping");
}

TEST(ParseCommandLine, NslookupNeedsArguments) {
    auto parsed = parse_command_line({"nslookup"});
    EXPECT_EQ(parsed.action, ParsedArgs::Action::Guidance);
    EXPECT_EQ(parsed.subcommand, "nslookup");
}

TEST(ParseCommandLine, PingWithArguments) {
    auto parsed = parse_command_line({"ping", "8.8.8.8", "-c", "4"});
    EXPECT_EQ(parsed.action, ParsedArgs::Action::Run);
    EXPECT_EQ(parsed.request.label, "ping");
    EXPECT_EQ(parsed.request.remote_cmd,
              (std::vector<std::string>{"ping", "8.8.8.8", "-c", "4"}));
}

TEST(ParseCommandLine, PassthroughHasNoAllowList) {
    auto parsed = parse_command_line({"systemctl", "status", "ssh"});
    EXPECT_EQ(parsed.action, ParsedArgs::Action::Run);
    EXPECT_EQ(parsed.request.label, "systemctl");
    EXPECT_EQ(parsed.request.remote_cmd,
              (std::vector<std::string>{"systemctl", "status", "ssh"}));

    // A lone passthrough token needs no arguments
    auto single = parse_command_line({"uptime"});
    EXPECT_EQ(single.action, ParsedArgs::Action::Run);
}

TEST(ParseCommandLine, HelpOnlyRecognisedFirst) {
    auto parsed = parse_command_line({"grep", "-h", "x"});
    EXPECT_EQ(parsed.action, ParsedArgs::Action::Run);
}

TEST(CommandRequest, DisplayLabelFallback) {
    EXPECT_EQ((CommandRequest{{"ls", "-l"}, ""}).display_label(), "ls");
    EXPECT_EQ((CommandRequest{{}, ""}).display_label(), "command");
    EXPECT_EQ((CommandRequest{{"ls"}, "listing"}).display_label(), "listing");
}

// ── dispatch: usage paths ───────────────────────────────────

TEST_F(DispatcherTest, NoArgumentsPrintsUsageAndFails) {
    auto d = make_dispatcher();
    EXPECT_EQ(d.dispatch({}), 1);
    EXPECT_NE(err.str().find("rcr ping"), std::string::npos);
    EXPECT_TRUE(out.str().empty());
    EXPECT_TRUE(launcher.calls.empty());
}

TEST_F(DispatcherTest, HelpPrintsUsageAndSucceeds) {
    auto d = make_dispatcher();
    EXPECT_EQ(d.dispatch({"--help"}), 0);
    EXPECT_NE(err.str().find("rcr <command> [args...]"), std::string::npos);
    EXPECT_TRUE(launcher.calls.empty());
}

TEST_F(DispatcherTest, BarePingNeverTouchesConfig) {
    // No config file exists; guidance must come before any load attempt
    auto d = make_dispatcher();
    EXPECT_EQ(d.dispatch({"ping"}), 1);

    EXPECT_NE(err.str().find("rcr ping requires ping arguments."), std::string::npos);
    EXPECT_NE(err.str().find("rcr ping 8.8.8.8 -c 4"), std::string::npos);
    EXPECT_EQ(err.str().find("Config file not found"), std::string::npos);
    EXPECT_EQ(d.state(), DispatchState::Start);
    EXPECT_TRUE(resolver.lookups.empty());
    EXPECT_TRUE(launcher.calls.empty());
}

TEST_F(DispatcherTest, BareNslookupGuidance) {
    auto d = make_dispatcher();
    EXPECT_EQ(d.dispatch({"nslookup"}), 1);
    EXPECT_NE(err.str().find("rcr nslookup requires a hostname."), std::string::npos);
    EXPECT_TRUE(launcher.calls.empty());
}

// ── dispatch: config failures ───────────────────────────────

TEST_F(DispatcherTest, MissingConfigFile) {
    auto d = make_dispatcher();
    EXPECT_EQ(d.dispatch({"uname", "-a"}), 1);

    EXPECT_NE(err.str().find("Config file not found"), std::string::npos);
    EXPECT_NE(err.str().find("[remote] section"), std::string::npos);
    EXPECT_EQ(d.state(), DispatchState::ConfigFailed);
    EXPECT_TRUE(resolver.lookups.empty());
    EXPECT_TRUE(launcher.calls.empty());
}

TEST_F(DispatcherTest, MissingSectionStopsBeforeNetwork) {
    write_config("[server]\nhost = h\nuser = u\nkey = k\n");
    auto d = make_dispatcher();
    EXPECT_EQ(d.dispatch({"uname"}), 1);

    EXPECT_NE(err.str().find("[remote] section missing"), std::string::npos);
    EXPECT_TRUE(resolver.lookups.empty());
    EXPECT_TRUE(launcher.calls.empty());
    EXPECT_TRUE(out.str().empty());
}

TEST_F(DispatcherTest, MissingFieldsAllNamed) {
    write_config("[remote]\n");
    auto d = make_dispatcher();
    EXPECT_EQ(d.dispatch({"uname"}), 1);

    const std::string msg = err.str();
    EXPECT_NE(msg.find("host"), std::string::npos);
    EXPECT_NE(msg.find("user"), std::string::npos);
    EXPECT_NE(msg.find("key"), std::string::npos);
    EXPECT_TRUE(launcher.calls.empty());
}

TEST_F(DispatcherTest, InvalidPort) {
    write_config("[remote]\nhost = h\nuser = u\nkey = k\nport = abc\n");
    auto d = make_dispatcher();
    EXPECT_EQ(d.dispatch({"uname"}), 1);

    EXPECT_NE(err.str().find("Invalid port in config: abc"), std::string::npos);
    EXPECT_TRUE(launcher.calls.empty());
}

// ── dispatch: launching ─────────────────────────────────────

TEST_F(DispatcherTest, PingBuildsArgvAndPropagatesExitCode) {
    write_valid_config();
    launcher.next = LaunchResult::completed(2);
    auto d = make_dispatcher();

    EXPECT_EQ(d.dispatch({"ping", "8.8.8.8", "-c", "4"}), 2);

    ASSERT_EQ(launcher.calls.size(), 1u);
    const auto& argv = launcher.calls[0];
    EXPECT_EQ(argv, (std::vector<std::string>{
        "ssh", "-i", "/keys/ops", "-p", "2022", "ops@gateway.lan",
        "ping", "8.8.8.8", "-c", "4"}));
    EXPECT_EQ(tail(argv, 4), (std::vector<std::string>{"ping", "8.8.8.8", "-c", "4"}));
    EXPECT_EQ(d.state(), DispatchState::Completed);
}

TEST_F(DispatcherTest, BannerNamesLabelHostAndAddress) {
    write_valid_config();
    auto d = make_dispatcher();

    EXPECT_EQ(d.dispatch({"nslookup", "example.com"}), 0);
    EXPECT_NE(out.str().find("Running nslookup on host gateway.lan with IP 203.0.113.10"),
              std::string::npos) << out.str();
    EXPECT_EQ(resolver.lookups, (std::vector<std::string>{"gateway.lan"}));
}

TEST_F(DispatcherTest, UnresolvableHostStillLaunches) {
    write_valid_config();
    resolver.fail = true;
    launcher.next = LaunchResult::completed(0);
    auto d = make_dispatcher();

    EXPECT_EQ(d.dispatch({"uptime"}), 0);
    EXPECT_NE(out.str().find("with IP unknown"), std::string::npos);
    EXPECT_EQ(d.resolved_address(), "unknown");
    EXPECT_EQ(launcher.calls.size(), 1u);
}

TEST_F(DispatcherTest, RunWithoutBanner) {
    write_valid_config();
    auto d = make_dispatcher();

    EXPECT_EQ(d.run(CommandRequest{{"id"}, ""}, false), 0);
    EXPECT_TRUE(out.str().empty());
    EXPECT_EQ(launcher.calls.size(), 1u);
}

TEST_F(DispatcherTest, EmptyRemoteCommandOpensShell) {
    write_valid_config();
    auto d = make_dispatcher();

    EXPECT_EQ(d.run(CommandRequest{}), 0);
    ASSERT_EQ(launcher.calls.size(), 1u);
    EXPECT_EQ(launcher.calls[0].size(), 6u);
    EXPECT_NE(out.str().find("Running command on host"), std::string::npos);
}

TEST_F(DispatcherTest, LaunchFailureMentionsSsh) {
    write_valid_config();
    launcher.next = LaunchResult::failed("ssh: No such file or directory");
    auto d = make_dispatcher();

    EXPECT_EQ(d.dispatch({"uname"}), 1);
    EXPECT_NE(err.str().find("ssh"), std::string::npos);
    EXPECT_NE(err.str().find("PATH"), std::string::npos);
    EXPECT_EQ(d.state(), DispatchState::LaunchFailed);
}

TEST_F(DispatcherTest, InterruptExits130) {
    write_valid_config();
    launcher.next = LaunchResult::interrupted();
    auto d = make_dispatcher();

    EXPECT_EQ(d.dispatch({"top"}), 130);
    EXPECT_EQ(d.state(), DispatchState::Interrupted);
    EXPECT_TRUE(err.str().empty());
}

TEST_F(DispatcherTest, NonZeroRemoteExitIsNotAnError) {
    write_valid_config();
    launcher.next = LaunchResult::completed(255);
    auto d = make_dispatcher();

    EXPECT_EQ(d.dispatch({"false"}), 255);
    EXPECT_TRUE(err.str().empty());
}

TEST(DispatchState, Names) {
    EXPECT_STREQ(to_string(DispatchState::ConfigFailed), "config-failed");
    EXPECT_STREQ(to_string(DispatchState::Interrupted), "interrupted");
}
