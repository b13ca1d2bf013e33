#include <gtest/gtest.h>

#include <chrono>
#include <fstream>
#include <sstream>
#include <thread>

#include "core/session.hpp"
#include "errors.hpp"
#include "fake_device.hpp"

namespace {

using namespace mbf_session;
using mbf_test::FakeDevice;

constexpr const char *kAgentPath = "/data/local/tmp/mbf-agent";

class SessionTest : public ::testing::Test {
protected:
  std::shared_ptr<FakeDevice> device = std::make_shared<FakeDevice>();
  std::vector<pb::LogMsg> events;

  LogEventSink sink() {
    return [this](const pb::LogMsg &log) { events.push_back(log); };
  }

  TerminalResult run(const std::string &script, const Request &request) {
    device->agent_script = script;
    Session session(device, nullptr, kAgentPath, sink());
    return session.run(request);
  }
};

TEST_F(SessionTest, ModStatusAfterInfoLog) {
  const TerminalResult result = run(
      R"(read -r line
printf '%s\n' '{"type":"LogMsg","level":"Info","message":"checking"}'
printf '%s\n' '{"type":"ModStatus","installed_mods":[]}')",
      pb::GetModStatus());

  ASSERT_TRUE(std::holds_alternative<pb::ModStatus>(result));
  EXPECT_EQ(std::get<pb::ModStatus>(result).installed_mods_size(), 0);
  ASSERT_EQ(events.size(), 1u);
  EXPECT_EQ(events[0].message(), "checking");
  EXPECT_EQ(device->listener_count(), 0u);
}

TEST_F(SessionTest, SendsOneNewlineTerminatedRequest) {
  const std::string capture = ::testing::TempDir() + "mbf_session_request";
  run("cat > '" + capture + "'\n" +
          R"(printf '%s\n' '{"type":"FixedPlayerData","existed":true}')",
      pb::FixPlayerData());

  std::ifstream in(capture);
  std::stringstream got;
  got << in.rdbuf();
  EXPECT_EQ(got.str(), "{\"type\":\"FixPlayerData\"}\n");
}

TEST_F(SessionTest, ErrorLogThenCleanExitIsAgentError) {
  try {
    run(R"(read -r line
printf '%s\n' '{"type":"LogMsg","level":"Info","message":"working"}'
printf '%s\n' '{"type":"LogMsg","level":"Error","message":"Mod not found"}')",
        pb::RemoveMod());
    FAIL() << "expected AgentError";
  } catch (const mbf_link::AgentError &e) {
    EXPECT_STREQ(e.what(), "Mod not found");
    EXPECT_TRUE(e.from_agent_log());
  }
  // Both agent logs, and no second copy of the failure.
  EXPECT_EQ(events.size(), 2u);
}

TEST_F(SessionTest, ErrorLogFollowedByResultSucceeds) {
  const TerminalResult result = run(
      R"(read -r line
printf '%s\n' '{"type":"LogMsg","level":"Error","message":"retrying"}'
printf '%s\n' '{"type":"Mods","installed_mods":[]}')",
      pb::SetModsEnabled());
  EXPECT_TRUE(std::holds_alternative<pb::Mods>(result));
}

TEST_F(SessionTest, ResultThenErrorLogIsAgentError) {
  try {
    run(R"(read -r line
printf '%s\n' '{"type":"ModStatus","installed_mods":[]}'
printf '%s\n' '{"type":"LogMsg","level":"Error","message":"late failure"}')",
        pb::GetModStatus());
    FAIL() << "expected AgentError";
  } catch (const mbf_link::AgentError &e) {
    EXPECT_STREQ(e.what(), "late failure");
    EXPECT_TRUE(e.from_agent_log());
  }
}

TEST_F(SessionTest, NoOutputIsAgentError) {
  try {
    run("read -r line", pb::GetModStatus());
    FAIL() << "expected AgentError";
  } catch (const mbf_link::AgentError &e) {
    EXPECT_FALSE(e.from_agent_log());
    EXPECT_NE(std::string(e.what()).find("no response"), std::string::npos);
  }
  ASSERT_EQ(events.size(), 1u);
  EXPECT_EQ(events[0].level(), pb::LogMsg::Error);
}

TEST_F(SessionTest, NonZeroExitIsProtocolErrorWithStderr) {
  try {
    run(R"(read -r line
printf '%s\n' '{"type":"ModStatus","installed_mods":[]}'
echo 'exec format error' >&2
exit 3)",
        pb::GetModStatus());
    FAIL() << "expected ProtocolError";
  } catch (const mbf_link::ProtocolError &e) {
    const std::string what = e.what();
    EXPECT_NE(what.find("exit code 3"), std::string::npos);
    EXPECT_NE(what.find("exec format error"), std::string::npos);
  }
}

TEST_F(SessionTest, LingeringChildDoesNotHoldUpFailure) {
  const auto start = std::chrono::steady_clock::now();
  try {
    run(R"(read -r line
sleep 30 > /dev/null &
echo 'segfault' >&2
exit 139)",
        pb::GetModStatus());
    FAIL() << "expected ProtocolError";
  } catch (const mbf_link::ProtocolError &e) {
    EXPECT_NE(std::string(e.what()).find("segfault"), std::string::npos);
  }
  EXPECT_LT(std::chrono::steady_clock::now() - start, std::chrono::seconds(10));
}

TEST_F(SessionTest, MalformedFrameAbortsWithRawText) {
  const auto start = std::chrono::steady_clock::now();
  try {
    run(R"(read -r line
echo 'thread main panicked'
exec sleep 30)",
        pb::GetModStatus());
    FAIL() << "expected ProtocolError";
  } catch (const mbf_link::ProtocolError &e) {
    EXPECT_NE(std::string(e.what()).find("thread main panicked"),
              std::string::npos);
  }
  // The agent was killed rather than waited for.
  EXPECT_LT(std::chrono::steady_clock::now() - start, std::chrono::seconds(10));
}

TEST_F(SessionTest, DisconnectEndsStreaming) {
  std::thread unplug([this] {
    std::this_thread::sleep_for(std::chrono::milliseconds(200));
    device->disconnect();
  });

  const auto start = std::chrono::steady_clock::now();
  EXPECT_THROW(run("read -r line\nexec sleep 30", pb::GetModStatus()),
               mbf_link::TransportError);
  unplug.join();

  EXPECT_LT(std::chrono::steady_clock::now() - start, std::chrono::seconds(10));
  ASSERT_FALSE(events.empty());
  EXPECT_EQ(events.back().level(), pb::LogMsg::Error);
}

TEST_F(SessionTest, ResultWithoutTrailingNewlineIsLost) {
  EXPECT_THROW(run(R"(read -r line
printf '%s' '{"type":"Mods","installed_mods":[]}')",
                   pb::RemoveMod()),
               mbf_link::AgentError);
}

TEST_F(SessionTest, AgentThatIgnoresStdinStillResolves) {
  const TerminalResult result =
      run(R"(printf '%s\n' '{"type":"DowngradedManifest","manifest_xml":"<manifest/>"}')",
          pb::GetDowngradedManifest());
  EXPECT_EQ(std::get<pb::DowngradedManifest>(result).manifest_xml(),
            "<manifest/>");
}

TEST_F(SessionTest, SilentModeBehavesTheSame) {
  device->agent_script = R"(read -r line
printf '%s\n' '{"type":"LogMsg","level":"Info","message":"checking"}'
printf '%s\n' '{"type":"ModStatus","installed_mods":[]}')";
  Session session(device, nullptr, kAgentPath, LogEventSink{});
  EXPECT_TRUE(
      std::holds_alternative<pb::ModStatus>(session.run(pb::GetModStatus())));
  EXPECT_EQ(session.state(), SessionState::Resolved);
}

TEST(ResolveOutcome, NonZeroExitWinsOverLatchedResult) {
  const std::optional<Latched> latched = Latched{TerminalResult{pb::Mods()}};
  EXPECT_THROW(resolve_outcome(1, latched, "boom"), mbf_link::ProtocolError);
}

TEST(ResolveOutcome, CleanExitReturnsLatchedResult) {
  const std::optional<Latched> latched = Latched{TerminalResult{pb::Mods()}};
  EXPECT_TRUE(std::holds_alternative<pb::Mods>(resolve_outcome(0, latched, "")));
}

} // namespace
