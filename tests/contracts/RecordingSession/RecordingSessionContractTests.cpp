#include "../../BaseContractTest.h"
#include "../ContractRegistryEnvironment.h"

#include <chrono>
#include <memory>
#include <thread>

#include "fixtures/FakeFrameChannel.h"
#include "fixtures/RecordingPresentationSink.h"
#include "fixtures/ScriptedAudioSource.h"
#include "seedling/control/ControlApi.hpp"
#include "seedling/runtime/MainLoop.hpp"
#include "seedling/runtime/RecordingOrchestrator.hpp"
#include "seedling/util/Json.hpp"
#include "support/DeterministicTimeSource.hpp"

using namespace seedling;
using namespace seedling::tests;
using namespace seedling::tests::fixtures;

namespace
{

using seedling::tests::RegisterExpectedDomainCoverage;

const bool kRegisterCoverage = []() {
  RegisterExpectedDomainCoverage("RecordingSession", {"RS-001", "RS-002", "RS-003"});
  return true;
}();

session::StreamingSessionConfig ContractSessionConfig()
{
  session::StreamingSessionConfig c;
  c.url = "ws://contract.invalid/asr";
  c.poll_interval = std::chrono::milliseconds(10);
  c.handshake_timeout = std::chrono::milliseconds(500);
  c.send_timeout = std::chrono::milliseconds(500);
  c.close_timeout = std::chrono::milliseconds(200);
  c.finish_timeout = std::chrono::milliseconds(1500);
  c.force_close_grace = std::chrono::milliseconds(300);
  c.stop_timeout = std::chrono::milliseconds(500);
  return c;
}

std::vector<int32_t> AudioSequences(const std::vector<protocol::Frame>& frames)
{
  std::vector<int32_t> out;
  for (const auto& f : frames)
  {
    if (f.message_type == protocol::kMessageTypeClientAudioOnlyRequest && f.sequence)
    {
      out.push_back(*f.sequence);
    }
  }
  return out;
}

util::JsonValue Body(const control::HttpReply& reply)
{
  auto parsed = util::ParseJson(reply.body);
  EXPECT_TRUE(parsed.has_value()) << reply.body;
  return parsed.value_or(util::JsonValue());
}

// Control plane, orchestrator and streaming session wired together; only the
// recognizer and the microphone are simulated.
class RecordingSessionContractTest : public BaseContractTest
{
protected:
  [[nodiscard]] std::string DomainName() const override
  {
    return "RecordingSession";
  }

  [[nodiscard]] std::vector<std::string> CoveredRuleIds() const override
  {
    return {"RS-001", "RS-002", "RS-003"};
  }

  void Build(FakeRemoteScript script)
  {
    remote_ = std::make_shared<FakeRemote>(std::move(script));
    audio_ = std::make_shared<ScriptedAudioSource>();
    sink_ = std::make_shared<RecordingPresentationSink>();
    clock_ = std::make_shared<DeterministicTimeSource>(50'000);
    orchestrator_ = std::make_unique<runtime::RecordingOrchestrator>(
        loop_, ContractSessionConfig(), remote_->Factory(), audio_, sink_, clock_);
    control::ControlApiConfig api_config;
    api_config.port = 18888;
    api_ = std::make_unique<control::ControlApi>(*orchestrator_, api_config);
    loop_thread_ = std::thread([this] { loop_.Run(); });
  }

  void TearDown() override
  {
    if (api_)
    {
      api_->Handle("POST", "/cancel");
    }
    loop_.Shutdown();
    if (loop_thread_.joinable())
    {
      loop_thread_.join();
    }
    api_.reset();
    orchestrator_.reset();
  }

  runtime::MainLoop loop_;
  std::thread loop_thread_;
  std::shared_ptr<FakeRemote> remote_;
  std::shared_ptr<ScriptedAudioSource> audio_;
  std::shared_ptr<RecordingPresentationSink> sink_;
  std::shared_ptr<DeterministicTimeSource> clock_;
  std::unique_ptr<runtime::RecordingOrchestrator> orchestrator_;
  std::unique_ptr<control::ControlApi> api_;
};

// Rule: RS-001 A stopped recording streams every segment in order, ends with
// the negated terminal sequence and reports the stripped final transcript.
TEST_F(RecordingSessionContractTest, RS_001_StopDeliversOrderedSegmentsAndFinalText)
{
  FakeRemoteScript script;
  script.segment_text = [](int32_t seq) { return seq < 3 ? "hello" : "hello world"; };
  script.final_text = "hello world.";
  Build(script);

  ASSERT_EQ(api_->Handle("POST", "/start").status, 200);
  const auto pcm = MakePcm(6400);
  for (int i = 0; i < 3; ++i)
  {
    ASSERT_TRUE(audio_->Emit(pcm));
  }
  ASSERT_TRUE(remote_->WaitForFrames(4, std::chrono::milliseconds(2000)));
  clock_->AdvanceMs(600);

  const auto reply = api_->Handle("POST", "/stop");
  ASSERT_EQ(reply.status, 200);
  const auto body = Body(reply);
  EXPECT_EQ(body.GetString("status").value_or(""), "stopped");
  EXPECT_EQ(body.GetString("text").value_or(""), "hello world");
  EXPECT_EQ(body.Find("chars")->AsInt(), 11);
  EXPECT_DOUBLE_EQ(body.Find("duration")->AsNumber(), 0.6);

  EXPECT_EQ(AudioSequences(remote_->frames()), (std::vector<int32_t>{1, 2, 3, -4}));
  EXPECT_EQ(remote_->close_kind(), CloseKind::kGraceful);

  const auto status = Body(api_->Handle("GET", "/status"));
  EXPECT_EQ(status.GetString("state").value_or(""), "idle");
  EXPECT_EQ(status.GetString("last_text").value_or(""), "hello world");
}

// Rule: RS-002 Cancel right after start completes within its bound, sends no
// graceful finish and leaves no transcript behind.
TEST_F(RecordingSessionContractTest, RS_002_CancelBeforeAudioIsBoundedAndEmpty)
{
  Build(FakeRemoteScript{});

  ASSERT_EQ(api_->Handle("POST", "/start").status, 200);

  const auto t0 = std::chrono::steady_clock::now();
  const auto reply = api_->Handle("POST", "/cancel");
  const auto elapsed = std::chrono::steady_clock::now() - t0;

  EXPECT_LT(elapsed, std::chrono::milliseconds(2000));
  ASSERT_EQ(reply.status, 200);
  const auto body = Body(reply);
  EXPECT_EQ(body.GetString("status").value_or(""), "cancelled");
  EXPECT_GE(body.Find("duration")->AsNumber(), 0.0);
  EXPECT_EQ(body.Find("timeout"), nullptr);

  for (int32_t seq : AudioSequences(remote_->frames()))
  {
    EXPECT_GT(seq, 0) << "cancel must not send a terminal frame";
  }

  const auto status = Body(api_->Handle("GET", "/status"));
  EXPECT_EQ(status.GetString("state").value_or(""), "idle");
  EXPECT_EQ(status.GetString("last_text").value_or("x"), "");
  const auto ended = sink_->ended();
  ASSERT_EQ(ended.size(), 1u);
  EXPECT_TRUE(ended[0].cancelled);
}

// Rule: RS-003 A connection lost mid-recording still ends cleanly on the next
// stop, and the daemon can record again afterwards.
TEST_F(RecordingSessionContractTest, RS_003_DroppedStreamRecoversOnNextStop)
{
  FakeRemoteScript script;
  script.segment_text = [](int32_t seq) { return "partial " + std::to_string(seq); };
  script.drop_after_writes = 2;  // handshake + first segment
  Build(script);

  ASSERT_EQ(api_->Handle("POST", "/start").status, 200);
  const auto pcm = MakePcm(6400);
  for (int i = 0; i < 3; ++i)
  {
    ASSERT_TRUE(audio_->Emit(pcm));
  }

  const auto deadline = std::chrono::steady_clock::now() + std::chrono::seconds(3);
  while (orchestrator_->Snapshot().stream_alive && std::chrono::steady_clock::now() < deadline)
  {
    std::this_thread::sleep_for(std::chrono::milliseconds(5));
  }
  ASSERT_FALSE(orchestrator_->Snapshot().stream_alive);
  EXPECT_EQ(orchestrator_->Snapshot().state, runtime::RecordingState::kActive);

  const auto stop = Body(api_->Handle("POST", "/stop"));
  EXPECT_EQ(stop.GetString("status").value_or(""), "stopped");
  EXPECT_EQ(orchestrator_->Snapshot().state, runtime::RecordingState::kIdle);

  ASSERT_EQ(api_->Handle("POST", "/start").status, 200);
  EXPECT_EQ(orchestrator_->Snapshot().recordings, 2u);
  const auto cancel = Body(api_->Handle("POST", "/cancel"));
  EXPECT_EQ(cancel.GetString("status").value_or(""), "cancelled");
}

} // namespace
