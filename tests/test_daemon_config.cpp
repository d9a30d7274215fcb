// Repository: Seedling
// Component: Daemon Configuration Unit Tests
// Purpose: Layering of defaults, environment and flags.
// Copyright (c) 2025 RetroVue

#include "seedling/config/DaemonConfig.hpp"

#include <gtest/gtest.h>

#include <map>
#include <string>
#include <vector>

using namespace seedling::config;

namespace {

// Environment stand-in backed by a map.
class FakeEnv
{
public:
  FakeEnv& Set(const std::string& k, const std::string& v)
  {
    vars_[k] = v;
    return *this;
  }

  EnvLookup Lookup() const
  {
    return [this](const char* name) -> const char* {
      auto it = vars_.find(name);
      return it == vars_.end() ? nullptr : it->second.c_str();
    };
  }

private:
  std::map<std::string, std::string> vars_;
};

DaemonConfig Load(const std::vector<const char*>& args, const FakeEnv& env = FakeEnv(),
                  bool portaudio = false)
{
  std::vector<const char*> argv = {"seedlingd"};
  argv.insert(argv.end(), args.begin(), args.end());
  return LoadDaemonConfig(static_cast<int>(argv.size()), argv.data(), portaudio, env.Lookup());
}

bool HasWarningMentioning(const DaemonConfig& c, const std::string& needle)
{
  for (const auto& w : c.warnings) {
    if (w.find(needle) != std::string::npos) return true;
  }
  return false;
}

}  // namespace

TEST(DaemonConfigTest, Defaults)
{
  const auto c = Load({});
  EXPECT_EQ(c.port, 18888);
  EXPECT_EQ(c.bind_address, "127.0.0.1");
  EXPECT_EQ(c.http_threads, 2);
  EXPECT_EQ(c.audio_source, "stdin");
  EXPECT_EQ(c.session.url, "wss://openspeech.bytedance.com/api/v3/sauc/bigmodel_async");
  EXPECT_EQ(c.session.resource_id, "volc.seedasr.sauc.duration");
  EXPECT_EQ(c.session.finish_timeout.count(), 1500);
  EXPECT_EQ(c.session.stop_timeout.count(), 500);
  EXPECT_EQ(c.session.poll_interval.count(), 100);
  EXPECT_FALSE(c.show_help);

  EXPECT_EQ(Load({}, FakeEnv(), true).audio_source, "portaudio");
}

TEST(DaemonConfigTest, MissingCredentialsWarn)
{
  const auto c = Load({});
  EXPECT_TRUE(HasWarningMentioning(c, kEnvAppKey));
  EXPECT_TRUE(HasWarningMentioning(c, kEnvAccessKey));

  FakeEnv env;
  env.Set(kEnvAppKey, "a").Set(kEnvAccessKey, "b");
  EXPECT_TRUE(Load({}, env).warnings.empty());
}

TEST(DaemonConfigTest, EnvironmentOverridesDefaults)
{
  FakeEnv env;
  env.Set(kEnvPort, "19000")
      .Set(kEnvBindAddress, "0.0.0.0")
      .Set(kEnvAsrUrl, "ws://127.0.0.1:9001/asr")
      .Set(kEnvAppKey, "app")
      .Set(kEnvAccessKey, "secret")
      .Set(kEnvResourceId, "volc.custom")
      .Set(kEnvAudioSource, "/tmp/seedling.fifo");
  const auto c = Load({}, env);
  EXPECT_EQ(c.port, 19000);
  EXPECT_EQ(c.bind_address, "0.0.0.0");
  EXPECT_EQ(c.session.url, "ws://127.0.0.1:9001/asr");
  EXPECT_EQ(c.session.app_key, "app");
  EXPECT_EQ(c.session.access_key, "secret");
  EXPECT_EQ(c.session.resource_id, "volc.custom");
  EXPECT_EQ(c.audio_source, "/tmp/seedling.fifo");
}

TEST(DaemonConfigTest, FlagsOverrideEnvironment)
{
  FakeEnv env;
  env.Set(kEnvPort, "19000").Set(kEnvAudioSource, "portaudio");
  const auto c = Load({"--port", "19100", "--audio", "-", "--finish-timeout-ms", "2500",
                       "--cancel-timeout-ms", "800", "--poll-interval-ms", "20",
                       "--http-threads", "4"},
                      env);
  EXPECT_EQ(c.port, 19100);
  EXPECT_EQ(c.audio_source, "-");
  EXPECT_EQ(c.session.finish_timeout.count(), 2500);
  EXPECT_EQ(c.session.stop_timeout.count(), 800);
  EXPECT_EQ(c.session.poll_interval.count(), 20);
  EXPECT_EQ(c.http_threads, 4);
}

TEST(DaemonConfigTest, DialogContextFromEnvironmentAndFlags)
{
  EXPECT_TRUE(Load({}).session.handshake.context_lines.empty());

  FakeEnv env;
  env.Set(kEnvContext, "  first line \n\n second line\r\n");
  EXPECT_EQ(Load({}, env).session.handshake.context_lines,
            (std::vector<std::string>{"first line", "second line"}));

  const auto c = Load({"--context", "alpha", "--context", "beta"}, env);
  EXPECT_EQ(c.session.handshake.context_lines, (std::vector<std::string>{"alpha", "beta"}));
}

TEST(DaemonConfigTest, LegacyPortVariableIsIgnoredWithWarning)
{
  FakeEnv env;
  env.Set(kEnvLegacyPort, "17777");
  const auto c = Load({}, env);
  EXPECT_EQ(c.port, kDefaultPort);
  EXPECT_TRUE(HasWarningMentioning(c, kEnvLegacyPort));
}

TEST(DaemonConfigTest, MalformedValuesThrow)
{
  EXPECT_THROW(Load({"--port", "http"}), ConfigError);
  EXPECT_THROW(Load({"--port", "0"}), ConfigError);
  EXPECT_THROW(Load({"--port", "70000"}), ConfigError);
  EXPECT_THROW(Load({"--port"}), ConfigError);
  EXPECT_THROW(Load({"--http-threads", "0"}), ConfigError);
  EXPECT_THROW(Load({"--finish-timeout-ms", "-5"}), ConfigError);
  EXPECT_THROW(Load({"--verbose"}), ConfigError);
  EXPECT_THROW(Load({"--asr-url", "https://example.com"}), ConfigError);
  EXPECT_THROW(Load({"--bind", ""}), ConfigError);

  FakeEnv env;
  env.Set(kEnvPort, "abc");
  EXPECT_THROW(Load({}, env), ConfigError);
}

TEST(DaemonConfigTest, HelpSkipsValidation)
{
  const auto c = Load({"--asr-url", "bogus", "--help"});
  EXPECT_TRUE(c.show_help);
  const std::string usage = UsageText("seedlingd");
  EXPECT_NE(usage.find("--port"), std::string::npos);
  EXPECT_NE(usage.find(kEnvAccessKey), std::string::npos);
}
