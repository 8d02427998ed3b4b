#include "client/stage_client.hpp"
#include "test_support.hpp"
#include <chrono>
#include <fstream>
#include <gtest/gtest.h>
#include <vector>

using namespace stagelink;
using namespace std::chrono_literals;
using stagelink::testing::TempDir;
using stagelink::testing::unusedPort;
using stagelink::testing::writeExecutable;

class StageClientTest : public ::testing::Test {
protected:
  StageClientTest()
      : registry(dir.path()),
        key(Registry::makeKey((dir.path() / "stagelink.config").string(),
                              "dev")),
        config("") {
    config.daemon_executable = STAGELINK_BINARY;
    config.daemon_arguments = {"--idle-timeout=30", "--heartbeat=1"};
    config.registration_timeout_ms = 10000;
    config.connection_timeout_seconds = 1;
    config.retry_backoff_ms = 10;
  }

  void TearDown() override {
    stagelink::testing::stopRegisteredDaemon(registry, key);
  }

  TempDir dir;
  Registry registry;
  StageKey key;
  ClientConfig config;
};

TEST_F(StageClientTest, StreamsEventsFromStartedDaemon) {
  StageClient client(registry, config);
  std::stop_source stop;
  std::vector<Event> events;

  auto result = client.attach(key, stop.get_token(), [&](const Event &event) {
    events.push_back(event);
    if (events.size() == 2) {
      stop.request_stop();
    }
  });

  EXPECT_EQ(result.error(), ErrorCode::StreamCancelled)
      << describeError(result);
  ASSERT_EQ(events.size(), 2u);
  EXPECT_EQ(events[0].type, "heartbeat");
  EXPECT_TRUE(events[0].payload.contains("uptime_ms"));
  EXPECT_LT(events[0].seq, events[1].seq);

  // The daemon outlives the client
  EXPECT_TRUE(registry.lookup(key));
}

TEST_F(StageClientTest, SecondAttachReusesDaemon) {
  StageClient client(registry, config);
  std::string first_address;

  for (int round = 0; round < 2; ++round) {
    std::stop_source stop;
    auto result = client.attach(key, stop.get_token(),
                                [&](const Event &) { stop.request_stop(); });
    EXPECT_EQ(result.error(), ErrorCode::StreamCancelled);

    auto found = registry.lookup(key);
    ASSERT_TRUE(found);
    if (round == 0) {
      first_address = found.value().address;
    } else {
      EXPECT_EQ(found.value().address, first_address);
    }
  }
}

TEST_F(StageClientTest, StaleRegistrationIsHealed) {
  const std::string stale = "127.0.0.1:" + std::to_string(unusedPort());
  // A pid that cannot belong to a live daemon of ours
  ASSERT_TRUE(registry.publish(key, stale, 0));

  StageClient client(registry, config);
  std::stop_source stop;
  size_t received = 0;
  auto result = client.attach(key, stop.get_token(), [&](const Event &) {
    ++received;
    stop.request_stop();
  });

  EXPECT_EQ(result.error(), ErrorCode::StreamCancelled)
      << describeError(result);
  EXPECT_EQ(received, 1u);

  auto found = registry.lookup(key);
  ASSERT_TRUE(found);
  EXPECT_NE(found.value().address, stale);
}

TEST_F(StageClientTest, GivesUpAfterBoundedAttempts) {
  // Every "daemon" registers an address nobody listens on, then exits
  const std::string dead = "127.0.0.1:" + std::to_string(unusedPort());
  auto counter = dir.path() / "spawns";
  auto record = registry.recordPath(key);
  std::filesystem::create_directories(record.parent_path());

  nlohmann::json body = {{"config_path", key.config_path},
                         {"stage", key.stage},
                         {"address", dead},
                         {"pid", 0},
                         {"created_at", 0}};
  auto body_file = dir.path() / "record.json";
  {
    std::ofstream out(body_file);
    out << body.dump();
  }
  auto script = dir.path() / "bogus-daemon.sh";
  writeExecutable(script, "#!/bin/sh\necho spawn >> " + counter.string() +
                              "\ncp " + body_file.string() + " " +
                              record.string() + ".tmp && mv " +
                              record.string() + ".tmp " + record.string() +
                              "\n");

  config.daemon_executable = script.string();
  config.daemon_arguments.clear();
  config.max_connect_attempts = 3;
  StageClient client(registry, config);

  std::stop_source stop;
  size_t received = 0;
  auto result = client.attach(key, stop.get_token(),
                              [&](const Event &) { ++received; });

  EXPECT_EQ(result.error(), ErrorCode::LaunchDaemonUnreachable);
  EXPECT_EQ(received, 0u);

  std::ifstream spawns(counter);
  int lines = 0;
  std::string line;
  while (std::getline(spawns, line)) {
    ++lines;
  }
  EXPECT_EQ(lines, 3);

  // Each dead entry was cleared before the next try
  EXPECT_EQ(registry.lookup(key).error(), ErrorCode::RegistryNotFound);
}

TEST_F(StageClientTest, CancelledBeforeAttach) {
  config.daemon_executable = "/nonexistent/stagelink-daemon";
  StageClient client(registry, config);

  std::stop_source stop;
  stop.request_stop();
  auto result = client.attach(key, stop.get_token(), [](const Event &) {});
  EXPECT_EQ(result.error(), ErrorCode::LaunchCancelled);
}
