#include "crypto/stage_digest.hpp"
#include "registry/registry.hpp"
#include "test_support.hpp"
#include <atomic>
#include <fstream>
#include <gtest/gtest.h>
#include <latch>
#include <thread>
#include <vector>

using namespace stagelink;
using stagelink::testing::TempDir;

class RegistryTest : public ::testing::Test {
protected:
  RegistryTest()
      : registry(dir.path()),
        key(Registry::makeKey((dir.path() / "stagelink.config").string(),
                              "dev")) {}

  TempDir dir;
  Registry registry;
  StageKey key;
};

TEST_F(RegistryTest, LookupWithoutRecordIsNotFound) {
  auto result = registry.lookup(key);
  EXPECT_EQ(result.error(), ErrorCode::RegistryNotFound);
}

TEST_F(RegistryTest, PublishedRecordIsVisible) {
  auto published = registry.publish(key, "127.0.0.1:4100", 4321);
  ASSERT_TRUE(published) << describeError(published);

  auto found = registry.lookup(key);
  ASSERT_TRUE(found) << describeError(found);
  EXPECT_EQ(found.value().address, "127.0.0.1:4100");
  EXPECT_EQ(found.value().pid, 4321);
  EXPECT_EQ(found.value().key, key);
}

TEST_F(RegistryTest, SecondPublishCollidesAndKeepsFirst) {
  ASSERT_TRUE(registry.publish(key, "127.0.0.1:4100", 1));

  auto second = registry.publish(key, "127.0.0.1:4200", 2);
  EXPECT_EQ(second.error(), ErrorCode::RegistryCollision);

  auto found = registry.lookup(key);
  ASSERT_TRUE(found);
  EXPECT_EQ(found.value().address, "127.0.0.1:4100");
}

TEST_F(RegistryTest, RemoveIfOnlyRemovesMatchingAddress) {
  ASSERT_TRUE(registry.publish(key, "127.0.0.1:4100", 1));

  auto mismatched = registry.removeIf(key, "127.0.0.1:9999");
  ASSERT_TRUE(mismatched);
  EXPECT_FALSE(mismatched.value());
  EXPECT_TRUE(registry.lookup(key));

  auto matched = registry.removeIf(key, "127.0.0.1:4100");
  ASSERT_TRUE(matched);
  EXPECT_TRUE(matched.value());
  EXPECT_EQ(registry.lookup(key).error(), ErrorCode::RegistryNotFound);
}

TEST_F(RegistryTest, RemoveIsIdempotent) {
  EXPECT_TRUE(registry.remove(key));
  ASSERT_TRUE(registry.publish(key, "127.0.0.1:4100", 1));
  EXPECT_TRUE(registry.remove(key));
  EXPECT_TRUE(registry.remove(key));
  EXPECT_EQ(registry.lookup(key).error(), ErrorCode::RegistryNotFound);
}

TEST_F(RegistryTest, RepublishAfterRemoval) {
  ASSERT_TRUE(registry.publish(key, "127.0.0.1:4100", 1));
  ASSERT_TRUE(registry.removeIf(key, "127.0.0.1:4100"));
  auto again = registry.publish(key, "127.0.0.1:4200", 2);
  ASSERT_TRUE(again);
  EXPECT_EQ(registry.lookup(key).value().address, "127.0.0.1:4200");
}

TEST_F(RegistryTest, StagesAreIndependent) {
  StageKey prod{key.config_path, "prod"};
  ASSERT_TRUE(registry.publish(key, "127.0.0.1:4100", 1));
  ASSERT_TRUE(registry.publish(prod, "127.0.0.1:4200", 2));

  EXPECT_NE(registry.recordPath(key), registry.recordPath(prod));
  EXPECT_EQ(registry.lookup(key).value().address, "127.0.0.1:4100");
  EXPECT_EQ(registry.lookup(prod).value().address, "127.0.0.1:4200");
}

TEST_F(RegistryTest, UnreadableRecordIsCorrupt) {
  std::filesystem::create_directories(registry.recordPath(key).parent_path());
  {
    std::ofstream out(registry.recordPath(key));
    out << "{\"address\":";
  }
  EXPECT_EQ(registry.lookup(key).error(), ErrorCode::RegistryCorruptRecord);
}

TEST_F(RegistryTest, RecordForAnotherKeyIsCorrupt) {
  StageKey other{key.config_path, "other"};
  ASSERT_TRUE(registry.publish(other, "127.0.0.1:4100", 1));
  std::filesystem::create_directories(registry.recordPath(key).parent_path());
  std::filesystem::copy_file(registry.recordPath(other),
                             registry.recordPath(key));

  EXPECT_EQ(registry.lookup(key).error(), ErrorCode::RegistryCorruptRecord);
}

TEST_F(RegistryTest, RemoveIfCorruptOnlyRemovesUnreadableRecord) {
  auto removed = registry.removeIfCorrupt(key);
  ASSERT_TRUE(removed);
  EXPECT_FALSE(removed.value());

  ASSERT_TRUE(registry.publish(key, "127.0.0.1:4100", 1));
  removed = registry.removeIfCorrupt(key);
  ASSERT_TRUE(removed);
  EXPECT_FALSE(removed.value());
  EXPECT_TRUE(registry.lookup(key));
}

TEST_F(RegistryTest, CorruptRecordReplacedByAnotherClientSurvives) {
  std::filesystem::create_directories(registry.recordPath(key).parent_path());
  {
    std::ofstream out(registry.recordPath(key));
    out << "{\"address\":";
  }
  // This client sees the corrupt record...
  ASSERT_EQ(registry.lookup(key).error(), ErrorCode::RegistryCorruptRecord);

  // ...while another clears it and its new daemon registers
  Registry other(dir.path());
  auto cleared = other.removeIfCorrupt(key);
  ASSERT_TRUE(cleared);
  EXPECT_TRUE(cleared.value());
  ASSERT_TRUE(other.publish(key, "127.0.0.1:4200", 2));

  auto removed = registry.removeIfCorrupt(key);
  ASSERT_TRUE(removed);
  EXPECT_FALSE(removed.value());
  auto found = registry.lookup(key);
  ASSERT_TRUE(found);
  EXPECT_EQ(found.value().address, "127.0.0.1:4200");
}

TEST_F(RegistryTest, ConcurrentPublishersExactlyOneWins) {
  constexpr int PUBLISHERS = 16;
  std::latch start(PUBLISHERS);
  std::atomic<int> wins{0};
  std::atomic<int> collisions{0};
  std::vector<std::string> winners(PUBLISHERS);
  std::vector<std::thread> threads;

  for (int i = 0; i < PUBLISHERS; ++i) {
    threads.emplace_back([&, i] {
      // Separate instances, as separate processes would have
      Registry own(dir.path());
      std::string address = "127.0.0.1:" + std::to_string(5000 + i);
      start.arrive_and_wait();
      auto result = own.publish(key, address, 100 + i);
      if (result) {
        ++wins;
        winners[i] = address;
      } else if (result.error() == ErrorCode::RegistryCollision) {
        ++collisions;
      }
    });
  }
  for (auto &t : threads) {
    t.join();
  }

  EXPECT_EQ(wins.load(), 1);
  EXPECT_EQ(collisions.load(), PUBLISHERS - 1);

  auto found = registry.lookup(key);
  ASSERT_TRUE(found);
  bool matches_winner = false;
  for (const auto &address : winners) {
    matches_winner = matches_winner || address == found.value().address;
  }
  EXPECT_TRUE(matches_winner);

  // No temp files left behind by the losers
  size_t entries = 0;
  for (const auto &entry : std::filesystem::directory_iterator(
           registry.recordPath(key).parent_path())) {
    if (entry.path().extension() == ".json") {
      ++entries;
    }
    EXPECT_EQ(entry.path().string().find(".tmp."), std::string::npos)
        << entry.path();
  }
  EXPECT_EQ(entries, 1u);
}

TEST(RegistryKeyTest, ConfigPathIsAbsolute) {
  auto key = Registry::makeKey("relative/stagelink.config", "dev");
  EXPECT_TRUE(std::filesystem::path(key.config_path).is_absolute());
  EXPECT_EQ(key.stage, "dev");
  EXPECT_EQ(key, Registry::makeKey("./relative/stagelink.config", "dev"));
}

TEST(RegistryKeyTest, DefaultStateDirSitsBesideConfig) {
  EXPECT_EQ(Registry::defaultStateDir("/srv/app/stagelink.config"),
            std::filesystem::path("/srv/app/.stagelink"));
}

TEST(StageDigestTest, DeterministicAndSeparated) {
  StageKey a{"/srv/app/stagelink.config", "dev"};
  EXPECT_EQ(StageDigest::compute(a), StageDigest::compute(a));
  EXPECT_EQ(StageDigest::compute(a).size(), StageDigest::DIGEST_BYTES * 2);
  EXPECT_NE(StageDigest::compute(a),
            StageDigest::compute({"/srv/app/stagelink.config", "prod"}));
  EXPECT_NE(StageDigest::compute({"/a", "bc"}),
            StageDigest::compute({"/ab", "c"}));
}
