#include "protocol/line_decoder.hpp"
#include <gtest/gtest.h>
#include <string>
#include <vector>

using namespace stagelink;

class LineDecoderTest : public ::testing::Test {
protected:
  LineDecoder makeDecoder(size_t max_line_bytes = 1024) {
    return LineDecoder(max_line_bytes,
                       [this](Event &&event) { events.push_back(event); });
  }

  Result<void> feed(LineDecoder &decoder, const std::string &bytes) {
    return decoder.feed(bytes.data(), bytes.size());
  }

  std::vector<Event> events;
};

TEST_F(LineDecoderTest, ReassemblesLinesAcrossChunks) {
  auto decoder = makeDecoder();
  std::string stream = "{\"type\":\"progress\",\"pct\":10}\n{\"type\":\"done\"}\n";

  // One byte at a time is the worst case for reassembly
  for (char c : stream) {
    ASSERT_TRUE(decoder.feed(&c, 1));
  }
  ASSERT_TRUE(decoder.finish());

  ASSERT_EQ(events.size(), 2u);
  EXPECT_EQ(events[0].type, "progress");
  EXPECT_EQ(events[0].payload["pct"], 10);
  EXPECT_EQ(events[1].type, "done");
}

TEST_F(LineDecoderTest, SeveralLinesInOneChunk) {
  auto decoder = makeDecoder();
  ASSERT_TRUE(feed(decoder, "{\"type\":\"a\"}\n{\"type\":\"b\"}\n{\"type\":\"c\"}\n"));
  ASSERT_EQ(events.size(), 3u);
  EXPECT_EQ(events[2].type, "c");
  EXPECT_EQ(decoder.deliveredCount(), 3u);
}

TEST_F(LineDecoderTest, SkipsMalformedLineAndContinues) {
  auto decoder = makeDecoder();
  ASSERT_TRUE(feed(decoder, "{\"type\":\"a\"}\n{\"type\":\n{\"type\":\"b\"}\n"));

  ASSERT_EQ(events.size(), 2u);
  EXPECT_EQ(events[0].type, "a");
  EXPECT_EQ(events[1].type, "b");
  EXPECT_EQ(decoder.skippedCount(), 1u);
}

TEST_F(LineDecoderTest, IgnoresKeepAliveLines) {
  auto decoder = makeDecoder();
  ASSERT_TRUE(feed(decoder, "\n\n{\"type\":\"a\"}\n\n\r\n"));
  ASSERT_EQ(events.size(), 1u);
  EXPECT_EQ(decoder.skippedCount(), 0u);
}

TEST_F(LineDecoderTest, StripsCarriageReturns) {
  auto decoder = makeDecoder();
  ASSERT_TRUE(feed(decoder, "{\"type\":\"a\"}\r\n"));
  ASSERT_EQ(events.size(), 1u);
  EXPECT_EQ(events[0].type, "a");
}

TEST_F(LineDecoderTest, FinishFlushesUnterminatedLine) {
  auto decoder = makeDecoder();
  ASSERT_TRUE(feed(decoder, "{\"type\":\"a\"}\n{\"type\":\"tail\"}"));
  EXPECT_EQ(events.size(), 1u);
  ASSERT_TRUE(decoder.finish());
  ASSERT_EQ(events.size(), 2u);
  EXPECT_EQ(events[1].type, "tail");
}

TEST_F(LineDecoderTest, OversizedLineIsFatal) {
  auto decoder = makeDecoder(64);
  ASSERT_TRUE(feed(decoder, "{\"type\":\"a\"}\n"));

  auto result = feed(decoder, std::string(65, 'x'));
  EXPECT_EQ(result.error(), ErrorCode::StreamOversizedLine);

  // Stays failed, even for input that would otherwise decode
  EXPECT_EQ(feed(decoder, "\n{\"type\":\"b\"}\n").error(),
            ErrorCode::StreamOversizedLine);
  EXPECT_EQ(decoder.finish().error(), ErrorCode::StreamOversizedLine);
  ASSERT_EQ(events.size(), 1u);
}

TEST_F(LineDecoderTest, OversizeCountsBytesAcrossChunks) {
  auto decoder = makeDecoder(64);
  ASSERT_TRUE(feed(decoder, std::string(40, ' ')));
  EXPECT_EQ(feed(decoder, std::string(40, ' ')).error(),
            ErrorCode::StreamOversizedLine);
}

TEST_F(LineDecoderTest, LineAtLimitIsAccepted) {
  auto decoder = makeDecoder(64);
  std::string line = "{\"type\":\"a\",\"pad\":\"";
  line += std::string(64 - line.size() - 2, 'p');
  line += "\"}";
  ASSERT_EQ(line.size(), 64u);

  ASSERT_TRUE(feed(decoder, line + "\n"));
  ASSERT_EQ(events.size(), 1u);
}
