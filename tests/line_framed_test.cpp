#include <gtest/gtest.h>

#include "core/transport/line_framed.hpp"

namespace {

using transport::LineFramer;

const std::string kStream =
    "{\"type\":\"LogMsg\",\"level\":\"Info\",\"message\":\"caf\xC3\xA9\"}\n"
    "{\"type\":\"ModStatus\",\"installed_mods\":[]}\n";

std::vector<std::string> feed_all(const std::vector<std::string> &chunks,
                                  LineFramer &framer) {
  std::vector<std::string> frames;
  std::string err;
  for (const auto &c : chunks) {
    EXPECT_TRUE(framer.feed(c, frames, err)) << err;
  }
  return frames;
}

TEST(LineFramer, SplitsCompleteFrames) {
  LineFramer framer;
  const auto frames = feed_all({kStream}, framer);
  ASSERT_EQ(frames.size(), 2u);
  EXPECT_EQ(frames[1], "{\"type\":\"ModStatus\",\"installed_mods\":[]}");
  EXPECT_TRUE(framer.pending().empty());
}

TEST(LineFramer, SameFramesForEverySplitPoint) {
  LineFramer whole;
  const auto expected = feed_all({kStream}, whole);

  // Includes cuts inside the two-byte UTF-8 sequence.
  for (size_t cut = 0; cut <= kStream.size(); ++cut) {
    LineFramer framer;
    const auto frames =
        feed_all({kStream.substr(0, cut), "", kStream.substr(cut)}, framer);
    EXPECT_EQ(frames, expected) << "cut at " << cut;
    EXPECT_TRUE(framer.pending().empty());
  }
}

TEST(LineFramer, ByteAtATime) {
  LineFramer framer;
  std::vector<std::string> chunks;
  for (const char c : kStream) {
    chunks.emplace_back(1, c);
  }
  const auto frames = feed_all(chunks, framer);
  ASSERT_EQ(frames.size(), 2u);
  EXPECT_EQ(frames[0].back(), '}');
}

TEST(LineFramer, KeepsPartialTail) {
  LineFramer framer;
  auto frames = feed_all({"{\"a\":1}\n{\"b\""}, framer);
  ASSERT_EQ(frames.size(), 1u);
  EXPECT_EQ(framer.pending(), "{\"b\"");

  frames = feed_all({":2}\n"}, framer);
  ASSERT_EQ(frames.size(), 1u);
  EXPECT_EQ(frames[0], "{\"b\":2}");
}

TEST(LineFramer, EmptyLineIsAFrame) {
  LineFramer framer;
  const auto frames = feed_all({"\n\n"}, framer);
  ASSERT_EQ(frames.size(), 2u);
  EXPECT_TRUE(frames[0].empty());
}

TEST(LineFramer, RejectsOversizedPartialFrame) {
  LineFramer framer(8);
  std::vector<std::string> frames;
  std::string err;
  EXPECT_TRUE(framer.feed("12345678", frames, err));
  EXPECT_FALSE(framer.feed("9", frames, err));
  EXPECT_NE(err.find("exceeds max"), std::string::npos);
}

TEST(EncodeFrame, AppendsSingleNewline) {
  std::string out;
  std::string err;
  ASSERT_TRUE(transport::encode_frame("{\"type\":\"FixPlayerData\"}", out, err));
  EXPECT_EQ(out, "{\"type\":\"FixPlayerData\"}\n");
}

TEST(EncodeFrame, RejectsEmbeddedNewline) {
  std::string out;
  std::string err;
  EXPECT_FALSE(transport::encode_frame("{\n}", out, err));
  EXPECT_FALSE(err.empty());
}

} // namespace
