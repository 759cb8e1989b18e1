#include "sandbox/output_capture.hpp"

#include "gtest/gtest.h"

namespace {

using sandbox::OutputCapture;

// NOLINTNEXTLINE
TEST(OutputCaptureTest, KeepsEverythingUnderLimit) {
  OutputCapture capture(16, 4);
  capture.Append("hello ");
  capture.Append("world");
  EXPECT_EQ(capture.Head(), "hello world");
  EXPECT_EQ(capture.Tail(), "orld");
  EXPECT_EQ(capture.TotalBytes(), 11u);
  EXPECT_FALSE(capture.Truncated());
}

// NOLINTNEXTLINE
TEST(OutputCaptureTest, TruncatesHead) {
  OutputCapture capture(5, 3);
  capture.Append("abc");
  capture.Append("defgh");
  capture.Append("ij");
  EXPECT_EQ(capture.Head(), "abcde");
  EXPECT_EQ(capture.Tail(), "hij");
  EXPECT_EQ(capture.TotalBytes(), 10u);
  EXPECT_TRUE(capture.Truncated());
}

// NOLINTNEXTLINE
TEST(OutputCaptureTest, TailOfLargeChunk) {
  OutputCapture capture(0, 4);
  capture.Append(std::string(100, 'x') + "done");
  EXPECT_EQ(capture.Head(), "");
  EXPECT_EQ(capture.Tail(), "done");
  EXPECT_TRUE(capture.Truncated());
}

// NOLINTNEXTLINE
TEST(OutputCaptureTest, EmptyStream) {
  OutputCapture capture(10);
  EXPECT_EQ(capture.Head(), "");
  EXPECT_EQ(capture.Tail(), "");
  EXPECT_FALSE(capture.Truncated());
}

}  // namespace
