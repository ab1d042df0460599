// Copyright 2026 The clipforge Authors
// Tests for: SignalChannel (engine signal queue)

#include <chrono>
#include <string>
#include <thread>

#include "core/signal_channel.h"
#include "fake_engine.h"
#include "gtest/gtest.h"

using clipforge::internal::EngineSignal;
using clipforge::internal::SignalChannel;
using clipforge::testing::RecordingSignal;

namespace {
constexpr std::chrono::milliseconds kShortWait{50};
}

TEST(SignalChannelTest, MatchingSignalIsAccepted) {
  SignalChannel channel;
  channel.Push(RecordingSignal("start"));
  std::string message;
  EXPECT_EQ(channel.AwaitSignal("start", &message, kShortWait), kClipForgeOk);
  EXPECT_EQ(channel.size(), 0u);
}

TEST(SignalChannelTest, SignalsAreConsumedInOrder) {
  SignalChannel channel;
  channel.Push(RecordingSignal("stopping"));
  channel.Push(RecordingSignal("stop"));
  channel.Push(RecordingSignal("wrote"));

  EXPECT_EQ(channel.AwaitSignal("stopping", nullptr, kShortWait), kClipForgeOk);
  EXPECT_EQ(channel.AwaitSignal("stop", nullptr, kShortWait), kClipForgeOk);
  EXPECT_EQ(channel.AwaitSignal("wrote", nullptr, kShortWait), kClipForgeOk);
}

TEST(SignalChannelTest, TimeoutWhenNothingArrives) {
  SignalChannel channel;
  std::string message;
  auto begin = std::chrono::steady_clock::now();
  EXPECT_EQ(channel.AwaitSignal("start", &message, kShortWait),
            kClipForgeErrorSignalTimeout);
  EXPECT_GE(std::chrono::steady_clock::now() - begin,
            kShortWait - std::chrono::milliseconds(5));
  EXPECT_NE(message.find("start"), std::string::npos);
}

TEST(SignalChannelTest, WrongTypeIsReported) {
  SignalChannel channel;
  EngineSignal signal = RecordingSignal("start");
  signal.type = "streaming";
  channel.Push(signal);
  std::string message;
  EXPECT_EQ(channel.AwaitSignal("start", &message, kShortWait),
            kClipForgeErrorUnexpectedSignalType);
  EXPECT_NE(message.find("streaming"), std::string::npos);
}

TEST(SignalChannelTest, WrongValueIsReportedWithoutRetry) {
  SignalChannel channel;
  channel.Push(RecordingSignal("stop", -4));
  channel.Push(RecordingSignal("start"));
  std::string message;
  EXPECT_EQ(channel.AwaitSignal("start", &message, kShortWait),
            kClipForgeErrorUnexpectedSignalValue);
  EXPECT_NE(message.find("stop"), std::string::npos);
  // The mismatching signal was consumed; the next one is still queued.
  EXPECT_EQ(channel.size(), 1u);
}

TEST(SignalChannelTest, WaiterWakesOnPushFromAnotherThread) {
  SignalChannel channel;
  std::thread producer([&channel] {
    std::this_thread::sleep_for(std::chrono::milliseconds(20));
    channel.Push(RecordingSignal("start"));
  });
  EXPECT_EQ(channel.AwaitSignal("start", nullptr, std::chrono::seconds(5)),
            kClipForgeOk);
  producer.join();
}

TEST(SignalChannelTest, ClearDropsQueuedSignals) {
  SignalChannel channel;
  channel.Push(RecordingSignal("stop"));
  channel.Push(RecordingSignal("wrote"));
  EXPECT_EQ(channel.Clear(), 2u);
  EXPECT_EQ(channel.size(), 0u);
  EXPECT_FALSE(channel.WaitNext(kShortWait, nullptr));
}
