#include "stream/streaming_loop.hpp"
#include "test_support.hpp"
#include <gtest/gtest.h>
#include <stdexcept>
#include <thread>

using std::chrono::milliseconds;
using std::chrono::seconds;

class StreamingLoopTest : public ::testing::Test {
protected:
  ManualClock clock;
  RecordingSink sink;
  StreamCursor cursor;
  StreamingOptions options;

  void SetUp() override {
    options.poll_interval = milliseconds(5000);
    options.block_delay_threshold = milliseconds(60000);
  }

  std::unique_ptr<ProviderPool> MakePool(std::vector<std::pair<std::string, std::shared_ptr<FakeBlockSource>>> srcs) {
    std::vector<ProviderSpec> specs;
    for (auto& s : srcs) specs.push_back(ProviderSpec{s.first, "", std::nullopt, s.second});
    return std::unique_ptr<ProviderPool>(new ProviderPool(specs, nullptr, seconds(300), clock.Bind().sleep));
  }

  void StartAt(BlockNumber last) {
    cursor.last_block = last;
    cursor.last_block_time = clock.now;
  }
};

TEST_F(StreamingLoopTest, EmitsContiguousBlocksInOrder) {
  auto src = FakeBlockSource::Serving(1, 5);
  auto pool = MakePool({{"Primary", src}});
  StartAt(0);
  StreamingLoop loop(*pool, cursor, sink, options, clock.Bind());

  CycleReport report = loop.RunCycle();
  EXPECT_EQ(report.outcome, CycleOutcome::ADVANCED);
  EXPECT_EQ(report.emitted, 5u);
  EXPECT_EQ(sink.Numbers(), (std::vector<BlockNumber>{1, 2, 3, 4, 5}));
  EXPECT_EQ(*cursor.last_block, 5u);

  report = loop.RunCycle();
  EXPECT_EQ(report.outcome, CycleOutcome::IDLE);
  EXPECT_EQ(sink.emitted.size(), 5u);
}

TEST_F(StreamingLoopTest, UninitializedCursorStartsAtCurrentHead) {
  auto src = FakeBlockSource::Serving(1, 10);
  auto pool = MakePool({{"Primary", src}});
  StreamingLoop loop(*pool, cursor, sink, options, clock.Bind());
  EXPECT_EQ(loop.State(), LoopState::UNINITIALIZED);

  loop.RunCycle();
  EXPECT_EQ(loop.State(), LoopState::POLLING);
  EXPECT_EQ(sink.Numbers(), (std::vector<BlockNumber>{10}));
  EXPECT_EQ(src->requested, (std::vector<BlockNumber>{10}));
  EXPECT_EQ(*cursor.last_block, 10u);
}

TEST_F(StreamingLoopTest, HeadZeroEmitsGenesisBlock) {
  auto src = FakeBlockSource::Serving(0, 0);
  auto pool = MakePool({{"Genesis", src}});
  StreamingLoop loop(*pool, cursor, sink, options, clock.Bind());

  EXPECT_EQ(loop.RunCycle().outcome, CycleOutcome::ADVANCED);
  EXPECT_EQ(loop.State(), LoopState::POLLING);
  EXPECT_EQ(sink.Numbers(), (std::vector<BlockNumber>{0}));
  EXPECT_EQ(*cursor.last_block, 0u);

  src->blocks[1] = MakeBlock(1);
  src->head = 1;
  loop.RunCycle();
  EXPECT_EQ(sink.Numbers(), (std::vector<BlockNumber>{0, 1}));
}

TEST_F(StreamingLoopTest, ProviderStuckAtHeadZeroIsRotatedAway) {
  auto genesis = FakeBlockSource::Serving(0, 0);
  auto healthy = FakeBlockSource::Serving(1, 5);
  auto pool = MakePool({{"A", genesis}, {"B", healthy}});
  StreamingLoop loop(*pool, cursor, sink, options, clock.Bind());

  for (int i = 0; i < 20 && pool->ActiveIndex() == 0; ++i) loop.Step();
  ASSERT_EQ(pool->ActiveIndex(), 1u);
  loop.Step();
  std::vector<std::pair<BlockNumber, std::string>> expected{
      {0, "A"}, {1, "B"}, {2, "B"}, {3, "B"}, {4, "B"}, {5, "B"}};
  EXPECT_EQ(sink.emitted, expected);
}

TEST_F(StreamingLoopTest, HeadZeroWithoutBlockZeroStallsAfterThreshold) {
  auto empty = std::make_shared<FakeBlockSource>();
  auto pool = MakePool({{"Empty", empty}, {"B", FakeBlockSource::Serving(1, 2)}});
  StreamingLoop loop(*pool, cursor, sink, options, clock.Bind());

  EXPECT_EQ(loop.Step().outcome, CycleOutcome::BLOCK_NOT_FOUND);
  EXPECT_EQ(loop.State(), LoopState::POLLING);
  clock.Advance(options.block_delay_threshold);
  EXPECT_EQ(loop.Step().outcome, CycleOutcome::STALLED);
  EXPECT_EQ(pool->ActiveIndex(), 1u);
  EXPECT_TRUE(sink.emitted.empty());
}

TEST_F(StreamingLoopTest, StalledProviderIsRotatedOnce) {
  auto a = FakeBlockSource::Serving(1, 5);
  auto b = FakeBlockSource::Serving(1, 5);
  auto pool = MakePool({{"ProviderA", a}, {"ProviderB", b}});
  options.block_delay_threshold = milliseconds(1000);
  StartAt(5);
  clock.Advance(seconds(5));
  StreamingLoop loop(*pool, cursor, sink, options, clock.Bind());

  CycleReport report = loop.Step();
  EXPECT_EQ(report.outcome, CycleOutcome::STALLED);
  EXPECT_EQ(pool->ActiveIndex(), 1u);
  EXPECT_EQ(pool->FailureCount("ProviderA"), 1u);
  // Only the rotation backoff, no extra poll sleep.
  EXPECT_EQ(clock.sleeps, (std::vector<milliseconds>{milliseconds(2000)}));
  EXPECT_TRUE(sink.emitted.empty());
  EXPECT_EQ(b->latest_calls, 1);
}

TEST_F(StreamingLoopTest, QuietProviderWithinThresholdJustWaits) {
  auto src = FakeBlockSource::Serving(1, 5);
  auto pool = MakePool({{"A", src}, {"B", FakeBlockSource::Serving(1, 5)}});
  StartAt(5);
  clock.Advance(seconds(30));
  StreamingLoop loop(*pool, cursor, sink, options, clock.Bind());

  EXPECT_EQ(loop.Step().outcome, CycleOutcome::IDLE);
  EXPECT_EQ(pool->ActiveIndex(), 0u);
  EXPECT_EQ(clock.sleeps, (std::vector<milliseconds>{milliseconds(5000)}));
}

TEST_F(StreamingLoopTest, StallBoundaryIsExclusive) {
  auto pool = MakePool({{"A", FakeBlockSource::Serving(1, 5)}, {"B", FakeBlockSource::Serving(1, 5)}});
  StartAt(5);
  clock.Advance(options.block_delay_threshold);
  StreamingLoop loop(*pool, cursor, sink, options, clock.Bind());
  EXPECT_EQ(loop.RunCycle().outcome, CycleOutcome::IDLE);
  clock.Advance(milliseconds(1));
  EXPECT_EQ(loop.RunCycle().outcome, CycleOutcome::STALLED);
}

TEST_F(StreamingLoopTest, FetchFailureFailsOverAndResumes) {
  auto a = FakeBlockSource::Serving(1, 2);
  a->head = 3;
  a->failing.insert(3);
  auto b = FakeBlockSource::Serving(1, 4);
  auto pool = MakePool({{"ProviderA", a}, {"ProviderB", b}});
  StartAt(0);
  StreamingLoop loop(*pool, cursor, sink, options, clock.Bind());

  CycleReport first = loop.Step();
  EXPECT_EQ(first.outcome, CycleOutcome::FETCH_FAILED);
  EXPECT_EQ(first.emitted, 2u);
  loop.Step();
  loop.Step();

  std::vector<std::pair<BlockNumber, std::string>> expected{
      {1, "ProviderA"}, {2, "ProviderA"}, {3, "ProviderB"}, {4, "ProviderB"}};
  EXPECT_EQ(sink.emitted, expected);
  EXPECT_EQ(pool->ActiveIndex(), 1u);
  EXPECT_EQ(b->requested, (std::vector<BlockNumber>{3, 4}));
}

TEST_F(StreamingLoopTest, LatestFailureRotatesWithoutPollSleep) {
  auto a = FakeBlockSource::Serving(1, 5);
  auto pool = MakePool({{"A", a}, {"B", FakeBlockSource::Serving(1, 5)}});
  a->fail_latest = true;
  StartAt(3);
  StreamingLoop loop(*pool, cursor, sink, options, clock.Bind());

  EXPECT_EQ(loop.Step().outcome, CycleOutcome::LATEST_FAILED);
  EXPECT_EQ(pool->ActiveIndex(), 1u);
  EXPECT_EQ(clock.sleeps, (std::vector<milliseconds>{milliseconds(2000)}));
  EXPECT_EQ(*cursor.last_block, 3u);
  EXPECT_TRUE(sink.emitted.empty());
}

TEST_F(StreamingLoopTest, NotFoundStopsWithoutRotatingOrSkipping) {
  auto a = FakeBlockSource::Serving(1, 2);
  a->head = 3;
  auto pool = MakePool({{"A", a}, {"B", FakeBlockSource::Serving(1, 3)}});
  StartAt(0);
  StreamingLoop loop(*pool, cursor, sink, options, clock.Bind());

  CycleReport report = loop.Step();
  EXPECT_EQ(report.outcome, CycleOutcome::BLOCK_NOT_FOUND);
  EXPECT_EQ(report.emitted, 2u);
  EXPECT_EQ(pool->ActiveIndex(), 0u);
  EXPECT_EQ(*cursor.last_block, 2u);
  EXPECT_EQ(clock.sleeps, (std::vector<milliseconds>{milliseconds(5000)}));

  a->blocks[3] = MakeBlock(3);
  EXPECT_EQ(loop.Step().outcome, CycleOutcome::ADVANCED);
  EXPECT_EQ(sink.Numbers(), (std::vector<BlockNumber>{1, 2, 3}));
  EXPECT_EQ(pool->FailureCount("A"), 0u);
}

TEST_F(StreamingLoopTest, PersistentNotFoundBeyondThresholdCountsAsStall) {
  auto a = FakeBlockSource::Serving(1, 2);
  a->head = 3;
  auto pool = MakePool({{"A", a}, {"B", FakeBlockSource::Serving(1, 3)}});
  StartAt(2);
  clock.Advance(options.block_delay_threshold + milliseconds(1));
  StreamingLoop loop(*pool, cursor, sink, options, clock.Bind());

  EXPECT_EQ(loop.Step().outcome, CycleOutcome::STALLED);
  EXPECT_EQ(pool->ActiveIndex(), 1u);
  loop.Step();
  EXPECT_EQ(sink.emitted, (std::vector<std::pair<BlockNumber, std::string>>{{3, "B"}}));
}

TEST_F(StreamingLoopTest, CursorNeverMovesBackwards) {
  auto a = FakeBlockSource::Serving(1, 7);
  a->head = 5;
  auto pool = MakePool({{"A", a}});
  StartAt(0);
  StreamingLoop loop(*pool, cursor, sink, options, clock.Bind());

  std::vector<BlockNumber> watermarks;
  for (BlockNumber head : {5ULL, 3ULL, 5ULL, 7ULL, 6ULL}) {
    a->head = head;
    loop.Step();
    watermarks.push_back(*cursor.last_block);
  }
  EXPECT_EQ(watermarks, (std::vector<BlockNumber>{5, 5, 5, 7, 7}));
  EXPECT_EQ(sink.Numbers(), (std::vector<BlockNumber>{1, 2, 3, 4, 5, 6, 7}));
}

TEST_F(StreamingLoopTest, BlockWithWrongNumberIsAFetchFailure) {
  auto a = FakeBlockSource::Serving(1, 2);
  a->wrong_number[2] = 9;
  auto pool = MakePool({{"A", a}, {"B", FakeBlockSource::Serving(1, 2)}});
  StartAt(0);
  StreamingLoop loop(*pool, cursor, sink, options, clock.Bind());

  CycleReport report = loop.RunCycle();
  EXPECT_EQ(report.outcome, CycleOutcome::FETCH_FAILED);
  EXPECT_EQ(sink.Numbers(), (std::vector<BlockNumber>{1}));
  EXPECT_EQ(*cursor.last_block, 1u);
}

TEST_F(StreamingLoopTest, RunChecksPredicateBetweenCycles) {
  auto a = FakeBlockSource::Serving(1, 3);
  auto pool = MakePool({{"A", a}});
  StartAt(0);
  StreamingLoop loop(*pool, cursor, sink, options, clock.Bind());

  int cycles = 0;
  loop.Run([&]{ return cycles++ < 3; });
  EXPECT_EQ(a->latest_calls, 1 + 3);  // startup check plus three cycles
  EXPECT_EQ(clock.sleeps.size(), 3u);
  EXPECT_EQ(sink.Numbers(), (std::vector<BlockNumber>{1, 2, 3}));
}

namespace {
// Fails the first delivery of one block number.
class FlakySink : public RecordingSink {
public:
  explicit FlakySink(BlockNumber fail_once) : fail_once_(fail_once) {}
  void Emit(const Block& block, const std::string& provider_name) override {
    if (!failed_ && block.number == fail_once_) {
      failed_ = true;
      throw std::runtime_error("disk full");
    }
    RecordingSink::Emit(block, provider_name);
  }
private:
  BlockNumber fail_once_;
  bool failed_ = false;
};
}

TEST_F(StreamingLoopTest, FailedEmitIsRetriedExactlyOnce) {
  auto a = FakeBlockSource::Serving(1, 4);
  auto pool = MakePool({{"A", a}});
  StartAt(0);
  FlakySink flaky(3);
  StreamingLoop loop(*pool, cursor, flaky, options, clock.Bind());

  int cycles = 0;
  loop.Run([&]{
    if (cycles == 1) EXPECT_EQ(*cursor.last_block, 2u);
    return cycles++ < 2;
  });
  EXPECT_EQ(flaky.Numbers(), (std::vector<BlockNumber>{1, 2, 3, 4}));
  EXPECT_EQ(*cursor.last_block, 4u);
  EXPECT_EQ(pool->ActiveIndex(), 0u);
}

TEST(StreamingLoopStopTest, StopCutsBackoffShort) {
  StopSignal stop;
  LoopClock clock = LoopClock::System(&stop);
  auto down = FakeBlockSource::Serving(1, 1);
  std::vector<ProviderSpec> specs{ProviderSpec{"Down", "", std::nullopt, down}};
  ProviderPool pool(specs, nullptr, seconds(300), clock.sleep);
  down->fail_latest = true;  // first rotation backs off for 2s

  StreamCursor cursor;
  RecordingSink sink;
  StreamingOptions options;
  StreamingLoop loop(pool, cursor, sink, options, clock);

  std::thread stopper([&stop]{
    std::this_thread::sleep_for(milliseconds(50));
    stop.RequestStop();
  });
  auto started = std::chrono::steady_clock::now();
  loop.Run([&stop]{ return !stop.StopRequested(); });
  auto elapsed = std::chrono::steady_clock::now() - started;
  stopper.join();

  EXPECT_LT(elapsed, milliseconds(1500));
  EXPECT_EQ(pool.FailureCount("Down"), 1u);
  EXPECT_TRUE(sink.emitted.empty());
}

TEST(StopSignalTest, WaitEndsEarlyOnStop) {
  StopSignal stop;
  EXPECT_TRUE(stop.WaitFor(milliseconds(1)));
  stop.RequestStop();
  EXPECT_TRUE(stop.StopRequested());
  auto started = std::chrono::steady_clock::now();
  EXPECT_FALSE(stop.WaitFor(milliseconds(60000)));
  EXPECT_LT(std::chrono::steady_clock::now() - started, seconds(5));
}

TEST(CycleOutcomeTest, RotatedOutcomes) {
  EXPECT_TRUE((CycleReport{CycleOutcome::STALLED, 0}).Rotated());
  EXPECT_TRUE((CycleReport{CycleOutcome::FETCH_FAILED, 1}).Rotated());
  EXPECT_TRUE((CycleReport{CycleOutcome::LATEST_FAILED, 0}).Rotated());
  EXPECT_FALSE((CycleReport{CycleOutcome::BLOCK_NOT_FOUND, 0}).Rotated());
  EXPECT_FALSE((CycleReport{CycleOutcome::ADVANCED, 2}).Rotated());
  EXPECT_STREQ(CycleOutcomeToString(CycleOutcome::STALLED), "stalled");
}
