// Carpark headers
#include "core/Coordinator.hpp"
#include "core/Logger.hpp"
#include "core/StatusFormat.hpp"
#include "core/TelemetryStore.hpp"

// Carpark-Fake headers
#include "FakeInputSource.hpp"
#include "FakeOutputSink.hpp"
#include "FakePublisher.hpp"
#include "MockErrorMonitor.hpp"

// GTest headers
#include <gmock/gmock.h>
#include <gtest/gtest.h>

#include <stdexcept>
#include <string>
#include <thread>
#include <utility>
#include <vector>

namespace carpark::test {

  using carpark::core::Coordinator;
  using carpark::core::CoordinatorOptions;
  using carpark::core::InputEvent;
  using carpark::core::Logger;
  using carpark::core::LogLevel;
  using carpark::core::OccupancyError;
  using carpark::core::OccupancyStore;
  using carpark::core::RetryPolicy;
  using carpark::core::TelemetryStore;
  using Outcome = FakePublisher::Outcome;
  using ::testing::HasSubstr;

  class CoordinatorTest : public ::testing::Test {
  protected:
    void SetUp() override {
      logger = std::make_shared<Logger>();
      logger->setMirrorLevel(LogLevel::Error);
      errorMonitor = std::make_shared<::testing::NiceMock<MockErrorMonitor>>();
      sink = std::make_shared<FakeOutputSink>();
      publisher = std::make_shared<FakePublisher>();
    }

    std::unique_ptr<Coordinator> make(int capacity, int occupied = 0,
                                      std::shared_ptr<const TelemetryStore> telemetry = nullptr) {
      CoordinatorOptions options;
      options.topic = "carpark/Moondalup";
      // fast retries keep the suite quick; the sequence is what matters
      options.publishPolicy = RetryPolicy{ 3, std::chrono::milliseconds{ 1 },
                                           std::chrono::milliseconds{ 4 },
                                           std::chrono::milliseconds{ 1000 } };
      options.renderPolicy = options.publishPolicy;
      auto c = std::make_unique<Coordinator>(
          std::make_unique<OccupancyStore>("Moondalup", capacity, occupied), sink, publisher,
          options, logger, std::static_pointer_cast<core::ErrorMonitor>(errorMonitor),
          std::move(telemetry));
      return c;
    }

    std::shared_ptr<Logger> logger;
    std::shared_ptr<::testing::NiceMock<MockErrorMonitor>> errorMonitor;
    std::shared_ptr<FakeOutputSink> sink;
    std::shared_ptr<FakePublisher> publisher;
  };

  TEST_F(CoordinatorTest, RequiresCollaboratorsAndTopic) {
    CoordinatorOptions options;
    options.topic = "t";
    EXPECT_THROW(Coordinator(std::make_unique<OccupancyStore>("Lot", 1), nullptr, publisher,
                             options, logger, errorMonitor),
                 std::invalid_argument);
    EXPECT_THROW(Coordinator(std::make_unique<OccupancyStore>("Lot", 1), sink, nullptr, options,
                             logger, errorMonitor),
                 std::invalid_argument);
    options.topic.clear();
    EXPECT_THROW(Coordinator(std::make_unique<OccupancyStore>("Lot", 1), sink, publisher,
                             options, logger, errorMonitor),
                 std::invalid_argument);
  }

  TEST_F(CoordinatorTest, AcceptedEnterRendersAndPublishesOnce) {
    auto coordinator = make(10, 4);
    coordinator->start();

    ASSERT_TRUE(coordinator->submit(InputEvent::Enter));
    coordinator->waitIdle();

    EXPECT_EQ(coordinator->store().occupied(), 5);
    ASSERT_EQ(sink->calls(), 1u);
    ASSERT_EQ(publisher->calls(), 1u);

    const auto rendered = sink->rendered();
    EXPECT_THAT(rendered[0], HasSubstr("Moondalup | Available bays: 5 |"));

    const auto published = publisher->published();
    EXPECT_EQ(published[0].topic, "carpark/Moondalup");
    auto snap = core::fromPayload(published[0].payload);
    ASSERT_TRUE(snap);
    EXPECT_EQ(snap->available(), 5);
    EXPECT_EQ(snap->occupied, 5);
    EXPECT_EQ(core::formatStatus(*snap), rendered[0]);
    EXPECT_EQ(coordinator->applied(), 1u);
  }

  TEST_F(CoordinatorTest, PublisherRecoversWithinRetryBudget) {
    EXPECT_CALL(*errorMonitor, notifyFailure(::testing::_)).Times(0);
    publisher->expect({ Outcome::Fail, Outcome::Fail, Outcome::Ack });

    auto coordinator = make(10);
    coordinator->start();
    coordinator->submit(InputEvent::Enter);
    coordinator->waitIdle();

    EXPECT_EQ(publisher->calls(), 3u);
    EXPECT_EQ(publisher->published().size(), 1u);
    EXPECT_EQ(coordinator->publishWorker().delivered(), 1u);
    EXPECT_EQ(coordinator->publishWorker().failed(), 0u);
    EXPECT_EQ(coordinator->publishWorker().attempts(), 3u);

    // the display never saw the publisher's trouble
    EXPECT_EQ(sink->calls(), 1u);
    EXPECT_EQ(coordinator->renderWorker().attempts(), 1u);
  }

  TEST_F(CoordinatorTest, ExhaustedPublisherNeitherRollsBackNorStalls) {
    EXPECT_CALL(*errorMonitor, notifyFailure(HasSubstr("[Publisher] delivery failed after 3")))
        .Times(2);
    publisher->alwaysFail();

    auto coordinator = make(10);
    coordinator->start();
    coordinator->submit(InputEvent::Enter);
    coordinator->submit(InputEvent::Enter);
    coordinator->waitIdle();

    EXPECT_EQ(coordinator->store().occupied(), 2);
    EXPECT_EQ(coordinator->applied(), 2u);
    EXPECT_EQ(publisher->calls(), 6u);
    EXPECT_EQ(coordinator->publishWorker().failed(), 2u);
    EXPECT_EQ(coordinator->renderWorker().delivered(), 2u);
  }

  TEST_F(CoordinatorTest, ThrowingPublisherCountsAsFailedAttempt) {
    publisher->expect({ Outcome::Throw, Outcome::Ack });

    auto coordinator = make(10);
    coordinator->start();
    coordinator->submit(InputEvent::Enter);
    coordinator->waitIdle();

    EXPECT_EQ(publisher->calls(), 2u);
    EXPECT_EQ(coordinator->publishWorker().delivered(), 1u);
  }

  TEST_F(CoordinatorTest, FailingSinkDoesNotBlockPublishing) {
    sink->fallback = false;
    EXPECT_CALL(*errorMonitor, notifyFailure(HasSubstr("[OutputSink]"))).Times(1);

    auto coordinator = make(10);
    coordinator->start();
    coordinator->submit(InputEvent::Enter);
    coordinator->waitIdle();

    EXPECT_EQ(publisher->published().size(), 1u);
    EXPECT_EQ(coordinator->renderWorker().failed(), 1u);
    EXPECT_EQ(coordinator->store().occupied(), 1);
  }

  TEST_F(CoordinatorTest, RejectionEmitsNothingAndNotifiesCallback) {
    std::vector<std::pair<InputEvent, OccupancyError>> rejections;
    auto coordinator = make(1);
    coordinator->registerRejectionCallback(
        [&](InputEvent e, OccupancyError err) { rejections.emplace_back(e, err); });
    coordinator->start();

    coordinator->submit(InputEvent::Enter);
    coordinator->submit(InputEvent::Enter); // full
    coordinator->submit(InputEvent::Exit);
    coordinator->submit(InputEvent::Exit); // empty
    coordinator->waitIdle();

    ASSERT_EQ(rejections.size(), 2u);
    EXPECT_EQ(rejections[0], std::make_pair(InputEvent::Enter, OccupancyError::AtCapacity));
    EXPECT_EQ(rejections[1], std::make_pair(InputEvent::Exit, OccupancyError::AlreadyEmpty));
    EXPECT_EQ(coordinator->applied(), 2u);
    EXPECT_EQ(coordinator->rejected(), 2u);
    EXPECT_EQ(sink->calls(), 2u);
    EXPECT_EQ(publisher->calls(), 2u);
    EXPECT_EQ(coordinator->store().occupied(), 0);
  }

  TEST_F(CoordinatorTest, SnapshotsCarryLatestTemperature) {
    auto telemetry = std::make_shared<TelemetryStore>();
    telemetry->set(core::Telemetry::Temperature, 21.5);

    auto coordinator = make(10, 0, telemetry);
    coordinator->start();
    coordinator->submit(InputEvent::Enter);
    coordinator->waitIdle();

    EXPECT_THAT(sink->rendered().at(0), HasSubstr("Temperature: 21.5°C"));
    auto snap = core::fromPayload(publisher->published().at(0).payload);
    ASSERT_TRUE(snap);
    ASSERT_TRUE(snap->temperature);
    EXPECT_DOUBLE_EQ(*snap->temperature, 21.5);
  }

  TEST_F(CoordinatorTest, ConcurrentSubmittersAreSerialised) {
    constexpr int kThreads = 8;
    constexpr int kPerThread = 50;
    constexpr int kCapacity = 300;

    auto coordinator = make(kCapacity);
    coordinator->start();

    std::vector<std::thread> sources;
    for (int t = 0; t < kThreads; ++t)
      sources.emplace_back([&] {
        for (int i = 0; i < kPerThread; ++i)
          EXPECT_TRUE(coordinator->submit(InputEvent::Enter));
      });
    for (auto& t : sources)
      t.join();
    coordinator->waitIdle();

    EXPECT_EQ(coordinator->store().occupied(), kCapacity);
    EXPECT_EQ(coordinator->applied(), static_cast<std::uint64_t>(kCapacity));
    EXPECT_EQ(coordinator->rejected(), static_cast<std::uint64_t>(kThreads * kPerThread - kCapacity));

    // one render and one publish per accepted transition
    EXPECT_EQ(sink->calls(), static_cast<std::size_t>(kCapacity));
    EXPECT_EQ(publisher->calls(), static_cast<std::size_t>(kCapacity));
    EXPECT_EQ(coordinator->renderWorker().delivered(), static_cast<std::uint64_t>(kCapacity));
    EXPECT_EQ(coordinator->publishWorker().delivered(), static_cast<std::uint64_t>(kCapacity));
  }

  TEST_F(CoordinatorTest, SlowSinkStillRendersEveryTransitionInOrder) {
    constexpr int kEvents = 10;
    sink->delay = std::chrono::milliseconds{ 20 };
    auto coordinator = make(kEvents);
    coordinator->start();

    for (int i = 0; i < kEvents; ++i)
      ASSERT_TRUE(coordinator->submit(InputEvent::Enter));
    coordinator->waitIdle();

    EXPECT_EQ(coordinator->applied(), static_cast<std::uint64_t>(kEvents));
    ASSERT_EQ(sink->calls(), static_cast<std::size_t>(kEvents));
    EXPECT_EQ(publisher->calls(), static_cast<std::size_t>(kEvents));

    const auto rendered = sink->rendered();
    for (int i = 0; i < kEvents; ++i)
      EXPECT_THAT(rendered[static_cast<std::size_t>(i)],
                  HasSubstr("Available bays: " + std::to_string(kEvents - 1 - i) + " |"));
    EXPECT_EQ(coordinator->renderWorker().pending(), 0u);
  }

  TEST_F(CoordinatorTest, TransitionsAppliedDuringStopAreStillFannedOut) {
    sink->delay = std::chrono::milliseconds{ 10 };
    auto coordinator = make(20);
    coordinator->start();

    for (int i = 0; i < 10; ++i)
      coordinator->submit(InputEvent::Enter);
    coordinator->waitIdle();
    ASSERT_EQ(sink->calls(), 10u);

    for (int i = 0; i < 5; ++i)
      coordinator->submit(InputEvent::Enter);
    coordinator->stop();

    EXPECT_EQ(coordinator->applied(), 15u);
    EXPECT_EQ(sink->calls(), 15u);
    EXPECT_EQ(publisher->calls(), 15u);
    EXPECT_THAT(sink->rendered().back(), HasSubstr("Available bays: 5 |"));
    auto last = core::fromPayload(publisher->published().back().payload);
    ASSERT_TRUE(last);
    EXPECT_EQ(last->occupied, 15);
  }

  TEST_F(CoordinatorTest, InputSourceIntentsReachTheStore) {
    FakeInputSource buttons;
    auto coordinator = make(3);
    Coordinator* c = coordinator.get();
    buttons.registerCallback([c](InputEvent e) { c->submit(e); });
    coordinator->start();
    buttons.start();

    buttons.press(InputEvent::Enter);
    buttons.press(InputEvent::Enter);
    buttons.press(InputEvent::Exit);
    coordinator->waitIdle();
    buttons.stop();

    EXPECT_EQ(coordinator->store().occupied(), 1);
    EXPECT_EQ(sink->calls(), 3u);
    EXPECT_THAT(sink->rendered().back(), HasSubstr("Available bays: 2"));
  }

  TEST_F(CoordinatorTest, StopDrainsQueuedEventsThenRefusesInput) {
    auto coordinator = make(10);
    coordinator->start();
    for (int i = 0; i < 5; ++i)
      coordinator->submit(InputEvent::Enter);
    coordinator->stop();

    EXPECT_EQ(coordinator->store().occupied(), 5);
    EXPECT_EQ(sink->calls(), 5u);
    EXPECT_EQ(publisher->calls(), 5u);
    EXPECT_FALSE(coordinator->submit(InputEvent::Enter));
    EXPECT_EQ(coordinator->store().occupied(), 5);
    coordinator->stop(); // idempotent
  }

} // namespace carpark::test
