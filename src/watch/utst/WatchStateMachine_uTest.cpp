/**
 * @file WatchStateMachine_uTest.cpp
 * @brief Unit tests for mountwatch::watch::WatchStateMachine.
 *
 * Notes:
 *  - The mount table is a scripted in-memory source; each test edits its
 *    text between triggers to simulate mounts and unmounts.
 *  - Coalescing tests use the real timerfd, registered with a real
 *    EventPoller through the registrar hook.
 */

#include "src/watch/inc/WatchStateMachine.hpp"
#include "src/watch/inc/EventPoller.hpp"

#include <gtest/gtest.h>

#include <cerrno>
#include <chrono>
#include <cstdint>
#include <stdexcept>
#include <string>
#include <utility>
#include <vector>

using mountwatch::mount::MountRecord;
using mountwatch::watch::ChangeEvent;
using mountwatch::watch::EventPoller;
using mountwatch::watch::MountTableSource;
using mountwatch::watch::PollOutcome;
using mountwatch::watch::TIMER_EVENTS;
using mountwatch::watch::TIMER_TOKEN;
using mountwatch::watch::WatchControl;
using mountwatch::watch::WatchError;
using mountwatch::watch::WatchStateMachine;
using mountwatch::watch::WatchStatus;

namespace {

constexpr const char* ROOT = "/dev/sda1 / ext4 rw,relatime 0 1\n";
constexpr const char* PROC = "proc /proc proc rw,nosuid,nodev,noexec,relatime 0 0\n";
constexpr const char* BOOT = "/dev/sda2 /boot ext4 rw,relatime 0 2\n";
constexpr const char* USB = "/dev/sdb1 /media/usb vfat rw,relatime 0 0\n";
constexpr const char* NFS = "server:/export /mnt/nfs nfs4 rw,relatime 0 0\n";

/// Mount table whose content is set by the test.
class ScriptedSource final : public MountTableSource {
public:
  std::string table;
  int readErrno{0};
  std::uint64_t reads{0};

  int readAll(std::string& out) override {
    ++reads;
    if (readErrno != 0) {
      out.clear();
      return readErrno;
    }
    out = table;
    return 0;
  }

  int fd() const noexcept override { return -1; }

  const std::string& name() const noexcept override { return name_; }

private:
  std::string name_{"scripted"};
};

/// Handler recording events and answering with a scripted decision.
struct Recorder {
  std::vector<ChangeEvent> events;
  std::vector<WatchControl> answers; ///< Consumed in order; CONTINUE when exhausted

  mountwatch::watch::MountHandler handler() {
    return [this](ChangeEvent ev) {
      events.push_back(std::move(ev));
      if (answers.empty()) {
        return WatchControl::keepWatching();
      }
      const WatchControl NEXT = answers.front();
      answers.erase(answers.begin());
      return NEXT;
    };
  }
};

bool hasMountPoint(const std::vector<MountRecord>& records, const std::string& mountPoint) {
  for (const auto& R : records) {
    if (R.mountPoint == mountPoint) {
      return true;
    }
  }
  return false;
}

class WatchStateMachineTest : public ::testing::Test {
protected:
  ScriptedSource source_;
  Recorder rec_;
  WatchControl decision_{};
};

} // namespace

/* ----------------------------- Idle State ----------------------------- */

/** @test Initial trigger reports every entry as mounted. */
TEST_F(WatchStateMachineTest, InitialEventListsAllMounts) {
  source_.table = std::string(ROOT) + PROC + BOOT;
  WatchStateMachine sm(source_, rec_.handler());

  ASSERT_TRUE(sm.onTrigger(false, true, decision_).ok());
  ASSERT_EQ(rec_.events.size(), 1U);

  const ChangeEvent& EV = rec_.events[0];
  EXPECT_TRUE(EV.initial);
  EXPECT_FALSE(EV.coalesced);
  EXPECT_EQ(EV.mounted.size(), 3U);
  EXPECT_TRUE(EV.unmounted.empty());
  EXPECT_EQ(sm.lastKnown().size(), 3U);
  EXPECT_EQ(decision_.action, WatchControl::Action::CONTINUE);
}

/** @test Removing one entry reports exactly that entry as unmounted. */
TEST_F(WatchStateMachineTest, RemovalReportsUnmounted) {
  source_.table = std::string(ROOT) + PROC + BOOT;
  WatchStateMachine sm(source_, rec_.handler());
  ASSERT_TRUE(sm.onTrigger(false, true, decision_).ok());

  source_.table = std::string(ROOT) + PROC;
  ASSERT_TRUE(sm.onTrigger(false, false, decision_).ok());
  ASSERT_EQ(rec_.events.size(), 2U);

  const ChangeEvent& EV = rec_.events[1];
  EXPECT_FALSE(EV.initial);
  EXPECT_FALSE(EV.coalesced);
  EXPECT_TRUE(EV.mounted.empty());
  ASSERT_EQ(EV.unmounted.size(), 1U);
  EXPECT_EQ(EV.unmounted[0].mountPoint, "/boot");
}

/** @test A trigger without a table change calls nobody. */
TEST_F(WatchStateMachineTest, UnchangedTableIsSilent) {
  source_.table = std::string(ROOT) + PROC;
  WatchStateMachine sm(source_, rec_.handler());
  ASSERT_TRUE(sm.onTrigger(false, true, decision_).ok());

  ASSERT_TRUE(sm.onTrigger(false, false, decision_).ok());
  ASSERT_TRUE(sm.onTrigger(false, false, decision_).ok());
  EXPECT_EQ(rec_.events.size(), 1U);
  EXPECT_EQ(sm.handlerCalls(), 1U);
  EXPECT_EQ(decision_.action, WatchControl::Action::CONTINUE);
}

/** @test Two triggers for one change produce one event. */
TEST_F(WatchStateMachineTest, RepeatedTriggerIsIdempotent) {
  source_.table = ROOT;
  WatchStateMachine sm(source_, rec_.handler());
  ASSERT_TRUE(sm.onTrigger(false, true, decision_).ok());

  source_.table = std::string(ROOT) + USB;
  ASSERT_TRUE(sm.onTrigger(false, false, decision_).ok());
  ASSERT_TRUE(sm.onTrigger(false, false, decision_).ok());

  ASSERT_EQ(rec_.events.size(), 2U);
  EXPECT_TRUE(hasMountPoint(rec_.events[1].mounted, "/media/usb"));
}

/** @test An empty initial table produces no initial event. */
TEST_F(WatchStateMachineTest, EmptyInitialTableIsSilent) {
  WatchStateMachine sm(source_, rec_.handler());
  ASSERT_TRUE(sm.onTrigger(false, true, decision_).ok());
  EXPECT_TRUE(rec_.events.empty());
}

/** @test STOP is passed through and the baseline still advances. */
TEST_F(WatchStateMachineTest, StopDecisionPassedThrough) {
  source_.table = ROOT;
  rec_.answers = {WatchControl::stopWatching()};
  WatchStateMachine sm(source_, rec_.handler());

  ASSERT_TRUE(sm.onTrigger(false, true, decision_).ok());
  EXPECT_EQ(decision_.action, WatchControl::Action::STOP);
  EXPECT_EQ(sm.lastKnown().size(), 1U);
}

/** @test A timer expiry while idle acts as a plain change notification. */
TEST_F(WatchStateMachineTest, TimerExpiryWhileIdle) {
  source_.table = ROOT;
  WatchStateMachine sm(source_, rec_.handler());
  ASSERT_TRUE(sm.onTrigger(false, true, decision_).ok());

  source_.table = std::string(ROOT) + USB;
  ASSERT_TRUE(sm.onTrigger(true, false, decision_).ok());
  ASSERT_EQ(rec_.events.size(), 2U);
  EXPECT_FALSE(rec_.events[1].coalesced);
}

/* ----------------------------- Failures ----------------------------- */

/** @test A malformed line fails the read and leaves the baseline untouched. */
TEST_F(WatchStateMachineTest, MalformedLineIsParseError) {
  source_.table = ROOT;
  WatchStateMachine sm(source_, rec_.handler());
  ASSERT_TRUE(sm.onTrigger(false, true, decision_).ok());

  source_.table = std::string(ROOT) + "croup2 /sys/fs/cgroup\n";
  const WatchError ERR = sm.onTrigger(false, false, decision_);
  EXPECT_EQ(ERR.status, WatchStatus::PARSE_FAILED);
  EXPECT_NE(ERR.detail.find("croup2 /sys/fs/cgroup"), std::string::npos);
  EXPECT_NE(ERR.detail.find("line 2"), std::string::npos);
  EXPECT_FALSE(ERR.isSetupFailure());

  EXPECT_EQ(rec_.events.size(), 1U);
  EXPECT_EQ(sm.lastKnown().size(), 1U);
}

/** @test A failing read reports the errno and the source name. */
TEST_F(WatchStateMachineTest, ReadFailure) {
  source_.readErrno = EIO;
  WatchStateMachine sm(source_, rec_.handler());

  const WatchError ERR = sm.onTrigger(false, true, decision_);
  EXPECT_EQ(ERR.status, WatchStatus::MOUNT_READ_FAILED);
  EXPECT_EQ(ERR.sysErrno, EIO);
  EXPECT_EQ(ERR.detail, "scripted");
  EXPECT_TRUE(rec_.events.empty());
}

/** @test Handler exceptions propagate and the baseline is not replaced. */
TEST_F(WatchStateMachineTest, HandlerExceptionPropagates) {
  source_.table = ROOT;
  WatchStateMachine sm(source_, [](ChangeEvent) -> WatchControl {
    throw std::runtime_error("handler failed");
  });

  EXPECT_THROW(static_cast<void>(sm.onTrigger(false, true, decision_)), std::runtime_error);
  EXPECT_TRUE(sm.lastKnown().empty());
}

/** @test Registration failure of the timer is fatal and leaves the machine idle. */
TEST_F(WatchStateMachineTest, TimerRegistrationFailure) {
  source_.table = ROOT;
  rec_.answers = {WatchControl::coalesceFor(std::chrono::milliseconds(10))};
  WatchStateMachine sm(source_, rec_.handler(), [](int) { return ENOMEM; });

  const WatchError ERR = sm.onTrigger(false, true, decision_);
  EXPECT_EQ(ERR.status, WatchStatus::TIMER_FAILED);
  EXPECT_EQ(ERR.sysErrno, ENOMEM);
  EXPECT_FALSE(sm.isCoalescing());
}

/* ----------------------------- Coalescing ----------------------------- */

class WatchStateMachineCoalesceTest : public WatchStateMachineTest {
protected:
  void SetUp() override { ASSERT_EQ(poller_.open(), 0); }

  mountwatch::watch::TimerRegistrar registrar() {
    return [this](int fd) {
      ++registrations_;
      return poller_.add(fd, TIMER_EVENTS, TIMER_TOKEN);
    };
  }

  /// Block until the coalescing timer fires, then consume it.
  void waitForTimer(WatchStateMachine& sm) {
    std::uint64_t token = 99;
    ASSERT_EQ(poller_.wait(std::chrono::milliseconds(2000), token), PollOutcome::READY);
    ASSERT_EQ(token, TIMER_TOKEN);
    EXPECT_EQ(sm.timer().drain(), 1U);
  }

  EventPoller poller_;
  int registrations_{0};
};

/** @test Changes inside the window are absorbed and summarized once at expiry. */
TEST_F(WatchStateMachineCoalesceTest, WindowDeliversOneSummary) {
  source_.table = std::string(ROOT) + PROC + BOOT;
  WatchStateMachine sm(source_, rec_.handler(), registrar());
  ASSERT_TRUE(sm.onTrigger(false, true, decision_).ok());

  // Event N asks to coalesce
  source_.table = std::string(ROOT) + PROC + BOOT + USB;
  rec_.answers = {WatchControl::coalesceFor(std::chrono::milliseconds(30))};
  ASSERT_TRUE(sm.onTrigger(false, false, decision_).ok());
  ASSERT_EQ(rec_.events.size(), 2U);
  EXPECT_EQ(decision_.action, WatchControl::Action::COALESCE);
  EXPECT_TRUE(sm.isCoalescing());
  EXPECT_EQ(registrations_, 1);

  // Two more raw changes inside the window
  source_.table = std::string(ROOT) + PROC + USB;
  ASSERT_TRUE(sm.onTrigger(false, false, decision_).ok());
  source_.table = std::string(ROOT) + PROC + USB + NFS;
  ASSERT_TRUE(sm.onTrigger(false, false, decision_).ok());
  EXPECT_EQ(rec_.events.size(), 2U);
  EXPECT_EQ(decision_.action, WatchControl::Action::CONTINUE);

  waitForTimer(sm);
  ASSERT_TRUE(sm.onTrigger(true, false, decision_).ok());
  ASSERT_EQ(rec_.events.size(), 3U);
  EXPECT_FALSE(sm.isCoalescing());

  // Summary spans event N's baseline to the final table
  const ChangeEvent& EV = rec_.events[2];
  EXPECT_TRUE(EV.coalesced);
  EXPECT_FALSE(EV.initial);
  EXPECT_EQ(EV.mounted.size(), 2U);
  EXPECT_TRUE(hasMountPoint(EV.mounted, "/media/usb"));
  EXPECT_TRUE(hasMountPoint(EV.mounted, "/mnt/nfs"));
  ASSERT_EQ(EV.unmounted.size(), 1U);
  EXPECT_EQ(EV.unmounted[0].mountPoint, "/boot");
  EXPECT_EQ(sm.lastKnown().size(), 4U);
}

/** @test Changes that cancel out inside the window deliver nothing. */
TEST_F(WatchStateMachineCoalesceTest, CancellingChangesDeliverNothing) {
  source_.table = ROOT;
  WatchStateMachine sm(source_, rec_.handler(), registrar());
  ASSERT_TRUE(sm.onTrigger(false, true, decision_).ok());

  source_.table = std::string(ROOT) + USB;
  rec_.answers = {WatchControl::coalesceFor(std::chrono::milliseconds(20))};
  ASSERT_TRUE(sm.onTrigger(false, false, decision_).ok());

  source_.table = ROOT;
  ASSERT_TRUE(sm.onTrigger(false, false, decision_).ok());

  waitForTimer(sm);
  ASSERT_TRUE(sm.onTrigger(true, false, decision_).ok());
  EXPECT_EQ(rec_.events.size(), 2U);
  EXPECT_FALSE(sm.isCoalescing());
}

/** @test Absorbed triggers do not read the table. */
TEST_F(WatchStateMachineCoalesceTest, AbsorbedTriggersSkipRead) {
  source_.table = ROOT;
  rec_.answers = {WatchControl::coalesceFor(std::chrono::seconds(10))};
  WatchStateMachine sm(source_, rec_.handler(), registrar());
  ASSERT_TRUE(sm.onTrigger(false, true, decision_).ok());
  const std::uint64_t READS = source_.reads;

  ASSERT_TRUE(sm.onTrigger(false, false, decision_).ok());
  ASSERT_TRUE(sm.onTrigger(false, false, decision_).ok());
  EXPECT_EQ(source_.reads, READS);
}

/** @test The coalesced summary can itself request another window; the timer is reused. */
TEST_F(WatchStateMachineCoalesceTest, SecondWindowReusesTimer) {
  source_.table = ROOT;
  WatchStateMachine sm(source_, rec_.handler(), registrar());

  rec_.answers = {WatchControl::coalesceFor(std::chrono::milliseconds(20))};
  ASSERT_TRUE(sm.onTrigger(false, true, decision_).ok());
  waitForTimer(sm);

  // Initial changes are still pending against the empty baseline
  rec_.answers = {WatchControl::coalesceFor(std::chrono::milliseconds(20))};
  ASSERT_TRUE(sm.onTrigger(true, false, decision_).ok());
  ASSERT_EQ(rec_.events.size(), 2U);
  EXPECT_TRUE(rec_.events[1].coalesced);
  EXPECT_TRUE(sm.isCoalescing());

  waitForTimer(sm);
  ASSERT_TRUE(sm.onTrigger(true, false, decision_).ok());
  EXPECT_EQ(rec_.events.size(), 3U);
  EXPECT_EQ(registrations_, 1);
  EXPECT_FALSE(sm.timer().wasCreatedByLastArm());
}
