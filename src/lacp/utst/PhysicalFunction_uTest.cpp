/**
 * @file PhysicalFunction_uTest.cpp
 * @brief Unit tests for pfrelay::lacp::PhysicalFunction.
 *
 * Notes:
 *  - Monitoring tests use a short polling interval and poll for the expected
 *    effect with a generous deadline.
 */

#include "src/lacp/inc/PhysicalFunction.hpp"
#include "src/lacp/utst/FakeLink.hpp"
#include "src/runtime/inc/CancelScope.hpp"

#include <gtest/gtest.h>

#include <chrono>
#include <cstddef>
#include <string>
#include <thread>

using pfrelay::lacp::InspectResult;
using pfrelay::lacp::InspectStatus;
using pfrelay::lacp::PhysicalFunction;
using pfrelay::lacp::UpdateStatus;
using pfrelay::lacp::test::FakeLinks;
using pfrelay::lacp::test::FakeVfControl;
using pfrelay::lacp::test::lacpUpSlave;
using pfrelay::lacp::test::LogCapture;
using pfrelay::lacp::test::makePf;
using pfrelay::lacp::test::waitUntil;
using pfrelay::link::BondInfo;
using pfrelay::link::BondMode;
using pfrelay::link::LinkAttributes;
using pfrelay::link::OperState;
using pfrelay::link::VfLinkState;
using pfrelay::runtime::CancelScope;

using namespace std::chrono_literals;

namespace {

constexpr int PF_INDEX = 5;
constexpr int BOND_INDEX = 9;
constexpr auto FAST_POLL = 5ms;

} // namespace

class PhysicalFunctionTest : public ::testing::Test {
protected:
  FakeLinks links_;
  FakeVfControl vfs_{links_};
  LogCapture logs_;

  void SetUp() override {
    links_.setMaster(BOND_INDEX, BondInfo{"bond0", BondMode::IEEE_802_3AD});
  }

  LinkAttributes pfAttrs(OperState state, int masterIndex) {
    LinkAttributes attrs = makePf("eth0", PF_INDEX, state, masterIndex, lacpUpSlave(),
                                  {VfLinkState::DISABLE, VfLinkState::DISABLE});
    links_.setLink(attrs);
    return attrs;
  }
};

/* ----------------------------- inspect Tests ----------------------------- */

/** @test Up, enslaved to an 802.3ad bond: eligible. */
TEST_F(PhysicalFunctionTest, InspectEligible) {
  const PhysicalFunction PF(pfAttrs(OperState::UP, BOND_INDEX), FAST_POLL, links_, vfs_,
                            logs_.logger());

  const InspectResult RESULT = PF.inspect();
  EXPECT_TRUE(RESULT.ok());
  EXPECT_TRUE(RESULT.message.empty());
}

/** @test A link that is not up is rejected first. */
TEST_F(PhysicalFunctionTest, InspectLinkDown) {
  const PhysicalFunction PF(pfAttrs(OperState::DOWN, BOND_INDEX), FAST_POLL, links_, vfs_,
                            logs_.logger());

  const InspectResult RESULT = PF.inspect();
  EXPECT_EQ(RESULT.status, InspectStatus::LINK_NOT_UP);
  EXPECT_EQ(RESULT.message, "link is not up");
}

/** @test Lower-layer-down is not up either. */
TEST_F(PhysicalFunctionTest, InspectLowerLayerDown) {
  const PhysicalFunction PF(pfAttrs(OperState::LOWER_LAYER_DOWN, BOND_INDEX), FAST_POLL, links_,
                            vfs_, logs_.logger());

  EXPECT_EQ(PF.inspect().status, InspectStatus::LINK_NOT_UP);
}

/** @test No master is rejected. */
TEST_F(PhysicalFunctionTest, InspectNoMaster) {
  const PhysicalFunction PF(pfAttrs(OperState::UP, 0), FAST_POLL, links_, vfs_, logs_.logger());

  const InspectResult RESULT = PF.inspect();
  EXPECT_EQ(RESULT.status, InspectStatus::NO_MASTER);
  EXPECT_EQ(RESULT.message, "no master interface associated");
}

/** @test An unresolvable master names the index and the cause. */
TEST_F(PhysicalFunctionTest, InspectMasterUnresolved) {
  const PhysicalFunction PF(pfAttrs(OperState::UP, 77), FAST_POLL, links_, vfs_, logs_.logger());

  const InspectResult RESULT = PF.inspect();
  EXPECT_EQ(RESULT.status, InspectStatus::MASTER_UNRESOLVED);
  EXPECT_EQ(RESULT.message, "failed to fetch master interface with index 77: Link not found");
}

/** @test A bond in another mode is rejected. */
TEST_F(PhysicalFunctionTest, InspectWrongBondMode) {
  links_.setMaster(BOND_INDEX, BondInfo{"bond0", BondMode::ACTIVE_BACKUP});
  const PhysicalFunction PF(pfAttrs(OperState::UP, BOND_INDEX), FAST_POLL, links_, vfs_,
                            logs_.logger());

  const InspectResult RESULT = PF.inspect();
  EXPECT_EQ(RESULT.status, InspectStatus::NOT_LACP_BOND);
  EXPECT_EQ(RESULT.message.rfind("bond bond0 does not have mode 802.3ad", 0), 0U);
}

/** @test A master that is not a bond at all is rejected. */
TEST_F(PhysicalFunctionTest, InspectMasterNotBond) {
  links_.setMaster(BOND_INDEX, BondInfo{"br0", BondMode::NOT_A_BOND});
  const PhysicalFunction PF(pfAttrs(OperState::UP, BOND_INDEX), FAST_POLL, links_, vfs_,
                            logs_.logger());

  const InspectResult RESULT = PF.inspect();
  EXPECT_EQ(RESULT.status, InspectStatus::NOT_LACP_BOND);
  EXPECT_EQ(RESULT.message, "master br0 is not a bond");
}

/* ----------------------------- update Tests ----------------------------- */

/** @test Same operstate: unchanged, even if other attributes moved. */
TEST_F(PhysicalFunctionTest, UpdateUnchanged) {
  PhysicalFunction pf(pfAttrs(OperState::UP, BOND_INDEX), FAST_POLL, links_, vfs_,
                      logs_.logger());
  links_.setMasterIndex(PF_INDEX, 42);

  std::string error;
  EXPECT_EQ(pf.update(error), UpdateStatus::UNCHANGED);
  EXPECT_EQ(pf.masterIndex(), BOND_INDEX);
  EXPECT_EQ(logs_.count("PF was not updated"), 1U);
}

/** @test New operstate: changed and the whole cache is overwritten. */
TEST_F(PhysicalFunctionTest, UpdateChanged) {
  PhysicalFunction pf(pfAttrs(OperState::DOWN, BOND_INDEX), FAST_POLL, links_, vfs_,
                      logs_.logger());
  links_.setOperState(PF_INDEX, OperState::UP);
  links_.setMasterIndex(PF_INDEX, 42);

  std::string error;
  EXPECT_EQ(pf.update(error), UpdateStatus::CHANGED);
  EXPECT_EQ(pf.operState(), OperState::UP);
  EXPECT_EQ(pf.masterIndex(), 42);
  EXPECT_EQ(logs_.count("PF was updated"), 1U);
}

/** @test Lookup failure is reported and the cache is untouched. */
TEST_F(PhysicalFunctionTest, UpdateLookupFailed) {
  PhysicalFunction pf(pfAttrs(OperState::UP, BOND_INDEX), FAST_POLL, links_, vfs_,
                      logs_.logger());
  links_.setLookupFails(PF_INDEX, true);

  std::string error;
  EXPECT_EQ(pf.update(error), UpdateStatus::LOOKUP_FAILED);
  EXPECT_FALSE(error.empty());
  EXPECT_EQ(pf.operState(), OperState::UP);
}

/* ----------------------------- Monitoring Tests ----------------------------- */

/** @test Stop when not monitoring is a no-op. */
TEST_F(PhysicalFunctionTest, StopWhenIdle) {
  PhysicalFunction pf(pfAttrs(OperState::UP, BOND_INDEX), FAST_POLL, links_, vfs_,
                      logs_.logger());

  pf.stopMonitoring();
  EXPECT_FALSE(pf.isMonitoring());
  EXPECT_EQ(logs_.count("stopping lacp monitoring"), 0U);
}

/** @test Starting twice leaves exactly one task. */
TEST_F(PhysicalFunctionTest, StartTwice) {
  const CancelScope ROOT;
  PhysicalFunction pf(pfAttrs(OperState::UP, BOND_INDEX), FAST_POLL, links_, vfs_,
                      logs_.logger());

  pf.startMonitoring(ROOT);
  pf.startMonitoring(ROOT);

  EXPECT_TRUE(pf.isMonitoring());
  EXPECT_EQ(logs_.count("starting lacp monitoring"), 1U);
  EXPECT_EQ(logs_.count("lacp monitoring has already started"), 1U);

  pf.stopMonitoring();
  EXPECT_EQ(logs_.count("ctx cancelled routine=monitoring"), 1U);
}

/** @test A running task reconciles VFs on its own. */
TEST_F(PhysicalFunctionTest, MonitoringReconciles) {
  const CancelScope ROOT;
  PhysicalFunction pf(pfAttrs(OperState::UP, BOND_INDEX), FAST_POLL, links_, vfs_,
                      logs_.logger());

  pf.startMonitoring(ROOT);
  EXPECT_TRUE(waitUntil([this] {
    return links_.vfState(PF_INDEX, 0) == VfLinkState::AUTO &&
           links_.vfState(PF_INDEX, 1) == VfLinkState::AUTO;
  }));
  pf.stopMonitoring();

  EXPECT_EQ(logs_.count("lacp is up"), 1U);
}

/** @test After stop no further ticks run. */
TEST_F(PhysicalFunctionTest, StopHaltsTicks) {
  const CancelScope ROOT;
  PhysicalFunction pf(pfAttrs(OperState::UP, BOND_INDEX), FAST_POLL, links_, vfs_,
                      logs_.logger());

  pf.startMonitoring(ROOT);
  ASSERT_TRUE(waitUntil([this] { return links_.lookupsByIndex() > 0; }));
  pf.stopMonitoring();
  EXPECT_FALSE(pf.isMonitoring());

  const std::size_t AFTER_STOP = links_.lookupsByIndex();
  std::this_thread::sleep_for(FAST_POLL * 10);
  EXPECT_EQ(links_.lookupsByIndex(), AFTER_STOP);
}

/** @test Cancelling the parent ends the task; stop then joins without blocking. */
TEST_F(PhysicalFunctionTest, ParentCancelEndsTask) {
  const CancelScope ROOT;
  PhysicalFunction pf(pfAttrs(OperState::UP, BOND_INDEX), 10s, links_, vfs_, logs_.logger());

  pf.startMonitoring(ROOT);
  ROOT.cancel();
  EXPECT_TRUE(waitUntil([this] { return logs_.count("ctx cancelled routine=monitoring") == 1; }));

  pf.stopMonitoring();
  EXPECT_FALSE(pf.isMonitoring());
}

/** @test Monitoring can be restarted after a stop. */
TEST_F(PhysicalFunctionTest, RestartAfterStop) {
  const CancelScope ROOT;
  PhysicalFunction pf(pfAttrs(OperState::UP, BOND_INDEX), FAST_POLL, links_, vfs_,
                      logs_.logger());

  pf.startMonitoring(ROOT);
  pf.stopMonitoring();
  pf.startMonitoring(ROOT);
  EXPECT_TRUE(pf.isMonitoring());
  pf.stopMonitoring();

  EXPECT_EQ(logs_.count("starting lacp monitoring"), 2U);
  EXPECT_EQ(logs_.count("stopping lacp monitoring"), 2U);
}

/** @test Destruction stops a running task. */
TEST_F(PhysicalFunctionTest, DestructorStops) {
  const CancelScope ROOT;
  {
    PhysicalFunction pf(pfAttrs(OperState::UP, BOND_INDEX), FAST_POLL, links_, vfs_,
                        logs_.logger());
    pf.startMonitoring(ROOT);
  }
  EXPECT_EQ(logs_.count("ctx cancelled routine=monitoring"), 1U);
  EXPECT_FALSE(ROOT.isCancelled());
}

/** @test Status names are stable. */
TEST(InspectStatusTest, ToString) {
  EXPECT_STREQ(toString(InspectStatus::NO_MASTER), "NO_MASTER");
  EXPECT_STREQ(toString(UpdateStatus::CHANGED), "CHANGED");
}
