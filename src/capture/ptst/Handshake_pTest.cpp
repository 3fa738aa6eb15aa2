/**
 * @file Handshake_pTest.cpp
 * @brief Process tests for the target-side handshake helpers.
 *
 * The first group loops the handshake back to this process. The last test runs
 * the HandshakeTarget_Demo binary under the controller with a fake perf stat.
 */

#include "src/capture/inc/CaptureController.hpp"
#include "src/capture/inc/Handshake.hpp"
#include "src/capture/inc/SignalChannel.hpp"
#include "helpers/TestHelpers.hpp"

#include <gtest/gtest.h>

#include <algorithm>
#include <csignal>
#include <cstdlib>
#include <string>
#include <vector>

#include <unistd.h>

using perfcap::capture::ACK_SIGNAL_ENV;
using perfcap::capture::ackSignalFromEnv;
using perfcap::capture::CaptureController;
using perfcap::capture::CONTROLLER_PID_ENV;
using perfcap::capture::controllerFromEnv;
using perfcap::capture::ControllerEvent;
using perfcap::capture::ControllerState;
using perfcap::capture::HandshakeOptions;
using perfcap::capture::Mode;
using perfcap::capture::requestCollectionStart;
using perfcap::capture::requestCollectionStop;
using perfcap::capture::Session;
using perfcap::capture::SignalChannel;
using perfcap::capture::SignalEvent;
using perfcap::capture::test::FakeToolchain;

/* ----------------------------- Environment Tests ----------------------------- */

/** @test Controller PID is read from the environment and validated. */
TEST(HandshakeTest, ControllerFromEnv) {
  ::unsetenv(CONTROLLER_PID_ENV);
  EXPECT_EQ(controllerFromEnv(), 0);

  ::setenv(CONTROLLER_PID_ENV, "4321", 1);
  EXPECT_EQ(controllerFromEnv(), 4321);

  ::setenv(CONTROLLER_PID_ENV, "12abc", 1);
  EXPECT_EQ(controllerFromEnv(), 0);

  ::setenv(CONTROLLER_PID_ENV, "-7", 1);
  EXPECT_EQ(controllerFromEnv(), 0);

  ::unsetenv(CONTROLLER_PID_ENV);
}

/** @test The ack defaults to SIGRTMIN, never the begin or end signal. */
TEST(HandshakeTest, AckSignalFromEnv) {
  ::unsetenv(ACK_SIGNAL_ENV);
  EXPECT_EQ(ackSignalFromEnv(), SIGRTMIN);
  EXPECT_NE(ackSignalFromEnv(), HandshakeOptions{}.beginSignal);
  EXPECT_NE(ackSignalFromEnv(), HandshakeOptions{}.endSignal);

  ::setenv(ACK_SIGNAL_ENV, std::to_string(SIGUSR1).c_str(), 1);
  EXPECT_EQ(ackSignalFromEnv(), SIGUSR1);

  ::setenv(ACK_SIGNAL_ENV, "bogus", 1);
  EXPECT_EQ(ackSignalFromEnv(), SIGRTMIN);

  ::unsetenv(ACK_SIGNAL_ENV);
}

/** @test Without a controller nothing is signalled. */
TEST(HandshakeTest, StandaloneIsNoOp) {
  ::unsetenv(CONTROLLER_PID_ENV);

  EXPECT_FALSE(requestCollectionStart());
  EXPECT_FALSE(requestCollectionStop());
}

/* ----------------------------- Loopback Tests ----------------------------- */

/** @test When the begin signal doubles as the ack, start completes against self. */
TEST(HandshakeTest, StartAcknowledged) {
  HandshakeOptions opts;
  opts.controller = ::getpid();
  opts.beginSignal = SIGUSR1;
  opts.ackSignal = SIGUSR1;
  opts.ackTimeoutMs = 2000;

  EXPECT_TRUE(requestCollectionStart(opts));
}

/** @test With no explicit ack, start waits for SIGRTMIN. */
TEST(HandshakeTest, StartWaitsForRealtimeAckByDefault) {
  ::unsetenv(ACK_SIGNAL_ENV);
  HandshakeOptions opts;
  opts.controller = ::getpid();
  opts.beginSignal = SIGRTMIN;
  opts.ackTimeoutMs = 2000;

  EXPECT_TRUE(requestCollectionStart(opts));
}

/** @test Start times out when no ack arrives; the begin signal reached the controller. */
TEST(HandshakeTest, StartTimesOut) {
  SignalChannel controller{SIGUSR2};
  HandshakeOptions opts;
  opts.controller = ::getpid();
  opts.beginSignal = SIGUSR2;
  opts.ackSignal = SIGUSR1;
  opts.ackTimeoutMs = 100;

  EXPECT_FALSE(requestCollectionStart(opts));

  const SignalEvent EV = controller.poll();
  EXPECT_EQ(EV.signo, SIGUSR2);
  EXPECT_EQ(EV.sender, ::getpid());
}

/** @test Stop sends the end signal to the controller. */
TEST(HandshakeTest, StopSignalsController) {
  SignalChannel controller{SIGUSR2};
  HandshakeOptions opts;
  opts.controller = ::getpid();

  EXPECT_TRUE(requestCollectionStop(opts));
  EXPECT_EQ(controller.poll().signo, SIGUSR2);
}

/* ----------------------------- Demo Target Test ----------------------------- */

/** @test The demo target brackets its workload; counters start and stop around it. */
TEST(HandshakeTest, DemoTargetUnderController) {
  FakeToolchain fake;
  Session s;
  s.mode = Mode::ExecInteractive;
  s.execPath = PERFCAP_DEMO_TARGET;
  s.execArgs = {"1"};
  CaptureController ctl(fake.config(), s);
  std::vector<ControllerEvent> events;
  ctl.setEventHook([&](ControllerEvent e) { events.push_back(e); });

  EXPECT_FALSE(ctl.run().has_value());

  EXPECT_EQ(ctl.state(), ControllerState::Done);
  EXPECT_NE(std::find(events.begin(), events.end(), ControllerEvent::HandshakeAcknowledged),
            events.end());
  ASSERT_FALSE(events.empty());
  EXPECT_EQ(events.back(), ControllerEvent::TargetExited);

  const auto CALLS = fake.perfCalls();
  ASSERT_EQ(CALLS.size(), 1u);
  EXPECT_EQ(CALLS[0].rfind("stat -e ", 0), 0u);
}
