// EN: Unit tests for SignalHandler - cleanup callbacks, ordering, failures and real signal delivery
// FR: Tests unitaires pour SignalHandler - callbacks de nettoyage, ordre, échecs et vraie réception de signal

#include <gtest/gtest.h>
#include <gmock/gmock.h>

#include "infrastructure/system/signal_handler.hpp"
#include "core/cancellation.hpp"
#include "test_fakes.hpp"

#include <atomic>
#include <chrono>
#include <csignal>
#include <stdexcept>
#include <thread>
#include <vector>

using namespace FGL;
using namespace FGL::Testing;
using namespace std::chrono_literals;

// EN: Test fixture for SignalHandler tests
// FR: Fixture de test pour les tests SignalHandler
class SignalHandlerTest : public ::testing::Test {
protected:
    void SetUp() override {
        signal_handler_ = &SignalHandler::getInstance();
        signal_handler_->reset();
        signal_handler_->setEnabled(true);
        signal_handler_->configure(SignalHandlerConfig{});
    }

    void TearDown() override {
        signal_handler_->reset();
    }

    LogCapture capture_;
    SignalHandler* signal_handler_{nullptr};
};

TEST_F(SignalHandlerTest, SingletonPattern) {
    EXPECT_EQ(&SignalHandler::getInstance(), signal_handler_);
}

TEST_F(SignalHandlerTest, TriggerShutdownRunsCallbacksInNameOrder) {
    std::vector<std::string> order;
    signal_handler_->registerCleanupCallback("b_reports", [&]() { order.push_back("b_reports"); });
    signal_handler_->registerCleanupCallback("a_engine", [&]() { order.push_back("a_engine"); });

    EXPECT_FALSE(signal_handler_->isShutdownRequested());
    signal_handler_->triggerShutdown(SIGINT);

    EXPECT_TRUE(signal_handler_->isShutdownRequested());
    EXPECT_TRUE(signal_handler_->waitForShutdown(1000ms));
    EXPECT_THAT(order, ::testing::ElementsAre("a_engine", "b_reports"));
    EXPECT_TRUE(capture_.contains("Received signal: SIGINT"));

    auto stats = signal_handler_->getStats();
    EXPECT_EQ(stats.signals_received, 1u);
    EXPECT_EQ(stats.signal_counts[SIGINT], 1u);
    EXPECT_EQ(stats.successful_shutdowns, 1u);
}

TEST_F(SignalHandlerTest, ShutdownCancelsInFlightWork) {
    CancellationToken run_token;
    signal_handler_->registerCleanupCallback("engine", [run_token]() mutable {
        run_token.cancel("interrupted by signal");
    });

    signal_handler_->triggerShutdown();

    EXPECT_TRUE(run_token.isCancelled());
    EXPECT_EQ(run_token.reason(), "interrupted by signal");
}

TEST_F(SignalHandlerTest, UnregisteredCallbackIsNotRun) {
    bool ran = false;
    signal_handler_->registerCleanupCallback("engine", [&]() { ran = true; });
    EXPECT_EQ(signal_handler_->getStats().cleanup_callbacks_registered, 1u);

    signal_handler_->unregisterCleanupCallback("engine");
    EXPECT_EQ(signal_handler_->getStats().cleanup_callbacks_registered, 0u);

    signal_handler_->triggerShutdown();
    EXPECT_FALSE(ran);
}

TEST_F(SignalHandlerTest, FailingCallbackDoesNotStopTheOthers) {
    bool later_ran = false;
    signal_handler_->registerCleanupCallback("a_failing", []() { throw std::runtime_error("disk full"); });
    signal_handler_->registerCleanupCallback("b_later", [&]() { later_ran = true; });

    signal_handler_->triggerShutdown();

    EXPECT_TRUE(later_ran);
    EXPECT_EQ(signal_handler_->getStats().failed_callbacks, 1u);
    EXPECT_TRUE(capture_.contains("Cleanup callback failed: a_failing - disk full"));
}

TEST_F(SignalHandlerTest, SecondSignalDuringShutdownIsIgnored) {
    std::atomic<int> runs{0};
    signal_handler_->registerCleanupCallback("engine", [&]() {
        ++runs;
        signal_handler_->triggerShutdown(SIGTERM);
    });

    signal_handler_->triggerShutdown(SIGINT);

    EXPECT_EQ(runs.load(), 1);
    EXPECT_EQ(signal_handler_->getStats().signals_received, 2u);
    EXPECT_TRUE(capture_.contains("Signal received during shutdown, ignoring"));
}

TEST_F(SignalHandlerTest, CallbacksAfterTimeoutAreSkipped) {
    SignalHandlerConfig config;
    config.shutdown_timeout = 50ms;
    signal_handler_->configure(config);

    bool second_ran = false;
    signal_handler_->registerCleanupCallback("a_slow", []() { std::this_thread::sleep_for(100ms); });
    signal_handler_->registerCleanupCallback("b_skipped", [&]() { second_ran = true; });

    signal_handler_->triggerShutdown();

    EXPECT_FALSE(second_ran);
    EXPECT_TRUE(capture_.contains("Cleanup timeout reached"));
}

TEST_F(SignalHandlerTest, ResetAllowsAnotherShutdown) {
    signal_handler_->triggerShutdown();
    EXPECT_TRUE(signal_handler_->isShuttingDown());

    signal_handler_->reset();
    EXPECT_FALSE(signal_handler_->isShutdownRequested());
    EXPECT_FALSE(signal_handler_->isShuttingDown());
    EXPECT_FALSE(signal_handler_->waitForShutdown(20ms));

    bool ran = false;
    signal_handler_->registerCleanupCallback("engine", [&]() { ran = true; });
    signal_handler_->triggerShutdown();
    EXPECT_TRUE(ran);
}

TEST_F(SignalHandlerTest, RealSigtermIsHandledByWatcher) {
    std::atomic<bool> ran{false};
    signal_handler_->registerCleanupCallback("engine", [&]() { ran = true; });
    signal_handler_->initialize();

    std::raise(SIGTERM);

    EXPECT_TRUE(signal_handler_->waitForShutdown(2000ms));
    EXPECT_TRUE(ran.load());
    EXPECT_EQ(signal_handler_->getStats().signal_counts[SIGTERM], 1u);
}
