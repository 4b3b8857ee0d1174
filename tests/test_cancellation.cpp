#include <gtest/gtest.h>

#include "dsfetch/cancellation.hpp"

#include <csignal>
#include <memory>
#include <thread>

using namespace dsfetch;
using namespace std::chrono_literals;

TEST(CancellationTokenTest, LinkedTokenFollowsParent) {
    CancellationToken parent;
    CancellationToken child(&parent);
    EXPECT_FALSE(child.isCancelled());

    parent.cancel();

    EXPECT_TRUE(child.isCancelled());
}

TEST(CancellationTokenTest, CancellingLinkedTokenLeavesParentRunning) {
    CancellationToken parent;
    CancellationToken child(&parent);

    child.cancel();

    EXPECT_TRUE(child.isCancelled());
    EXPECT_FALSE(parent.isCancelled());
}

TEST(CancellationTokenTest, LinkingToCancelledParentStartsCancelled) {
    CancellationToken parent;
    parent.cancel();

    CancellationToken child(&parent);
    EXPECT_TRUE(child.isCancelled());
}

TEST(CancellationTokenTest, ParentCancelWakesWaitOnLinkedToken) {
    CancellationToken parent;
    CancellationToken child(&parent);

    std::thread canceller([&parent] {
        std::this_thread::sleep_for(50ms);
        parent.cancel();
    });

    const auto start = std::chrono::steady_clock::now();
    EXPECT_FALSE(child.waitFor(60s));
    EXPECT_LT(std::chrono::steady_clock::now() - start, 30s);
    canceller.join();
}

TEST(CancellationTokenTest, DestroyedLinkedTokenIsForgotten) {
    CancellationToken parent;
    {
        auto child = std::make_unique<CancellationToken>(&parent);
    }
    CancellationToken survivor(&parent);

    parent.cancel();

    EXPECT_TRUE(survivor.isCancelled());
}

TEST(SignalHandlingTest, FirstSignalCancelsAndRestoresDefaultAction) {
    static CancellationToken token;
    installSignalHandlers(token);

    ASSERT_EQ(std::raise(SIGINT), 0);

    EXPECT_FALSE(token.waitFor(5s));
    // The next SIGINT would terminate the process.
    const auto previous = std::signal(SIGINT, SIG_DFL);
    EXPECT_EQ(previous, SIG_DFL);
    std::signal(SIGTERM, SIG_DFL);
}
