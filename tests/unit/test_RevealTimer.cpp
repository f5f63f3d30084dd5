#include <gtest/gtest.h>
#include "nav/RevealTimer.hpp"
#include "support/ManualClock.hpp"

using namespace lv::nav;
using namespace std::chrono_literals;

class RevealTimerTest : public ::testing::Test {
protected:
    lv::test::ManualClock clock;
    RevealTimer timer{30s, clock};
};

TEST_F(RevealTimerTest, RevealsOnlyTheGivenKey) {
    timer.reveal("kv/a:db");
    EXPECT_TRUE(timer.isRevealed("kv/a:db"));
    EXPECT_FALSE(timer.isRevealed("kv/a:other"));
    EXPECT_EQ(timer.revealedKey(), std::optional<std::string>("kv/a:db"));
}

TEST_F(RevealTimerTest, ExpiresAfterTimeout) {
    timer.reveal("k");
    clock.advance(29s);
    EXPECT_FALSE(timer.expire());
    EXPECT_TRUE(timer.isRevealed("k"));

    clock.advance(1s);
    EXPECT_FALSE(timer.isRevealed("k"));
    EXPECT_TRUE(timer.expire());
    EXPECT_FALSE(timer.expire());
    EXPECT_FALSE(timer.revealedKey().has_value());
}

TEST_F(RevealTimerTest, RevealingAnotherKeyReplacesAndRestarts) {
    timer.reveal("a");
    clock.advance(20s);
    timer.reveal("b");
    clock.advance(20s);
    EXPECT_FALSE(timer.isRevealed("a"));
    EXPECT_TRUE(timer.isRevealed("b"));
}

TEST_F(RevealTimerTest, HideClearsImmediately) {
    timer.reveal("a");
    timer.hide();
    EXPECT_FALSE(timer.isRevealed("a"));
    EXPECT_FALSE(timer.expire());
}
