#include "input/debouncer.h"

#include <gtest/gtest.h>
#include <stdexcept>

using show_ingest::input::Debouncer;
using namespace std::chrono_literals;

TEST(Debouncer, FirstEventAlwaysAccepted) {
    Debouncer d(200ms);
    EXPECT_FALSE(d.lastAccepted().has_value());
    EXPECT_TRUE(d.accept(5000));
    EXPECT_EQ(d.lastAccepted(), 5000);
}

TEST(Debouncer, WindowBoundary) {
    Debouncer d(200ms);
    ASSERT_TRUE(d.accept(1000));
    EXPECT_FALSE(d.accept(1000));
    EXPECT_FALSE(d.accept(1199));
    EXPECT_TRUE(d.accept(1200));
    EXPECT_EQ(d.lastAccepted(), 1200);
}

TEST(Debouncer, SuppressedEventsDoNotExtendWindow) {
    Debouncer d(100ms);
    ASSERT_TRUE(d.accept(0));
    EXPECT_FALSE(d.accept(50));
    EXPECT_FALSE(d.accept(99));
    EXPECT_TRUE(d.accept(100));
}

TEST(Debouncer, EarlierClockBaseStartsNewReference) {
    Debouncer d(200ms);
    ASSERT_TRUE(d.accept(3'600'000));

    // Presses one second apart on a clock one hour behind.
    int accepted = 0;
    for (int i = 0; i < 10; ++i) {
        accepted += d.accept(i * 1000) ? 1 : 0;
    }
    EXPECT_EQ(accepted, 10);
    EXPECT_EQ(d.lastAccepted(), 9000);

    // The window applies again on the new base.
    EXPECT_FALSE(d.accept(9100));
    EXPECT_TRUE(d.accept(9200));
}

TEST(Debouncer, RejectsNonPositiveWindow) {
    EXPECT_THROW(Debouncer(0ms), std::invalid_argument);
    EXPECT_THROW(Debouncer(-5ms), std::invalid_argument);
    EXPECT_EQ(Debouncer(1ms).windowMs(), 1);
}
