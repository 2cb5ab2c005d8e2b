#include <gtest/gtest.h>
#include <core/time_utils.hpp>

using namespace std::chrono_literals;

TEST(TimeUtils, FormatElapsedSubSecond) {
    EXPECT_EQ(format_elapsed(850ms), "850ms");
    EXPECT_EQ(format_elapsed(-5ms), "0ms");
}

TEST(TimeUtils, FormatElapsedPadsMinutesAndSeconds) {
    EXPECT_EQ(format_elapsed(12s), "12s");
    EXPECT_EQ(format_elapsed(185s), "3m05s");
    EXPECT_EQ(format_elapsed(3720s), "1h02m");
}

TEST(TimeUtils, FormatBytes) {
    EXPECT_EQ(format_bytes(0), "0 B");
    EXPECT_EQ(format_bytes(512), "512 B");
    EXPECT_EQ(format_bytes(1536), "1.5 KiB");
    EXPECT_EQ(format_bytes(3ull * 1024 * 1024 * 1024), "3.0 GiB");
}

TEST(TimeUtils, FormatRate) {
    EXPECT_EQ(format_rate(1000, 0ms), "-");
    EXPECT_EQ(format_rate(2 * 1024 * 1024, 1000ms), "2.0 MiB/s");
}
