#include <gtest/gtest.h>
#include "utils/units.hpp"

TEST(bytes2human, should_return_0_for_0) {
    EXPECT_EQ("0", bytes2human(0));
}

TEST(bytes2human, default_unit) {
    EXPECT_EQ("0 bytes", bytes2human(0, " bytes"));
    EXPECT_EQ("4095 bytes", bytes2human(4095, " bytes"));
}

TEST(bytes2human, _3mb) {
    EXPECT_EQ("3072Kb", bytes2human(3*1024*1024));
}

TEST(bytes2human, _4mb) {
    EXPECT_EQ("4Mb", bytes2human(4*1024*1024));
}

TEST(bytes2human, _4gb) {
    EXPECT_EQ("4Gb", bytes2human(4ULL*1024*1024*1024));
}

TEST(bytes2human, _4tb) {
    EXPECT_EQ("4Tb", bytes2human(4ULL*1024*1024*1024*1024));
}

TEST(seconds2human, zero) {
    EXPECT_EQ("0s", seconds2human(0));
}

TEST(seconds2human, two_units) {
    EXPECT_EQ("59s", seconds2human(59));
    EXPECT_EQ("1m5s", seconds2human(65));
    EXPECT_EQ("1h2m", seconds2human(3725));
    EXPECT_EQ("1d0h", seconds2human(86400 + 59));
}

TEST(seconds2human, max_units) {
    EXPECT_EQ("1h2m5s", seconds2human(3725, 3));
    EXPECT_EQ("1h", seconds2human(3725, 1));
}
