#include <gtest/gtest.h>
#include "utils/units.hpp"

TEST(bytes2human, should_return_0_for_0) {
    EXPECT_EQ("0", bytes2human(0));
}

TEST(bytes2human, default_unit) {
    EXPECT_EQ("0 bytes", bytes2human(0, " bytes"));
}

TEST(bytes2human, _3mb) {
    EXPECT_EQ("3072Kb", bytes2human(3*1024*1024));
}

TEST(bytes2human, min_unit) {
    EXPECT_EQ("3Mb", bytes2human(3*1024*1024, "", 1024*1024));
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

TEST(human2bytes, plain_number) {
    EXPECT_EQ(4096, human2bytes("4096"));
    EXPECT_EQ(0, human2bytes("0"));
}

TEST(human2bytes, hex) {
    EXPECT_EQ(0x1000, human2bytes("0x1000"));
    EXPECT_EQ(0xabc, human2bytes("0XABC"));
}

TEST(human2bytes, units) {
    EXPECT_EQ(5, human2bytes("5b"));
    EXPECT_EQ(64*1024, human2bytes("64k"));
    EXPECT_EQ(64*1024, human2bytes("64Kb"));
    EXPECT_EQ(1024*1024, human2bytes("1M"));
    EXPECT_EQ(2ULL*1024*1024*1024, human2bytes("2GB"));
    EXPECT_EQ(1ULL << 40, human2bytes("1t"));
}

TEST(human2bytes, invalid) {
    EXPECT_THROW(human2bytes(""), std::runtime_error);
    EXPECT_THROW(human2bytes("k"), std::runtime_error);
    EXPECT_THROW(human2bytes("12q"), std::runtime_error);
    EXPECT_THROW(human2bytes("12 mb"), std::runtime_error);
}

TEST(human2bytes, overflow) {
    EXPECT_THROW(human2bytes("99999999999t"), std::runtime_error);
}

TEST(seconds2human, zero) {
    EXPECT_EQ("0s", seconds2human(0));
}

TEST(seconds2human, max_units) {
    EXPECT_EQ("1m1s", seconds2human(61));
    EXPECT_EQ("1h1m", seconds2human(3661));
    EXPECT_EQ("1h", seconds2human(3661, 1));
    EXPECT_EQ("1d0h", seconds2human(86400));
}
