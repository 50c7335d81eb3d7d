#include <gtest/gtest.h>
#include <darian.hpp>

#include <array>
#include <vector>

using namespace darian;

// Test fixture for the compact state encoding
class StateCodecTest : public ::testing::Test {};

// ==============================================================================
// Date
// ==============================================================================

TEST_F(StateCodecTest, DateLayout) {
    auto bytes = encode_state(*Date::from_ymd(219, 13, 27));
    std::array<uint8_t, DATE_STATE_SIZE> expected{STATE_VERSION, 0x00, 0xDB, 13, 27};
    EXPECT_EQ(bytes, expected);
}

TEST_F(StateCodecTest, DateDecode) {
    const std::array<uint8_t, DATE_STATE_SIZE> bytes{STATE_VERSION, 0x27, 0x0F, 24, 28};
    auto d = decode_date_state(bytes);
    ASSERT_TRUE(d);
    EXPECT_EQ(*d, Date::max());
}

TEST_F(StateCodecTest, DateDecodeRevalidates) {
    // Year 218 is not a leap year
    const std::array<uint8_t, DATE_STATE_SIZE> bytes{STATE_VERSION, 0x00, 0xDA, 24, 28};
    auto d = decode_date_state(bytes);
    ASSERT_FALSE(d);
    EXPECT_EQ(d.error(), CalendarError::sol_out_of_range);
}

// ==============================================================================
// DateTime
// ==============================================================================

TEST_F(StateCodecTest, DateTimeLayout) {
    auto dt = *DateTime::from_fields(219, 13, 27, 23, 59, 58, 0x0ABCDE, nullptr, 1);
    auto bytes = encode_state(dt);
    std::array<uint8_t, DATETIME_STATE_SIZE> expected{
        STATE_VERSION, 0x00, 0xDB, 13 | 0x80, 27, 23, 59, 58, 0x0A, 0xBC, 0xDE};
    EXPECT_EQ(bytes, expected);
}

TEST_F(StateCodecTest, DateTimeDecodeAttachesProvider) {
    auto tz = *FixedOffset::create(*Duration::from_hours(-4));
    auto original = *DateTime::from_fields(219, 19, 1, 1, 30, 0, 123456, tz, 1);
    auto bytes = encode_state(original);

    auto aware = decode_datetime_state(bytes, tz);
    ASSERT_TRUE(aware);
    EXPECT_EQ(aware->provider().get(), tz.get());
    EXPECT_EQ(aware->fold(), 1);
    EXPECT_EQ(aware->month(), 19);
    EXPECT_EQ(aware->microsecond(), 123456);
    EXPECT_TRUE(*aware == original);

    auto naive = decode_datetime_state(bytes);
    ASSERT_TRUE(naive);
    EXPECT_FALSE(naive->provider());
    EXPECT_EQ(naive->wall_clock(), original.wall_clock());
}

TEST_F(StateCodecTest, DateTimeDecodeRevalidates) {
    std::array<uint8_t, DATETIME_STATE_SIZE> bytes{
        STATE_VERSION, 0x00, 0xDB, 13, 27, 24, 0, 0, 0, 0, 0};
    auto r1 = decode_datetime_state(bytes);
    ASSERT_FALSE(r1);
    EXPECT_EQ(r1.error(), CalendarError::hour_out_of_range);

    // 0x0F4240 is 1,000,000 microseconds
    bytes = {STATE_VERSION, 0x00, 0xDB, 13, 27, 0, 0, 0, 0x0F, 0x42, 0x40};
    auto r2 = decode_datetime_state(bytes);
    ASSERT_FALSE(r2);
    EXPECT_EQ(r2.error(), CalendarError::microsecond_out_of_range);
}

// ==============================================================================
// Duration
// ==============================================================================

TEST_F(StateCodecTest, DurationLayout) {
    auto bytes = encode_state(*Duration::from_microseconds(-1));
    std::array<uint8_t, DURATION_STATE_SIZE> expected{
        STATE_VERSION, 0xFF, 0xFF, 0xFF, 0xFF,  // sols = -1
        0x00, 0x01, 0x51, 0x7F,                 // seconds = 86399
        0x00, 0x0F, 0x42, 0x3F};                // microseconds = 999999
    EXPECT_EQ(bytes, expected);
}

TEST_F(StateCodecTest, DurationDecode) {
    for (const auto& d : {Duration::min(), Duration::max(), Duration::zero(),
                          *Duration::from_parts({.sols = 1.5, .hours = -3.25})}) {
        auto bytes = encode_state(d);
        auto back = decode_duration_state(bytes);
        ASSERT_TRUE(back);
        EXPECT_EQ(*back, d);
    }
}

TEST_F(StateCodecTest, DurationDecodeRevalidates) {
    // sols = 1,000,000,000
    std::array<uint8_t, DURATION_STATE_SIZE> bytes{STATE_VERSION, 0x3B, 0x9A, 0xCA, 0x00,
                                                   0, 0, 0, 0, 0, 0, 0, 0};
    auto r1 = decode_duration_state(bytes);
    ASSERT_FALSE(r1);
    EXPECT_EQ(r1.error(), CalendarError::duration_overflow);

    // seconds = 86400
    bytes = {STATE_VERSION, 0, 0, 0, 0, 0x00, 0x01, 0x51, 0x80, 0, 0, 0, 0};
    auto r2 = decode_duration_state(bytes);
    ASSERT_FALSE(r2);
    EXPECT_EQ(r2.error(), CalendarError::second_out_of_range);

    // microseconds = -1
    bytes = {STATE_VERSION, 0, 0, 0, 0, 0, 0, 0, 0, 0xFF, 0xFF, 0xFF, 0xFF};
    auto r3 = decode_duration_state(bytes);
    ASSERT_FALSE(r3);
    EXPECT_EQ(r3.error(), CalendarError::microsecond_out_of_range);
}

// ==============================================================================
// Header Checks
// ==============================================================================

TEST_F(StateCodecTest, WrongSize) {
    std::vector<uint8_t> bytes{STATE_VERSION, 0x00, 0xDB, 13};
    auto r = decode_date_state(bytes);
    ASSERT_FALSE(r);
    EXPECT_EQ(r.error(), CalendarError::state_size_mismatch);

    auto dt_bytes = encode_state(*Date::from_ymd(219, 13, 27));
    auto r2 = decode_datetime_state(dt_bytes);
    ASSERT_FALSE(r2);
    EXPECT_EQ(r2.error(), CalendarError::state_size_mismatch);
}

TEST_F(StateCodecTest, WrongVersion) {
    auto bytes = encode_state(*Date::from_ymd(219, 13, 27));
    bytes[0] = STATE_VERSION + 1;
    auto r = decode_date_state(bytes);
    ASSERT_FALSE(r);
    EXPECT_EQ(r.error(), CalendarError::state_version_mismatch);
}
