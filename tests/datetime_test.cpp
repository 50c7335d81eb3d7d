#include <gtest/gtest.h>
#include <darian.hpp>

#include <memory>

using namespace darian;

namespace {

/**
 * Standard offset +01:00 with one hour of daylight time from month 7 sol 1
 * 02:00 (standard) to month 19 sol 1 02:00 (daylight).
 *
 * Local 02:00-03:00 on 7-1 is skipped and 01:00-02:00 on 19-1 is repeated;
 * fold picks the offset in both.
 */
class MarsDaylight final : public OffsetProvider {
public:
    std::optional<Duration> mtc_offset(const DateTime* dt) const override {
        return *(*Duration::from_hours(1) + *dst(dt));
    }

    std::optional<Duration> dst(const DateTime* dt) const override {
        if (dt == nullptr || !dt->provider()) {
            return Duration::zero();
        }
        constexpr int64_t HOUR = 3600;
        int64_t local = dt->to_ordinal() * 86400 + dt->hour() * HOUR + dt->minute() * 60 +
                        dt->second();
        int64_t start = Date::from_ymd(dt->year(), 7, 1)->to_ordinal() * 86400 + 2 * HOUR;
        int64_t end = Date::from_ymd(dt->year(), 19, 1)->to_ordinal() * 86400 + 2 * HOUR;
        auto daylight = *Duration::from_hours(1);

        if (start + HOUR <= local && local < end - HOUR) {
            return daylight;
        }
        if (end - HOUR <= local && local < end) {
            // Repeated hour: fold=1 is the later, standard-time reading
            return dt->fold() ? Duration::zero() : daylight;
        }
        if (start <= local && local < start + HOUR) {
            // Skipped hour
            return dt->fold() ? daylight : Duration::zero();
        }
        return Duration::zero();
    }

    std::optional<std::string> name(const DateTime* dt) const override {
        auto d = dst(dt);
        return d->is_zero() ? "AMT" : "AMDT";
    }
};

} // namespace

// Test fixture for DateTime tests
class DateTimeTest : public ::testing::Test {
protected:
    void SetUp() override { daylight_ = std::make_shared<const MarsDaylight>(); }

    static Duration hours(double h) { return *Duration::from_hours(h); }

    static OffsetProviderPtr fixed(double h) { return *FixedOffset::create(hours(h)); }

    static DateTime at(int64_t y, int64_t m, int64_t s, int64_t hh = 0, int64_t mm = 0,
                       int64_t ss = 0, int64_t us = 0, OffsetProviderPtr provider = nullptr,
                       int64_t fold = 0) {
        return *DateTime::from_fields(y, m, s, hh, mm, ss, us, std::move(provider), fold);
    }

    OffsetProviderPtr daylight_;
};

// ==============================================================================
// Construction and Validation
// ==============================================================================

TEST_F(DateTimeTest, DefaultIsNaiveMin) {
    DateTime dt;
    EXPECT_EQ(dt.date(), Date::min());
    EXPECT_EQ(dt.wall_clock(), (WallClock{0, 0, 0, 0}));
    EXPECT_EQ(dt.fold(), 0);
    EXPECT_FALSE(dt.provider());
}

TEST_F(DateTimeTest, NamedConstants) {
    EXPECT_EQ(DateTime::min().date(), Date::min());
    EXPECT_EQ(DateTime::max().date(), Date::max());
    EXPECT_EQ(DateTime::max().wall_clock(), (WallClock{23, 59, 59, 999999}));
    EXPECT_EQ(DateTime::resolution(), Duration::resolution());
}

TEST_F(DateTimeTest, FromFields) {
    auto dt = DateTime::from_fields(219, 13, 27, 12, 34, 56, 789, FixedOffset::mtc(), 1);
    ASSERT_TRUE(dt);
    EXPECT_EQ(dt->year(), 219);
    EXPECT_EQ(dt->month(), 13);
    EXPECT_EQ(dt->sol(), 27);
    EXPECT_EQ(dt->hour(), 12);
    EXPECT_EQ(dt->minute(), 34);
    EXPECT_EQ(dt->second(), 56);
    EXPECT_EQ(dt->microsecond(), 789);
    EXPECT_EQ(dt->fold(), 1);
    EXPECT_EQ(dt->provider().get(), FixedOffset::mtc().get());
    EXPECT_EQ(dt->to_ordinal(), 146782);
    EXPECT_EQ(dt->weekday(), 4);
    EXPECT_EQ(dt->day_of_year(), 361);
}

TEST_F(DateTimeTest, FieldErrorsInOrder) {
    struct Case {
        int64_t y, m, s, hh, mm, ss, us, fold;
        CalendarError error;
    };
    const Case cases[] = {
        {10000, 1, 1, 0, 0, 0, 0, 0, CalendarError::year_out_of_range},
        {219, 25, 1, 0, 0, 0, 0, 0, CalendarError::month_out_of_range},
        {219, 6, 28, 0, 0, 0, 0, 0, CalendarError::sol_out_of_range},
        {219, 1, 1, 24, 0, 0, 0, 0, CalendarError::hour_out_of_range},
        {219, 1, 1, 0, 60, 0, 0, 0, CalendarError::minute_out_of_range},
        {219, 1, 1, 0, 0, 60, 0, 0, CalendarError::second_out_of_range},
        {219, 1, 1, 0, 0, 0, 1000000, 0, CalendarError::microsecond_out_of_range},
        {219, 1, 1, 0, 0, 0, 0, 2, CalendarError::fold_out_of_range},
        {219, 1, 1, -1, -1, -1, -1, -1, CalendarError::hour_out_of_range},
    };
    for (const auto& c : cases) {
        auto r = DateTime::from_fields(c.y, c.m, c.s, c.hh, c.mm, c.ss, c.us, nullptr, c.fold);
        ASSERT_FALSE(r);
        EXPECT_EQ(r.error(), c.error);
    }
}

TEST_F(DateTimeTest, Combine) {
    auto date = *Date::from_ymd(219, 13, 27);
    auto dt = DateTime::combine(date, WallClock{1, 2, 3, 4}, FixedOffset::mtc());
    ASSERT_TRUE(dt);
    EXPECT_EQ(dt->date(), date);
    EXPECT_EQ(dt->wall_clock(), (WallClock{1, 2, 3, 4}));

    auto bad = DateTime::combine(date, WallClock{0, 0, 0, -1});
    ASSERT_FALSE(bad);
    EXPECT_EQ(bad.error(), CalendarError::microsecond_out_of_range);
}

TEST_F(DateTimeTest, WithProviderKeepsFields) {
    auto naive = at(219, 13, 27, 12);
    auto aware = naive.with_provider(fixed(3));
    EXPECT_EQ(aware.wall_clock(), naive.wall_clock());
    EXPECT_EQ(aware.date(), naive.date());
    EXPECT_TRUE(aware.provider());
}

// ==============================================================================
// Offset Queries
// ==============================================================================

TEST_F(DateTimeTest, NaiveHasNoOffset) {
    auto dt = at(219, 13, 27, 12);
    auto offset = dt.mtc_offset();
    ASSERT_TRUE(offset);
    EXPECT_FALSE(offset->has_value());
    auto daylight = dt.dst();
    ASSERT_TRUE(daylight);
    EXPECT_FALSE(daylight->has_value());
    EXPECT_FALSE(dt.zone_name().has_value());
}

TEST_F(DateTimeTest, DaylightProviderOffsets) {
    auto winter = at(219, 2, 1, 12, 0, 0, 0, daylight_);
    auto summer = at(219, 10, 5, 12, 0, 0, 0, daylight_);
    EXPECT_EQ(**winter.mtc_offset(), hours(1));
    EXPECT_EQ(**summer.mtc_offset(), hours(2));
    EXPECT_EQ(**summer.dst(), hours(1));
    EXPECT_EQ(summer.zone_name(), std::optional<std::string>("AMDT"));
    EXPECT_EQ(winter.zone_name(), std::optional<std::string>("AMT"));
}

TEST_F(DateTimeTest, RepeatedHourUsesFold) {
    auto first = at(219, 19, 1, 1, 30, 0, 0, daylight_, 0);
    auto second = first.with_fold(true);
    EXPECT_EQ(**first.mtc_offset(), hours(2));
    EXPECT_EQ(**second.mtc_offset(), hours(1));
}

// ==============================================================================
// Comparison
// ==============================================================================

TEST_F(DateTimeTest, SameProviderComparesFields) {
    auto a = at(219, 13, 27, 12, 0, 0, 0, daylight_);
    auto b = at(219, 13, 27, 12, 0, 0, 1, daylight_);
    EXPECT_EQ(*a.compare(b), std::strong_ordering::less);
    EXPECT_EQ(*b.compare(a), std::strong_ordering::greater);
    EXPECT_FALSE(a == b);
    EXPECT_TRUE(a == a);
}

TEST_F(DateTimeTest, SameProviderIgnoresFold) {
    auto first = at(219, 19, 1, 1, 30, 0, 0, daylight_, 0);
    auto second = first.with_fold(true);
    EXPECT_TRUE(first == second);
    EXPECT_EQ(*first.hash(), *second.hash());
}

TEST_F(DateTimeTest, FoldTwinsAcrossProviderInstances) {
    auto other_daylight = std::make_shared<const MarsDaylight>();
    auto first = at(219, 19, 1, 1, 30, 0, 0, daylight_, 0);
    auto second = at(219, 19, 1, 1, 30, 0, 0, other_daylight, 1);
    // Different instants, but both hash as the fold=0 reading
    EXPECT_FALSE(first == second);
    EXPECT_EQ(*first.hash(), *second.hash());
    EXPECT_EQ(*second.compare(first), std::strong_ordering::greater);
}

TEST_F(DateTimeTest, DifferentOffsetsCompareInstants) {
    auto a = at(219, 13, 27, 12, 0, 0, 0, fixed(3));
    auto b = at(219, 13, 27, 9, 0, 0, 0, FixedOffset::mtc());
    EXPECT_TRUE(a == b);
    EXPECT_EQ(*a.compare(b), std::strong_ordering::equal);
    EXPECT_EQ(*a.hash(), *b.hash());

    auto later = at(219, 13, 27, 9, 0, 0, 1, FixedOffset::mtc());
    EXPECT_EQ(*a.compare(later), std::strong_ordering::less);
}

TEST_F(DateTimeTest, DaylightAgainstFixed) {
    auto local = at(219, 10, 5, 14, 0, 0, 0, daylight_);
    auto mtc = at(219, 10, 5, 12, 0, 0, 0, FixedOffset::mtc());
    EXPECT_TRUE(local == mtc);
    EXPECT_EQ(*local.hash(), *mtc.hash());
}

TEST_F(DateTimeTest, FoldSensitiveValuesNeverEqualAcrossProviders) {
    // 01:30 daylight time on 19-1 is 23:30 MTC on the sol before
    auto ambiguous = at(219, 19, 1, 1, 30, 0, 0, daylight_, 0);
    auto mtc = at(219, 18, 27, 23, 30, 0, 0, FixedOffset::mtc());
    EXPECT_FALSE(ambiguous == mtc);
    auto eq = ambiguous.equals(mtc);
    ASSERT_TRUE(eq);
    EXPECT_FALSE(*eq);
    // Ordering still sees the same instant
    EXPECT_EQ(*ambiguous.compare(mtc), std::strong_ordering::equal);
}

TEST_F(DateTimeTest, NaiveVersusAware) {
    auto naive = at(219, 13, 27, 12);
    auto aware = at(219, 13, 27, 12, 0, 0, 0, FixedOffset::mtc());
    EXPECT_FALSE(naive == aware);
    auto eq = naive.equals(aware);
    ASSERT_TRUE(eq);
    EXPECT_FALSE(*eq);

    auto c = naive.compare(aware);
    ASSERT_FALSE(c);
    EXPECT_EQ(c.error(), CalendarError::naive_aware_mismatch);
    EXPECT_EQ(error_category(c.error()), ErrorCategory::type_mismatch);
}

TEST_F(DateTimeTest, NaiveValuesCompareFields) {
    EXPECT_TRUE(at(219, 13, 27, 12) == at(219, 13, 27, 12));
    EXPECT_EQ(*at(219, 13, 27, 12).compare(at(219, 13, 28)), std::strong_ordering::less);
    EXPECT_EQ(*at(219, 13, 27, 12).hash(), *at(219, 13, 27, 12).hash());
}

// ==============================================================================
// Arithmetic
// ==============================================================================

TEST_F(DateTimeTest, AddCarriesIntoDate) {
    auto r = at(219, 24, 27, 23) + hours(2);
    ASSERT_TRUE(r);
    EXPECT_EQ(r->date(), *Date::from_ymd(219, 24, 28));
    EXPECT_EQ(r->hour(), 1);

    auto r2 = hours(25) + at(219, 24, 28, 0);
    ASSERT_TRUE(r2);
    EXPECT_EQ(r2->date(), *Date::from_ymd(220, 1, 1));
    EXPECT_EQ(r2->hour(), 1);
}

TEST_F(DateTimeTest, AddKeepsProviderResetsFold) {
    auto dt = at(219, 19, 1, 1, 30, 0, 0, daylight_, 1);
    auto r = dt + *Duration::from_minutes(10);
    ASSERT_TRUE(r);
    EXPECT_EQ(r->provider().get(), daylight_.get());
    EXPECT_EQ(r->fold(), 0);
    EXPECT_EQ(r->minute(), 40);
}

TEST_F(DateTimeTest, SubtractDuration) {
    auto r = at(220, 1, 1, 0, 0, 0, 0) - Duration::resolution();
    ASSERT_TRUE(r);
    EXPECT_EQ(r->date(), *Date::from_ymd(219, 24, 28));
    EXPECT_EQ(r->wall_clock(), (WallClock{23, 59, 59, 999999}));
}

TEST_F(DateTimeTest, ArithmeticOverflow) {
    auto r1 = DateTime::max() + Duration::resolution();
    ASSERT_FALSE(r1);
    EXPECT_EQ(r1.error(), CalendarError::date_overflow);

    auto r2 = DateTime::min() - Duration::resolution();
    ASSERT_FALSE(r2);
    EXPECT_EQ(r2.error(), CalendarError::date_overflow);

    auto r3 = DateTime::min() - Duration::min();
    ASSERT_FALSE(r3);
    EXPECT_EQ(r3.error(), CalendarError::date_overflow);
}

TEST_F(DateTimeTest, DifferenceSameProvider) {
    auto a = at(219, 13, 28, 1, 0, 0, 0, daylight_);
    auto b = at(219, 13, 27, 23, 0, 0, 0, daylight_);
    auto d = a - b;
    ASSERT_TRUE(d);
    EXPECT_EQ(*d, hours(2));
}

TEST_F(DateTimeTest, DifferenceAcrossOffsets) {
    auto local = at(219, 10, 5, 14, 0, 0, 0, daylight_);
    auto mtc = at(219, 10, 5, 11, 0, 0, 0, FixedOffset::mtc());
    EXPECT_EQ(*(local - mtc), hours(1));
    EXPECT_EQ(*(mtc - local), hours(-1));

    auto a = at(219, 13, 27, 12, 0, 0, 0, fixed(3));
    auto b = at(219, 13, 27, 9, 0, 0, 0, FixedOffset::mtc());
    EXPECT_TRUE((*(a - b)).is_zero());
}

TEST_F(DateTimeTest, DifferenceNaiveVersusAware) {
    auto r = at(219, 13, 27, 12) - at(219, 13, 27, 12, 0, 0, 0, fixed(1));
    ASSERT_FALSE(r);
    EXPECT_EQ(r.error(), CalendarError::naive_aware_mismatch);
}

TEST_F(DateTimeTest, DifferenceSpansWholeRange) {
    auto d = DateTime::max() - DateTime::min();
    ASSERT_TRUE(d);
    EXPECT_EQ(d->sols(), MAX_ORDINAL - 1);
    EXPECT_EQ(d->seconds(), 86399);
    EXPECT_EQ(d->microseconds(), 999999);
}

// ==============================================================================
// Time Zone Conversion
// ==============================================================================

TEST_F(DateTimeTest, AstimezoneFixed) {
    auto c = at(219, 13, 27, 23, 30, 0, 0, fixed(-2));
    auto mtc = c.astimezone();
    ASSERT_TRUE(mtc);
    EXPECT_EQ(mtc->date(), *Date::from_ymd(219, 13, 28));
    EXPECT_EQ(mtc->wall_clock(), (WallClock{1, 30, 0, 0}));
    EXPECT_EQ(mtc->provider().get(), FixedOffset::mtc().get());

    auto india = c.astimezone(fixed(5.5));
    ASSERT_TRUE(india);
    EXPECT_EQ(india->date(), *Date::from_ymd(219, 13, 28));
    EXPECT_EQ(india->wall_clock(), (WallClock{7, 0, 0, 0}));
    EXPECT_TRUE(*india == c);
}

TEST_F(DateTimeTest, AstimezoneSameProviderIsIdentity) {
    auto dt = at(219, 19, 1, 1, 30, 0, 0, daylight_, 1);
    auto r = dt.astimezone(daylight_);
    ASSERT_TRUE(r);
    EXPECT_EQ(r->fold(), 1);
    EXPECT_EQ(r->wall_clock(), dt.wall_clock());
}

TEST_F(DateTimeTest, AstimezoneNaiveIsMtc) {
    auto naive = at(219, 13, 27, 12);
    auto r = naive.astimezone(fixed(1));
    ASSERT_TRUE(r);
    EXPECT_EQ(r->hour(), 13);

    // Already "in" MTC: returned as is, still naive
    auto same = naive.astimezone();
    ASSERT_TRUE(same);
    EXPECT_FALSE(same->provider());
    EXPECT_EQ(same->hour(), 12);
}

TEST_F(DateTimeTest, AstimezoneNullTarget) {
    auto r = at(219, 13, 27, 12).astimezone(nullptr);
    ASSERT_FALSE(r);
    EXPECT_EQ(r.error(), CalendarError::missing_provider);
}

TEST_F(DateTimeTest, AstimezoneDaylight) {
    auto summer = at(219, 10, 5, 12, 0, 0, 0, FixedOffset::mtc()).astimezone(daylight_);
    ASSERT_TRUE(summer);
    EXPECT_EQ(summer->hour(), 14);
    EXPECT_EQ(summer->provider().get(), daylight_.get());

    auto winter = at(219, 2, 1, 12, 0, 0, 0, FixedOffset::mtc()).astimezone(daylight_);
    ASSERT_TRUE(winter);
    EXPECT_EQ(winter->hour(), 13);

    auto back = summer->astimezone();
    ASSERT_TRUE(back);
    EXPECT_EQ(back->hour(), 12);
    EXPECT_EQ(back->date(), *Date::from_ymd(219, 10, 5));
}

TEST_F(DateTimeTest, AstimezoneOverflow) {
    auto r = DateTime::max().with_provider(fixed(-1)).astimezone();
    ASSERT_FALSE(r);
    EXPECT_EQ(r.error(), CalendarError::date_overflow);
}

// ==============================================================================
// Time Tuple and Text
// ==============================================================================

TEST_F(DateTimeTest, TimeTupleDstFlag) {
    auto summer = at(219, 10, 5, 12, 0, 30, 250000, daylight_);
    auto t = summer.time_tuple();
    ASSERT_TRUE(t);
    EXPECT_EQ(t->dst_flag, 1);
    EXPECT_DOUBLE_EQ(t->second, 30.25);
    EXPECT_EQ(t->hour, 12);
    EXPECT_EQ(t->weekday, summer.weekday());
    EXPECT_FALSE(t->day_of_year.has_value());

    EXPECT_EQ(at(219, 2, 1, 12, 0, 0, 0, daylight_).time_tuple()->dst_flag, 0);
    EXPECT_EQ(at(219, 2, 1, 12, 0, 0, 0, fixed(1)).time_tuple()->dst_flag, -1);
    EXPECT_EQ(at(219, 2, 1).time_tuple()->dst_flag, -1);
}

TEST_F(DateTimeTest, ToString) {
    EXPECT_EQ(*to_string(at(219, 13, 27, 9, 5, 7)), "0219-13-27 09:05:07");
    EXPECT_EQ(*to_string(at(219, 13, 27, 9, 5, 7, 42, FixedOffset::mtc())),
              "0219-13-27 09:05:07.000042+00:00");
    EXPECT_EQ(*to_string(at(219, 13, 27, 0, 0, 0, 0, fixed(-5.5))),
              "0219-13-27 00:00:00-05:30");
}
