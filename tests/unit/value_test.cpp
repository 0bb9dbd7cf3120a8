#include <gtest/gtest.h>

#include <cstdlib>
#include <ctime>

#include "core/errors/Errors.hpp"
#include "core/value/DateTime.hpp"
#include "core/value/Value.hpp"

using namespace filemeta;

namespace {

// Pins local time to UTC+3 (POSIX TZ strings invert the sign).
class FixedZone : public ::testing::Test {
protected:
  void SetUp() override {
    if (const char* tz = std::getenv("TZ")) saved_ = tz, hadTz_ = true;
    setenv("TZ", "XXX-3", 1);
    tzset();
  }
  void TearDown() override {
    if (hadTz_) setenv("TZ", saved_.c_str(), 1);
    else unsetenv("TZ");
    tzset();
  }

private:
  std::string saved_;
  bool hadTz_ = false;
};

} // namespace

TEST(TagParse, NameOnly) {
  Tag t = parseTag("  foo  ");
  EXPECT_EQ(t.name, "foo");
  EXPECT_EQ(t.color, 0);
}

TEST(TagParse, ReservedNameGetsCanonicalLabel) {
  Tag t = parseTag("red");
  EXPECT_EQ(t.name, "Red");
  EXPECT_EQ(t.color, 6);
}

TEST(TagParse, ExplicitColorByNumberOrName) {
  EXPECT_EQ(parseTag("test,6"), (Tag{"test", 6}));
  EXPECT_EQ(parseTag("test, Blue"), (Tag{"test", 4}));
  EXPECT_EQ(parseTag("Red,0"), (Tag{"Red", 0}));
}

TEST(TagParse, Rejects) {
  EXPECT_THROW(parseTag("a,1,2"), TypeMismatch);
  EXPECT_THROW(parseTag("a,8"), TypeMismatch);
  EXPECT_THROW(parseTag("a,mauve"), TypeMismatch);
  EXPECT_THROW(parseTag(" ,1"), TypeMismatch);
}

TEST(Labels, ReservedNamesAreCaseInsensitive) {
  EXPECT_EQ(reservedColorForName("GRAY"), 1);
  EXPECT_EQ(reservedColorForName("orange"), 7);
  EXPECT_FALSE(reservedColorForName("None").has_value());
  EXPECT_FALSE(reservedColorForName("Redish").has_value());
  EXPECT_EQ(labelNameForColor(3), "Purple");
  EXPECT_THROW(labelNameForColor(8), TypeMismatch);
}

TEST(ValueModel, KindsAndEmptiness) {
  EXPECT_TRUE(Value().isNull());
  EXPECT_FALSE(Value().kind().has_value());
  EXPECT_EQ(Value::ofInteger(5).kind(), ValueKind::Integer);
  EXPECT_EQ(Value::ofBoolean(false).kind(), ValueKind::Boolean);
  EXPECT_TRUE(Value::ofString("").isEmpty());
  EXPECT_TRUE(Value::emptyOf(ValueKind::TagList).isEmpty());
  EXPECT_EQ(Value::emptyOf(ValueKind::TagList).kind(), ValueKind::TagList);
  EXPECT_TRUE(Value::emptyOf(ValueKind::DateTime).isNull());
  EXPECT_FALSE(Value::ofBoolean(false).isEmpty());
}

TEST(ValueModel, WrongAccessorIsTypeMismatch) {
  Value v = Value::ofString("x");
  EXPECT_THROW(v.asTags(), TypeMismatch);
  EXPECT_THROW(v.asInteger(), TypeMismatch);
  EXPECT_THROW(requireKind(v, ValueKind::TagList, "tags"), TypeMismatch);
  EXPECT_NO_THROW(requireKind(Value(), ValueKind::TagList, "tags"));
}

TEST(DateTimeParse, Forms) {
  DateTime d = parseIsoDateTime("2020-04-14");
  EXPECT_EQ(d.year, 2020);
  EXPECT_EQ(d.hour, 0);
  EXPECT_TRUE(d.isNaive());

  DateTime t = parseIsoDateTime("2020-04-14T12:30:05.25-07:00");
  EXPECT_EQ(t.hour, 12);
  EXPECT_EQ(t.second, 5);
  EXPECT_EQ(t.microsecond, 250000);
  EXPECT_EQ(t.utcOffsetMinutes, -420);

  EXPECT_EQ(parseIsoDateTime("2020-04-14 01:02Z").utcOffsetMinutes, 0);
}

TEST(DateTimeParse, Rejects) {
  EXPECT_THROW(parseIsoDateTime("2020-13-01"), TypeMismatch);
  EXPECT_THROW(parseIsoDateTime("2021-02-29"), TypeMismatch);
  EXPECT_THROW(parseIsoDateTime("yesterday"), TypeMismatch);
  EXPECT_THROW(parseIsoDateTime("2020-04-14T12"), TypeMismatch);
}

TEST(DateTimeFormat, IsoOutput) {
  EXPECT_EQ(formatIsoDateTime(parseIsoDateTime("2020-04-14T12:00:00")), "2020-04-14T12:00:00");
  EXPECT_EQ(formatIsoDateTime(parseIsoDateTime("2020-04-14T12:00:00.5+05:30")),
            "2020-04-14T12:00:00.500000+05:30");
}

TEST(DateTimeUtc, AwareValuesIgnoreLocalZone) {
  DateTime aware = parseIsoDateTime("1970-01-01T01:00:00+01:00");
  EXPECT_EQ(toUnixMicros(aware, false), 0);
  EXPECT_EQ(toUnixMicros(aware, true), 0);
  DateTime back = fromUnixMicros(0, true);
  EXPECT_EQ(formatIsoDateTime(back), "1970-01-01T00:00:00+00:00");
}

TEST_F(FixedZone, NaiveIsLocalUnlessAssumedUtc) {
  DateTime naive = parseIsoDateTime("2020-06-01T12:00:00");
  const std::int64_t utcNoon = toUnixMicros(parseIsoDateTime("2020-06-01T12:00:00Z"), false);
  EXPECT_EQ(toUnixMicros(naive, true), utcNoon);
  EXPECT_EQ(toUnixMicros(naive, false), utcNoon - 3LL * 3600 * 1000000);

  DateTime local = fromUnixMicros(utcNoon, false);
  EXPECT_TRUE(local.isNaive());
  EXPECT_EQ(local.hour, 15);
}

TEST_F(FixedZone, NegativeMicrosRoundTrip) {
  DateTime dt = fromUnixMicros(-1, true);
  EXPECT_EQ(dt.year, 1969);
  EXPECT_EQ(dt.microsecond, 999999);
  EXPECT_EQ(toUnixMicros(dt, false), -1);
}
