#include <gtest/gtest.h>

#include "fakes.h"
#include "ridesafe/location_provider.h"

using ridesafe::FixResult;
using ridesafe::LocationProvider;
using ridesafe::nmeaToDegrees;
using ridesafe::parseGgaSentence;
using ridesafe::fakes::FakeClock;
using ridesafe::fakes::FakeSerialStream;

namespace {

const char* const GGA_MUNICH = "$GPGGA,123519,4807.038,N,01131.000,E,1,08,0.9,545.4,M,46.9,M,,*47";
const char* const GGA_COIMBATORE = "$GNGGA,101530.00,1101.4700,N,07700.0150,E,1,07,1.1,411.2,M,-88.0,M,,*5E";
const char* const GGA_NO_FIX = "$GPGGA,123519,,,,,0,00,,,M,,M,,*6B";
const char* const RMC = "$GPRMC,123519,A,4807.038,N,01131.000,E,022.4,084.4,230394,003.1,W*6A";
// GGA_MUNICH with a checksum that does not match its payload
const char* const GGA_CORRUPT = "$GPGGA,123519,4807.038,N,01131.000,E,1,08,0.9,545.4,M,46.9,M,,*00";

}  // namespace

TEST(NmeaDegreesTest, ConvertsDegreesAndMinutes) {
  std::optional<double> degrees = nmeaToDegrees("1102.1500");
  ASSERT_TRUE(degrees.has_value());
  EXPECT_NEAR(*degrees, 11.0 + 2.15 / 60.0, 1e-9);
  EXPECT_NEAR(*degrees, 11.03583, 1e-5);
}

TEST(NmeaDegreesTest, ConvertsThreeDigitLongitude) {
  std::optional<double> degrees = nmeaToDegrees("07700.0150");
  ASSERT_TRUE(degrees.has_value());
  EXPECT_NEAR(*degrees, 77.00025, 1e-9);
}

TEST(NmeaDegreesTest, RejectsShortOrMalformedInput) {
  EXPECT_FALSE(nmeaToDegrees("").has_value());
  EXPECT_FALSE(nmeaToDegrees("110").has_value());
  EXPECT_FALSE(nmeaToDegrees("1102").has_value());
  EXPECT_FALSE(nmeaToDegrees("ab02.150").has_value());
  EXPECT_FALSE(nmeaToDegrees("1102.1x0").has_value());
  EXPECT_FALSE(nmeaToDegrees("1172.1500").has_value());
}

TEST(GgaSentenceTest, AcceptsGpsAndMultiConstellationTalkers) {
  EXPECT_TRUE(parseGgaSentence(GGA_MUNICH).has_value());
  EXPECT_TRUE(parseGgaSentence(GGA_COIMBATORE).has_value());
}

TEST(GgaSentenceTest, IgnoresOtherSentenceTypes) {
  // RMC carries a valid position but is not a GGA sentence
  EXPECT_FALSE(parseGgaSentence(RMC).has_value());
  EXPECT_FALSE(parseGgaSentence("GPGGA without dollar").has_value());
  EXPECT_FALSE(parseGgaSentence("$GP").has_value());
}

TEST(GgaSentenceTest, RejectsChecksumMismatch) {
  EXPECT_FALSE(parseGgaSentence(GGA_CORRUPT).has_value());
  // Payload garbled in transit, original checksum kept
  EXPECT_FALSE(parseGgaSentence("$GPGGA,123519,4807.038,N,01191.000,E,1,08,0.9,545.4,M,46.9,M,,*47").has_value());
}

TEST(GgaSentenceTest, ParsesPosition) {
  std::optional<FixResult> fix = parseGgaSentence(GGA_MUNICH);
  ASSERT_TRUE(fix.has_value());
  EXPECT_NEAR(fix->latitude, 48.1173, 1e-6);
  EXPECT_NEAR(fix->longitude, 11.516666, 1e-6);
}

TEST(GgaSentenceTest, SouthAndWestAreNegative) {
  std::optional<FixResult> fix =
      parseGgaSentence("$GPGGA,000000,3351.6200,S,15112.5800,W,1,05,1.0,10.0,M,0.0,M,,*43\r\n");
  ASSERT_TRUE(fix.has_value());
  EXPECT_NEAR(fix->latitude, -(33.0 + 51.62 / 60.0), 1e-6);
  EXPECT_NEAR(fix->longitude, -(151.0 + 12.58 / 60.0), 1e-6);
}

TEST(GgaSentenceTest, SkipsSentencesWithoutPosition) {
  EXPECT_FALSE(parseGgaSentence(GGA_NO_FIX).has_value());
  // Coordinates present but receiver reports no fix
  EXPECT_FALSE(parseGgaSentence("$GPGGA,123519,4807.038,N,01131.000,E,0,00,,,M,,M,,*52").has_value());
  // Fix reported with an empty latitude
  EXPECT_FALSE(parseGgaSentence("$GPGGA,123519,,N,01131.000,E,1,08,0.9,545.4,M,46.9,M,,*59").has_value());
  EXPECT_FALSE(parseGgaSentence("$GPGGA,123519,4807.038").has_value());
}

class LocationProviderTest : public ::testing::Test {
protected:
  FakeClock clock;
  FakeSerialStream gps{clock};
  LocationProvider provider{gps, clock};

  void SetUp() override { ridesafe::fakes::clearCapturedLog(); }
};

TEST_F(LocationProviderTest, ReturnsFirstValidFix) {
  gps.lines.push_back(RMC);
  gps.lines.push_back(GGA_NO_FIX);
  gps.lines.push_back(GGA_COIMBATORE);
  gps.lines.push_back(GGA_MUNICH);

  std::optional<FixResult> fix = provider.acquireFix(10000);
  ASSERT_TRUE(fix.has_value());
  EXPECT_NEAR(fix->latitude, 11.0245, 1e-9);
  EXPECT_NEAR(fix->longitude, 77.00025, 1e-9);
  EXPECT_EQ(gps.linesRead, 3);
}

TEST_F(LocationProviderTest, DiscardsStaleInputBeforeWindow) {
  gps.staleLines.push_back(GGA_MUNICH);
  gps.lines.push_back(GGA_COIMBATORE);

  std::optional<FixResult> fix = provider.acquireFix(10000);
  EXPECT_EQ(gps.drainCount, 1);
  ASSERT_TRUE(fix.has_value());
  EXPECT_NEAR(fix->latitude, 11.0245, 1e-9);
}

TEST_F(LocationProviderTest, MalformedSentenceIsSkippedNotFatal) {
  gps.lines.push_back("$GPGGA,123519,48x7.038,N,01131.000,E,1,08,0.9,545.4,M,46.9,M,,*0F");
  gps.lines.push_back(GGA_MUNICH);

  EXPECT_TRUE(provider.acquireFix(10000).has_value());
}

TEST_F(LocationProviderTest, CorruptSentenceNeverBecomesTheFix) {
  gps.lines.push_back(GGA_CORRUPT);
  gps.lines.push_back(GGA_COIMBATORE);

  std::optional<FixResult> fix = provider.acquireFix(10000);
  ASSERT_TRUE(fix.has_value());
  EXPECT_NEAR(fix->latitude, 11.0245, 1e-9);
  EXPECT_EQ(gps.linesRead, 2);
}

TEST_F(LocationProviderTest, OnlyCorruptSentencesTimeOut) {
  gps.repeatLine = GGA_CORRUPT;

  EXPECT_FALSE(provider.acquireFix(2000).has_value());
  EXPECT_NE(ridesafe::fakes::capturedLog().find("failed checksum"), std::string::npos);
}

TEST_F(LocationProviderTest, TimesOutOnNonMatchingSentences) {
  gps.repeatLine = RMC;

  std::optional<FixResult> fix = provider.acquireFix(10000);
  EXPECT_FALSE(fix.has_value());
  EXPECT_GE(clock.now, 10000u);
  EXPECT_LT(clock.now, 10000u + gps.lineIntervalMs + 1);
}

TEST_F(LocationProviderTest, TimesOutOnSilentReceiver) {
  std::optional<FixResult> fix = provider.acquireFix(3000);
  EXPECT_FALSE(fix.has_value());
  EXPECT_EQ(gps.linesRead, 0);
  EXPECT_EQ(clock.totalDelay(), 3000u);
}
