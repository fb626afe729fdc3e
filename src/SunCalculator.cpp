#include "LightsOut.h"

#include <cmath>

// ===== SUNRISE / SUNSET =====
//
// Simplified NOAA almanac method: day of year -> mean anomaly -> true
// longitude -> right ascension -> declination -> local hour angle at the
// official zenith. The UTC result is shifted into local time either by a
// fixed offset or by the system time zone for that date (DST aware).

namespace {

const double PI = 3.14159265358979323846;
const double DEG_TO_RAD = PI / 180.0;
const double RAD_TO_DEG = 180.0 / PI;

double normalize(double value, double range) {
  double result = fmod(value, range);
  if (result < 0) result += range;
  return result;
}

}

SunCalculator::SunCalculator(double lat, double lon)
  : latitude(lat), longitude(lon), timezoneMode(SUN_TZ_FIXED), utcOffsetMinutes(DEFAULT_UTC_OFFSET_MINUTES) {}

void SunCalculator::setFixedOffset(int offsetMinutes) {
  timezoneMode = SUN_TZ_FIXED;
  utcOffsetMinutes = offsetMinutes;
}

void SunCalculator::useLocalTimezone() {
  timezoneMode = SUN_TZ_LOCAL;
}

ClockTime SunCalculator::getSunrise(time_t date) const {
  return calculateSunTime(date, true);
}

ClockTime SunCalculator::getSunset(time_t date) const {
  return calculateSunTime(date, false);
}

int SunCalculator::offsetMinutesFor(time_t date) const {
  if (timezoneMode == SUN_TZ_FIXED) return utcOffsetMinutes;

  // Offset in effect at local noon of that date
  time_t noon = localTimeAt(date, 12, 0);
  struct tm timeinfo;
  if (!localtime_r(&noon, &timeinfo)) return 0;
  return static_cast<int>(timeinfo.tm_gmtoff / 60);
}

ClockTime SunCalculator::calculateSunTime(time_t date, bool rising) const {
  struct tm timeinfo;
  int dayOfYear = 1;
  if (localtime_r(&date, &timeinfo)) {
    dayOfYear = timeinfo.tm_yday + 1;
  }

  double lngHour = longitude / 15.0;
  double t = dayOfYear + ((rising ? 6.0 : 18.0) - lngHour) / 24.0;

  // Sun's mean anomaly
  double M = (0.9856 * t) - 3.289;

  // Sun's true longitude
  double L = M + (1.916 * sin(M * DEG_TO_RAD)) + (0.020 * sin(2 * M * DEG_TO_RAD)) + 282.634;
  L = normalize(L, 360.0);

  // Right ascension, moved into the same quadrant as L
  double RA = normalize(RAD_TO_DEG * atan(0.91764 * tan(L * DEG_TO_RAD)), 360.0);
  double lQuadrant = floor(L / 90.0) * 90.0;
  double raQuadrant = floor(RA / 90.0) * 90.0;
  RA = (RA + (lQuadrant - raQuadrant)) / 15.0;

  // Declination
  double sinDec = 0.39782 * sin(L * DEG_TO_RAD);
  double cosDec = cos(asin(sinDec));

  // Local hour angle, clamped for polar day/night
  double cosH = (cos(SUN_ZENITH * DEG_TO_RAD) - (sinDec * sin(latitude * DEG_TO_RAD))) /
                (cosDec * cos(latitude * DEG_TO_RAD));
  if (cosH > 1.0) cosH = 1.0;
  if (cosH < -1.0) cosH = -1.0;

  double H = rising ? 360.0 - RAD_TO_DEG * acos(cosH) : RAD_TO_DEG * acos(cosH);
  H = H / 15.0;

  // Local mean time, then UTC
  double T = H + RA - (0.06571 * t) - 6.622;
  double UT = normalize(T - lngHour, 24.0);

  double localHour = normalize(UT + offsetMinutesFor(date) / 60.0, 24.0);

  ClockTime result;
  result.hour = static_cast<int>(localHour);
  result.minute = static_cast<int>((localHour - result.hour) * 60.0);
  if (result.minute > 59) result.minute = 59;
  return result;
}
