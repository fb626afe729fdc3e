#ifndef TEST_TIME_H
#define TEST_TIME_H

#include <ctime>

// Local wall-clock time, DST resolved by the C library
inline time_t localDateTime(int year, int month, int day, int hour, int minute, int second = 0) {
  struct tm timeinfo = {};
  timeinfo.tm_year = year - 1900;
  timeinfo.tm_mon = month - 1;
  timeinfo.tm_mday = day;
  timeinfo.tm_hour = hour;
  timeinfo.tm_min = minute;
  timeinfo.tm_sec = second;
  timeinfo.tm_isdst = -1;
  return mktime(&timeinfo);
}

inline int minuteOfDay(time_t timestamp) {
  struct tm timeinfo;
  localtime_r(&timestamp, &timeinfo);
  return timeinfo.tm_hour * 60 + timeinfo.tm_min;
}

#endif // TEST_TIME_H
