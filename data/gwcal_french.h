#ifndef gwcal_french_h
#define gwcal_french_h

/// @file

#include "gwcal_config.h"

/** @brief
 * The French Republican calendar.
 *
 * @details
 * Year I began on 1 Vendemiaire, 22 September 1792 in the Gregorian
 * calendar. A year has twelve months of 30 days followed by the
 * complementary days (sansculottides), which are treated as a 13th month of
 * 5 days, or 6 in a leap year.
 *
 * While in use, leap years were placed by the autumn equinox. Here a fixed
 * arithmetic rule is used instead: year y is a leap year when y + 1 is a
 * Gregorian leap year number, i.e. (y+1) is divisible by 4, and not by 100
 * unless also by 400. This matches the sextile years III, VII and XI of the
 * period the calendar was in use. Placement after year XIV is proleptic and
 * does not agree with the equinox rule in every year.
 */
namespace gwcal_french
{
/// the absolute day of 1 Vendemiaire I
constexpr long epoch = 2375840;
/// the first year that can be converted
constexpr long min_year = 1;
/// the last year that can be converted
constexpr long max_year = 1000000;
/// the month holding the complementary days
constexpr long complementary_month = 13;

GWCAL_EXPORT
bool is_leap_year(long y);

/** return the number of days in the month. 30 for months 1 through 12, and 5
 * or 6 for the complementary days. 0 if m is not a month.
 */
GWCAL_EXPORT
long days_in_month(long y, long m);

/// always 13
GWCAL_EXPORT
long months_per_year(long y);

/** check that the date exists in the calendar. returns 0 if it does, and an
 * error code otherwise. the offending input is identified in bad_field.
 */
GWCAL_EXPORT
int validate(long y, long m, long d, int &bad_field);

GWCAL_EXPORT
int to_absolute_day(long y, long m, long d, long &abs_day);

GWCAL_EXPORT
int from_absolute_day(long abs_day, long &y, long &m, long &d);

GWCAL_EXPORT
long min_absolute_day();

GWCAL_EXPORT
long max_absolute_day();
}

#endif
