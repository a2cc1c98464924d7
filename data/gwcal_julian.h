#ifndef gwcal_julian_h
#define gwcal_julian_h

/// @file

#include "gwcal_config.h"

/** @brief
 * The proleptic Julian calendar.
 *
 * @details
 * Every fourth year is a leap year, with no century exception. Years are
 * numbered astronomically. The day number follows the same March based
 * scheme as the Gregorian calendar so that the drift between the two falls
 * out of the leap rules.
 */
namespace gwcal_julian
{
/// the first year that can be converted
constexpr long min_year = -1000000;
/// the last year that can be converted
constexpr long max_year = 1000000;

/** return a date number counting days from March 1st of year 0 in the
 * Julian calendar. The date is not validated.
 */
GWCAL_EXPORT
long julian_number(long y, long m, long d);

/// convert a date number computed by julian_number back into a date
GWCAL_EXPORT
void date_from_julian_number(long j, long &y, long &m, long &d);

/// return true if y is a leap year
GWCAL_EXPORT
bool is_leap_year(long y);

/// return the number of days in the month, or 0 if m is not a month
GWCAL_EXPORT
long days_in_month(long y, long m);

/// always 12
GWCAL_EXPORT
long months_per_year(long y);

/** check that the date exists in the calendar. returns 0 if it does, and an
 * error code otherwise. the offending input is identified in bad_field.
 */
GWCAL_EXPORT
int validate(long y, long m, long d, int &bad_field);

/// convert a date to an absolute day number. returns 0 if successful.
GWCAL_EXPORT
int to_absolute_day(long y, long m, long d, long &abs_day);

/// convert an absolute day number to a date. returns 0 if successful.
GWCAL_EXPORT
int from_absolute_day(long abs_day, long &y, long &m, long &d);

GWCAL_EXPORT
long min_absolute_day();

GWCAL_EXPORT
long max_absolute_day();
}

#endif
