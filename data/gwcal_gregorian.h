#ifndef gwcal_gregorian_h
#define gwcal_gregorian_h

/// @file

#include "gwcal_config.h"

/** @brief
 * The proleptic Gregorian calendar.
 *
 * @details
 * Functions for date computations in the gregorian calendar. The same leap
 * rule is applied to every year, there is no cut over from the Julian
 * calendar. Years are numbered astronomically, year 0 is 1 BCE. for details
 * about the day number math see
 * http://alcor.concordia.ca/~gpkatch/gdate-algorithm.html
 */
namespace gwcal_gregorian
{
/// the first year that can be converted
constexpr long min_year = -1000000;
/// the last year that can be converted
constexpr long max_year = 1000000;

/** return a date number for the given date that can be used in computations.
 * The date is not validated. The number counts days from March 1st of year 0.
 * input:
 *
 * > y : year
 * > m : month, 1 to 12
 * > d : day of the month
 *
 */
GWCAL_EXPORT
long gregorian_number(long y, long m, long d);

/** input:
 *
 * > g : date number computed from gregorian_number
 *
 * returns:
 *
 * > y : year
 * > m : month
 * > d : day of the month
 *
 */
GWCAL_EXPORT
void date_from_gregorian_number(long g, long &y, long &m, long &d);

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

/** convert a date to an absolute day number. returns 0 if successful,
 * gwcal_error::invalid_date or gwcal_error::out_of_range if not.
 */
GWCAL_EXPORT
int to_absolute_day(long y, long m, long d, long &abs_day);

/** convert an absolute day number to a date. returns 0 if successful, and
 * gwcal_error::out_of_range if abs_day is outside of the supported years.
 */
GWCAL_EXPORT
int from_absolute_day(long abs_day, long &y, long &m, long &d);

/// the absolute day of January 1st of min_year
GWCAL_EXPORT
long min_absolute_day();

/// the absolute day of December 31st of max_year
GWCAL_EXPORT
long max_absolute_day();
}

#endif
