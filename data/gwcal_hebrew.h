#ifndef gwcal_hebrew_h
#define gwcal_hebrew_h

/// @file

#include "gwcal_config.h"

/** @brief
 * The arithmetic Hebrew calendar.
 *
 * @details
 * Years are counted from the creation era (AM). Leap years fall in years 3,
 * 6, 8, 11, 14, 17 and 19 of the 19 year Metonic cycle and carry a 13th
 * month. Months are numbered from Tishri, the first month of the civil year:
 *
 * | month | common year | leap year  |
 * |-------|-------------|------------|
 * | 1     | Tishri      | Tishri     |
 * | 2     | Heshvan     | Heshvan    |
 * | 3     | Kislev      | Kislev     |
 * | 4     | Tevet       | Tevet      |
 * | 5     | Shevat      | Shevat     |
 * | 6     | Adar        | Adar I     |
 * | 7     | Nisan       | Adar II    |
 * | 8     | Iyyar       | Nisan      |
 * | 9     | Sivan       | Iyyar      |
 * | 10    | Tammuz      | Sivan      |
 * | 11    | Av          | Tammuz     |
 * | 12    | Elul        | Av         |
 * | 13    |             | Elul       |
 *
 * The first day of each year is derived from the molad of Tishri with the
 * postponement rules applied. The year's length decides Heshvan and Kislev:
 * Heshvan has 30 days in a complete year (355 or 385 days) and Kislev has 29
 * days in a deficient year (353 or 383 days).
 */
namespace gwcal_hebrew
{
/// the absolute day of 1 Tishri AM 1
constexpr long epoch = 347998;
/// the first year that can be converted
constexpr long min_year = 1;
/// the last year that can be converted
constexpr long max_year = 1000000;

/// the months of the year, see days_in_month for the mapping to ordinals
enum month_name
{
    tishri = 1,
    heshvan,
    kislev,
    tevet,
    shevat,
    adar,
    adar_i,
    adar_ii,
    nisan,
    iyyar,
    sivan,
    tammuz,
    av,
    elul
};

/// return true if y has 13 months
GWCAL_EXPORT
bool is_leap_year(long y);

/// 12 or 13
GWCAL_EXPORT
long months_per_year(long y);

/** the number of months from the epoch to the start of year y. This is the
 * count of complete lunations used to locate the molad of Tishri.
 */
GWCAL_EXPORT
long months_elapsed(long y);

/** the number of days from the epoch to the molad day of Tishri of year y,
 * with the postponements that depend only on the molad itself applied.
 */
GWCAL_EXPORT
long elapsed_days(long y);

/** The absolute day of 1 Tishri of year y and the number of days in the year.
 * Memoized in gwcal_hebrew_year_cache. returns 0 if successful and
 * gwcal_error::out_of_range when y is outside of the supported years.
 */
GWCAL_EXPORT
int get_year_info(long y, long &new_year, long &length);

/// returns one of 353, 354, 355, 383, 384, or 385. 0 for unsupported years
GWCAL_EXPORT
long days_in_year(long y);

/** return the name of the m'th month of year y. returns 0 if m is not a
 * month of the year.
 */
GWCAL_EXPORT
int get_month_name(long y, long m);

/** return the number of days in the m'th month of year y. 0 is returned if
 * m is not a month of the year or y is outside of the supported years.
 */
GWCAL_EXPORT
long days_in_month(long y, long m);

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
