#include "gwcal_hebrew.h"

#include "gwcal_calendar_util.h"
#include "gwcal_error.h"
#include "gwcal_hebrew_year_cache.h"

using gwcal_calendar_util::floor_div;
using gwcal_calendar_util::floor_mod;

namespace
{
// the molad of Tishri AM 1 (BaHaRaD) measured in parts (1/1080 hour) from
// the start of the day preceding the epoch, and the length of the mean
// lunation in parts beyond 29 days.
constexpr long molad_of_epoch = 12084;
constexpr long lunation_parts = 13753;
constexpr long parts_per_day = 25920;

// apply the postponements that depend on the length of adjacent years. a
// year may not be 356 days long and a common year following a leap year may
// not be 382 days long.
long year_length_correction(long y)
{
    long ny0 = gwcal_hebrew::elapsed_days(y - 1);
    long ny1 = gwcal_hebrew::elapsed_days(y);
    long ny2 = gwcal_hebrew::elapsed_days(y + 1);

    if ((ny2 - ny1) == 356)
        return 2;

    if ((ny1 - ny0) == 382)
        return 1;

    return 0;
}

long compute_new_year(long y)
{
    return gwcal_hebrew::epoch + gwcal_hebrew::elapsed_days(y) +
        year_length_correction(y);
}

int month_of_year(bool leap, long m)
{
    if ((m < 1) || (m > (leap ? 13 : 12)))
        return 0;

    if (m <= 5)
        return m;

    if (leap)
    {
        if (m == 6)
            return gwcal_hebrew::adar_i;
        if (m == 7)
            return gwcal_hebrew::adar_ii;
        return gwcal_hebrew::nisan + (m - 8);
    }

    if (m == 6)
        return gwcal_hebrew::adar;

    return gwcal_hebrew::nisan + (m - 7);
}

// the length of month m given the year's leap status and length. 0 if m is
// not a month of the year
long month_length(bool leap, long year_length, long m)
{
    switch (month_of_year(leap, m))
    {
        case gwcal_hebrew::tishri: return 30;
        case gwcal_hebrew::heshvan: return (year_length % 10 == 5) ? 30 : 29;
        case gwcal_hebrew::kislev: return (year_length % 10 == 3) ? 29 : 30;
        case gwcal_hebrew::tevet: return 29;
        case gwcal_hebrew::shevat: return 30;
        case gwcal_hebrew::adar: return 29;
        case gwcal_hebrew::adar_i: return 30;
        case gwcal_hebrew::adar_ii: return 29;
        case gwcal_hebrew::nisan: return 30;
        case gwcal_hebrew::iyyar: return 29;
        case gwcal_hebrew::sivan: return 30;
        case gwcal_hebrew::tammuz: return 29;
        case gwcal_hebrew::av: return 30;
        case gwcal_hebrew::elul: return 29;
    }
    return 0;
}
}

namespace gwcal_hebrew
{
// **************************************************************************
bool is_leap_year(long y)
{
    return floor_mod(7*y + 1, 19) < 7;
}

// **************************************************************************
long months_per_year(long y)
{
    return is_leap_year(y) ? 13 : 12;
}

// **************************************************************************
long months_elapsed(long y)
{
    return floor_div(235*y - 234, 19);
}

// **************************************************************************
long elapsed_days(long y)
{
    long months = months_elapsed(y);
    long parts = molad_of_epoch + lunation_parts*months;
    long days = 29*months + floor_div(parts, parts_per_day);

    // Rosh Hashanah may not fall on Sunday, Wednesday, or Friday
    if (floor_mod(3*(days + 1), 7) < 3)
        days += 1;

    return days;
}

// **************************************************************************
int get_year_info(long y, long &new_year, long &length)
{
    if ((y < min_year) || (y > max_year))
        return gwcal_error::out_of_range;

    gwcal_hebrew_year_cache &cache = gwcal_hebrew_year_cache::get_instance();

    gwcal_hebrew_year_cache::year_info info;
    if (!cache.find(y, info))
    {
        info.new_year = compute_new_year(y);
        info.length = compute_new_year(y + 1) - info.new_year;
        cache.insert(y, info);
    }

    new_year = info.new_year;
    length = info.length;

    return gwcal_error::success;
}

// **************************************************************************
long days_in_year(long y)
{
    long new_year = 0;
    long length = 0;
    if (get_year_info(y, new_year, length))
        return 0;
    return length;
}

// **************************************************************************
int get_month_name(long y, long m)
{
    return month_of_year(is_leap_year(y), m);
}

// **************************************************************************
long days_in_month(long y, long m)
{
    long length = days_in_year(y);
    if (length == 0)
        return 0;
    return month_length(is_leap_year(y), length, m);
}

// **************************************************************************
int validate(long y, long m, long d, int &bad_field)
{
    long new_year = 0;
    long length = 0;
    if (int ierr = get_year_info(y, new_year, length))
    {
        bad_field = gwcal_error::year_field;
        return ierr;
    }

    bool leap = is_leap_year(y);
    if ((m < 1) || (m > (leap ? 13 : 12)))
    {
        bad_field = gwcal_error::month_field;
        return gwcal_error::invalid_date;
    }

    if ((d < 1) || (d > month_length(leap, length, m)))
    {
        bad_field = gwcal_error::day_field;
        return gwcal_error::invalid_date;
    }

    bad_field = gwcal_error::no_field;
    return gwcal_error::success;
}

// **************************************************************************
int to_absolute_day(long y, long m, long d, long &abs_day)
{
    int bad_field = gwcal_error::no_field;
    if (int ierr = validate(y, m, d, bad_field))
        return ierr;

    long new_year = 0;
    long length = 0;
    if (int ierr = get_year_info(y, new_year, length))
        return ierr;

    bool leap = is_leap_year(y);

    abs_day = new_year + (d - 1);
    for (long i = 1; i < m; ++i)
        abs_day += month_length(leap, length, i);

    return gwcal_error::success;
}

// **************************************************************************
int from_absolute_day(long abs_day, long &y, long &m, long &d)
{
    if ((abs_day < min_absolute_day()) || (abs_day > max_absolute_day()))
        return gwcal_error::out_of_range;

    // estimate the year from the mean year length of 35975351/98496 days,
    // then walk to the year that contains abs_day. this takes at most a step
    // or two.
    y = floor_div((abs_day - epoch)*98496, 35975351) + 1;
    if (y < min_year)
        y = min_year;
    else if (y > max_year)
        y = max_year;

    long new_year = 0;
    long length = 0;
    int ierr = get_year_info(y, new_year, length);

    while (!ierr && (abs_day < new_year))
        ierr = get_year_info(--y, new_year, length);

    while (!ierr && (abs_day >= (new_year + length)))
        ierr = get_year_info(++y, new_year, length);

    if (ierr)
        return ierr;

    bool leap = is_leap_year(y);

    long doy = abs_day - new_year;

    m = 1;
    long len = month_length(leap, length, m);
    while (doy >= len)
    {
        doy -= len;
        len = month_length(leap, length, ++m);
    }

    d = doy + 1;

    return gwcal_error::success;
}

// **************************************************************************
long min_absolute_day()
{
    return epoch;
}

// **************************************************************************
long max_absolute_day()
{
    return compute_new_year(max_year + 1) - 1;
}
}
