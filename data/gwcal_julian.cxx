#include "gwcal_julian.h"

#include "gwcal_calendar_util.h"
#include "gwcal_error.h"

using gwcal_calendar_util::floor_div;

namespace
{
// absolute day of julian number 0, March 1st of year 0
constexpr long julian_number_origin = 1721118;

const long month_lengths[12] = {31, 28, 31, 30, 31, 30, 31, 31, 30, 31, 30, 31};

long days_before_year(long y)
{
    return 365*y + floor_div(y, 4);
}
}

namespace gwcal_julian
{
// **************************************************************************
long julian_number(long y, long m, long d)
{
    m = (m + 9) % 12;
    y = y - m/10;
    return days_before_year(y) + (m*306 + 5)/10 + (d - 1);
}

// **************************************************************************
void date_from_julian_number(long j, long &y, long &m, long &d)
{
    // the leap cycle is exactly 1461 days so this is never off by one
    y = floor_div(4*j + 3, 1461);
    long ddd = j - days_before_year(y);

    long mi = (100*ddd + 52)/3060;

    m = (mi + 2)%12 + 1;
    y = y + (mi + 2)/12;
    d = ddd - (mi*306 + 5)/10 + 1;
}

// **************************************************************************
bool is_leap_year(long y)
{
    return y % 4 == 0;
}

// **************************************************************************
long days_in_month(long y, long m)
{
    if ((m < 1) || (m > 12))
        return 0;

    if ((m == 2) && is_leap_year(y))
        return 29;

    return month_lengths[m - 1];
}

// **************************************************************************
long months_per_year(long)
{
    return 12;
}

// **************************************************************************
int validate(long y, long m, long d, int &bad_field)
{
    if ((y < min_year) || (y > max_year))
    {
        bad_field = gwcal_error::year_field;
        return gwcal_error::out_of_range;
    }

    if ((m < 1) || (m > 12))
    {
        bad_field = gwcal_error::month_field;
        return gwcal_error::invalid_date;
    }

    if ((d < 1) || (d > days_in_month(y, m)))
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

    abs_day = julian_number(y, m, d) + julian_number_origin;

    return gwcal_error::success;
}

// **************************************************************************
int from_absolute_day(long abs_day, long &y, long &m, long &d)
{
    if ((abs_day < min_absolute_day()) || (abs_day > max_absolute_day()))
        return gwcal_error::out_of_range;

    date_from_julian_number(abs_day - julian_number_origin, y, m, d);

    return gwcal_error::success;
}

// **************************************************************************
long min_absolute_day()
{
    return julian_number(min_year, 1, 1) + julian_number_origin;
}

// **************************************************************************
long max_absolute_day()
{
    return julian_number(max_year, 12, 31) + julian_number_origin;
}
}
