#include "gwcal_french.h"

#include "gwcal_error.h"

namespace
{
// the number of days from the epoch to the first day of year y. years
// before y that are leap years are those in 1 .. y-1 where the following
// year number is a Gregorian leap year number, there are y/4 - y/100 + y/400
// of them.
long days_before_year(long y)
{
    return 365*(y - 1) + y/4 - y/100 + y/400;
}
}

namespace gwcal_french
{
// **************************************************************************
bool is_leap_year(long y)
{
    long n = y + 1;
    return (n % 4 == 0) && ((n % 100 != 0) || (n % 400 == 0));
}

// **************************************************************************
long days_in_month(long y, long m)
{
    if ((m < 1) || (m > complementary_month))
        return 0;

    if (m == complementary_month)
        return is_leap_year(y) ? 6 : 5;

    return 30;
}

// **************************************************************************
long months_per_year(long)
{
    return 13;
}

// **************************************************************************
int validate(long y, long m, long d, int &bad_field)
{
    if ((y < min_year) || (y > max_year))
    {
        bad_field = gwcal_error::year_field;
        return gwcal_error::out_of_range;
    }

    if ((m < 1) || (m > complementary_month))
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

    abs_day = epoch + days_before_year(y) + 30*(m - 1) + (d - 1);

    return gwcal_error::success;
}

// **************************************************************************
int from_absolute_day(long abs_day, long &y, long &m, long &d)
{
    if ((abs_day < min_absolute_day()) || (abs_day > max_absolute_day()))
        return gwcal_error::out_of_range;

    long n = abs_day - epoch;

    // estimate from the mean year length of 146097/400 days and correct.
    // the estimate is never off by more than a year.
    y = (400*n)/146097 + 1;
    while (days_before_year(y + 1) <= n)
        ++y;
    while (days_before_year(y) > n)
        --y;

    long doy = n - days_before_year(y);

    m = doy/30 + 1;
    d = doy%30 + 1;

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
    return epoch + days_before_year(max_year + 1) - 1;
}
}
