#include "gwcal_config.h"
#include "gwcal_common.h"
#include "gwcal_error.h"
#include "gwcal_french.h"
#include "gwcal_gregorian.h"

#include <iostream>

namespace
{
// --------------------------------------------------------------------------
int check_gregorian(long fy, long fm, long fd, long gy, long gm, long gd)
{
    long abs_day = 0;
    if (int ierr = gwcal_french::to_absolute_day(fy, fm, fd, abs_day))
    {
        GWCAL_ERROR("Failed to convert " << fy << "-" << fm << "-" << fd
            << ". " << gwcal_error::get_code_name(ierr))
        return -1;
    }

    long y = 0, m = 0, d = 0;
    if (gwcal_gregorian::from_absolute_day(abs_day, y, m, d) ||
        (y != gy) || (m != gm) || (d != gd))
    {
        GWCAL_ERROR(<< fy << "-" << fm << "-" << fd << " converted to "
            << y << "-" << m << "-" << d << " where " << gy << "-" << gm
            << "-" << gd << " was expected")
        return -1;
    }

    if (gwcal_french::from_absolute_day(abs_day, y, m, d) ||
        (y != fy) || (m != fm) || (d != fd))
    {
        GWCAL_ERROR("Day " << abs_day << " converted to " << y << "-" << m
            << "-" << d << " where " << fy << "-" << fm << "-" << fd
            << " was expected")
        return -1;
    }

    return 0;
}
}

int main(int, char **)
{
    // dates from the period the calendar was in use
    if (check_gregorian(1, 1, 1, 1792, 9, 22) ||     // 1 Vendemiaire I
        check_gregorian(2, 1, 1, 1793, 9, 22) ||
        check_gregorian(3, 13, 6, 1795, 9, 22) ||    // the first leap day
        check_gregorian(4, 1, 1, 1795, 9, 23) ||
        check_gregorian(8, 2, 18, 1799, 11, 9) ||    // 18 Brumaire VIII
        check_gregorian(12, 1, 1, 1803, 9, 24) ||
        check_gregorian(14, 1, 1, 1805, 9, 23) ||
        check_gregorian(14, 4, 10, 1805, 12, 31))    // 10 Nivose XIV
        return -1;

    // leap years in the period of use, and a few of the arithmetic ones
    for (long y = 1; y <= 20; ++y)
    {
        bool expect = (y == 3) || (y == 7) || (y == 11) || (y == 15) || (y == 19);
        if (gwcal_french::is_leap_year(y) != expect)
        {
            GWCAL_ERROR("Year " << y << (expect ? " should" : " should not")
                << " be a leap year")
            return -1;
        }

        long n_days = gwcal_french::days_in_month(y, gwcal_french::complementary_month);
        if (n_days != (expect ? 6 : 5))
        {
            GWCAL_ERROR("Year " << y << " has " << n_days << " complementary days")
            return -1;
        }
    }

    // the century rule is applied to the year that follows
    if (!gwcal_french::is_leap_year(399) || gwcal_french::is_leap_year(99) ||
        gwcal_french::is_leap_year(100) || !gwcal_french::is_leap_year(103))
    {
        GWCAL_ERROR("The century rule is not applied correctly")
        return -1;
    }

    // every regular month has 30 days
    for (long m = 1; m < gwcal_french::complementary_month; ++m)
    {
        if (gwcal_french::days_in_month(5, m) != 30)
        {
            GWCAL_ERROR("Month " << m << " should have 30 days")
            return -1;
        }
    }

    if (gwcal_french::months_per_year(5) != 13)
    {
        GWCAL_ERROR("There should be 13 months")
        return -1;
    }

    // invalid dates
    int bad_field = gwcal_error::no_field;
    struct { long y, m, d; int code; int field; } bad[] = {
        {4, 13, 6, gwcal_error::invalid_date, gwcal_error::day_field},
        {3, 13, 7, gwcal_error::invalid_date, gwcal_error::day_field},
        {5, 1, 31, gwcal_error::invalid_date, gwcal_error::day_field},
        {5, 14, 1, gwcal_error::invalid_date, gwcal_error::month_field},
        {5, 0, 1, gwcal_error::invalid_date, gwcal_error::month_field},
        {0, 1, 1, gwcal_error::out_of_range, gwcal_error::year_field},
        {-1, 1, 1, gwcal_error::out_of_range, gwcal_error::year_field}
        };

    for (auto &b : bad)
    {
        long abs_day = 0;
        int ierr = gwcal_french::validate(b.y, b.m, b.d, bad_field);
        if ((ierr != b.code) || (bad_field != b.field) ||
            (gwcal_french::to_absolute_day(b.y, b.m, b.d, abs_day) != b.code))
        {
            GWCAL_ERROR(<< b.y << "-" << b.m << "-" << b.d << " gave \""
                << gwcal_error::get_code_name(ierr) << "\" in the "
                << gwcal_error::get_field_name(bad_field) << " field")
            return -1;
        }
    }

    // the day before the epoch is not representable
    long y = 0, m = 0, d = 0;
    if (gwcal_french::from_absolute_day(gwcal_french::epoch - 1, y, m, d) !=
        gwcal_error::out_of_range)
    {
        GWCAL_ERROR("The day before the epoch was accepted")
        return -1;
    }

    // round trip every day of the first 2000 years
    long last = 0;
    if (gwcal_french::to_absolute_day(2000, 13,
        gwcal_french::days_in_month(2000, 13), last))
    {
        GWCAL_ERROR("Failed to convert the last day of year 2000")
        return -1;
    }

    long py = 0, pm = 13, pd = 6;
    for (long abs_day = gwcal_french::epoch; abs_day <= last; ++abs_day)
    {
        long check = 0;
        if (gwcal_french::from_absolute_day(abs_day, y, m, d) ||
            gwcal_french::to_absolute_day(y, m, d, check) || (check != abs_day))
        {
            GWCAL_ERROR("Day " << abs_day << " did not round trip. "
                << y << "-" << m << "-" << d << " gave " << check)
            return -1;
        }

        bool next_day = (y == py) && (m == pm) && (d == pd + 1);
        bool next_month = (y == py) && (m == pm + 1) && (d == 1) && (pd == 30);
        bool next_year = (y == py + 1) && (m == 1) && (d == 1) && (pm == 13);
        if (!(next_day || next_month || next_year))
        {
            GWCAL_ERROR(<< y << "-" << m << "-" << d << " does not follow "
                << py << "-" << pm << "-" << pd)
            return -1;
        }

        py = y;
        pm = m;
        pd = d;
    }

    // the last supported day
    if (gwcal_french::from_absolute_day(gwcal_french::max_absolute_day(), y, m, d) ||
        (y != gwcal_french::max_year) || (m != 13) ||
        (d != gwcal_french::days_in_month(y, 13)) ||
        (gwcal_french::from_absolute_day(gwcal_french::max_absolute_day() + 1,
            y, m, d) != gwcal_error::out_of_range))
    {
        GWCAL_ERROR("The supported range has the wrong end")
        return -1;
    }

    return 0;
}
