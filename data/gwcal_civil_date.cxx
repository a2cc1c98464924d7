#include "gwcal_civil_date.h"

#include "gwcal_calendar_engine.h"
#include "gwcal_error.h"

#include <limits>

using gwcal_calendar_util::floor_mod;

// --------------------------------------------------------------------------
std::ostream &operator<<(std::ostream &os, const gwcal_civil_date &date)
{
    const char *name = gwcal_calendar_util::get_calendar_name(date.get_calendar());

    os << date.get_year() << "-" << date.get_month() << "-"
        << date.get_day() << " " << (name ? name : "unsupported");

    return os;
}

// --------------------------------------------------------------------------
gwcal_civil_date::gwcal_civil_date() : year(1), month(1), day(1),
    calendar(gwcal_calendar_util::gregorian), absolute_day(1721426)
{
}

// --------------------------------------------------------------------------
gwcal_civil_date::gwcal_civil_date(long y, long m, long d, int cal,
    long abs_day) : year(y), month(m), day(d), calendar(cal),
    absolute_day(abs_day)
{
}

// --------------------------------------------------------------------------
int gwcal_civil_date::create(long y, long m, long d, int calendar,
    gwcal_civil_date &date, int *bad_field)
{
    int field = gwcal_error::no_field;
    if (int ierr = gwcal_calendar_engine::validate(calendar, y, m, d, field))
    {
        if (bad_field)
            *bad_field = field;
        return ierr;
    }

    long abs_day = 0;
    if (int ierr = gwcal_calendar_engine::to_absolute_day(calendar, y, m, d, abs_day))
        return ierr;

    date = gwcal_civil_date(y, m, d, calendar, abs_day);

    return gwcal_error::success;
}

// --------------------------------------------------------------------------
int gwcal_civil_date::create(long abs_day, int calendar, gwcal_civil_date &date,
    int *bad_field)
{
    long y = 0;
    long m = 0;
    long d = 0;
    if (int ierr = gwcal_calendar_engine::from_absolute_day(calendar, abs_day, y, m, d))
    {
        if (bad_field)
            *bad_field = (ierr == gwcal_error::unsupported_calendar) ?
                gwcal_error::calendar_field : gwcal_error::absolute_day_field;
        return ierr;
    }

    date = gwcal_civil_date(y, m, d, calendar, abs_day);

    return gwcal_error::success;
}

// --------------------------------------------------------------------------
int gwcal_civil_date::convert_to(int cal, gwcal_civil_date &date,
    int *bad_field) const
{
    return gwcal_civil_date::create(this->absolute_day, cal, date, bad_field);
}

// --------------------------------------------------------------------------
gwcal_civil_date::order gwcal_civil_date::compare(
    const gwcal_civil_date &other) const
{
    if (this->absolute_day < other.absolute_day)
        return before;

    if (this->absolute_day > other.absolute_day)
        return after;

    return same;
}

// --------------------------------------------------------------------------
int gwcal_civil_date::add_days(long n, gwcal_civil_date &date,
    int *bad_field) const
{
    // guard against overflow before the calendar's range check
    if (((n > 0) && (this->absolute_day > std::numeric_limits<long>::max() - n)) ||
        ((n < 0) && (this->absolute_day < std::numeric_limits<long>::min() - n)))
    {
        if (bad_field)
            *bad_field = gwcal_error::absolute_day_field;
        return gwcal_error::out_of_range;
    }

    return gwcal_civil_date::create(this->absolute_day + n, this->calendar,
        date, bad_field);
}

// --------------------------------------------------------------------------
bool gwcal_civil_date::is_leap_year() const
{
    // the calendar was checked when the date was created
    return gwcal_calendar_engine::get_converter(this->calendar)->is_leap_year(this->year);
}

// --------------------------------------------------------------------------
long gwcal_civil_date::days_in_month() const
{
    return gwcal_calendar_engine::get_converter(this->calendar)->days_in_month(
        this->year, this->month);
}

// --------------------------------------------------------------------------
long gwcal_civil_date::months_per_year() const
{
    return gwcal_calendar_engine::get_converter(this->calendar)->months_per_year(
        this->year);
}

// --------------------------------------------------------------------------
int gwcal_civil_date::day_of_week() const
{
    // absolute day 0 was a Monday
    return static_cast<int>(floor_mod(this->absolute_day + 1, 7));
}

// --------------------------------------------------------------------------
bool gwcal_civil_date::operator==(const gwcal_civil_date &other) const
{
    return (this->calendar == other.calendar) && (this->year == other.year) &&
        (this->month == other.month) && (this->day == other.day);
}
