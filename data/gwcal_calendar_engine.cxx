#include "gwcal_calendar_engine.h"

#include "gwcal_error.h"
#include "gwcal_gregorian.h"
#include "gwcal_julian.h"
#include "gwcal_french.h"
#include "gwcal_hebrew.h"

namespace
{
#define GWCAL_CONVERTER(_ns)        \
    {                               \
        _ns::to_absolute_day,       \
        _ns::from_absolute_day,     \
        _ns::validate,              \
        _ns::is_leap_year,          \
        _ns::days_in_month,         \
        _ns::months_per_year,       \
        _ns::min_absolute_day,      \
        _ns::max_absolute_day       \
    }

// indexed by gwcal_calendar_util::calendar_kind
const gwcal_calendar_engine::converter converters[] = {
    GWCAL_CONVERTER(gwcal_gregorian),
    GWCAL_CONVERTER(gwcal_julian),
    GWCAL_CONVERTER(gwcal_french),
    GWCAL_CONVERTER(gwcal_hebrew)
    };

#undef GWCAL_CONVERTER

static_assert(sizeof(converters)/sizeof(converters[0]) ==
    gwcal_calendar_util::n_calendar_kinds,
    "each calendar kind must have a converter");
}

namespace gwcal_calendar_engine
{
// --------------------------------------------------------------------------
const converter *get_converter(int kind)
{
    if (!gwcal_calendar_util::valid_calendar_kind(kind))
        return nullptr;

    return &converters[kind];
}

// --------------------------------------------------------------------------
int to_absolute_day(int kind, long y, long m, long d, long &abs_day)
{
    const converter *conv = get_converter(kind);
    if (!conv)
        return gwcal_error::unsupported_calendar;

    return conv->to_absolute_day(y, m, d, abs_day);
}

// --------------------------------------------------------------------------
int from_absolute_day(int kind, long abs_day, long &y, long &m, long &d)
{
    const converter *conv = get_converter(kind);
    if (!conv)
        return gwcal_error::unsupported_calendar;

    return conv->from_absolute_day(abs_day, y, m, d);
}

// --------------------------------------------------------------------------
int validate(int kind, long y, long m, long d, int &bad_field)
{
    const converter *conv = get_converter(kind);
    if (!conv)
    {
        bad_field = gwcal_error::calendar_field;
        return gwcal_error::unsupported_calendar;
    }

    return conv->validate(y, m, d, bad_field);
}

// --------------------------------------------------------------------------
int is_leap_year(int kind, long y, bool &leap)
{
    const converter *conv = get_converter(kind);
    if (!conv)
        return gwcal_error::unsupported_calendar;

    leap = conv->is_leap_year(y);

    return gwcal_error::success;
}

// --------------------------------------------------------------------------
int days_in_month(int kind, long y, long m, long &n_days)
{
    const converter *conv = get_converter(kind);
    if (!conv)
        return gwcal_error::unsupported_calendar;

    n_days = conv->days_in_month(y, m);

    return gwcal_error::success;
}

// --------------------------------------------------------------------------
int months_per_year(int kind, long y, long &n_months)
{
    const converter *conv = get_converter(kind);
    if (!conv)
        return gwcal_error::unsupported_calendar;

    n_months = conv->months_per_year(y);

    return gwcal_error::success;
}

// --------------------------------------------------------------------------
int get_absolute_day_range(int kind, long &first, long &last)
{
    const converter *conv = get_converter(kind);
    if (!conv)
        return gwcal_error::unsupported_calendar;

    first = conv->min_absolute_day();
    last = conv->max_absolute_day();

    return gwcal_error::success;
}

// --------------------------------------------------------------------------
int convert(int src_kind, long y, long m, long d, int dest_kind,
    long &dest_y, long &dest_m, long &dest_d)
{
    long abs_day = 0;
    if (int ierr = to_absolute_day(src_kind, y, m, d, abs_day))
        return ierr;

    return from_absolute_day(dest_kind, abs_day, dest_y, dest_m, dest_d);
}
}
