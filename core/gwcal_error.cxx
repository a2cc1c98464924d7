#include "gwcal_error.h"

namespace gwcal_error
{
// --------------------------------------------------------------------------
const char *get_code_name(int code)
{
    switch (code)
    {
        case success: return "success";
        case invalid_date: return "invalid date";
        case out_of_range: return "out of range";
        case unsupported_calendar: return "unsupported calendar";
    }
    return "unknown error";
}

// --------------------------------------------------------------------------
const char *get_field_name(int field)
{
    switch (field)
    {
        case no_field: return "none";
        case year_field: return "year";
        case month_field: return "month";
        case day_field: return "day";
        case absolute_day_field: return "absolute day";
        case calendar_field: return "calendar";
    }
    return "unknown field";
}
}
