#include "gwcal_calendar_util.h"

#include "gwcal_common.h"
#include "gwcal_error.h"
#include "gwcal_string_util.h"


namespace
{
const char *calendar_names[] = {"gregorian", "julian", "french", "hebrew"};
}

namespace gwcal_calendar_util
{
// --------------------------------------------------------------------------
const char *get_calendar_name(int kind)
{
    if (!valid_calendar_kind(kind))
        return nullptr;

    return calendar_names[kind];
}

// --------------------------------------------------------------------------
int get_calendar_kind(const std::string &name, int &kind)
{
    for (int i = 0; i < n_calendar_kinds; ++i)
    {
        if (name == calendar_names[i])
        {
            kind = i;
            return gwcal_error::success;
        }
    }
    return gwcal_error::unsupported_calendar;
}

// --------------------------------------------------------------------------
int guess_calendar_kind(long year)
{
    if (year > 5000)
        return hebrew;

    if ((year >= 1792) && (year <= 1805))
        return french_republican;

    if (year < 1582)
        return julian;

    return gregorian;
}

// --------------------------------------------------------------------------
int parse_date(const std::string &str, long &y, long &m, long &d)
{
    const char *p = str.c_str();
    if (gwcal_string_util::skip_pad(p))
    {
        GWCAL_ERROR("Empty date string")
        return -1;
    }

    long vals[3] = {0, 0, 0};
    for (int i = 0; i < 3; ++i)
    {
        // month and day are unsigned, only the year may be negative
        if ((i > 0) && ((*p < '0') || (*p > '9')))
        {
            GWCAL_ERROR("Failed to parse \"" << str << "\" as Y-M-D")
            return -1;
        }

        const char *endp = nullptr;
        if (gwcal_string_util::string_tt<long>::convert(p, vals[i], endp))
        {
            GWCAL_ERROR("Failed to parse \"" << str << "\" as Y-M-D")
            return -1;
        }
        p = endp;

        if (i < 2)
        {
            if (*p != '-')
            {
                GWCAL_ERROR("Failed to parse \"" << str << "\" as Y-M-D."
                    " Expected '-' after the " << (i ? "month" : "year"))
                return -1;
            }
            ++p;
        }
    }

    // only trailing white space is allowed
    if (!gwcal_string_util::skip_pad(p))
    {
        GWCAL_ERROR("Failed to parse \"" << str << "\" as Y-M-D."
            " Unexpected trailing characters \"" << p << "\"")
        return -1;
    }

    y = vals[0];
    m = vals[1];
    d = vals[2];

    return 0;
}
}
