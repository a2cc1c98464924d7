#ifndef gwcal_calendar_util_h
#define gwcal_calendar_util_h

/// @file

#include "gwcal_config.h"

#include <string>

/// Codes dealing with calendaring
namespace gwcal_calendar_util
{
/** The calendars that dates may be expressed in. This is a closed set, each
 * value indexes an entry in the calendar engine's dispatch table.
 */
enum calendar_kind
{
    gregorian = 0,
    julian = 1,
    french_republican = 2,
    hebrew = 3,
    n_calendar_kinds = 4
};

/// returns true if kind names one of the supported calendars
inline
bool valid_calendar_kind(int kind)
{
    return (kind >= gregorian) && (kind < n_calendar_kinds);
}

/** returns the string tag used when serializing dates in the given calendar.
 * one of "gregorian", "julian", "french", or "hebrew". nullptr is returned
 * for an unsupported kind.
 */
GWCAL_EXPORT
const char *get_calendar_name(int kind);

/** look up the calendar kind from its string tag. returns 0 if successful and
 * gwcal_error::unsupported_calendar if the name is not known.
 */
GWCAL_EXPORT
int get_calendar_kind(const std::string &name, int &kind);

/** Suggest the calendar a bare year was most likely recorded in. Years above
 * 5000 are taken to be Hebrew, 1792 to 1805 French Republican, and years
 * before the 1582 reform Julian. Everything else is Gregorian.
 */
GWCAL_EXPORT
int guess_calendar_kind(long year);

/** parse a date in the numeric Y-M-D form. The year may carry a leading
 * minus sign. returns 0 if successful.
 */
GWCAL_EXPORT
int parse_date(const std::string &str, long &y, long &m, long &d);

/// integer division rounding toward negative infinity. b must be positive.
inline
long floor_div(long a, long b)
{
    long q = a / b;
    if ((a % b) < 0)
        --q;
    return q;
}

/// the remainder that goes with floor_div. the result is in [0, b)
inline
long floor_mod(long a, long b)
{
    long r = a % b;
    if (r < 0)
        r += b;
    return r;
}
}

#endif
