#ifndef gwcal_error_h
#define gwcal_error_h

/// @file

#include "gwcal_config.h"

/// Error codes returned by the calendar engine and civil dates
namespace gwcal_error
{
/** @name Error codes
 * Fallible operations return one of these. Zero is success, every failure
 * is negative so that the usual `if (ierr)` test applies.
 */
///@{
enum code
{
    /// the operation succeeded
    success = 0,
    /** the fields are inconsistent for the stated calendar and year. a bad
     * month, a bad day of month, or a leap day that does not exist.
     */
    invalid_date = -1,
    /** the year, or a resulting day number, is outside of the span that the
     * calendar supports.
     */
    out_of_range = -2,
    /// the calendar tag is not one of the known calendars.
    unsupported_calendar = -3
};
///@}

/// Identifies the input that caused a failure.
enum field
{
    no_field = 0,
    year_field,
    month_field,
    day_field,
    absolute_day_field,
    calendar_field
};

/// returns a printable name for one of the error codes
GWCAL_EXPORT
const char *get_code_name(int code);

/// returns a printable name for one of the fields
GWCAL_EXPORT
const char *get_field_name(int field);
}

#endif
