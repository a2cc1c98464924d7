#ifndef gwcal_calendar_engine_h
#define gwcal_calendar_engine_h

/// @file

#include "gwcal_config.h"
#include "gwcal_calendar_util.h"

/** @brief
 * Dispatch of date computations to the calendar named by a
 * gwcal_calendar_util::calendar_kind.
 *
 * @details
 * Each calendar supplies a converter holding its functions. The converters
 * are kept in a table indexed by the calendar kind, adding a calendar means
 * adding an entry there. Every function is pure and may be called from any
 * thread. Functions taking a kind return gwcal_error::unsupported_calendar
 * when the kind is not in the table.
 */
namespace gwcal_calendar_engine
{
/// The operations that every calendar implements.
struct GWCAL_EXPORT converter
{
    int (*to_absolute_day)(long y, long m, long d, long &abs_day);
    int (*from_absolute_day)(long abs_day, long &y, long &m, long &d);
    int (*validate)(long y, long m, long d, int &bad_field);
    bool (*is_leap_year)(long y);
    long (*days_in_month)(long y, long m);
    long (*months_per_year)(long y);
    long (*min_absolute_day)();
    long (*max_absolute_day)();
};

/// returns the converter for the calendar or nullptr if kind is unsupported
GWCAL_EXPORT
const converter *get_converter(int kind);

/** convert the date to an absolute day number. returns 0 if successful, or
 * one of gwcal_error::invalid_date, gwcal_error::out_of_range,
 * gwcal_error::unsupported_calendar.
 */
GWCAL_EXPORT
int to_absolute_day(int kind, long y, long m, long d, long &abs_day);

/** convert the absolute day number to a date. returns 0 if successful or
 * gwcal_error::out_of_range when abs_day can not be represented.
 */
GWCAL_EXPORT
int from_absolute_day(int kind, long abs_day, long &y, long &m, long &d);

/** check a date without converting it. on failure bad_field names the input
 * at fault.
 */
GWCAL_EXPORT
int validate(int kind, long y, long m, long d, int &bad_field);

GWCAL_EXPORT
int is_leap_year(int kind, long y, bool &leap);

GWCAL_EXPORT
int days_in_month(int kind, long y, long m, long &n_days);

GWCAL_EXPORT
int months_per_year(int kind, long y, long &n_months);

/// get the range of absolute days the calendar can represent
GWCAL_EXPORT
int get_absolute_day_range(int kind, long &first, long &last);

/** convert a date from one calendar to another by way of its absolute day.
 * returns gwcal_error::out_of_range when the date falls outside of the range
 * of the target calendar.
 */
GWCAL_EXPORT
int convert(int src_kind, long y, long m, long d, int dest_kind,
    long &dest_y, long &dest_m, long &dest_d);
}

#endif
