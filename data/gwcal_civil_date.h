#ifndef gwcal_civil_date_h
#define gwcal_civil_date_h

/// @file

#include "gwcal_config.h"
#include "gwcal_calendar_util.h"

#include <ostream>

/** @brief
 * A day in one of the supported calendars.
 *
 * @details
 * An immutable value pairing a year, month, and day with the calendar they
 * are expressed in. Instances are created with gwcal_civil_date::create,
 * which validates the fields, and are never modified afterwards. Operations
 * that produce a different date return a new value. The absolute day number
 * is computed once at construction and all comparisons use it, so dates in
 * different calendars may be compared directly.
 */
class GWCAL_EXPORT gwcal_civil_date
{
public:
    /// the result of compare
    enum order
    {
        before = -1,
        same = 0,
        after = 1
    };

    /// 1 January 1 in the Gregorian calendar
    gwcal_civil_date();
    ~gwcal_civil_date() = default;

    gwcal_civil_date(const gwcal_civil_date &) = default;
    gwcal_civil_date &operator=(const gwcal_civil_date &) = default;

    /** Validate the fields and construct a date from them.
     *
     * @param[in] y the year. may be zero or negative in the Gregorian and
     *              Julian calendars
     * @param[in] m the month, from 1 to the number of months in the year
     * @param[in] d the day of the month, starting at 1
     * @param[in] calendar one of gwcal_calendar_util::calendar_kind
     * @param[out] date the new date
     * @param[out] bad_field if not null, set to the gwcal_error::field at
     *             fault when the fields are rejected
     * @returns 0 if successful, or one of gwcal_error::invalid_date,
     *          gwcal_error::out_of_range, gwcal_error::unsupported_calendar
     */
    static int create(long y, long m, long d, int calendar,
        gwcal_civil_date &date, int *bad_field = nullptr);

    /** construct the date falling on the given absolute day in the named
     * calendar. returns gwcal_error::out_of_range if the calendar can not
     * represent the day. bad_field, if not null, is set to
     * gwcal_error::absolute_day_field or gwcal_error::calendar_field on
     * failure.
     */
    static int create(long abs_day, int calendar, gwcal_civil_date &date,
        int *bad_field = nullptr);

    long get_year() const { return this->year; }
    long get_month() const { return this->month; }
    long get_day() const { return this->day; }
    int get_calendar() const { return this->calendar; }

    /// the absolute day number, a count of days shared by all calendars
    long get_absolute_day() const { return this->absolute_day; }

    /** Express the date in another calendar. Converting back to this date's
     * calendar gives a date equal to this one. returns
     * gwcal_error::out_of_range if the target calendar does not reach this
     * date.
     */
    int convert_to(int calendar, gwcal_civil_date &date,
        int *bad_field = nullptr) const;

    /// order two dates by the day they fall on, whatever their calendars
    order compare(const gwcal_civil_date &other) const;

    /// true if both dates fall on the same day
    bool same_day(const gwcal_civil_date &other) const
    { return this->absolute_day == other.absolute_day; }

    /// the number of days from this date to other, negative if other is before
    long days_between(const gwcal_civil_date &other) const
    { return other.absolute_day - this->absolute_day; }

    /** shift the date by n days, which may be negative. the result is in the
     * same calendar. returns gwcal_error::out_of_range if the result can not
     * be represented, with bad_field set to gwcal_error::absolute_day_field.
     */
    int add_days(long n, gwcal_civil_date &date, int *bad_field = nullptr) const;

    /// @name introspection
    /// computed in the date's own calendar
    ///@{
    bool is_leap_year() const;
    long days_in_month() const;
    long months_per_year() const;
    ///@}

    /// the day of the week, 0 for Sunday through 6 for Saturday
    int day_of_week() const;

    /// equal when the fields and the calendar are the same
    bool operator==(const gwcal_civil_date &other) const;
    bool operator!=(const gwcal_civil_date &other) const
    { return !(*this == other); }

    /// ordering by absolute day
    bool operator<(const gwcal_civil_date &other) const
    { return this->absolute_day < other.absolute_day; }

    bool operator<=(const gwcal_civil_date &other) const
    { return this->absolute_day <= other.absolute_day; }

    bool operator>(const gwcal_civil_date &other) const
    { return this->absolute_day > other.absolute_day; }

    bool operator>=(const gwcal_civil_date &other) const
    { return this->absolute_day >= other.absolute_day; }

private:
    gwcal_civil_date(long y, long m, long d, int cal, long abs_day);

private:
    long year;
    long month;
    long day;
    int calendar;
    long absolute_day;
};

/// sends the date as "Y-M-D calendar" to the stream
GWCAL_EXPORT
std::ostream &operator<<(std::ostream &os, const gwcal_civil_date &date);

#endif
