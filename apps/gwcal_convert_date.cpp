#include "gwcal_config.h"
#include "gwcal_common.h"
#include "gwcal_error.h"
#include "gwcal_calendar_util.h"
#include "gwcal_civil_date.h"
#include "gwcal_app_util.h"

#include <string>
#include <iostream>
#include <boost/program_options.hpp>

using boost::program_options::value;
using options_description = boost::program_options::options_description;
using variables_map = boost::program_options::variables_map;

namespace
{
const char *day_names[] = {"Sunday", "Monday", "Tuesday",
    "Wednesday", "Thursday", "Friday", "Saturday"};
}

// --------------------------------------------------------------------------
int main(int argc, char **argv)
{
    int help_width = 100;
    options_description opt_defs(
        "Converts a date between the Gregorian, Julian, French Republican,\n"
        "and Hebrew calendars, optionally shifting it by a number of days.\n\n"
        "Command line options", help_width, help_width - 4
        );
    opt_defs.add_options()

        ("date", value<std::string>()->required(), "\nThe date to convert in"
            " numeric Y-M-D form. Months are numbered from 1 in every calendar."
            " Hebrew months are counted from Tishri, and the French Republican"
            " complementary days are month 13. Use --date=Y-M-D when the year"
            " is negative.\n")

        ("calendar", value<std::string>()->default_value("gregorian"),
            "\nThe calendar the date is expressed in. One of gregorian, julian,"
            " french, or hebrew.\n")

        ("to", value<std::string>(), "\nThe calendar to convert the date to."
            " When not given the date is kept in its own calendar.\n")

        ("add_days", value<long>()->default_value(0), "\nThe number of days,"
            " possibly negative, to shift the date by before converting it.\n")

        ("verbose", value<int>()->default_value(0), "\nWhen non-zero details"
            " about the resulting date are reported.\n")

        ("help", "\ndisplays documentation for application specific command line options\n")
        ;

    // parse the command line
    int ierr = 0;
    variables_map opt_vals;
    if ((ierr = gwcal_app_util::process_command_line_help(
        argc, argv, opt_defs, opt_vals)))
    {
        if (ierr == 1)
            return 0;
        return -1;
    }

    int verbose = opt_vals["verbose"].as<int>();

    // look up the calendars
    int calendar = gwcal_calendar_util::gregorian;
    std::string calendar_name = opt_vals["calendar"].as<std::string>();
    if (gwcal_calendar_util::get_calendar_kind(calendar_name, calendar))
    {
        GWCAL_FATAL_ERROR("The calendar \"" << calendar_name << "\" is not"
            " supported. Use one of gregorian, julian, french, or hebrew")
        return -1;
    }

    int target = calendar;
    if (opt_vals.count("to"))
    {
        std::string target_name = opt_vals["to"].as<std::string>();
        if (gwcal_calendar_util::get_calendar_kind(target_name, target))
        {
            GWCAL_FATAL_ERROR("The target calendar \"" << target_name << "\" is"
                " not supported. Use one of gregorian, julian, french, or hebrew")
            return -1;
        }
    }

    // construct the date
    long y = 0;
    long m = 0;
    long d = 0;
    std::string date_str = opt_vals["date"].as<std::string>();
    if (gwcal_calendar_util::parse_date(date_str, y, m, d))
    {
        GWCAL_FATAL_ERROR("Failed to parse the date \"" << date_str << "\"")
        return -1;
    }

    gwcal_civil_date date;
    int bad_field = gwcal_error::no_field;
    if ((ierr = gwcal_civil_date::create(y, m, d, calendar, date, &bad_field)))
    {
        GWCAL_FATAL_ERROR("The date " << date_str << " is not valid in the "
            << calendar_name << " calendar. "
            << gwcal_error::get_code_name(ierr) << " in the "
            << gwcal_error::get_field_name(bad_field) << " field")
        return -1;
    }

    // shift it
    long n_days = opt_vals["add_days"].as<long>();
    if (n_days)
    {
        gwcal_civil_date shifted;
        if ((ierr = date.add_days(n_days, shifted, &bad_field)))
        {
            GWCAL_FATAL_ERROR("Failed to add " << n_days << " days to " << date
                << ". " << gwcal_error::get_code_name(ierr) << " in the "
                << gwcal_error::get_field_name(bad_field) << " field")
            return -1;
        }
        date = shifted;
    }

    if (verbose)
    {
        GWCAL_STATUS("Converting " << date << " to the "
            << gwcal_calendar_util::get_calendar_name(target) << " calendar")
    }

    // convert it
    gwcal_civil_date result;
    if ((ierr = date.convert_to(target, result, &bad_field)))
    {
        GWCAL_FATAL_ERROR("Failed to convert " << date << " to the "
            << gwcal_calendar_util::get_calendar_name(target) << " calendar. "
            << gwcal_error::get_code_name(ierr) << " in the "
            << gwcal_error::get_field_name(bad_field) << " field")
        return -1;
    }

    std::cout << result << std::endl;

    if (verbose)
    {
        std::cout << "absolute day: " << result.get_absolute_day() << std::endl
            << "day of week: " << day_names[result.day_of_week()] << std::endl
            << "leap year: " << (result.is_leap_year() ? "yes" : "no") << std::endl
            << "months in year: " << result.months_per_year() << std::endl
            << "days in month: " << result.days_in_month() << std::endl;
    }

    return 0;
}
