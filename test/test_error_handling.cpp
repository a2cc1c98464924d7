#include "gwcal_config.h"
#include "gwcal_common.h"
#include "gwcal_error.h"
#include "gwcal_string_util.h"
#include "gwcal_system_util.h"

#include <cstdlib>
#include <cstring>
#include <iostream>
#include <string>

namespace
{
int n_errors = 0;
std::string last_error;

// records the message instead of printing it
void record_error(const char *msg)
{
    ++n_errors;
    last_error = msg;
}
}

int main(int, char **)
{
    // errors are routed through the installed handler
    gwcal_error::set_error_handler(record_error);

    GWCAL_FATAL_ERROR("day " << 42 << " is out of range")

    if ((n_errors != 1) ||
        (last_error.find("day 42 is out of range") == std::string::npos) ||
        (last_error.find("ERROR:") == std::string::npos) ||
        (last_error.find(GWCAL_VERSION_DESCR) == std::string::npos))
    {
        gwcal_error::set_error_message_handler();
        GWCAL_ERROR("The custom error handler was not used. n_errors = "
            << n_errors << " message = \"" << last_error << "\"")
        return -1;
    }

    gwcal_error::set_error_message_handler();
    if (gwcal_error::error_handler != gwcal_error::error_message)
    {
        GWCAL_ERROR("The default error handler was not restored")
        return -1;
    }

    // printable names
    if (strcmp(gwcal_error::get_code_name(gwcal_error::success), "success") ||
        strcmp(gwcal_error::get_code_name(gwcal_error::invalid_date), "invalid date") ||
        strcmp(gwcal_error::get_code_name(gwcal_error::out_of_range), "out of range") ||
        strcmp(gwcal_error::get_code_name(gwcal_error::unsupported_calendar),
            "unsupported calendar") ||
        strcmp(gwcal_error::get_code_name(-99), "unknown error") ||
        strcmp(gwcal_error::get_field_name(gwcal_error::day_field), "day") ||
        strcmp(gwcal_error::get_field_name(gwcal_error::calendar_field), "calendar") ||
        strcmp(gwcal_error::get_field_name(99), "unknown field"))
    {
        GWCAL_ERROR("Error names are wrong")
        return -1;
    }

    // every failure is negative
    if ((gwcal_error::invalid_date >= 0) || (gwcal_error::out_of_range >= 0) ||
        (gwcal_error::unsupported_calendar >= 0))
    {
        GWCAL_ERROR("An error code is not negative")
        return -1;
    }

    // text to number conversion
    int ival = 0;
    long lval = 0;
    if (gwcal_string_util::string_tt<int>::convert("  -17", ival) || (ival != -17) ||
        gwcal_string_util::string_tt<long>::convert("1721426", lval) ||
        (lval != 1721426) ||
        !gwcal_string_util::string_tt<long>::convert("abc", lval) ||
        !gwcal_string_util::string_tt<int>::convert("99999999999", ival))
    {
        GWCAL_ERROR("Conversion from text failed")
        return -1;
    }

    // the environment
    setenv("GWCAL_TEST_VALUE", "123", 1);
    setenv("GWCAL_TEST_BAD_VALUE", "twelve", 1);
    setenv("GWCAL_TEST_TRAILING_VALUE", "16abc", 1);
    setenv("GWCAL_TEST_PADDED_VALUE", " 32 ", 1);
    unsetenv("GWCAL_TEST_MISSING_VALUE");

    long val = 0;
    if ((gwcal_system_util::get_environment_variable("GWCAL_TEST_VALUE", val) != 0) ||
        (val != 123) ||
        (gwcal_system_util::get_environment_variable("GWCAL_TEST_MISSING_VALUE", val) != 1) ||
        (gwcal_system_util::get_environment_variable("GWCAL_TEST_BAD_VALUE", val) != -1) ||
        (gwcal_system_util::get_environment_variable("GWCAL_TEST_TRAILING_VALUE", val) != -1) ||
        (val != 123) ||
        (gwcal_system_util::get_environment_variable("GWCAL_TEST_PADDED_VALUE", val) != 0) ||
        (val != 32))
    {
        GWCAL_ERROR("Failed to read the environment")
        return -1;
    }

    return 0;
}
