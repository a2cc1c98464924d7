#ifndef gwcal_app_util_h
#define gwcal_app_util_h

/// @file

#include "gwcal_config.h"

#include <string>
#include <boost/program_options.hpp>

/// Codes shared among the command line applications
namespace gwcal_app_util
{

/** Check for flag and if found print the help message
 * and the option definitions. return non-zero if the flag
 * was found.
 */
int process_command_line_help(const std::string &app_name,
    const std::string &flag,
    boost::program_options::options_description &opt_defs,
    boost::program_options::variables_map &opt_vals);

/** parses the command line options and checks for the --help flag. if found
 * prints the option defintions.  if the help flag was found 1 is returned. If
 * there is an error -1 is returned. Otherwise 0 is returned.
 */
int process_command_line_help(int argc, char **argv,
    boost::program_options::options_description &opt_defs,
    boost::program_options::variables_map &opt_vals);

}

#endif
