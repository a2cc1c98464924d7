#include "gwcal_app_util.h"

#include "gwcal_config.h"
#include "gwcal_common.h"

#include <exception>
#include <iostream>


namespace gwcal_app_util
{

// --------------------------------------------------------------------------
int process_command_line_help(const std::string &app_name,
    const std::string &flag,
    boost::program_options::options_description &opt_defs,
    boost::program_options::variables_map &opt_vals)
{
    if (opt_vals.count(flag))
    {
        std::cerr << std::endl
            << "gwcal version " << GWCAL_VERSION_DESCR
            << " compiled on " << __DATE__ << " " << __TIME__ << std::endl
            << std::endl
            << "Application usage: " << app_name << " [options]" << std::endl
            << std::endl
            << opt_defs << std::endl
            << std::endl;
        return 1;
    }
    return 0;
}

// --------------------------------------------------------------------------
int process_command_line_help(int argc, char **argv,
    boost::program_options::options_description &opt_defs,
    boost::program_options::variables_map &opt_vals)
{
    // this will prevent typos from being treated as positionals.
    boost::program_options::positional_options_description pos_opt_defs;

    std::string app_name = argc ? argv[0] : "";
    size_t pos = app_name.find_last_of('/');
    if (pos != std::string::npos)
        app_name = app_name.substr(pos + 1);

    try
    {
        boost::program_options::store(
            boost::program_options::command_line_parser(argc, argv)
                .style(boost::program_options::command_line_style::unix_style ^
                       boost::program_options::command_line_style::allow_short)
                .options(opt_defs)
                .positional(pos_opt_defs)
                .run(),
            opt_vals);

        if (process_command_line_help(app_name, "help", opt_defs, opt_vals))
            return 1;

        boost::program_options::notify(opt_vals);
    }
    catch (std::exception &e)
    {
        GWCAL_ERROR("Error parsing command line options. See --help "
            "for a list of supported options. " << e.what())
        return -1;
    }

    return 0;
}

}
