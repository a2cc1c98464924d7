#include "gwcal_common.h"

#include <cstdlib>

// **************************************************************************
int have_tty()
{
    static int have = -1;
    if (have < 0)
        have = isatty(fileno(stderr));
    return have;
}


namespace gwcal_error
{
// **************************************************************************
void error_message(const char *msg)
{
    // flush any pending user output
    std::cout.flush();
    std::cerr.flush();

    // send the error message
    std::cerr << std::endl << msg << std::endl;
}

// **************************************************************************
void set_error_handler(p_gwcal_error_handler handler)
{
    gwcal_error::error_handler = handler;
}

// **************************************************************************
void set_error_message_handler()
{
    gwcal_error::error_handler = gwcal_error::error_message;
}

// global error handler instance
p_gwcal_error_handler error_handler = error_message;
};
