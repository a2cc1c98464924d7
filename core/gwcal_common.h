#ifndef gwcal_common_h
#define gwcal_common_h

/// @file

#include "gwcal_config.h"
#include "gwcal_thread_id.h"

#include <iostream>
#include <sstream>
#include <unistd.h>
#include <cstdio>
#include <string>

/** The call signature for the error handler. The error handler will be passed
 * a string describing the error.
 */
using p_gwcal_error_handler = void (*) (const char*);

/// global error handling hooks
namespace gwcal_error
{
/// The global error handler instance.
extern p_gwcal_error_handler error_handler GWCAL_EXPORT;

/** An error handler that flushes stdout and stderr streams, and sends msg to
 * the stderr before returing. This is the default.
 */
GWCAL_EXPORT
void error_message(const char *msg);

/** Install a custom error handler. The error handler must have the following
 * signature.
 *
 * void error_handler(const char *msg);
 *
 */
GWCAL_EXPORT
void set_error_handler(p_gwcal_error_handler handler);

/// Install the gwcal_error::error_message error handler
GWCAL_EXPORT
void set_error_message_handler();
};

/** Return true if we are writing to a TTY. If we are not then we should not
 * use ansi color codes.
 */
GWCAL_EXPORT int have_tty();

/// @cond

#define ANSI_RED "\033[1;31;40m"
#define ANSI_GREEN "\033[1;32;40m"
#define ANSI_YELLOW "\033[1;33;40m"
#define ANSI_WHITE "\033[1;37;40m"
#define ANSI_OFF "\033[0m"

#define BEGIN_HL(_color) (have_tty()?_color:"")
#define END_HL (have_tty()?ANSI_OFF:"")

/// @endcond


/** Send a message into the stream with an ANSI color coded message that
 * includes the thread id.
 */
#define GWCAL_MESSAGE(_strm, _head, _head_color, _msg)                  \
_strm                                                                   \
    << BEGIN_HL(_head_color) << _head << END_HL                         \
    << " " << gwcal_thread_id() << " [" << __FILE__ << ":" << __LINE__  \
    << " " << GWCAL_VERSION_DESCR << "]" << std::endl                   \
    << BEGIN_HL(_head_color) << _head << END_HL << " "                  \
    << BEGIN_HL(ANSI_WHITE) << "" _msg << END_HL << std::endl;

/** Constructs an the error message using GWCAL_MESSAGE and invokes the
 * error handler.
 */
#define GWCAL_FATAL_ERROR(_msg)                                         \
{                                                                       \
    std::ostringstream ess;                                             \
    GWCAL_MESSAGE(ess, "ERROR:", ANSI_RED, _msg)                        \
    gwcal_error::error_handler(ess.str().c_str());                      \
}

/// Constructs an error message and sends it to the stderr stream
#define GWCAL_ERROR(_msg) GWCAL_MESSAGE(std::cerr, "ERROR:", ANSI_RED, _msg)

/// Constructs a warning message and sends it to the stderr stream
#define GWCAL_WARNING(_msg) GWCAL_MESSAGE(std::cerr, "WARNING:", ANSI_YELLOW, _msg)

/// Constructs a status message and sends it to the stderr stream
#define GWCAL_STATUS(_msg) GWCAL_MESSAGE(std::cerr, "STATUS:", ANSI_GREEN, _msg)

#endif
