#ifndef gwcal_system_util_h
#define gwcal_system_util_h

/// @file

#include "gwcal_config.h"
#include "gwcal_common.h"
#include "gwcal_string_util.h"

#include <cstdlib>

/// Codes for dealing with low level system API's
namespace gwcal_system_util
{
/** initialize val with the environment variable named by var converted to a
 * numeric type. Only signed integers are implemented. For unsigned use,
 * check that the value is greater or equal to zero.
 *
 * returns:
 *    0  if the variable was found and val was initialized from it
 *    1  if the varibale was not found
 *   -1  if the variable was found but conversion from string failed
 */
template <typename T>
GWCAL_EXPORT
int get_environment_variable(const char *var, T &val)
{
    const char *tmp = getenv(var);
    if (tmp)
    {
        T tmp_val = T();
        const char *endp = nullptr;
        if (gwcal_string_util::string_tt<T>::convert(tmp, tmp_val, endp))
        {
            GWCAL_ERROR("Failed to convert " << var << " = \""
                << tmp << "\" to a number")
            return -1;
        }

        // only white space may follow the number
        if (!gwcal_string_util::skip_pad(endp))
        {
            GWCAL_ERROR("Failed to convert " << var << " = \""
                << tmp << "\" to a number. Unexpected trailing characters \""
                << endp << "\"")
            return -1;
        }

        val = tmp_val;
        return 0;
    }
    return 1;
}
}

#endif
