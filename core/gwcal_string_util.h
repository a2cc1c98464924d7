#ifndef gwcal_string_util_h
#define gwcal_string_util_h

/// @file

#include "gwcal_config.h"
#include "gwcal_common.h"

#include <cstdlib>
#include <cstring>
#include <cerrno>
#include <string>

/// Codes for dealing with string processing
namespace gwcal_string_util
{
/** Skip space, tabs, and new lines.  return non-zero if the end of the string
 * is reached before a non-pad character is encountered
 */
inline
int skip_pad(const char *&buf)
{
    while ((*buf != '\0') &&
        ((*buf == ' ') || (*buf == '\n') || (*buf == '\r') || (*buf == '\t')))
        ++buf;
    return *buf == '\0' ? -1 : 0;
}

/// A traits class for conversion from text to numbers
template <typename T>
struct GWCAL_EXPORT string_tt {};

#define DECLARE_STR_CONVERSION_I(_CPP_T, _FUNC)                                     \
/** A traits class for conversion from text to numbers, specialized for _CPP_T */   \
template <>                                                                         \
struct string_tt<_CPP_T>                                                            \
{                                                                                   \
    static const char *type_name() { return # _CPP_T; }                             \
                                                                                    \
    static int convert(const char *str, _CPP_T &val)                                \
    {                                                                               \
        const char *endp = nullptr;                                                 \
        return convert(str, val, endp);                                             \
    }                                                                               \
                                                                                    \
    static int convert(const char *str, _CPP_T &val, const char *&endp)             \
    {                                                                               \
        errno = 0;                                                                  \
        char *tmp_endp = nullptr;                                                   \
        long long tmp = _FUNC(str, &tmp_endp, 10);                                  \
        endp = tmp_endp;                                                            \
        if (errno != 0)                                                             \
        {                                                                           \
            GWCAL_ERROR("Failed to convert string \""                               \
                << str << "\" to a number. " << strerror(errno))                    \
            return  -1;                                                             \
        }                                                                           \
        else if (endp == str)                                                       \
        {                                                                           \
            GWCAL_ERROR("Failed to convert string \""                               \
                << str << "\" to a number. Invalid string.")                        \
            return  -1;                                                             \
        }                                                                           \
        val = static_cast<_CPP_T>(tmp);                                             \
        if (static_cast<long long>(val) != tmp)                                     \
        {                                                                           \
            GWCAL_ERROR("Failed to convert string \"" << str << "\" to a "          \
                << type_name() << ". The value is out of range.")                   \
            return -1;                                                              \
        }                                                                           \
        return 0;                                                                   \
    }                                                                               \
};

DECLARE_STR_CONVERSION_I(int, strtoll)
DECLARE_STR_CONVERSION_I(long, strtoll)
DECLARE_STR_CONVERSION_I(long long, strtoll)

}

#endif
