#ifndef gwcal_thread_id_h
#define gwcal_thread_id_h

/// @file

#include "gwcal_config.h"
#include <iosfwd>

/// A helper class for debug and error messages.
class GWCAL_EXPORT gwcal_thread_id
{};

// Prints the callers thread id to the given stream. This is a
// debug/diagnostic message.
GWCAL_EXPORT
std::ostream &operator<<(std::ostream &os, const gwcal_thread_id &id);

#endif
