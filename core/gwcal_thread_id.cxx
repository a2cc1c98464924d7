#include "gwcal_config.h"
#include "gwcal_thread_id.h"

#include <ostream>
#include <sstream>
#include <thread>

using std::ostringstream;
using std::ostream;

ostream &operator<<(ostream &os, const gwcal_thread_id &)
{
    ostringstream oss;
    oss << "[" << std::this_thread::get_id() << "]";
    os << oss.str();
    return os;
}
