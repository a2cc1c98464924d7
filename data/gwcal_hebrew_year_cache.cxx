#include "gwcal_hebrew_year_cache.h"

#include "gwcal_common.h"
#include "gwcal_system_util.h"

// --------------------------------------------------------------------------
gwcal_hebrew_year_cache::gwcal_hebrew_year_cache(size_t capacity) :
    m_capacity(capacity)
{
}

// --------------------------------------------------------------------------
gwcal_hebrew_year_cache &gwcal_hebrew_year_cache::get_instance()
{
    static gwcal_hebrew_year_cache instance(
        []() -> size_t
        {
            long capacity = default_capacity;
            long tmp = 0;
            int ierr = gwcal_system_util::get_environment_variable(
                "GWCAL_HEBREW_YEAR_CACHE_SIZE", tmp);
            if ((ierr == 0) && (tmp < 0))
            {
                GWCAL_WARNING("GWCAL_HEBREW_YEAR_CACHE_SIZE = " << tmp
                    << " is negative. The default of " << default_capacity
                    << " is used")
            }
            else if (ierr == 0)
            {
                capacity = tmp;
            }
            return capacity;
        }());

    return instance;
}

// --------------------------------------------------------------------------
bool gwcal_hebrew_year_cache::find(long year, year_info &info) const
{
    std::lock_guard<std::mutex> lock(m_mutex);
    auto it = m_years.find(year);
    if (it == m_years.end())
        return false;
    info = it->second;
    return true;
}

// --------------------------------------------------------------------------
void gwcal_hebrew_year_cache::insert(long year, const year_info &info)
{
    if (m_capacity == 0)
        return;

    std::lock_guard<std::mutex> lock(m_mutex);

    // another thread may have computed the same year
    if (!m_years.emplace(year, info).second)
        return;

    m_order.push_back(year);

    while (m_order.size() > m_capacity)
    {
        m_years.erase(m_order.front());
        m_order.pop_front();
    }
}

// --------------------------------------------------------------------------
size_t gwcal_hebrew_year_cache::size() const
{
    std::lock_guard<std::mutex> lock(m_mutex);
    return m_years.size();
}

// --------------------------------------------------------------------------
void gwcal_hebrew_year_cache::clear()
{
    std::lock_guard<std::mutex> lock(m_mutex);
    m_years.clear();
    m_order.clear();
}
