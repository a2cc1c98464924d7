#ifndef gwcal_hebrew_year_cache_h
#define gwcal_hebrew_year_cache_h

/// @file

#include "gwcal_config.h"

#include <cstddef>
#include <deque>
#include <mutex>
#include <unordered_map>

/** @brief
 * A bounded, thread safe, read through cache of Hebrew year boundaries.
 *
 * @details
 * Locating the first day of a Hebrew year and the year's length requires the
 * molad of four consecutive years. Conversions repeatedly ask for the same
 * few years so the results are memoized here. The cache holds at most
 * capacity years, when full the oldest entry is evicted. A capacity of 0
 * disables caching. Results never depend on the cache's contents.
 */
class GWCAL_EXPORT gwcal_hebrew_year_cache
{
public:
    /// the cached values for one year
    struct year_info
    {
        long new_year;  ///< the absolute day of 1 Tishri
        long length;    ///< number of days in the year
    };

    /// the capacity used when GWCAL_HEBREW_YEAR_CACHE_SIZE is not set
    static constexpr long default_capacity = 1024;

    explicit gwcal_hebrew_year_cache(size_t capacity);
    ~gwcal_hebrew_year_cache() = default;

    gwcal_hebrew_year_cache(const gwcal_hebrew_year_cache &) = delete;
    void operator=(const gwcal_hebrew_year_cache &) = delete;

    /** The process wide instance. It is created on first use with the
     * capacity named by the GWCAL_HEBREW_YEAR_CACHE_SIZE environment
     * variable.
     */
    static gwcal_hebrew_year_cache &get_instance();

    /// look up a year. returns true and initializes info if it was found
    bool find(long year, year_info &info) const;

    /// add a year, evicting the oldest entry if the cache is full
    void insert(long year, const year_info &info);

    /// number of cached years
    size_t size() const;

    size_t get_capacity() const { return m_capacity; }

    /// remove all entries
    void clear();

private:
    mutable std::mutex m_mutex;
    size_t m_capacity;
    std::unordered_map<long, year_info> m_years;
    std::deque<long> m_order;
};

#endif
