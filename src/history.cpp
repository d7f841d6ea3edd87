#include <secret_santa/history.hpp>

#include <secret_santa/log.hpp>

#include <algorithm>
#include <set>

namespace secret_santa
{

std::vector<history_record> select_active_history(std::vector<history_record> history, int lookback_years)
{
    std::stable_sort(std::begin(history), std::end(history), [](history_record const& a, history_record const& b) {
        return a.year > b.year;
    });

    if (lookback_years < 0)
        return history;

    std::set<int> years;
    for (auto& record : history)
    {
        if (!record.exclude_pairs)
            continue;

        if (years.count(record.year) == 0)
        {
            if (static_cast<int>(years.size()) == lookback_years)
            {
                log(log_level::debug, "History {} is older than the {} year lookback.", record.year, lookback_years);
                record.exclude_pairs = false;
                continue;
            }
            years.insert(record.year);
        }
    }

    return history;
}

int calendar_year(std::time_t when)
{
    std::tm const* local = std::localtime(&when);
    if (local == nullptr)
        return unknown_year;
    return local->tm_year + 1900;
}

}
