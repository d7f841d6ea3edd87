#pragma once

#include <secret_santa/model.hpp>

#include <ctime>
#include <vector>

namespace secret_santa
{

constexpr int all_years = -1;
constexpr int unknown_year = 0;

/// Keeps pair exclusion on for the newest lookback_years distinct years that
/// asked for it and clears exclude_pairs on every other record, so older
/// records still get their names checked but no longer forbid anything.
/// A negative lookback keeps every year. Records come back newest first.
std::vector<history_record> select_active_history(std::vector<history_record> history, int lookback_years = all_years);

// Local calendar year of a point in time, or unknown_year when it cannot be
// represented.
int calendar_year(std::time_t when);

}
