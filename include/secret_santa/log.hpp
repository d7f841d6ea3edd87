#pragma once

#include <cstdio>
#include <utility>

#include <fmt/format.h>

namespace secret_santa
{

enum class log_level
{
    debug,
    info,
    warn,
    error,
};

void set_log_level(log_level level);
log_level get_log_level();
char const* to_string(log_level level);

template<typename... TArgs>
void log(log_level level, fmt::format_string<TArgs...> format, TArgs&&... args)
{
    if (static_cast<int>(level) < static_cast<int>(get_log_level()))
        return;
    fmt::print(stderr, "[{}] {}\n", to_string(level), fmt::format(format, std::forward<TArgs>(args)...));
}

}
