#include <secret_santa/log.hpp>

#include <atomic>

namespace secret_santa
{

namespace
{
std::atomic<log_level> threshold { log_level::info };
}

void set_log_level(log_level level)
{
    threshold.store(level);
}

log_level get_log_level()
{
    return threshold.load();
}

char const* to_string(log_level level)
{
    switch (level)
    {
    case log_level::debug:
        return "debug";
    case log_level::info:
        return "info";
    case log_level::warn:
        return "warn";
    case log_level::error:
        return "error";
    }
    return "info";
}

}
