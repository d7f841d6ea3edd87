#pragma once

#include <cstddef>
#include <stdexcept>
#include <string>
#include <utility>

namespace secret_santa
{

// Where a forbidden edge came from. Also used to say which rule made a
// problem infeasible.
enum class constraint_source
{
    none,
    self,
    blacklist,
    household,
    history,
    whitelist,
    no_two_cycles,
};

char const* to_string(constraint_source source);

class error : public std::runtime_error
{
public:
    using std::runtime_error::runtime_error;
};

class configuration_error : public error
{
public:
    using error::error;
};

class infeasible_error : public error
{
public:
    infeasible_error(std::string const& message, constraint_source source, std::string person = std::string())
        : error(message), source_(source), person_(std::move(person))
    {
    }

    constraint_source source() const { return source_; }

    // Empty when no single person can be blamed.
    std::string const& person() const { return person_; }

private:
    constraint_source source_;
    std::string person_;
};

class search_limit_error : public error
{
public:
    search_limit_error(std::string const& message, std::size_t steps)
        : error(message), steps_(steps)
    {
    }

    std::size_t steps() const { return steps_; }

private:
    std::size_t steps_;
};

}
