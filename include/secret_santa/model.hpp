#pragma once

#include <map>
#include <string>
#include <vector>

namespace secret_santa
{

struct person
{
    std::string name;
    std::string email;
};

struct pair
{
    std::string giver;
    std::string receiver;
};

inline bool operator==(pair const& lhs, pair const& rhs)
{
    return lhs.giver == rhs.giver && lhs.receiver == rhs.receiver;
}

inline bool operator!=(pair const& lhs, pair const& rhs)
{
    return !(lhs == rhs);
}

typedef std::vector<std::string> blacklist_set;

struct history_record
{
    int year = 0;
    bool exclude_pairs = true;
    std::vector<pair> pairs;
};

// Everything a solve consumes. The history holds only the records the caller
// wants considered; see select_active_history.
struct constraint_model
{
    std::vector<person> people;
    std::vector<pair> whitelist;
    std::vector<pair> blacklist;
    std::vector<blacklist_set> blacklist_sets;
    std::vector<history_record> history;
};

// giver -> receiver
typedef std::map<std::string, std::string> assignments;

}
