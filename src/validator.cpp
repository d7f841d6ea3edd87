#include <secret_santa/validator.hpp>

#include <secret_santa/log.hpp>

#include <algorithm>
#include <set>

#include <fmt/format.h>
#include <fmt/ranges.h>

namespace secret_santa
{

namespace
{

person_index lookup(normalized_constraints const& constraints, std::string const& name, char const* role, std::string const& where)
{
    auto const index = constraints.index_of(name);
    if (index == no_person)
        throw configuration_error(fmt::format("{} named '{}' present in {} but not found in people.", role, name, where));
    return index;
}

void forbid(normalized_constraints& constraints, person_index giver, person_index receiver, constraint_source source)
{
    auto& cell = constraints.forbidden[giver][receiver];
    if (cell == constraint_source::none)
        cell = source;
}

void add_people(normalized_constraints& constraints, std::vector<person> const& people)
{
    if (people.empty())
        throw configuration_error("No people given.");

    for (auto const& person : people)
    {
        if (person.name.empty())
            throw configuration_error("Person with an empty name.");
        auto const index = static_cast<person_index>(constraints.names.size());
        if (!constraints.indices.emplace(person.name, index).second)
            throw configuration_error(fmt::format("Person named '{}' listed more than once.", person.name));
        constraints.names.push_back(person.name);
    }

    auto const count = constraints.size();
    constraints.forced.assign(count, no_person);
    constraints.forbidden.assign(count, std::vector<constraint_source>(count, constraint_source::none));

    for (person_index i = 0; i < static_cast<person_index>(count); ++i)
        forbid(constraints, i, i, constraint_source::self);
}

void add_blacklist_sets(normalized_constraints& constraints, std::vector<blacklist_set> const& sets)
{
    for (auto const& set : sets)
    {
        std::set<person_index> members;
        for (auto const& name : set)
            members.insert(lookup(constraints, name, "Member", "blacklist_sets"));

        if (members.size() < 2)
            throw configuration_error(fmt::format("Blacklist set [{}] needs at least two different people.", fmt::join(set, ", ")));

        for (auto const a : members)
        {
            for (auto const b : members)
            {
                if (a != b)
                    forbid(constraints, a, b, constraint_source::household);
            }
        }
    }
}

void add_history(normalized_constraints& constraints, std::vector<history_record> const& history)
{
    for (auto const& record : history)
    {
        auto const where = fmt::format("history {}", record.year);
        for (auto const& entry : record.pairs)
        {
            auto const giver = lookup(constraints, entry.giver, "Giver", where);
            auto const receiver = lookup(constraints, entry.receiver, "Receiver", where);
            if (record.exclude_pairs)
                forbid(constraints, giver, receiver, constraint_source::history);
        }
    }
}

void add_whitelist(normalized_constraints& constraints, std::vector<pair> const& whitelist)
{
    std::vector<person_index> forced_giver(constraints.size(), no_person);

    for (auto const& entry : whitelist)
    {
        auto const giver = lookup(constraints, entry.giver, "Giver", "whitelist");
        auto const receiver = lookup(constraints, entry.receiver, "Receiver", "whitelist");

        if (giver == receiver)
            throw configuration_error(fmt::format("Whitelist makes '{}' their own secret santa.", entry.giver));

        if (constraints.forced[giver] == receiver)
            continue; // Listed twice

        if (constraints.forced[giver] != no_person)
            throw configuration_error(fmt::format("Whitelist has '{}' giving to both '{}' and '{}'.",
                entry.giver, constraints.names[constraints.forced[giver]], entry.receiver));

        if (forced_giver[receiver] != no_person)
            throw configuration_error(fmt::format("Whitelist has '{}' receiving from both '{}' and '{}'.",
                entry.receiver, constraints.names[forced_giver[receiver]], entry.giver));

        if (constraints.forced[receiver] == giver)
            throw configuration_error(fmt::format("Whitelist has '{}' and '{}' giving to each other.", entry.giver, entry.receiver));

        auto const source = constraints.forbidden[giver][receiver];
        if (source != constraint_source::none)
            throw configuration_error(fmt::format("Whitelist pair '{}' -> '{}' is also excluded by {}.",
                entry.giver, entry.receiver, to_string(source)));

        constraints.forced[giver] = receiver;
        forced_giver[receiver] = giver;
    }
}

}

normalized_constraints validate(constraint_model const& model)
{
    normalized_constraints constraints;

    add_people(constraints, model.people);

    for (auto const& entry : model.blacklist)
    {
        forbid(constraints,
            lookup(constraints, entry.giver, "Giver", "blacklist"),
            lookup(constraints, entry.receiver, "Receiver", "blacklist"),
            constraint_source::blacklist);
    }

    add_blacklist_sets(constraints, model.blacklist_sets);
    add_history(constraints, model.history);

    // Last, so a forced pair can be checked against every exclusion.
    add_whitelist(constraints, model.whitelist);

    std::size_t forbidden_pairs = 0;
    for (auto const& row : constraints.forbidden)
    {
        for (auto const cell : row)
        {
            if (cell != constraint_source::none && cell != constraint_source::self)
                ++forbidden_pairs;
        }
    }
    log(log_level::debug, "Validated {} people, {} forced and {} forbidden pairs.",
        constraints.size(),
        std::count_if(constraints.forced.begin(), constraints.forced.end(), [](person_index r) { return r != no_person; }),
        forbidden_pairs);

    return constraints;
}

}
