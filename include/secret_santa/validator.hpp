#pragma once

#include <secret_santa/errors.hpp>
#include <secret_santa/model.hpp>

#include <cstddef>
#include <map>
#include <string>
#include <vector>

namespace secret_santa
{

typedef int person_index;
constexpr person_index no_person = -1;

// Index-based view of a validated constraint_model. Persons are numbered in
// roster order.
struct normalized_constraints
{
    std::vector<std::string> names;
    std::map<std::string, person_index> indices;

    // Receiver each giver is whitelisted to, or no_person.
    std::vector<person_index> forced;

    // [giver][receiver], constraint_source::none where the pair is allowed.
    // Holds the first rule that excluded the pair.
    std::vector<std::vector<constraint_source>> forbidden;

    std::size_t size() const { return names.size(); }

    bool is_forbidden(person_index giver, person_index receiver) const
    {
        return forbidden[giver][receiver] != constraint_source::none;
    }

    person_index index_of(std::string const& name) const
    {
        auto i = indices.find(name);
        return i == indices.end() ? no_person : i->second;
    }
};

/// Checks the model for unknown names, malformed blacklist sets and whitelist
/// entries that can never hold, then merges blacklist, households, excluding
/// history records and self-pairs into one forbidden relation.
///
/// Throws configuration_error naming the first conflict found.
normalized_constraints validate(constraint_model const& model);

}
