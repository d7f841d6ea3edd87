#pragma once

#include <secret_santa/errors.hpp>
#include <secret_santa/model.hpp>
#include <secret_santa/validator.hpp>

#include <cstddef>
#include <random>
#include <vector>

namespace secret_santa
{

typedef std::mt19937 random_engine;

struct search_limits
{
    // Tentative assignments tried before giving up. Zero searches exhaustively.
    std::size_t max_steps = 1000000;
};

namespace detail
{

struct search_state
{
    explicit search_state(std::size_t count)
        : receiver_of(count, no_person), giver_of(count, no_person)
    {
    }

    void assign(person_index giver, person_index receiver)
    {
        receiver_of[giver] = receiver;
        giver_of[receiver] = giver;
    }

    void unassign(person_index giver)
    {
        giver_of[receiver_of[giver]] = no_person;
        receiver_of[giver] = no_person;
    }

    std::vector<person_index> receiver_of;
    std::vector<person_index> giver_of;
};

// Whether giver may take receiver given the assignments made so far.
bool allowed(normalized_constraints const& constraints, person_index giver, person_index receiver, search_state const& state);

// First unassigned giver with no allowed receiver left, or no_person.
person_index find_stranded_giver(normalized_constraints const& constraints, search_state const& state);

// First unassigned receiver no unassigned giver may take, or no_person.
person_index find_stranded_receiver(normalized_constraints const& constraints, search_state const& state);

}

/// Finds secret santa assignments by randomized backtracking over the
/// givers that the whitelist leaves open.
class assigner
{
public:
    // Throws configuration_error if the model is inconsistent.
    explicit assigner(constraint_model const& model);

    normalized_constraints const& constraints() const { return constraints_; }

    /// Returns a derangement with no 2-cycles that honours every forced and
    /// forbidden pair. The same random engine state yields the same result.
    ///
    /// Throws infeasible_error when no such assignment exists and
    /// search_limit_error when limits.max_steps runs out first.
    assignments generate_valid_assignments(random_engine& random, search_limits const& limits = search_limits()) const;

    bool is_valid(assignments const& assignments) const;

private:
    void check_feasible(detail::search_state const& state) const;

    normalized_constraints constraints_;
};

}
