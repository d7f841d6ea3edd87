#include <secret_santa/assigner.hpp>

#include <secret_santa/log.hpp>

#include <algorithm>
#include <utility>

#include <fmt/format.h>

namespace secret_santa
{

namespace detail
{

bool allowed(normalized_constraints const& constraints, person_index giver, person_index receiver, search_state const& state)
{
    if (constraints.is_forbidden(giver, receiver))
        return false; // Forbidden explicitly, or giving to self

    if (state.giver_of[receiver] != no_person)
        return false; // Receiver already taken

    if (state.receiver_of[receiver] == giver)
        return false; // Giving to own giver

    return true;
}

person_index find_stranded_giver(normalized_constraints const& constraints, search_state const& state)
{
    auto const count = static_cast<person_index>(constraints.size());
    for (person_index giver = 0; giver < count; ++giver)
    {
        if (state.receiver_of[giver] != no_person)
            continue;

        bool stranded = true;
        for (person_index receiver = 0; receiver < count && stranded; ++receiver)
        {
            if (allowed(constraints, giver, receiver, state))
                stranded = false;
        }
        if (stranded)
            return giver;
    }
    return no_person;
}

person_index find_stranded_receiver(normalized_constraints const& constraints, search_state const& state)
{
    auto const count = static_cast<person_index>(constraints.size());
    for (person_index receiver = 0; receiver < count; ++receiver)
    {
        if (state.giver_of[receiver] != no_person)
            continue;

        bool stranded = true;
        for (person_index giver = 0; giver < count && stranded; ++giver)
        {
            if (state.receiver_of[giver] == no_person && allowed(constraints, giver, receiver, state))
                stranded = false;
        }
        if (stranded)
            return receiver;
    }
    return no_person;
}

}

namespace
{

// The single rule that rules out every partner of a stranded person, or
// constraint_source::none when several rules share the blame.
constraint_source blocking_source(normalized_constraints const& constraints, detail::search_state const& state, person_index person, bool as_giver)
{
    auto common = constraint_source::none;
    auto const count = static_cast<person_index>(constraints.size());
    for (person_index other = 0; other < count; ++other)
    {
        if (other == person)
            continue;

        auto const giver = as_giver ? person : other;
        auto const receiver = as_giver ? other : person;

        auto source = constraint_source::no_two_cycles;
        if (constraints.is_forbidden(giver, receiver))
            source = constraints.forbidden[giver][receiver];
        else if (as_giver ? state.giver_of[receiver] != no_person : state.receiver_of[giver] != no_person)
            source = constraint_source::whitelist;

        if (common == constraint_source::none)
            common = source;
        else if (common != source)
            return constraint_source::none;
    }
    return common;
}

struct search_frame
{
    person_index giver;
    std::vector<person_index> candidates;
    std::size_t next;
};

}

assigner::assigner(constraint_model const& model)
    : constraints_(validate(model))
{
}

void assigner::check_feasible(detail::search_state const& state) const
{
    auto const& names = constraints_.names;

    if (names.size() == 1)
        throw infeasible_error(fmt::format("'{}' can only be their own secret santa.", names[0]), constraint_source::self, names[0]);

    if (names.size() == 2)
        throw infeasible_error(fmt::format("'{}' and '{}' can only give to each other.", names[0], names[1]), constraint_source::no_two_cycles);

    auto const giver = detail::find_stranded_giver(constraints_, state);
    if (giver != no_person)
    {
        auto const source = blocking_source(constraints_, state, giver, true);
        throw infeasible_error(fmt::format("'{}' has no one left to give to (excluded by {}).", names[giver], to_string(source)), source, names[giver]);
    }

    auto const receiver = detail::find_stranded_receiver(constraints_, state);
    if (receiver != no_person)
    {
        auto const source = blocking_source(constraints_, state, receiver, false);
        throw infeasible_error(fmt::format("'{}' has no one left to receive from (excluded by {}).", names[receiver], to_string(source)), source, names[receiver]);
    }
}

assignments assigner::generate_valid_assignments(random_engine& random, search_limits const& limits) const
{
    auto const count = static_cast<person_index>(constraints_.size());

    detail::search_state state(constraints_.size());
    std::vector<person_index> givers;
    for (person_index giver = 0; giver < count; ++giver)
    {
        if (constraints_.forced[giver] != no_person)
            state.assign(giver, constraints_.forced[giver]);
        else
            givers.push_back(giver);
    }

    check_feasible(state);

    std::shuffle(std::begin(givers), std::end(givers), random);

    std::vector<search_frame> stack;
    auto push_frame = [&](person_index giver)
    {
        search_frame frame { giver, {}, 0 };
        for (person_index receiver = 0; receiver < count; ++receiver)
        {
            if (!constraints_.is_forbidden(giver, receiver))
                frame.candidates.push_back(receiver);
        }
        std::shuffle(std::begin(frame.candidates), std::end(frame.candidates), random);
        stack.push_back(std::move(frame));
    };

    std::size_t steps = 0;
    std::size_t backtracks = 0;

    if (!givers.empty())
        push_frame(givers.front());

    while (!stack.empty())
    {
        auto& frame = stack.back();
        if (state.receiver_of[frame.giver] != no_person)
            state.unassign(frame.giver);

        bool assigned = false;
        while (!assigned && frame.next < frame.candidates.size())
        {
            auto const receiver = frame.candidates[frame.next++];
            if (!detail::allowed(constraints_, frame.giver, receiver, state))
                continue;

            if (limits.max_steps != 0 && steps == limits.max_steps)
            {
                throw search_limit_error(fmt::format("Gave up after {} steps without an answer; retry with a larger bound.", steps), steps);
            }
            ++steps;

            state.assign(frame.giver, receiver);
            if (detail::find_stranded_giver(constraints_, state) == no_person
                && detail::find_stranded_receiver(constraints_, state) == no_person)
            {
                assigned = true;
            }
            else
            {
                state.unassign(frame.giver);
            }
        }

        if (!assigned)
        {
            stack.pop_back();
            ++backtracks;
            continue;
        }

        if (stack.size() == givers.size())
            break;

        push_frame(givers[stack.size()]);
    }

    if (stack.size() != givers.size())
    {
        log(log_level::debug, "Search exhausted after {} steps and {} backtracks.", steps, backtracks);
        throw infeasible_error("No assignment satisfies every constraint at once.", constraint_source::none);
    }

    log(log_level::debug, "Search finished after {} steps and {} backtracks.", steps, backtracks);

    assignments assignments;
    for (person_index giver = 0; giver < count; ++giver)
    {
        assignments[constraints_.names[giver]] = constraints_.names[state.receiver_of[giver]];
    }
    return assignments;
}

bool assigner::is_valid(assignments const& assignments) const
{
    auto const count = constraints_.size();
    if (assignments.size() != count)
        return false; // Someone left out

    std::vector<person_index> receiver_of(count, no_person);
    std::vector<bool> received(count, false);

    for (auto const& pair : assignments)
    {
        auto const giver = constraints_.index_of(pair.first);
        auto const receiver = constraints_.index_of(pair.second);

        if (giver == no_person || receiver == no_person)
            return false; // Not on the roster

        if (received[receiver])
            return false; // Receiving twice

        if (constraints_.is_forbidden(giver, receiver))
            return false; // Forbidden explicitly, or giving to self

        received[receiver] = true;
        receiver_of[giver] = receiver;
    }

    for (person_index giver = 0; giver < static_cast<person_index>(count); ++giver)
    {
        if (constraints_.forced[giver] != no_person && receiver_of[giver] != constraints_.forced[giver])
            return false; // Whitelist ignored

        if (receiver_of[receiver_of[giver]] == giver)
            return false; // Giving to own giver
    }

    return true;
}

}
