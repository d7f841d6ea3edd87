#include <secret_santa/validator.hpp>

#include "test_models.hpp"

#include <gtest/gtest.h>

using namespace secret_santa;

namespace
{

constraint_model three_people()
{
    constraint_model model;
    model.people = test::people({ "John", "Sean", "Shane" });
    return model;
}

}

TEST(ValidatorTest, whitelist_blacklist_conflict_is_configuration_error)
{
    EXPECT_THROW(validate(test::sample_conflict()), configuration_error);
}

TEST(ValidatorTest, conflict_message_names_the_blacklist)
{
    try
    {
        validate(test::sample_conflict());
        FAIL() << "expected configuration_error";
    }
    catch (configuration_error const& e)
    {
        std::string const message = e.what();
        EXPECT_NE(message.find("Sean"), std::string::npos);
        EXPECT_NE(message.find("Shane"), std::string::npos);
        EXPECT_NE(message.find("blacklist"), std::string::npos);
    }
}

TEST(ValidatorTest, unknown_names_are_rejected_everywhere)
{
    auto model = three_people();
    model.blacklist = { pair { "John", "Mary" } };
    EXPECT_THROW(validate(model), configuration_error);

    model = three_people();
    model.whitelist = { pair { "Mary", "John" } };
    EXPECT_THROW(validate(model), configuration_error);

    model = three_people();
    model.blacklist_sets = { blacklist_set { "John", "Mary" } };
    EXPECT_THROW(validate(model), configuration_error);

    // Records that do not exclude pairs are still checked.
    model = three_people();
    history_record record;
    record.year = 2020;
    record.exclude_pairs = false;
    record.pairs = { pair { "Mary", "John" } };
    model.history = { record };
    EXPECT_THROW(validate(model), configuration_error);
}

TEST(ValidatorTest, duplicate_and_empty_people_are_rejected)
{
    constraint_model model;
    EXPECT_THROW(validate(model), configuration_error);

    model.people = test::people({ "John", "Sean", "John" });
    EXPECT_THROW(validate(model), configuration_error);

    model.people = test::people({ "John", "" });
    EXPECT_THROW(validate(model), configuration_error);
}

TEST(ValidatorTest, blacklist_set_needs_two_people)
{
    auto model = three_people();
    model.blacklist_sets = { blacklist_set { "John" } };
    EXPECT_THROW(validate(model), configuration_error);

    model.blacklist_sets = { blacklist_set { "John", "John" } };
    EXPECT_THROW(validate(model), configuration_error);
}

TEST(ValidatorTest, inconsistent_whitelists_are_rejected)
{
    auto model = three_people();
    model.whitelist = { pair { "John", "John" } };
    EXPECT_THROW(validate(model), configuration_error);

    model.whitelist = { pair { "John", "Sean" }, pair { "John", "Shane" } };
    EXPECT_THROW(validate(model), configuration_error);

    model.whitelist = { pair { "John", "Shane" }, pair { "Sean", "Shane" } };
    EXPECT_THROW(validate(model), configuration_error);

    model.whitelist = { pair { "John", "Sean" }, pair { "Sean", "John" } };
    EXPECT_THROW(validate(model), configuration_error);
}

TEST(ValidatorTest, whitelist_against_household_or_history_is_rejected)
{
    auto model = three_people();
    model.blacklist_sets = { blacklist_set { "John", "Sean" } };
    model.whitelist = { pair { "Sean", "John" } };
    EXPECT_THROW(validate(model), configuration_error);

    model = three_people();
    history_record record;
    record.year = 2024;
    record.pairs = { pair { "John", "Shane" } };
    model.history = { record };
    model.whitelist = { pair { "John", "Shane" } };
    EXPECT_THROW(validate(model), configuration_error);

    // Informational history does not forbid anything.
    model.history.front().exclude_pairs = false;
    EXPECT_NO_THROW(validate(model));
}

TEST(ValidatorTest, repeated_whitelist_entry_counts_once)
{
    auto model = three_people();
    model.whitelist = { pair { "John", "Shane" }, pair { "John", "Shane" } };
    auto const constraints = validate(model);
    EXPECT_EQ(constraints.forced[constraints.index_of("John")], constraints.index_of("Shane"));
}

TEST(ValidatorTest, forbidden_relation_merges_every_source)
{
    constraint_model model;
    model.people = test::people({ "A", "B", "C", "D" });
    model.blacklist = { pair { "A", "B" } };
    model.blacklist_sets = { blacklist_set { "C", "D" } };
    history_record active;
    active.year = 2024;
    active.pairs = { pair { "B", "C" } };
    history_record informational;
    informational.year = 2023;
    informational.exclude_pairs = false;
    informational.pairs = { pair { "D", "A" } };
    model.history = { active, informational };

    auto const c = validate(model);
    auto const a = c.index_of("A"), b = c.index_of("B"), cc = c.index_of("C"), d = c.index_of("D");

    EXPECT_EQ(c.forbidden[a][a], constraint_source::self);
    EXPECT_EQ(c.forbidden[a][b], constraint_source::blacklist);
    EXPECT_FALSE(c.is_forbidden(b, a));
    EXPECT_EQ(c.forbidden[cc][d], constraint_source::household);
    EXPECT_EQ(c.forbidden[d][cc], constraint_source::household);
    EXPECT_EQ(c.forbidden[b][cc], constraint_source::history);
    EXPECT_FALSE(c.is_forbidden(d, a));
    EXPECT_EQ(c.forced, std::vector<person_index>(4, no_person));
}

TEST(ValidatorTest, validation_is_idempotent)
{
    auto model = test::sample_conflict();
    model.whitelist.clear();

    auto const first = validate(model);
    auto const second = validate(model);
    EXPECT_EQ(first.names, second.names);
    EXPECT_EQ(first.forced, second.forced);
    EXPECT_EQ(first.forbidden, second.forbidden);

    auto const conflicting = test::sample_conflict();
    EXPECT_THROW(validate(conflicting), configuration_error);
    EXPECT_THROW(validate(conflicting), configuration_error);
}
