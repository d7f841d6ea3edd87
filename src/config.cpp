#include <secret_santa/config.hpp>

#include <secret_santa/errors.hpp>

#include <utility>

#include <boost/property_tree/json_parser.hpp>
#include <boost/property_tree/ptree.hpp>
#include <fmt/format.h>

namespace secret_santa
{

namespace
{

using boost::property_tree::ptree;

template<typename TFunction>
void for_each_element(ptree const& tree, std::string const& key, TFunction&& function)
{
    auto const child = tree.get_child_optional(key);
    if (!child)
        return;
    for (auto const& element : *child)
    {
        function(element.second);
    }
}

pair read_pair(ptree const& node)
{
    return pair { node.get<std::string>("giver"), node.get<std::string>("receiver") };
}

std::vector<pair> read_pairs(ptree const& tree, std::string const& key)
{
    std::vector<pair> pairs;
    for_each_element(tree, key, [&](ptree const& node) { pairs.push_back(read_pair(node)); });
    return pairs;
}

constraint_model model_from_tree(ptree const& tree)
{
    constraint_model model;

    for (auto const& person_node : tree.get_child("people"))
    {
        auto const name = person_node.second.get<std::string>("name");
        auto const email = person_node.second.get("email", std::string());
        model.people.push_back(person { name, email });
    }

    model.whitelist = read_pairs(tree, "whitelist");
    model.blacklist = read_pairs(tree, "blacklist");

    for_each_element(tree, "blacklist_sets", [&](ptree const& set_node)
    {
        blacklist_set set;
        for (auto const& member_node : set_node)
        {
            set.push_back(member_node.second.get_value<std::string>());
        }
        model.blacklist_sets.push_back(set);
    });

    for_each_element(tree, "history", [&](ptree const& record_node)
    {
        history_record record;
        record.year = record_node.get<int>("year");
        record.exclude_pairs = record_node.get("exclude_pairs", true);
        record.pairs = read_pairs(record_node, "pairs");
        model.history.push_back(record);
    });

    return model;
}

ptree pair_tree(pair const& entry)
{
    ptree node;
    node.put("giver", entry.giver);
    node.put("receiver", entry.receiver);
    return node;
}

ptree pairs_tree(std::vector<pair> const& pairs)
{
    ptree node;
    for (auto const& entry : pairs)
    {
        node.push_back(std::make_pair("", pair_tree(entry)));
    }
    return node;
}

ptree history_record_tree(history_record const& record)
{
    ptree node;
    node.put("year", record.year);
    node.put("exclude_pairs", record.exclude_pairs);
    node.put_child("pairs", pairs_tree(record.pairs));
    return node;
}

}

constraint_model read_model(std::istream& stream)
{
    try
    {
        ptree tree;
        boost::property_tree::read_json(stream, tree);
        return model_from_tree(tree);
    }
    catch (boost::property_tree::ptree_error const& e)
    {
        throw configuration_error(fmt::format("Failed parsing configuration: {}", e.what()));
    }
}

constraint_model read_model_file(std::string const& file_name)
{
    try
    {
        ptree tree;
        boost::property_tree::read_json(file_name, tree);
        return model_from_tree(tree);
    }
    catch (boost::property_tree::ptree_error const& e)
    {
        throw configuration_error(fmt::format("Failed parsing '{}': {}", file_name, e.what()));
    }
}

void write_model(std::ostream& stream, constraint_model const& model)
{
    ptree tree;

    ptree people;
    for (auto const& person : model.people)
    {
        ptree person_tree;
        person_tree.put("name", person.name);
        person_tree.put("email", person.email);
        people.push_back(std::make_pair("", person_tree));
    }
    tree.put_child("people", people);

    tree.put_child("whitelist", pairs_tree(model.whitelist));
    tree.put_child("blacklist", pairs_tree(model.blacklist));

    ptree sets;
    for (auto const& set : model.blacklist_sets)
    {
        ptree set_tree;
        for (auto const& name : set)
        {
            set_tree.push_back(std::make_pair("", ptree(name)));
        }
        sets.push_back(std::make_pair("", set_tree));
    }
    tree.put_child("blacklist_sets", sets);

    ptree history;
    for (auto const& record : model.history)
    {
        history.push_back(std::make_pair("", history_record_tree(record)));
    }
    tree.put_child("history", history);

    boost::property_tree::write_json(stream, tree);
}

void write_assignments(std::ostream& stream, assignments const& assignments, int year)
{
    history_record record;
    record.year = year;
    record.exclude_pairs = true;
    for (auto const& entry : assignments)
    {
        record.pairs.push_back(pair { entry.first, entry.second });
    }
    boost::property_tree::write_json(stream, history_record_tree(record));
}

constraint_model sample_model()
{
    person const john { "John", "john@email.com" };
    person const sean { "Sean", "sean@email.com" };
    person const shane { "Shane", "shane@email.com" };

    constraint_model model;
    model.people = { john, sean, shane };
    model.blacklist_sets.push_back({ john.name, sean.name });
    model.whitelist.push_back(pair { sean.name, shane.name });
    model.blacklist.push_back(pair { sean.name, shane.name });

    history_record record;
    record.year = 2024;
    record.exclude_pairs = true;
    record.pairs = {
        pair { john.name, shane.name },
        pair { sean.name, john.name },
        pair { shane.name, sean.name },
    };
    model.history.push_back(record);

    return model;
}

}
