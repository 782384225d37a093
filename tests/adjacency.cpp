#include <gtest/gtest.h>

#include "compo/adjacency.hpp"

using namespace compo;

namespace {

auto make_component(const component_name& name,
                    const std::vector<std::pair<endpoint_name, direction>>& eps)
    -> component
{
    auto result = component{name};
    for (auto&& entry: eps) {
        result.add_endpoint(entry.first, entry.second);
    }
    return result;
}

}

TEST(make_adjacency, empty)
{
    EXPECT_TRUE(empty(make_adjacency({})));
}

TEST(make_adjacency, unconnected)
{
    const auto components = std::vector<component>{
        make_component("A", {{"X", direction::outbound}}),
        make_component("B", {{"Y", direction::inbound}}),
    };
    const auto result = make_adjacency(components);
    ASSERT_EQ(size(result), 2u);
    EXPECT_TRUE(empty(result[0]));
    EXPECT_TRUE(empty(result[1]));
}

TEST(make_adjacency, symmetric)
{
    const auto components = std::vector<component>{
        make_component("A", {{"X", direction::outbound}}),
        make_component("B", {{"X", direction::inbound}}),
    };
    const auto result = make_adjacency(components);
    ASSERT_EQ(size(result), 2u);
    EXPECT_EQ(result[0], (std::set<std::size_t>{1u}));
    EXPECT_EQ(result[1], (std::set<std::size_t>{0u}));
}

TEST(make_adjacency, direction_does_not_matter)
{
    const auto components = std::vector<component>{
        make_component("A", {{"X", direction::outbound}}),
        make_component("B", {{"X", direction::outbound}}),
        make_component("C", {{"Y", direction::inbound}}),
        make_component("D", {{"Y", direction::inbound}}),
    };
    const auto result = make_adjacency(components);
    ASSERT_EQ(size(result), 4u);
    EXPECT_EQ(result[0], (std::set<std::size_t>{1u}));
    EXPECT_EQ(result[2], (std::set<std::size_t>{3u}));
}

TEST(make_adjacency, shared_names_make_one_edge)
{
    const auto components = std::vector<component>{
        make_component("A", {
            {"X", direction::outbound}, {"Y", direction::inbound},
        }),
        make_component("B", {
            {"X", direction::inbound}, {"Y", direction::outbound},
        }),
    };
    const auto result = make_adjacency(components);
    ASSERT_EQ(size(result), 2u);
    EXPECT_EQ(result[0], (std::set<std::size_t>{1u}));
    EXPECT_EQ(result[1], (std::set<std::size_t>{0u}));
}

TEST(make_adjacency, shared_by_many)
{
    const auto components = std::vector<component>{
        make_component("A", {{"X", direction::outbound}}),
        make_component("B", {{"X", direction::inbound}}),
        make_component("C", {{"X", direction::inbound}}),
    };
    const auto result = make_adjacency(components);
    ASSERT_EQ(size(result), 3u);
    EXPECT_EQ(result[0], (std::set<std::size_t>{1u, 2u}));
    EXPECT_EQ(result[1], (std::set<std::size_t>{0u, 2u}));
    EXPECT_EQ(result[2], (std::set<std::size_t>{0u, 1u}));
}
