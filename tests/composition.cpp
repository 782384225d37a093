#include <sstream> // for std::ostringstream
#include <string>
#include <type_traits>
#include <utility> // for std::declval

#include <gtest/gtest.h>

#include "compo/composition.hpp"

using namespace compo;

TEST(composition, default_construction)
{
    const composition obj;
    EXPECT_TRUE(obj.name().empty());
    EXPECT_TRUE(empty(obj.components()));
    EXPECT_TRUE(empty(obj.component_names()));
}

TEST(composition, name)
{
    auto obj = composition{"Vehicle"};
    EXPECT_EQ(obj.name(), "Vehicle");
    obj.set_name("Truck");
    EXPECT_EQ(obj.name(), "Truck");
}

TEST(composition, add_component)
{
    auto obj = composition{};
    const auto& added = obj.add_component(component{"Sensor"});
    EXPECT_EQ(added.name(), component_name("Sensor"));
    obj.add_component(component{"Controller"});
    obj.add_component(component{"Actuator"});
    EXPECT_EQ(obj.component_names(), (std::vector<component_name>{
        "Sensor", "Controller", "Actuator",
    }));
}

TEST(composition, add_component_duplicate)
{
    auto obj = composition{};
    obj.add_component(component{"A", "first"});
    EXPECT_THROW(obj.add_component(component{"A", "second"}), duplicate_name);
    ASSERT_EQ(size(obj.components()), 1u);
    EXPECT_EQ(obj.components()[0].type(), "first");
    EXPECT_NO_THROW(obj.add_component(component{"B"}));
    EXPECT_EQ(obj.component_names(), (std::vector<component_name>{"A", "B"}));
}

TEST(composition, add_many_components)
{
    constexpr auto count = 200000u;
    auto obj = composition{};
    for (auto i = 0u; i < count; ++i) {
        obj.add_component(component{"C" + std::to_string(i)});
    }
    ASSERT_EQ(size(obj.components()), count);
    EXPECT_THROW(obj.add_component(component{"C12345"}), duplicate_name);
    ASSERT_NE(obj.find("C199999"), nullptr);
    EXPECT_EQ(obj.find("C199999"), &obj.components().back());
}

TEST(composition, find)
{
    auto obj = composition{};
    obj.add_component(component{"A"});
    obj.add_component(component{"B"});
    EXPECT_EQ(obj.find("C"), nullptr);
    const auto found = obj.find("B");
    ASSERT_NE(found, nullptr);
    EXPECT_EQ(found->name(), component_name("B"));
    EXPECT_EQ(found, &obj.components()[1]);
}

TEST(composition, names_stay_unique)
{
    static_assert(std::is_same_v<decltype(std::declval<composition&>()
                      .find(component_name{})), const component*>);
    static_assert(std::is_same_v<decltype(std::declval<composition&>()
                      .add_component(component{})), const component&>);
    auto obj = composition{};
    obj.add_component(component{"A"});
    obj.add_component(component{"B"});
    obj.add_endpoint("B", "X", direction::inbound);
    EXPECT_EQ(obj.component_names(), (std::vector<component_name>{"A", "B"}));
    EXPECT_THROW(obj.add_component(component{"B"}), duplicate_name);
}

TEST(composition, register_through_composition)
{
    auto obj = composition{};
    obj.add_component(component{"A"});
    obj.add_component(component{"B"});
    obj.add_endpoint("B", "X", direction::inbound);
    obj.add_behavior("B", {"onData"});
    obj.add_contract("B", {"C"});
    obj.associate("B", "C", "X");
    obj.add_field("B", "C", {"speed", "float"});
    EXPECT_TRUE(empty(obj.find("A")->endpoints()));
    const auto& b = *obj.find("B");
    EXPECT_EQ(b.endpoints().at("X"), direction::inbound);
    ASSERT_EQ(size(b.behaviors()), 1u);
    ASSERT_EQ(size(b.contracts()), 1u);
    EXPECT_EQ(b.contracts()[0], (contract{"C",
        contract_kind::publish_subscribe, {"X"}, {{"speed", "float"}}}));
}

TEST(composition, register_with_unknown_component)
{
    auto obj = composition{};
    obj.add_component(component{"A"});
    EXPECT_THROW(obj.add_endpoint("Z", "X", direction::inbound),
                 unknown_component);
    EXPECT_THROW(obj.add_behavior("Z", {"run"}), unknown_component);
    EXPECT_THROW(obj.add_contract("Z", {"C"}), unknown_component);
    EXPECT_THROW(obj.associate("Z", "C", "X"), unknown_component);
    EXPECT_THROW(obj.add_field("Z", "C", {"f", "int"}), unknown_component);
    auto expected = composition{};
    expected.add_component(component{"A"});
    EXPECT_EQ(obj, expected);
}

TEST(composition, register_errors_from_component)
{
    auto obj = composition{};
    obj.add_component(component{"A"});
    obj.add_endpoint("A", "X", direction::outbound);
    EXPECT_THROW(obj.add_endpoint("A", "X", direction::inbound),
                 duplicate_name);
    EXPECT_THROW(obj.associate("A", "C", "X"), unknown_contract);
    EXPECT_THROW(obj.add_contract("A", {"C",
        contract_kind::client_server, {"Y"}}), unknown_endpoint);
}

TEST(composition, equality)
{
    auto obj_a = composition{"x"};
    auto obj_b = composition{"x"};
    EXPECT_TRUE(composition() == composition());
    EXPECT_TRUE(obj_a == obj_b);
    obj_b.add_component(component{"A"});
    EXPECT_FALSE(obj_a == obj_b);
    obj_a.add_component(component{"A"});
    EXPECT_TRUE(obj_a == obj_b);
    obj_b.set_name("y");
    EXPECT_FALSE(obj_a == obj_b);
}

TEST(composition, ostream_operator_support)
{
    auto obj = composition{"demo"};
    {
        std::ostringstream os;
        os << obj;
        EXPECT_EQ(os.str(), "composition{.name=demo}");
    }
    obj.add_component(component{"A"});
    obj.add_component(component{"B"});
    {
        std::ostringstream os;
        os << obj;
        EXPECT_EQ(os.str(), "composition{.name=demo"
                  ",.components={component{.name=A},component{.name=B}}}");
    }
}
