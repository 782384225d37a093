#include <chrono>

#include <gtest/gtest.h>

#include "compo/validate.hpp"

using namespace compo;
using namespace std::chrono_literals;

TEST(check_structure, no_endpoints)
{
    const auto obj = component{"A"};
    const auto findings = check_structure(obj);
    ASSERT_EQ(size(findings), 1u);
    EXPECT_EQ(findings[0].level, severity::error);
    EXPECT_EQ(findings[0].category, finding_category::structure);
    EXPECT_EQ(findings[0].component, component_name("A"));
    EXPECT_EQ(findings[0].detail, "has no endpoints");
}

TEST(check_structure, valid)
{
    auto obj = component{"A"};
    obj.add_endpoint("X", direction::outbound);
    obj.add_behavior({"onData"});
    obj.add_behavior({"tick", trigger_kind::periodic, 50ms});
    obj.add_contract({"C", contract_kind::publish_subscribe, {"X"}});
    EXPECT_TRUE(empty(check_structure(obj)));
}

TEST(check_structure, periodic_behavior_without_period)
{
    auto obj = component{"A"};
    obj.add_endpoint("X", direction::outbound);
    obj.add_behavior({"tick", trigger_kind::periodic});
    const auto findings = check_structure(obj);
    ASSERT_EQ(size(findings), 1u);
    EXPECT_EQ(findings[0].category, finding_category::structure);
    EXPECT_EQ(findings[0].component, component_name("A"));
    EXPECT_EQ(findings[0].detail,
              "periodic behavior \"tick\" has no period");
}

TEST(check_structure, event_behavior_without_period)
{
    auto obj = component{"A"};
    obj.add_endpoint("X", direction::outbound);
    obj.add_behavior({"onData", trigger_kind::event});
    EXPECT_TRUE(empty(check_structure(obj)));
}

TEST(check_structure, findings_in_order)
{
    auto obj = component{"A"};
    obj.add_behavior({"first", trigger_kind::periodic});
    obj.add_behavior({"second", trigger_kind::periodic});
    const auto findings = check_structure(obj);
    ASSERT_EQ(size(findings), 3u);
    EXPECT_EQ(findings[0].detail, "has no endpoints");
    EXPECT_EQ(findings[1].detail,
              "periodic behavior \"first\" has no period");
    EXPECT_EQ(findings[2].detail,
              "periodic behavior \"second\" has no period");
}
