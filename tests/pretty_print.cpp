#include <chrono>
#include <sstream> // for std::ostringstream
#include <utility> // for std::move

#include <gtest/gtest.h>

#include "compo/composition.hpp"

using namespace compo;
using namespace std::chrono_literals;

TEST(pretty_print, empty)
{
    std::ostringstream os;
    pretty_print(os, composition{"demo"});
    EXPECT_EQ(os.str(),
              "composition \"demo\":\n"
              "  no components\n");
}

TEST(pretty_print, component_without_parts)
{
    auto obj = composition{"demo"};
    obj.add_component(component{"A", "Sensor"});
    std::ostringstream os;
    pretty_print(os, obj);
    EXPECT_EQ(os.str(),
              "composition \"demo\":\n"
              "  component 1: \"A\" (type: Sensor)\n"
              "    endpoints: none\n"
              "    behaviors: none\n"
              "    contracts: none\n");
}

TEST(pretty_print, full)
{
    auto obj = composition{"demo"};
    {
        auto c = component{"A", "Sensor"};
        c.add_endpoint("X", direction::outbound);
        c.add_behavior({"tick", trigger_kind::periodic, 100ms});
        c.add_behavior({"poll", trigger_kind::periodic});
        c.add_behavior({"onData"});
        c.add_contract({"C", contract_kind::publish_subscribe, {"X"},
            {{"speed", "float"}}});
        c.add_contract({"S", contract_kind::client_server});
        obj.add_component(std::move(c));
    }
    obj.add_component(component{"B", "Controller"});
    obj.add_endpoint("B", "X", direction::inbound);
    std::ostringstream os;
    pretty_print(os, obj);
    EXPECT_EQ(os.str(),
              "composition \"demo\":\n"
              "  component 1: \"A\" (type: Sensor)\n"
              "    endpoints:\n"
              "      \"X\" (sender)\n"
              "    behaviors:\n"
              "      \"tick\" (trigger: periodic, period: 100ms)\n"
              "      \"poll\" (trigger: periodic, period: none)\n"
              "      \"onData\" (trigger: event-based)\n"
              "    contracts:\n"
              "      \"C\" (type: senderReceiver, endpoints: \"X\")\n"
              "        data fields:\n"
              "          \"speed\" (type: float)\n"
              "      \"S\" (type: clientServer, endpoints: none)\n"
              "        data fields: none\n"
              "  component 2: \"B\" (type: Controller)\n"
              "    endpoints:\n"
              "      \"X\" (receiver)\n"
              "    behaviors: none\n"
              "    contracts: none\n");
}

TEST(pretty_print, restores_stream)
{
    std::ostringstream os;
    const auto buf = os.rdbuf();
    pretty_print(os, composition{});
    EXPECT_EQ(os.rdbuf(), buf);
    os << "after\n";
    EXPECT_EQ(os.str(),
              "composition \"\":\n"
              "  no components\n"
              "after\n");
}
