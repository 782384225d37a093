#include <chrono>
#include <sstream> // for std::ostringstream
#include <utility> // for std::move

#include <gtest/gtest.h>

#include "compo/json.hpp"

using namespace compo;
using namespace std::chrono_literals;

namespace {

auto make_composition() -> composition
{
    auto result = composition{"Vehicle"};
    {
        auto c = component{"SpeedSensor", "Sensor"};
        c.add_endpoint("SpeedData", direction::outbound);
        c.add_behavior({"readSpeed", trigger_kind::periodic, 10ms});
        c.add_behavior({"poll", trigger_kind::periodic});
        c.add_contract({"SpeedInterface", contract_kind::publish_subscribe,
            {"SpeedData"}, {{"speed", "float"}, {"unit", "string"}}});
        result.add_component(std::move(c));
    }
    {
        auto c = component{"Controller"};
        c.add_endpoint("SpeedData", direction::inbound);
        c.add_behavior({"onSpeed"});
        c.add_contract({"Service", contract_kind::client_server});
        result.add_component(std::move(c));
    }
    return result;
}

}

TEST(to_json, empty_composition)
{
    const auto j = to_json(composition{"none"});
    EXPECT_EQ(j.at("composition_name"), "none");
    ASSERT_TRUE(j.at("components").is_array());
    EXPECT_TRUE(j.at("components").empty());
}

TEST(to_json, counts_match)
{
    const auto obj = make_composition();
    const auto j = to_json(obj);
    EXPECT_EQ(j.at("composition_name"), obj.name());
    const auto& components = j.at("components");
    ASSERT_EQ(components.size(), size(obj.components()));
    for (auto i = std::size_t{}; i < size(obj.components()); ++i) {
        const auto& c = obj.components()[i];
        const auto& jc = components.at(i);
        EXPECT_EQ(jc.at("name"), c.name().get());
        EXPECT_EQ(jc.at("type"), c.type());
        EXPECT_EQ(jc.at("ports").size(), size(c.endpoints()));
        EXPECT_EQ(jc.at("runnables").size(), size(c.behaviors()));
        EXPECT_EQ(jc.at("interfaces").size(), size(c.contracts()));
    }
}

TEST(to_json, component_details)
{
    const auto j = to_json(make_composition());
    const auto& sensor = j.at("components").at(0);
    EXPECT_EQ(sensor.at("name"), "SpeedSensor");
    EXPECT_EQ(sensor.at("type"), "Sensor");
    EXPECT_EQ(sensor.at("ports"), nlohmann::ordered_json::parse(R"(
        [{"name": "SpeedData", "type": "sender"}]
    )"));
    EXPECT_EQ(sensor.at("runnables"), nlohmann::ordered_json::parse(R"([
        {"name": "readSpeed", "trigger": "periodic", "period": 10},
        {"name": "poll", "trigger": "periodic", "period": null}
    ])"));
    EXPECT_EQ(sensor.at("interfaces"), nlohmann::ordered_json::parse(R"([
        {"name": "SpeedInterface", "type": "senderReceiver",
         "associated_ports": ["SpeedData"],
         "data_elements": [
            {"name": "speed", "type": "float"},
            {"name": "unit", "type": "string"}
         ]}
    ])"));
    const auto& controller = j.at("components").at(1);
    EXPECT_EQ(controller.at("type"), "");
    EXPECT_EQ(controller.at("ports").at(0).at("type"), "receiver");
    EXPECT_EQ(controller.at("runnables").at(0).at("trigger"), "event-based");
    EXPECT_TRUE(controller.at("runnables").at(0).at("period").is_null());
    EXPECT_EQ(controller.at("interfaces").at(0).at("type"), "clientServer");
    EXPECT_TRUE(controller.at("interfaces").at(0)
                .at("associated_ports").empty());
}

TEST(write_json, indented_and_terminated)
{
    std::ostringstream os;
    write_json(os, composition{"x"});
    EXPECT_EQ(os.str(),
              "{\n"
              "    \"composition_name\": \"x\",\n"
              "    \"components\": []\n"
              "}\n");
}

TEST(write_json, parses_back)
{
    const auto obj = make_composition();
    std::ostringstream os;
    write_json(os, obj);
    EXPECT_EQ(nlohmann::ordered_json::parse(os.str()), to_json(obj));
}

TEST(write_json, members_in_document_order)
{
    auto obj = composition{"v"};
    auto c = component{"A", "Sensor"};
    c.add_endpoint("X", direction::outbound);
    c.add_behavior({"tick", trigger_kind::periodic, 5ms});
    c.add_contract({"C", contract_kind::client_server, {"X"}, {{"f", "int"}}});
    obj.add_component(std::move(c));
    std::ostringstream os;
    write_json(os, obj);
    EXPECT_EQ(os.str(), R"({
    "composition_name": "v",
    "components": [
        {
            "name": "A",
            "type": "Sensor",
            "ports": [
                {
                    "name": "X",
                    "type": "sender"
                }
            ],
            "runnables": [
                {
                    "name": "tick",
                    "trigger": "periodic",
                    "period": 5
                }
            ],
            "interfaces": [
                {
                    "name": "C",
                    "type": "clientServer",
                    "associated_ports": [
                        "X"
                    ],
                    "data_elements": [
                        {
                            "name": "f",
                            "type": "int"
                        }
                    ]
                }
            ]
        }
    ]
}
)");
}
