#include "compo/json.hpp"

namespace compo {

namespace {

constexpr auto json_indent = 4;

}

auto to_json(nlohmann::ordered_json& j, const data_field& value) -> void
{
    j = nlohmann::ordered_json{
        {"name", value.name},
        {"type", value.type},
    };
}

auto to_json(nlohmann::ordered_json& j, const behavior& value) -> void
{
    auto period = nlohmann::ordered_json(nullptr);
    if ((value.trigger == trigger_kind::periodic) && value.period) {
        period = value.period->count();
    }
    j = nlohmann::ordered_json{
        {"name", value.name.get()},
        {"trigger", to_cstring(value.trigger)},
        {"period", period},
    };
}

auto to_json(nlohmann::ordered_json& j, const contract& value) -> void
{
    auto ports = nlohmann::ordered_json::array();
    for (auto&& name: value.endpoints) {
        ports.push_back(name.get());
    }
    j = nlohmann::ordered_json{
        {"name", value.name.get()},
        {"type", to_cstring(value.kind)},
        {"associated_ports", ports},
        {"data_elements", value.fields},
    };
}

auto to_json(nlohmann::ordered_json& j, const component& value) -> void
{
    auto ports = nlohmann::ordered_json::array();
    for (auto&& entry: value.endpoints()) {
        ports.push_back(nlohmann::ordered_json{
            {"name", entry.first.get()},
            {"type", to_cstring(entry.second)},
        });
    }
    j = nlohmann::ordered_json{
        {"name", value.name().get()},
        {"type", value.type()},
        {"ports", ports},
        {"runnables", value.behaviors()},
        {"interfaces", value.contracts()},
    };
}

auto to_json(nlohmann::ordered_json& j, const composition& value) -> void
{
    j = nlohmann::ordered_json{
        {"composition_name", value.name()},
        {"components", value.components()},
    };
}

auto to_json(const composition& value) -> nlohmann::ordered_json
{
    auto result = nlohmann::ordered_json{};
    to_json(result, value);
    return result;
}

auto write_json(std::ostream& os, const composition& value) -> std::ostream&
{
    os << to_json(value).dump(json_indent) << "\n";
    return os;
}

}
