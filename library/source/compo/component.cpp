#include <algorithm> // for std::find_if
#include <sstream> // for std::ostringstream
#include <utility> // for std::move

#include "compo/component.hpp"

namespace compo {

component::component(component_name name, std::string type):
    name_{std::move(name)}, type_{std::move(type)}
{
    // Intentionally empty.
}

auto component::name() const noexcept -> const component_name&
{
    return name_;
}

auto component::type() const noexcept -> const std::string&
{
    return type_;
}

auto component::endpoints() const noexcept -> const endpoint_map&
{
    return endpoints_;
}

auto component::behaviors() const noexcept -> const std::vector<behavior>&
{
    return behaviors_;
}

auto component::contracts() const noexcept -> const std::vector<contract>&
{
    return contracts_;
}

auto component::add_endpoint(const endpoint_name& name, direction dir)
    -> void
{
    if (!endpoints_.emplace(name, dir).second) {
        std::ostringstream os;
        os << "endpoint named \"" << name << "\"";
        os << " already exists in component \"" << name_ << "\"";
        throw duplicate_name{name.get(), os.str()};
    }
}

auto component::add_behavior(behavior value) -> void
{
    if (value.period) {
        if (value.trigger != trigger_kind::periodic) {
            std::ostringstream os;
            os << value.trigger << " behavior \"" << value.name << "\"";
            os << " may not have a period";
            throw invalid_behavior{std::move(value), os.str()};
        }
        if (value.period->count() <= 0) {
            std::ostringstream os;
            os << "period of behavior \"" << value.name << "\"";
            os << " must be greater than zero, not ";
            os << value.period->count() << "ms";
            throw invalid_behavior{std::move(value), os.str()};
        }
    }
    const auto found = std::find_if(begin(behaviors_), end(behaviors_),
                                    [&value](const behavior& b){
        return b.name == value.name;
    });
    if (found != end(behaviors_)) {
        std::ostringstream os;
        os << "behavior named \"" << value.name << "\"";
        os << " already exists in component \"" << name_ << "\"";
        throw duplicate_name{value.name.get(), os.str()};
    }
    behaviors_.push_back(std::move(value));
}

auto component::add_contract(contract value) -> void
{
    if (find_contract(value.name)) {
        std::ostringstream os;
        os << "contract named \"" << value.name << "\"";
        os << " already exists in component \"" << name_ << "\"";
        throw duplicate_name{value.name.get(), os.str()};
    }
    for (auto&& endpoint: value.endpoints) {
        confirm_endpoint(endpoint);
    }
    contracts_.push_back(std::move(value));
}

auto component::associate(const contract_name& contract,
                          const endpoint_name& endpoint) -> void
{
    auto& found = get_contract(contract);
    confirm_endpoint(endpoint);
    found.endpoints.push_back(endpoint);
}

auto component::add_field(const contract_name& contract, data_field field)
    -> void
{
    get_contract(contract).fields.push_back(std::move(field));
}

auto component::find_contract(const contract_name& name) const
    -> const contract*
{
    const auto found = std::find_if(begin(contracts_), end(contracts_),
                                    [&name](const contract& c){
        return c.name == name;
    });
    return (found != end(contracts_))? &(*found): nullptr;
}

auto component::get_contract(const contract_name& name) -> contract&
{
    const auto found = std::find_if(begin(contracts_), end(contracts_),
                                    [&name](const contract& c){
        return c.name == name;
    });
    if (found == end(contracts_)) {
        std::ostringstream os;
        os << "no contract named \"" << name << "\"";
        os << " in component \"" << name_ << "\"";
        throw unknown_contract{name, os.str()};
    }
    return *found;
}

auto component::confirm_endpoint(const endpoint_name& name) const -> void
{
    if (!endpoints_.contains(name)) {
        std::ostringstream os;
        os << "no endpoint named \"" << name << "\"";
        os << " in component \"" << name_ << "\"";
        throw unknown_endpoint{name, os.str()};
    }
}

auto operator==(const component& lhs, const component& rhs) -> bool
{
    return (lhs.name() == rhs.name())
        && (lhs.type() == rhs.type())
        && (lhs.endpoints() == rhs.endpoints())
        && (lhs.behaviors() == rhs.behaviors())
        && (lhs.contracts() == rhs.contracts());
}

auto operator<<(std::ostream& os, const component& value) -> std::ostream&
{
    os << "component{";
    os << ".name=" << value.name();
    if (!empty(value.type())) {
        os << ",.type=" << value.type();
    }
    if (!empty(value.endpoints())) {
        os << ",.endpoints=" << value.endpoints();
    }
    if (!empty(value.behaviors())) {
        os << ",.behaviors={";
        auto prefix = "";
        for (auto&& entry: value.behaviors()) {
            os << prefix << entry;
            prefix = ",";
        }
        os << "}";
    }
    if (!empty(value.contracts())) {
        os << ",.contracts={";
        auto prefix = "";
        for (auto&& entry: value.contracts()) {
            os << prefix << entry;
            prefix = ",";
        }
        os << "}";
    }
    os << "}";
    return os;
}

auto get_matching_set(const component& value, direction dir)
    -> std::set<endpoint_name>
{
    return get_matching_set(value.endpoints(), dir);
}

}
