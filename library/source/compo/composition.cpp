#include <sstream> // for std::ostringstream
#include <utility> // for std::move

#include "compo/composition.hpp"

#include "indenting_ostreambuf.hpp"

namespace compo {

namespace {

auto pretty_print(std::ostream& os, const contract& value) -> void
{
    os << "\"" << value.name << "\" (type: " << value.kind;
    os << ", endpoints: ";
    if (empty(value.endpoints)) {
        os << "none";
    }
    auto prefix = "";
    for (auto&& name: value.endpoints) {
        os << prefix << "\"" << name << "\"";
        prefix = ", ";
    }
    os << ")\n";
    const detail::indenting_ostreambuf indent{os};
    if (empty(value.fields)) {
        os << "data fields: none\n";
        return;
    }
    os << "data fields:\n";
    const detail::indenting_ostreambuf field_indent{os};
    for (auto&& field: value.fields) {
        os << "\"" << field.name << "\" (type: " << field.type << ")\n";
    }
}

auto pretty_print(std::ostream& os, const component& value) -> void
{
    if (empty(value.endpoints())) {
        os << "endpoints: none\n";
    }
    else {
        os << "endpoints:\n";
        const detail::indenting_ostreambuf indent{os};
        for (auto&& entry: value.endpoints()) {
            os << "\"" << entry.first << "\" (" << entry.second << ")\n";
        }
    }
    if (empty(value.behaviors())) {
        os << "behaviors: none\n";
    }
    else {
        os << "behaviors:\n";
        const detail::indenting_ostreambuf indent{os};
        for (auto&& entry: value.behaviors()) {
            os << "\"" << entry.name << "\" (trigger: " << entry.trigger;
            if (entry.trigger == trigger_kind::periodic) {
                os << ", period: ";
                if (entry.period) {
                    os << entry.period->count() << "ms";
                }
                else {
                    os << "none";
                }
            }
            os << ")\n";
        }
    }
    if (empty(value.contracts())) {
        os << "contracts: none\n";
    }
    else {
        os << "contracts:\n";
        const detail::indenting_ostreambuf indent{os};
        for (auto&& entry: value.contracts()) {
            pretty_print(os, entry);
        }
    }
}

}

composition::composition(std::string name): name_{std::move(name)}
{
    // Intentionally empty.
}

auto composition::name() const noexcept -> const std::string&
{
    return name_;
}

auto composition::set_name(std::string name) -> void
{
    name_ = std::move(name);
}

auto composition::components() const noexcept
    -> const std::vector<component>&
{
    return components_;
}

auto composition::component_names() const -> std::vector<component_name>
{
    auto result = std::vector<component_name>{};
    result.reserve(size(components_));
    for (auto&& entry: components_) {
        result.push_back(entry.name());
    }
    return result;
}

auto composition::add_component(component value) -> const component&
{
    const auto [it, inserted] = index_.emplace(value.name(),
                                               size(components_));
    if (!inserted) {
        std::ostringstream os;
        os << "component named \"" << value.name() << "\"";
        os << " already exists in composition \"" << name_ << "\"";
        throw duplicate_name{value.name().get(), os.str()};
    }
    try {
        return components_.emplace_back(std::move(value));
    }
    catch (...) {
        index_.erase(it);
        throw;
    }
}

auto composition::find(const component_name& name) const
    -> const component*
{
    const auto found = index_.find(name);
    return (found != end(index_))? &components_[found->second]: nullptr;
}

auto composition::get(const component_name& name) -> component&
{
    const auto found = index_.find(name);
    if (found == end(index_)) {
        std::ostringstream os;
        os << "no component named \"" << name << "\"";
        os << " in composition \"" << name_ << "\"";
        throw unknown_component{name, os.str()};
    }
    return components_[found->second];
}

auto composition::add_endpoint(const component_name& comp,
                               const endpoint_name& name, direction dir)
    -> void
{
    get(comp).add_endpoint(name, dir);
}

auto composition::add_behavior(const component_name& comp, behavior value)
    -> void
{
    get(comp).add_behavior(std::move(value));
}

auto composition::add_contract(const component_name& comp, contract value)
    -> void
{
    get(comp).add_contract(std::move(value));
}

auto composition::associate(const component_name& comp,
                            const contract_name& contract,
                            const endpoint_name& endpoint) -> void
{
    get(comp).associate(contract, endpoint);
}

auto composition::add_field(const component_name& comp,
                            const contract_name& contract, data_field field)
    -> void
{
    get(comp).add_field(contract, std::move(field));
}

auto operator==(const composition& lhs, const composition& rhs) -> bool
{
    return (lhs.name() == rhs.name())
        && (lhs.components() == rhs.components());
}

auto operator<<(std::ostream& os, const composition& value) -> std::ostream&
{
    os << "composition{";
    os << ".name=" << value.name();
    if (!empty(value.components())) {
        os << ",.components={";
        auto prefix = "";
        for (auto&& entry: value.components()) {
            os << prefix << entry;
            prefix = ",";
        }
        os << "}";
    }
    os << "}";
    return os;
}

auto pretty_print(std::ostream& os, const composition& value) -> void
{
    os << "composition \"" << value.name() << "\":\n";
    const detail::indenting_ostreambuf indent{os};
    if (empty(value.components())) {
        os << "no components\n";
        return;
    }
    auto index = 0u;
    for (auto&& entry: value.components()) {
        os << "component " << ++index << ": \"" << entry.name() << "\"";
        os << " (type: " << entry.type() << ")\n";
        const detail::indenting_ostreambuf component_indent{os};
        pretty_print(os, entry);
    }
}

}
