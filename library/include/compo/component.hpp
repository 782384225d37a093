#ifndef component_hpp
#define component_hpp

#include <concepts> // for std::regular.
#include <ostream>
#include <set>
#include <string>
#include <vector>

#include "compo/behavior.hpp"
#include "compo/contract.hpp"
#include "compo/direction.hpp"
#include "compo/endpoint_map.hpp"
#include "compo/errors.hpp"
#include "compo/names.hpp"

namespace compo {

/// @brief Component of a composition.
/// @details A named unit that exposes endpoints, runs behavioral units, and
///   defines contracts over its endpoints.
/// @note Endpoints, behavioral units and contracts are only added through
///   the registration functions of this type, which enforce that their
///   names are unique and that contracts only refer to endpoints of this
///   component. Every registration function either succeeds or throws
///   without having changed the component.
/// @note A component doesn't know about other components. Which components
///   are connected is derived from their endpoint names.
/// @see composition, make_adjacency.
struct component
{
    component() = default;

    explicit component(component_name name, std::string type = {});

    [[nodiscard]] auto name() const noexcept -> const component_name&;

    /// @brief Free-form classification of the component.
    /// @note For example "Sensor" or "Controller".
    [[nodiscard]] auto type() const noexcept -> const std::string&;

    [[nodiscard]] auto endpoints() const noexcept -> const endpoint_map&;

    [[nodiscard]] auto behaviors() const noexcept
        -> const std::vector<behavior>&;

    [[nodiscard]] auto contracts() const noexcept
        -> const std::vector<contract>&;

    /// @throws duplicate_name if an endpoint named @name already exists.
    auto add_endpoint(const endpoint_name& name, direction dir) -> void;

    /// @throws duplicate_name if a behavior of the same name already exists.
    /// @throws invalid_behavior if @value has a period while its trigger
    ///   isn't <code>trigger_kind::periodic</code>, or if its period isn't
    ///   greater than zero.
    auto add_behavior(behavior value) -> void;

    /// @throws duplicate_name if a contract of the same name already exists.
    /// @throws unknown_endpoint if @value refers to an endpoint which this
    ///   component doesn't have.
    auto add_contract(contract value) -> void;

    /// @brief Associates the named contract with the named endpoint.
    /// @throws unknown_contract if no contract is named @contract.
    /// @throws unknown_endpoint if no endpoint is named @endpoint.
    auto associate(const contract_name& contract,
                   const endpoint_name& endpoint) -> void;

    /// @brief Appends the given data field to the named contract.
    /// @throws unknown_contract if no contract is named @contract.
    auto add_field(const contract_name& contract, data_field field) -> void;

    [[nodiscard]] auto find_contract(const contract_name& name) const
        -> const contract*;

private:
    component_name name_;
    std::string type_;
    endpoint_map endpoints_;
    std::vector<behavior> behaviors_;
    std::vector<contract> contracts_;

    auto get_contract(const contract_name& name) -> contract&;
    auto confirm_endpoint(const endpoint_name& name) const -> void;
};

auto operator==(const component& lhs, const component& rhs) -> bool;

static_assert(std::regular<component>);

auto operator<<(std::ostream& os, const component& value) -> std::ostream&;

/// @brief Gets the names of the component's endpoints having the given
///   direction.
auto get_matching_set(const component& value, direction dir)
    -> std::set<endpoint_name>;

}

#endif /* component_hpp */
