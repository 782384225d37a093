#ifndef composition_hpp
#define composition_hpp

#include <concepts> // for std::regular.
#include <cstddef> // for std::size_t
#include <map>
#include <ostream>
#include <string>
#include <vector>

#include "compo/component.hpp"
#include "compo/errors.hpp"
#include "compo/names.hpp"

namespace compo {

/// @brief Named collection of components.
/// @note Components are kept in the order they were added. That order is
///   the order in which they're validated, printed and exported.
/// @note Component names are unique within a composition. Added components
///   are only reachable as <code>const</code>, and only updated through the
///   registration functions of this type which forward to those of
///   <code>component</code>, so names can't be changed once added.
/// @see validate.
struct composition
{
    explicit composition(std::string name = {});

    [[nodiscard]] auto name() const noexcept -> const std::string&;

    auto set_name(std::string name) -> void;

    [[nodiscard]] auto components() const noexcept
        -> const std::vector<component>&;

    /// @brief Gets the names of the components in order.
    [[nodiscard]] auto component_names() const -> std::vector<component_name>;

    /// @brief Adds the given component after the already added ones.
    /// @return Reference to the added component.
    /// @note The returned reference, and any reference or pointer previously
    ///   returned for a component of this composition, is invalidated by the
    ///   next successful call to this function.
    /// @throws duplicate_name if a component of the same name was already
    ///   added. The composition is unchanged in that case.
    auto add_component(component value) -> const component&;

    /// @brief Finds the component of the given name.
    [[nodiscard]] auto find(const component_name& name) const
        -> const component*;

    /// @see component::add_endpoint.
    /// @throws unknown_component if there's no component named @comp.
    auto add_endpoint(const component_name& comp,
                      const endpoint_name& name, direction dir) -> void;

    /// @see component::add_behavior.
    /// @throws unknown_component if there's no component named @comp.
    auto add_behavior(const component_name& comp, behavior value) -> void;

    /// @see component::add_contract.
    /// @throws unknown_component if there's no component named @comp.
    auto add_contract(const component_name& comp, contract value) -> void;

    /// @see component::associate.
    /// @throws unknown_component if there's no component named @comp.
    auto associate(const component_name& comp,
                   const contract_name& contract,
                   const endpoint_name& endpoint) -> void;

    /// @see component::add_field.
    /// @throws unknown_component if there's no component named @comp.
    auto add_field(const component_name& comp,
                   const contract_name& contract, data_field field) -> void;

private:
    std::string name_;
    std::vector<component> components_;

    /// @brief Position within <code>components_</code> by name.
    std::map<component_name, std::size_t> index_;

    auto get(const component_name& name) -> component&;
};

auto operator==(const composition& lhs, const composition& rhs) -> bool;

static_assert(std::regular<composition>);

auto operator<<(std::ostream& os, const composition& value) -> std::ostream&;

/// @brief Prints a nested, human readable, listing of the composition.
auto pretty_print(std::ostream& os, const composition& value) -> void;

}

#endif /* composition_hpp */
