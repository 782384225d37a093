#ifndef contract_hpp
#define contract_hpp

#include <concepts> // for std::regular.
#include <ostream>
#include <string>
#include <vector>

#include "compo/contract_kind.hpp"
#include "compo/names.hpp"

namespace compo {

/// @brief Data field of a contract.
/// @note The type is a free-form tag. No type system is enforced.
struct data_field
{
    std::string name;
    std::string type;
};

inline auto operator==(const data_field& lhs, const data_field& rhs) -> bool
{
    return (lhs.name == rhs.name) && (lhs.type == rhs.type);
}

static_assert(std::regular<data_field>);

auto operator<<(std::ostream& os, const data_field& value) -> std::ostream&;

/// @brief Communication contract.
/// @details Groups endpoints of the owning <code>component</code> together
///   with the data fields that they exchange.
/// @note The endpoints are referred to by name. Every name must be that of
///   an endpoint of the component which the contract is added to.
/// @see component::add_contract, component::associate.
struct contract
{
    contract_name name;
    contract_kind kind{contract_kind::publish_subscribe};
    std::vector<endpoint_name> endpoints;
    std::vector<data_field> fields;
};

inline auto operator==(const contract& lhs, const contract& rhs) -> bool
{
    return (lhs.name == rhs.name)
        && (lhs.kind == rhs.kind)
        && (lhs.endpoints == rhs.endpoints)
        && (lhs.fields == rhs.fields);
}

static_assert(std::regular<contract>);

auto operator<<(std::ostream& os, const contract& value) -> std::ostream&;

}

#endif /* contract_hpp */
