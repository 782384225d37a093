#ifndef names_hpp
#define names_hpp

#include <concepts> // for std::regular.
#include <string>

#include "compo/checked.hpp"
#include "compo/name_checker.hpp"

namespace compo {

struct component_name_tag;
struct endpoint_name_tag;
struct behavior_name_tag;
struct contract_name_tag;

/// @brief Component name.
/// @details Identifies a <code>component</code> within a
///   <code>composition</code>.
/// @note This is a strongly typed <code>std::string</code>. A
///   <code>name_validator_error</code> exception is thrown on attempts to
///   construct it from a string containing a control character.
/// @see component, composition.
using component_name =
    detail::checked<std::string, detail::name_checker, component_name_tag>;

/// @brief Endpoint name.
/// @note Unique within its component but the key by which endpoints of
///   different components are matched to each other.
using endpoint_name =
    detail::checked<std::string, detail::name_checker, endpoint_name_tag>;

/// @brief Behavioral unit name.
using behavior_name =
    detail::checked<std::string, detail::name_checker, behavior_name_tag>;

/// @brief Contract name.
using contract_name =
    detail::checked<std::string, detail::name_checker, contract_name_tag>;

static_assert(std::regular<component_name>);
static_assert(std::regular<endpoint_name>);
static_assert(std::regular<behavior_name>);
static_assert(std::regular<contract_name>);

}

#endif /* names_hpp */
