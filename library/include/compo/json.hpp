#ifndef json_hpp
#define json_hpp

#include <ostream>

#include <nlohmann/json.hpp>

#include "compo/behavior.hpp"
#include "compo/component.hpp"
#include "compo/composition.hpp"
#include "compo/contract.hpp"

namespace compo {

// Hooks for nlohmann::ordered_json's conversion of these types...
auto to_json(nlohmann::ordered_json& j, const data_field& value) -> void;
auto to_json(nlohmann::ordered_json& j, const behavior& value) -> void;
auto to_json(nlohmann::ordered_json& j, const contract& value) -> void;
auto to_json(nlohmann::ordered_json& j, const component& value) -> void;
auto to_json(nlohmann::ordered_json& j, const composition& value) -> void;

/// @brief Makes the JSON document for the given composition.
/// @details The document is an object of the form:
/// <pre>
///   {"composition_name": ..., "components": [
///     {"name": ..., "type": ...,
///      "ports": [{"name": ..., "type": "sender"|"receiver"}...],
///      "runnables": [{"name": ..., "trigger": ..., "period": ms|null}...],
///      "interfaces": [{"name": ..., "type": ...,
///                      "associated_ports": [name...],
///                      "data_elements": [{"name": ..., "type": ...}...]}...]
///     }...]}
/// </pre>
/// @note Object members are written in the order shown.
/// @note "period" is null for behaviors that aren't periodic, and for
///   periodic behaviors that have no period.
auto to_json(const composition& value) -> nlohmann::ordered_json;

/// @brief Writes the JSON document for the given composition, indented
///   by 4 spaces per level, followed by a new line.
auto write_json(std::ostream& os, const composition& value) -> std::ostream&;

}

#endif /* json_hpp */
