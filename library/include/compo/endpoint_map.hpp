#ifndef endpoint_map_hpp
#define endpoint_map_hpp

#include <concepts> // for std::regular.
#include <map>
#include <ostream>
#include <set>

#include "compo/direction.hpp"
#include "compo/names.hpp"

namespace compo {

/// @brief Endpoints of a component keyed by name.
/// @note The map is both the storage of the endpoints and the index that
///   keeps their names unique. Iteration is in ascending name order.
using endpoint_map = std::map<endpoint_name, direction>;
using endpoint_map_entry = endpoint_map::value_type;

static_assert(std::regular<endpoint_map>);

auto operator<<(std::ostream& os, const endpoint_map& value)
    -> std::ostream&;

/// @brief Gets the names of the endpoints having the given direction.
auto get_matching_set(const endpoint_map& endpoints, direction dir)
    -> std::set<endpoint_name>;

}

#endif /* endpoint_map_hpp */
