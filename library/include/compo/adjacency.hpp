#ifndef adjacency_hpp
#define adjacency_hpp

#include <cstddef> // for std::size_t
#include <set>
#include <span>
#include <vector>

#include "compo/component.hpp"

namespace compo {

/// @brief Neighbors of each component, by position within the span of
///   components that the list was made from.
/// @note Neighbor sets iterate in ascending position order, which is the
///   order that the components were given in.
using adjacency_list = std::vector<std::set<std::size_t>>;

/// @brief Makes the adjacency list of the given components.
/// @details Two components are adjacent when they have at least one
///   endpoint name in common. The direction of the endpoints doesn't
///   matter, nor does the number of names they have in common.
/// @note Endpoint names are unique within a component so no component is
///   ever its own neighbor.
auto make_adjacency(const std::span<const component>& components)
    -> adjacency_list;

}

#endif /* adjacency_hpp */
