#ifndef validate_hpp
#define validate_hpp

#include <ostream>
#include <span>
#include <vector>

#include "compo/adjacency.hpp"
#include "compo/component.hpp"
#include "compo/composition.hpp"
#include "compo/finding.hpp"

namespace compo {

/// @brief Checks the structure of the given component by itself.
/// @details Finds when the component has no endpoints, when a periodic
///   behavior has no period, and when a behavior or contract name is
///   repeated.
auto check_structure(const component& value) -> std::vector<finding>;

/// @brief Checks that every endpoint has a counterpart.
/// @details An outbound endpoint is matched when any of the components,
///   including its own, has an inbound endpoint of the same name. Likewise
///   for inbound endpoints.
/// @return One finding per unmatched endpoint: unmatched outbound endpoints
///   first, then unmatched inbound ones, each in component order and then
///   endpoint order.
auto check_endpoints(const std::span<const component>& components)
    -> std::vector<finding>;

/// @brief Checks for cyclic dependencies between the given components.
/// @details Does a depth first search from each not yet visited component,
///   in order, over the undirected graph given by @adjacency. Going back
///   over the edge to the node just come from isn't a cycle. Reaching a
///   node that's still being searched from is, and is reported once naming
///   that node, without searching further along that edge. Nodes that have
///   been completely searched are skipped, including by later roots.
/// @pre @adjacency was made from @components.
/// @return One finding per independent cycle.
auto check_topology(const std::span<const component>& components,
                    const adjacency_list& adjacency)
    -> std::vector<finding>;

auto check_topology(const std::span<const component>& components)
    -> std::vector<finding>;

/// @brief Validates the given composition.
/// @details Runs <code>check_structure</code> for every component in order,
///   then <code>check_endpoints</code>, then <code>check_topology</code>.
/// @return All findings in the order produced. Empty if the composition
///   is valid.
auto validate(const composition& value) -> std::vector<finding>;

/// @brief Validates the given composition, writing a line of diagnostics
///   for each check that's run.
/// @param[in] value Composition to validate.
/// @param[out] diags Stream for the name of each check and its number of
///   findings.
auto validate(const composition& value, std::ostream& diags)
    -> std::vector<finding>;

}

#endif /* validate_hpp */
