#ifndef behavior_hpp
#define behavior_hpp

#include <chrono>
#include <concepts> // for std::regular.
#include <optional>
#include <ostream>

#include "compo/names.hpp"
#include "compo/trigger_kind.hpp"

namespace compo {

using period_type = std::chrono::milliseconds;

/// @brief Behavioral unit.
/// @details A named unit of work of a <code>component</code>.
/// @note <code>period</code> is only meaningful for units whose trigger is
///   <code>trigger_kind::periodic</code>. A periodic unit without a period
///   can be registered but is reported when validated.
/// @see component::add_behavior, check_structure.
struct behavior
{
    behavior_name name;
    trigger_kind trigger{trigger_kind::event};
    std::optional<period_type> period;
};

inline auto operator==(const behavior& lhs, const behavior& rhs) -> bool
{
    return (lhs.name == rhs.name)
        && (lhs.trigger == rhs.trigger)
        && (lhs.period == rhs.period);
}

static_assert(std::regular<behavior>);

auto operator<<(std::ostream& os, const behavior& value) -> std::ostream&;

}

#endif /* behavior_hpp */
