#ifndef trigger_kind_hpp
#define trigger_kind_hpp

#include <initializer_list>
#include <optional>
#include <ostream>
#include <string_view>

namespace compo {

/// @brief What causes a behavioral unit to run.
enum class trigger_kind: unsigned {
    event = 0x01u,
    periodic = 0x02u,
};

constexpr auto to_cstring(trigger_kind kind) noexcept -> const char*
{
    switch (kind) {
    case trigger_kind::event: return "event-based";
    case trigger_kind::periodic: return "periodic";
    }
    return "unknown";
}

/// @note Accepts "event-driven" as an alternative to "event-based".
constexpr auto to_trigger_kind(const std::string_view& s)
    -> std::optional<trigger_kind>
{
    for (const auto kind: std::initializer_list<trigger_kind>{
        trigger_kind::event, trigger_kind::periodic,
    }) {
        if (s == to_cstring(kind)) {
            return kind;
        }
    }
    if (s == "event-driven") {
        return trigger_kind::event;
    }
    return {};
}

auto operator<<(std::ostream& os, trigger_kind value) -> std::ostream&;

}

#endif /* trigger_kind_hpp */
