#ifndef direction_hpp
#define direction_hpp

#include <initializer_list>
#include <optional>
#include <ostream>
#include <string_view>

namespace compo {

/// @brief Direction of an endpoint.
enum class direction: unsigned {
    outbound = 0x01u,
    inbound = 0x02u,
};

constexpr auto reverse(direction dir) noexcept -> direction
{
    switch (dir) {
    case direction::outbound: return direction::inbound;
    case direction::inbound: return direction::outbound;
    }
    return dir;
}

constexpr auto to_cstring(direction dir) noexcept -> const char*
{
    switch (dir) {
    case direction::outbound: return "sender";
    case direction::inbound: return "receiver";
    }
    return "unknown";
}

constexpr auto to_direction(const std::string_view& s)
    -> std::optional<direction>
{
    for (const auto dir: std::initializer_list<direction>{
        direction::outbound, direction::inbound,
    }) {
        if (s == to_cstring(dir)) {
            return dir;
        }
    }
    return {};
}

auto operator<<(std::ostream& os, direction value) -> std::ostream&;

}

#endif /* direction_hpp */
