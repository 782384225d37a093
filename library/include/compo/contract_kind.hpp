#ifndef contract_kind_hpp
#define contract_kind_hpp

#include <initializer_list>
#include <optional>
#include <ostream>
#include <string_view>

namespace compo {

enum class contract_kind: unsigned {
    client_server = 0x01u,
    publish_subscribe = 0x02u,
};

constexpr auto to_cstring(contract_kind kind) noexcept -> const char*
{
    switch (kind) {
    case contract_kind::client_server: return "clientServer";
    case contract_kind::publish_subscribe: return "senderReceiver";
    }
    return "unknown";
}

constexpr auto to_contract_kind(const std::string_view& s)
    -> std::optional<contract_kind>
{
    for (const auto kind: std::initializer_list<contract_kind>{
        contract_kind::client_server, contract_kind::publish_subscribe,
    }) {
        if (s == to_cstring(kind)) {
            return kind;
        }
    }
    return {};
}

auto operator<<(std::ostream& os, contract_kind value) -> std::ostream&;

}

#endif /* contract_kind_hpp */
