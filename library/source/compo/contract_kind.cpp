#include "compo/contract_kind.hpp"

namespace compo {

auto operator<<(std::ostream& os, contract_kind value) -> std::ostream&
{
    os << to_cstring(value);
    return os;
}

}
