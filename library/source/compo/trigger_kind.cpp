#include "compo/trigger_kind.hpp"

namespace compo {

auto operator<<(std::ostream& os, trigger_kind value) -> std::ostream&
{
    os << to_cstring(value);
    return os;
}

}
