#include "compo/direction.hpp"

namespace compo {

auto operator<<(std::ostream& os, direction value) -> std::ostream&
{
    os << to_cstring(value);
    return os;
}

}
