#include "compo/behavior.hpp"

namespace compo {

auto operator<<(std::ostream& os, const behavior& value) -> std::ostream&
{
    os << "behavior{";
    os << ".name=" << value.name;
    os << ",.trigger=" << value.trigger;
    if (value.period) {
        os << ",.period=" << value.period->count() << "ms";
    }
    os << "}";
    return os;
}

}
