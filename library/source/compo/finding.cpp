#include <sstream> // for std::ostringstream

#include "compo/finding.hpp"

namespace compo {

auto operator<<(std::ostream& os, severity value) -> std::ostream&
{
    os << to_cstring(value);
    return os;
}

auto operator<<(std::ostream& os, finding_category value) -> std::ostream&
{
    os << to_cstring(value);
    return os;
}

auto operator<<(std::ostream& os, const finding& value) -> std::ostream&
{
    os << value.level << ": ";
    os << value.category << ": ";
    os << "component \"" << value.component << "\": ";
    os << value.detail;
    return os;
}

auto to_string(const finding& value) -> std::string
{
    std::ostringstream os;
    os << value;
    return os.str();
}

}
