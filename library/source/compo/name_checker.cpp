#include <algorithm> // for std::find_if
#include <cctype> // for std::iscntrl
#include <sstream> // for std::ostringstream

#include "compo/name_checker.hpp"

namespace compo {

name_validator_error::name_validator_error(char c,
                                           std::size_t pos,
                                           const std::string& what_arg):
    invalid_argument(what_arg), position_(pos), badchar_(c)
{
    // Intentionally empty.
}

auto name_validator_error::badchar() const noexcept -> char
{
    return badchar_;
}

auto name_validator_error::position() const noexcept -> std::size_t
{
    return position_;
}

}

namespace compo::detail {

auto name_validator(std::string v) -> std::string
{
    const auto found = std::find_if(begin(v), end(v), [](char c){
        return std::iscntrl(static_cast<unsigned char>(c)) != 0;
    });
    if (found != end(v)) {
        const auto c = *found;
        const auto pos = static_cast<std::size_t>(found - begin(v));
        std::ostringstream os;
        os << "may not contain control character '\\";
        os << std::oct << int(static_cast<unsigned char>(c));
        os << "'" << std::dec << " at position " << pos;
        throw name_validator_error{c, pos, os.str()};
    }
    return v;
}

}
