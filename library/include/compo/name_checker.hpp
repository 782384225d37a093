#ifndef name_checker_hpp
#define name_checker_hpp

#include <stdexcept> // for std::invalid_argument
#include <string>
#include <string_view>

namespace compo {

struct name_validator_error: public std::invalid_argument
{
    using invalid_argument::invalid_argument;

    name_validator_error(char badc, std::size_t pos,
                         const std::string& what_arg = {});

    [[nodiscard]] auto badchar() const noexcept -> char;
    [[nodiscard]] auto position() const noexcept -> std::size_t;

private:
    std::size_t position_{};
    char badchar_{};
};

}

namespace compo::detail {

/// @brief Name validator function.
/// @param[in] v Value to validate.
/// @throws name_validator_error if @v contains a control character.
auto name_validator(std::string v) -> std::string;

/// @brief Checker for names of the entities of a composition.
/// @note Names are case sensitive and may contain any character other than
///   a control character. The empty string is accepted.
struct name_checker
{
    auto operator()() const noexcept // NOLINT(bugprone-exception-escape)
        -> std::string
    {
        return {};
    }

    auto operator()(std::string v) const -> std::string
    {
        return name_validator(std::move(v));
    }

    auto operator()(const std::string_view& v) const -> std::string
    {
        return operator()(std::string(v));
    }

    auto operator()(const char *v) const -> std::string
    {
        return operator()(std::string(v));
    }
};

}

#endif /* name_checker_hpp */
