#ifndef finding_hpp
#define finding_hpp

#include <concepts> // for std::regular.
#include <ostream>
#include <string>

#include "compo/names.hpp"

namespace compo {

enum class severity: unsigned {
    error = 0x01u,
};

constexpr auto to_cstring(severity value) noexcept -> const char*
{
    switch (value) {
    case severity::error: return "error";
    }
    return "unknown";
}

/// @brief Which check a finding comes from.
enum class finding_category: unsigned {
    structure = 0x01u,
    endpoints = 0x02u,
    topology = 0x03u,
};

constexpr auto to_cstring(finding_category value) noexcept -> const char*
{
    switch (value) {
    case finding_category::structure: return "structure";
    case finding_category::endpoints: return "endpoints";
    case finding_category::topology: return "topology";
    }
    return "unknown";
}

auto operator<<(std::ostream& os, severity value) -> std::ostream&;
auto operator<<(std::ostream& os, finding_category value) -> std::ostream&;

/// @brief Validation finding.
/// @details One issue found in a composition by <code>validate</code>.
/// @see validate.
struct finding
{
    severity level{severity::error};
    finding_category category{finding_category::structure};

    /// @brief Name of the component the finding is about.
    component_name component;

    /// @brief Human readable description of the issue.
    std::string detail;
};

inline auto operator==(const finding& lhs, const finding& rhs) -> bool
{
    return (lhs.level == rhs.level)
        && (lhs.category == rhs.category)
        && (lhs.component == rhs.component)
        && (lhs.detail == rhs.detail);
}

static_assert(std::regular<finding>);

/// @brief Writes the finding as a single line without a line terminator.
/// @note The form is: <code>error: topology: component "A": ...</code>.
auto operator<<(std::ostream& os, const finding& value) -> std::ostream&;

auto to_string(const finding& value) -> std::string;

}

#endif /* finding_hpp */
