#ifndef errors_hpp
#define errors_hpp

#include <stdexcept> // for std::invalid_argument
#include <string>
#include <utility> // for std::move

#include "compo/behavior.hpp"
#include "compo/names.hpp"

namespace compo {

/// @brief Exception thrown on attempts to register an entity under a name
///   that's already taken within its scope.
struct duplicate_name: std::invalid_argument
{
    duplicate_name(std::string n, const std::string& what_arg):
        std::invalid_argument(what_arg), value(std::move(n))
    {}

    /// @brief The name that was already taken.
    std::string value;
};

/// @brief Exception thrown on attempts to update a component that the
///   composition doesn't have.
struct unknown_component: std::invalid_argument
{
    unknown_component(component_name n, const std::string& what_arg):
        std::invalid_argument(what_arg), value(std::move(n))
    {}

    component_name value;
};

/// @brief Exception thrown on attempts to associate a contract with an
///   endpoint that the component doesn't have.
struct unknown_endpoint: std::invalid_argument
{
    unknown_endpoint(endpoint_name n, const std::string& what_arg):
        std::invalid_argument(what_arg), value(std::move(n))
    {}

    endpoint_name value;
};

/// @brief Exception thrown on attempts to update a contract that the
///   component doesn't have.
struct unknown_contract: std::invalid_argument
{
    unknown_contract(contract_name n, const std::string& what_arg):
        std::invalid_argument(what_arg), value(std::move(n))
    {}

    contract_name value;
};

/// @brief Exception thrown on attempts to register a behavioral unit whose
///   period is inconsistent with its trigger.
struct invalid_behavior: std::invalid_argument
{
    invalid_behavior(behavior b, const std::string& what_arg):
        std::invalid_argument(what_arg), value(std::move(b))
    {}

    behavior value;
};

}

#endif /* errors_hpp */
