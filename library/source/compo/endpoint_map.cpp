#include "compo/endpoint_map.hpp"

namespace compo {

auto operator<<(std::ostream& os, const endpoint_map& value)
    -> std::ostream&
{
    os << "{";
    auto prefix = "";
    for (auto&& entry: value) {
        os << prefix;
        os << "{";
        os << entry.first;
        os << ",";
        os << entry.second;
        os << "}";
        prefix = ",";
    }
    os << "}";
    return os;
}

auto get_matching_set(const endpoint_map& endpoints, direction dir)
    -> std::set<endpoint_name>
{
    auto result = std::set<endpoint_name>{};
    for (auto&& entry: endpoints) {
        if (entry.second == dir) {
            result.insert(entry.first);
        }
    }
    return result;
}

}
