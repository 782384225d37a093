#include <iterator> // for std::next
#include <map>

#include "compo/adjacency.hpp"

namespace compo {

auto make_adjacency(const std::span<const component>& components)
    -> adjacency_list
{
    auto owners = std::map<endpoint_name, std::vector<std::size_t>>{};
    for (auto i = std::size_t{}; i < size(components); ++i) {
        for (auto&& entry: components[i].endpoints()) {
            owners[entry.first].push_back(i);
        }
    }
    auto result = adjacency_list(size(components));
    for (auto&& entry: owners) {
        const auto& group = entry.second;
        for (auto a = begin(group); a != end(group); ++a) {
            for (auto b = std::next(a); b != end(group); ++b) {
                result[*a].insert(*b);
                result[*b].insert(*a);
            }
        }
    }
    return result;
}

}
