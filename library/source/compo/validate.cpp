#include <iterator> // for std::make_move_iterator
#include <optional>
#include <set>
#include <sstream> // for std::ostringstream

#include "compo/validate.hpp"

namespace compo {

namespace {

auto append(std::vector<finding>& to, std::vector<finding>&& from) -> void
{
    to.insert(end(to),
              std::make_move_iterator(begin(from)),
              std::make_move_iterator(end(from)));
}

template <class T>
auto quote(const T& value) -> std::string
{
    std::ostringstream os;
    os << "\"" << value << "\"";
    return os.str();
}

auto check_unmatched(const std::span<const component>& components,
                     direction dir,
                     const std::set<endpoint_name>& counterparts)
    -> std::vector<finding>
{
    auto result = std::vector<finding>{};
    for (auto&& c: components) {
        for (auto&& entry: c.endpoints()) {
            if (entry.second != dir || counterparts.contains(entry.first)) {
                continue;
            }
            const auto other = reverse(dir);
            std::ostringstream os;
            os << (dir == direction::outbound? "outbound": "inbound");
            os << " endpoint " << quote(entry.first);
            os << " has no matching ";
            os << (other == direction::outbound? "outbound": "inbound");
            os << " endpoint";
            result.push_back({
                severity::error, finding_category::endpoints, c.name(), os.str()
            });
        }
    }
    return result;
}

/// @brief Depth first search state over the components' adjacency.
/// @note The search keeps its own stack of frames so its depth isn't
///   limited by the call stack.
struct topology_search
{
    struct frame
    {
        std::size_t node{};
        std::optional<std::size_t> parent;
        std::set<std::size_t>::const_iterator next;
    };

    topology_search(const std::span<const component>& c,
                    const adjacency_list& a):
        components{c}, adjacency{a},
        visited(size(c)), on_stack(size(c))
    {
        // Intentionally empty.
    }

    auto push(std::size_t node, std::optional<std::size_t> parent) -> void
    {
        on_stack[node] = true;
        frames.push_back({node, parent, begin(adjacency[node])});
    }

    auto search(std::size_t root) -> void
    {
        push(root, {});
        while (!empty(frames)) {
            auto& top = frames.back();
            if (top.next == end(adjacency[top.node])) {
                on_stack[top.node] = false;
                visited[top.node] = true;
                frames.pop_back();
                continue;
            }
            const auto node = top.node;
            const auto parent = top.parent;
            const auto next = *top.next++;
            if (parent && (next == *parent)) {
                continue;
            }
            if (on_stack[next]) {
                report(next);
                continue;
            }
            if (!visited[next]) {
                push(next, node);
            }
        }
    }

    auto report(std::size_t node) -> void
    {
        std::ostringstream os;
        os << "cyclic dependency through ";
        auto found = false;
        for (auto&& f: frames) {
            found = found || (f.node == node);
            if (found) {
                os << quote(components[f.node].name()) << " -> ";
            }
        }
        os << quote(components[node].name());
        findings.push_back({
            severity::error, finding_category::topology,
            components[node].name(), os.str()
        });
    }

    std::span<const component> components;
    const adjacency_list& adjacency;
    std::vector<bool> visited;
    std::vector<bool> on_stack;
    std::vector<frame> frames;
    std::vector<finding> findings;
};

auto validate(const composition& value, std::ostream* diags)
    -> std::vector<finding>
{
    auto result = std::vector<finding>{};
    const auto write = [diags](const char* check, std::size_t count){
        if (diags) {
            *diags << check << ": " << count << " finding(s)\n";
        }
    };
    const auto components = std::span<const component>{value.components()};
    auto count = std::size_t{};
    for (auto&& c: components) {
        auto findings = check_structure(c);
        count += size(findings);
        append(result, std::move(findings));
    }
    write("structure", count);
    auto endpoint_findings = check_endpoints(components);
    write("endpoints", size(endpoint_findings));
    append(result, std::move(endpoint_findings));
    auto topology_findings = check_topology(components);
    write("topology", size(topology_findings));
    append(result, std::move(topology_findings));
    return result;
}

}

auto check_structure(const component& value) -> std::vector<finding>
{
    auto result = std::vector<finding>{};
    const auto add = [&result,&value](std::string detail){
        result.push_back({
            severity::error, finding_category::structure,
            value.name(), std::move(detail)
        });
    };
    if (empty(value.endpoints())) {
        add("has no endpoints");
    }
    for (auto&& entry: value.behaviors()) {
        if ((entry.trigger == trigger_kind::periodic) && !entry.period) {
            add("periodic behavior " + quote(entry.name) + " has no period");
        }
    }
    // Unreachable while component's registration functions reject
    // duplicate behavior and contract names.
    auto behavior_names = std::set<behavior_name>{};
    for (auto&& entry: value.behaviors()) {
        if (!behavior_names.insert(entry.name).second) {
            add("duplicate behavior name " + quote(entry.name));
        }
    }
    auto contract_names = std::set<contract_name>{};
    for (auto&& entry: value.contracts()) {
        if (!contract_names.insert(entry.name).second) {
            add("duplicate contract name " + quote(entry.name));
        }
    }
    return result;
}

auto check_endpoints(const std::span<const component>& components)
    -> std::vector<finding>
{
    auto outbound = std::set<endpoint_name>{};
    auto inbound = std::set<endpoint_name>{};
    for (auto&& c: components) {
        outbound.merge(get_matching_set(c, direction::outbound));
        inbound.merge(get_matching_set(c, direction::inbound));
    }
    auto result = check_unmatched(components, direction::outbound, inbound);
    append(result, check_unmatched(components, direction::inbound, outbound));
    return result;
}

auto check_topology(const std::span<const component>& components,
                    const adjacency_list& adjacency)
    -> std::vector<finding>
{
    auto search = topology_search{components, adjacency};
    for (auto i = std::size_t{}; i < size(components); ++i) {
        if (!search.visited[i]) {
            search.search(i);
        }
    }
    return std::move(search.findings);
}

auto check_topology(const std::span<const component>& components)
    -> std::vector<finding>
{
    return check_topology(components, make_adjacency(components));
}

auto validate(const composition& value) -> std::vector<finding>
{
    return validate(value, nullptr);
}

auto validate(const composition& value, std::ostream& diags)
    -> std::vector<finding>
{
    return validate(value, &diags);
}

}
