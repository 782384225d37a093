#include <cassert>
#include <cerrno>
#include <cstdlib> // for std::strtol
#include <fstream>
#include <functional> // for std::function
#include <iomanip> // for std::quoted, std::setw
#include <iostream>
#include <map>
#include <memory> // for std::unique_ptr
#include <optional>
#include <span>
#include <string>
#include <string_view>
#include <system_error> // for std::error_code
#include <vector>

#include <histedit.h>

#include "compo/composition.hpp"
#include "compo/json.hpp"
#include "compo/validate.hpp"

namespace {

using arguments = std::vector<std::string>;
using string_span = std::span<const std::string>;

using cmd_handler = std::function<void(const string_span& args)>;
using cmd_table = std::map<std::string, cmd_handler>;

constexpr auto shell_name = "compo";
constexpr auto default_composition_name = "composition";

const auto name_prefix = std::string{"--name="};
const auto editor_prefix = std::string{"--editor="};
const auto type_prefix = std::string{"--type="};
const auto period_prefix = std::string{"--period="};
const auto endpoint_prefix = std::string{"--endpoint="};
const auto help_argument = std::string{"--help"};
const auto usage_argument = std::string{"--usage"};

constexpr auto emacs_editor_str = "emacs";
constexpr auto vi_editor_str = "vi";

/// @brief Makes the stated return type from given argument count and vector.
/// @param[in] ac Argument count.
/// @param[in] av Argument vector.
/// @pre @c av is non-null if @c ac is 1 or more.
auto make_arguments(int ac, const char*av[]) -> arguments
{
    assert(ac <= 0 || av);
    auto args = arguments{};
    for (auto i = 0; i < ac; ++i) {
        args.emplace_back(av[i]);
    }
    return args;
}

struct EditLineDeleter
{
    void operator()(EditLine *p)
    {
        el_end(p);
    }
};

using edit_line_ptr = std::unique_ptr<EditLine, EditLineDeleter>;

struct HistoryDeleter
{
    void operator()(History *p)
    {
        history_end(p);
    }
};

using history_ptr = std::unique_ptr<History, HistoryDeleter>;

struct TokenizerDeleter
{
    void operator()(Tokenizer *p)
    {
        tok_end(p);
    }
};

using tokenizer_ptr = std::unique_ptr<Tokenizer, TokenizerDeleter>;

auto continuation = false;

char *prompt([[maybe_unused]] EditLine *el)
{
    static auto nl_prefix = std::string{"\1\033[7m\1"};
    static auto nl_suffix = std::string{"$\1\033[0m\1 "};
    static auto nl_buf = nl_prefix + shell_name + nl_suffix;
    static auto cl_buf = std::string{shell_name} + "> ";
    return continuation? cl_buf.data(): nl_buf.data();
}

auto to_long(const std::string_view& view) -> std::optional<long>
{
    const auto str = std::string{view};
    char* p_end{};
    errno = 0;
    const auto n = std::strtol(str.c_str(), &p_end, 10);
    if ((p_end == str.c_str()) || (p_end != (str.c_str() + size(str)))
        || (errno == ERANGE)) {
        return {};
    }
    return {n};
}

/// @brief Handles the informational arguments common to all commands.
/// @return <code>true</code> if @args had such an argument, in which case
///   the command shouldn't do anything else.
auto handle_info(const string_span& args,
                 const std::string_view& description,
                 const std::string_view& syntax) -> bool
{
    for (auto&& arg: args.subspan(1u)) {
        if (arg == help_argument) {
            std::cout << description << "\n";
            return true;
        }
        if (arg == usage_argument) {
            std::cout << "usage: ";
            std::cout << args[0];
            std::cout << ' ';
            std::cout << help_argument;
            std::cout << '|';
            std::cout << usage_argument;
            if (!empty(syntax)) {
                std::cout << '|' << syntax;
            }
            std::cout << "\n";
            return true;
        }
    }
    return false;
}

/// @brief Converts the given string to a name of the given type.
/// @return Name or no value if the string isn't a valid name, in which case
///   the reason is written to <code>std::cerr</code>.
template <class Name>
auto to_name(const std::string& string, const std::string_view& what)
    -> std::optional<Name>
{
    try {
        return Name{string};
    }
    catch (const compo::name_validator_error& ex) {
        std::cerr << what << " name " << std::quoted(string);
        std::cerr << " invalid: " << ex.what() << "\n";
    }
    return {};
}

auto do_name(compo::composition& composition, const string_span& args)
    -> void
{
    if (handle_info(args, "shows or sets the composition name.",
                    "[<new-name>]")) {
        return;
    }
    if (size(args) > 2u) {
        std::cerr << "too many arguments: specify one name at most\n";
        return;
    }
    if (size(args) == 2u) {
        composition.set_name(args[1]);
        return;
    }
    std::cout << std::quoted(composition.name()) << "\n";
}

auto do_show_components(const compo::composition& composition,
                        const string_span& args) -> void
{
    if (handle_info(args, "lists the names of the components in order.",
                    "")) {
        return;
    }
    for (auto&& name: composition.component_names()) {
        std::cout << name << "\n";
    }
}

auto do_add_component(compo::composition& composition,
                      const string_span& args) -> void
{
    if (handle_info(args, "adds a new component.",
                    "<name> [" + type_prefix + "<type>]")) {
        return;
    }
    auto names = std::vector<std::string>{};
    auto type = std::string{};
    for (auto&& arg: args.subspan(1u)) {
        if (arg.starts_with(type_prefix)) {
            type = arg.substr(size(type_prefix));
            continue;
        }
        if (arg.starts_with("--")) {
            std::cerr << "aborting: unrecognized argument ";
            std::cerr << std::quoted(arg) << "\n";
            return;
        }
        names.push_back(arg);
    }
    if (size(names) != 1u) {
        std::cerr << "aborting: exactly one component name must be given\n";
        return;
    }
    const auto name = to_name<compo::component_name>(names[0], "component");
    if (!name) {
        return;
    }
    composition.add_component(compo::component{*name, type});
}

auto do_show_endpoints(const compo::composition& composition,
                       const string_span& args) -> void
{
    if (handle_info(args, "shows the endpoints of components.",
                    "[<component-name>...]")) {
        return;
    }
    const auto show = [](const compo::component& c){
        std::cout << c.name() << ":";
        for (auto&& entry: c.endpoints()) {
            std::cout << " " << entry.first << "(" << entry.second << ")";
        }
        std::cout << "\n";
    };
    if (size(args) < 2u) {
        for (auto&& c: composition.components()) {
            show(c);
        }
        return;
    }
    for (auto&& arg: args.subspan(1u)) {
        const auto name = to_name<compo::component_name>(arg, "component");
        if (!name) {
            continue;
        }
        if (const auto found = composition.find(*name)) {
            show(*found);
            continue;
        }
        std::cerr << "no such component as " << std::quoted(arg) << "\n";
    }
}

auto do_add_endpoint(compo::composition& composition,
                     const string_span& args) -> void
{
    const auto syntax = std::string{"<component-name> <endpoint-name> "}
        + compo::to_cstring(compo::direction::outbound) + "|"
        + compo::to_cstring(compo::direction::inbound);
    if (handle_info(args, "adds an endpoint to a component.", syntax)) {
        return;
    }
    if (size(args) != 4u) {
        std::cerr << "invalid argument count " << size(args);
        std::cerr << ": usage " << args[0] << " " << syntax << "\n";
        return;
    }
    const auto dir = compo::to_direction(args[3]);
    if (!dir) {
        std::cerr << "aborting: unrecognized direction ";
        std::cerr << std::quoted(args[3]) << "\n";
        return;
    }
    const auto name = to_name<compo::endpoint_name>(args[2], "endpoint");
    if (!name) {
        return;
    }
    if (const auto comp = to_name<compo::component_name>(args[1],
                                                         "component")) {
        composition.add_endpoint(*comp, *name, *dir);
    }
}

auto do_show_behaviors(const compo::composition& composition,
                       const string_span& args) -> void
{
    if (handle_info(args, "shows the behaviors of components.",
                    "[<component-name>...]")) {
        return;
    }
    const auto show = [](const compo::component& c){
        std::cout << c.name() << ":\n";
        for (auto&& entry: c.behaviors()) {
            std::cout << "  " << entry << "\n";
        }
    };
    if (size(args) < 2u) {
        for (auto&& c: composition.components()) {
            show(c);
        }
        return;
    }
    for (auto&& arg: args.subspan(1u)) {
        const auto name = to_name<compo::component_name>(arg, "component");
        if (!name) {
            continue;
        }
        if (const auto found = composition.find(*name)) {
            show(*found);
            continue;
        }
        std::cerr << "no such component as " << std::quoted(arg) << "\n";
    }
}

auto do_add_behavior(compo::composition& composition,
                     const string_span& args) -> void
{
    const auto syntax = std::string{"<component-name> <behavior-name> "}
        + compo::to_cstring(compo::trigger_kind::event) + "|"
        + compo::to_cstring(compo::trigger_kind::periodic)
        + " [" + period_prefix + "<milliseconds>]";
    if (handle_info(args, "adds a behavior to a component.", syntax)) {
        return;
    }
    auto positional = std::vector<std::string>{};
    auto period = std::optional<compo::period_type>{};
    for (auto&& arg: args.subspan(1u)) {
        if (arg.starts_with(period_prefix)) {
            const auto value = arg.substr(size(period_prefix));
            const auto ms = to_long(value);
            if (!ms) {
                std::cerr << "aborting: invalid period ";
                std::cerr << std::quoted(value) << "\n";
                return;
            }
            period = compo::period_type{*ms};
            continue;
        }
        if (arg.starts_with("--")) {
            std::cerr << "aborting: unrecognized argument ";
            std::cerr << std::quoted(arg) << "\n";
            return;
        }
        positional.push_back(arg);
    }
    if (size(positional) != 3u) {
        std::cerr << "aborting: usage " << args[0] << " " << syntax << "\n";
        return;
    }
    const auto trigger = compo::to_trigger_kind(positional[2]);
    if (!trigger) {
        std::cerr << "aborting: unrecognized trigger ";
        std::cerr << std::quoted(positional[2]) << "\n";
        return;
    }
    const auto name = to_name<compo::behavior_name>(positional[1], "behavior");
    if (!name) {
        return;
    }
    if (const auto comp = to_name<compo::component_name>(positional[0],
                                                         "component")) {
        composition.add_behavior(*comp,
                                 compo::behavior{*name, *trigger, period});
    }
}

auto do_show_contracts(const compo::composition& composition,
                       const string_span& args) -> void
{
    if (handle_info(args, "shows the contracts of components.",
                    "[<component-name>...]")) {
        return;
    }
    const auto show = [](const compo::component& c){
        std::cout << c.name() << ":\n";
        for (auto&& entry: c.contracts()) {
            std::cout << "  " << entry << "\n";
        }
    };
    if (size(args) < 2u) {
        for (auto&& c: composition.components()) {
            show(c);
        }
        return;
    }
    for (auto&& arg: args.subspan(1u)) {
        const auto name = to_name<compo::component_name>(arg, "component");
        if (!name) {
            continue;
        }
        if (const auto found = composition.find(*name)) {
            show(*found);
            continue;
        }
        std::cerr << "no such component as " << std::quoted(arg) << "\n";
    }
}

auto do_add_contract(compo::composition& composition,
                     const string_span& args) -> void
{
    const auto syntax = std::string{"<component-name> <contract-name> "}
        + compo::to_cstring(compo::contract_kind::client_server) + "|"
        + compo::to_cstring(compo::contract_kind::publish_subscribe)
        + " [" + endpoint_prefix + "<endpoint-name>...]";
    if (handle_info(args, "adds a contract to a component.", syntax)) {
        return;
    }
    auto positional = std::vector<std::string>{};
    auto endpoints = std::vector<compo::endpoint_name>{};
    for (auto&& arg: args.subspan(1u)) {
        if (arg.starts_with(endpoint_prefix)) {
            const auto name = to_name<compo::endpoint_name>(
                arg.substr(size(endpoint_prefix)), "endpoint");
            if (!name) {
                return;
            }
            endpoints.push_back(*name);
            continue;
        }
        if (arg.starts_with("--")) {
            std::cerr << "aborting: unrecognized argument ";
            std::cerr << std::quoted(arg) << "\n";
            return;
        }
        positional.push_back(arg);
    }
    if (size(positional) != 3u) {
        std::cerr << "aborting: usage " << args[0] << " " << syntax << "\n";
        return;
    }
    const auto kind = compo::to_contract_kind(positional[2]);
    if (!kind) {
        std::cerr << "aborting: unrecognized contract kind ";
        std::cerr << std::quoted(positional[2]) << "\n";
        return;
    }
    const auto name = to_name<compo::contract_name>(positional[1], "contract");
    if (!name) {
        return;
    }
    if (const auto comp = to_name<compo::component_name>(positional[0],
                                                         "component")) {
        composition.add_contract(*comp,
                                 compo::contract{*name, *kind, endpoints, {}});
    }
}

auto do_associate(compo::composition& composition, const string_span& args)
    -> void
{
    if (handle_info(args, "associates a contract with endpoints.",
                    "<component-name> <contract-name> <endpoint-name>...")) {
        return;
    }
    if (size(args) < 4u) {
        std::cerr << "aborting: component, contract, and one or more";
        std::cerr << " endpoint names must be specified\n";
        return;
    }
    const auto contract = to_name<compo::contract_name>(args[2], "contract");
    if (!contract) {
        return;
    }
    const auto comp = to_name<compo::component_name>(args[1], "component");
    if (!comp) {
        return;
    }
    for (auto&& arg: args.subspan(3u)) {
        if (const auto name = to_name<compo::endpoint_name>(arg, "endpoint")) {
            composition.associate(*comp, *contract, *name);
        }
    }
}

auto do_add_field(compo::composition& composition, const string_span& args)
    -> void
{
    if (handle_info(args, "adds a data field to a contract.",
                    "<component-name> <contract-name> <field-name> <type>")) {
        return;
    }
    if (size(args) != 5u) {
        std::cerr << "invalid argument count " << size(args);
        std::cerr << ": specify component, contract, field name and type\n";
        return;
    }
    const auto contract = to_name<compo::contract_name>(args[2], "contract");
    if (!contract) {
        return;
    }
    if (const auto comp = to_name<compo::component_name>(args[1],
                                                         "component")) {
        composition.add_field(*comp, *contract,
                              compo::data_field{args[3], args[4]});
    }
}

auto do_show(const compo::composition& composition, const string_span& args)
    -> void
{
    if (handle_info(args, "shows the whole composition.", "")) {
        return;
    }
    pretty_print(std::cout, composition);
}

auto do_validate(const compo::composition& composition,
                 const string_span& args) -> void
{
    if (handle_info(args, "validates the composition.", "")) {
        return;
    }
    const auto findings = validate(composition, std::cerr);
    if (empty(findings)) {
        std::cout << "configuration is valid.\n";
        return;
    }
    std::cout << "validation errors:\n";
    for (auto&& finding: findings) {
        std::cout << "- " << finding << "\n";
    }
}

auto do_export(const compo::composition& composition,
               const string_span& args) -> void
{
    if (handle_info(args, "exports the composition as JSON to a file.",
                    "<file-name>")) {
        return;
    }
    if (size(args) != 2u) {
        std::cerr << "invalid argument count " << size(args);
        std::cerr << ": specify the file name and only that\n";
        return;
    }
    const auto& path = args[1];
    std::ofstream file{path};
    if (!file) {
        const auto ec = std::error_code{errno, std::generic_category()};
        std::cerr << "unable to open " << std::quoted(path);
        std::cerr << ": " << ec.message() << "\n";
        return;
    }
    write_json(file, composition);
    file.close();
    if (!file) {
        std::cerr << "error while exporting to " << std::quoted(path) << "\n";
        return;
    }
    std::cout << "exported to " << std::quoted(path) << "\n";
}

auto do_history(history_ptr& hist, int hist_size, const string_span& args)
    -> void
{
    if (handle_info(args, "shows the history of commands entered.",
                    "[clear]")) {
        return;
    }
    HistEvent ev{};
    for (auto&& arg: args.subspan(1u)) {
        if (arg == "clear") {
            history(hist.get(), &ev, H_CLEAR);
            return;
        }
    }
    const auto width = static_cast<int>(std::to_string(hist_size).size());
    for (auto rv = history(hist.get(), &ev, H_LAST);
         rv != -1;
         rv = history(hist.get(), &ev, H_PREV)) {
         std::cout << std::setw(width) << ev.num << " " << ev.str;
    }
}

auto do_editor(edit_line_ptr& el, const string_span& args) -> void
{
    if (handle_info(args, "shows or sets the shell editor.",
                    std::string{vi_editor_str} + "|" + emacs_editor_str)) {
        return;
    }
    for (auto&& arg: args.subspan(1u)) {
        if ((arg == vi_editor_str) || (arg == emacs_editor_str)) {
            el_set(el.get(), EL_EDITOR, arg.c_str());
            continue;
        }
        std::cerr << std::quoted(arg) << ": unrecognized editor\n";
    }
    if (args.size() == 1u) {
        auto ptr = static_cast<const char *>(nullptr);
        el_get(el.get(), EL_EDITOR, &ptr);
        if (!ptr) {
            std::cerr << "unable to get current shell editor\n";
            return;
        }
        std::cout << "shell editor is currently ";
        std::cout << std::quoted(ptr);
        std::cout << '\n';
    }
}

auto do_help(const cmd_table& cmds, const string_span& args) -> void
{
    using strings = std::vector<std::string>;
    if (size(args) > 1u) {
        for (auto&& arg: args.subspan(1u)) {
            if (arg == help_argument) {
                std::cout << "provides help on builtin commands.\n";
                return;
            }
            if (arg == usage_argument) {
                std::cout << "usage: " << args[0] << ' ';
                std::cout << help_argument << '|' << usage_argument << '|';
                std::cout << "<builtin-command-name>...\n";
                return;
            }
            const auto found = cmds.find(arg);
            if (found == cmds.end()) {
                std::cerr << std::quoted(arg);
                std::cerr << ": unknown command, skipping\n";
                continue;
            }
            std::cout << found->first << ": ";
            found->second(strings{found->first, help_argument});
        }
        return;
    }
    for (auto&& entry: cmds) {
        if (empty(entry.first)) {
            continue;
        }
        std::cout << entry.first << ": ";
        entry.second(strings{entry.first, help_argument});
    }
}

auto do_usage(const cmd_table& cmds, const string_span& args) -> void
{
    using strings = std::vector<std::string>;
    if (size(args) > 1u) {
        for (auto&& arg: args.subspan(1u)) {
            if (arg == help_argument) {
                std::cout << "provides usage syntax of builtin commands.\n";
                return;
            }
            if (arg == usage_argument) {
                std::cout << "usage: " << args[0] << ' ';
                std::cout << help_argument << '|' << usage_argument << '|';
                std::cout << "<builtin-command-name>...\n";
                return;
            }
            const auto found = cmds.find(arg);
            if (found == cmds.end()) {
                std::cerr << std::quoted(arg);
                std::cerr << ": unknown command, skipping\n";
                continue;
            }
            std::cout << found->first << ' ';
            found->second(strings{found->first, usage_argument});
        }
        return;
    }
    for (auto&& entry: cmds) {
        if (empty(entry.first)) {
            continue;
        }
        std::cout << entry.first << ' ';
        entry.second(strings{entry.first, usage_argument});
    }
}

auto run(const cmd_handler& cmd, const string_span& args) -> void
{
    try {
        cmd(args);
    }
    catch (const std::invalid_argument& ex) {
        std::cerr << "unable to run " << args[0] << " command: ";
        std::cerr << ex.what() << "\n";
    }
}

auto do_cmds(const cmd_table& cmds, const string_span& args) -> void
{
    if (!empty(args)) {
        if (args[0] == help_argument) {
            std::cout << "\n";
            do_help(cmds, {});
            return;
        }
        if (args[0] == usage_argument) {
            std::cout << "\n";
            do_usage(cmds, {});
            return;
        }
    }
    const auto cmd = empty(args)? std::string{}: args[0];
    if (const auto it = cmds.find(cmd); it != cmds.end()) {
        const auto default_args = std::vector<std::string>{it->first};
        run(it->second, empty(args)? default_args: args);
    }
    else {
        std::cerr << std::quoted(cmd);
        std::cerr << ": no such command\n";
    }
}

}

auto main(int argc, const char * argv[]) -> int
{
    auto composition = compo::composition{default_composition_name};
    auto do_loop = true;
    auto hist_size = 100;
    auto editor = std::string{emacs_editor_str};

    for (auto i = 1; i < argc; ++i) {
        const auto arg = std::string_view{argv[i]};
        if (arg.starts_with(name_prefix)) {
            composition.set_name(std::string{arg.substr(size(name_prefix))});
            continue;
        }
        if (arg.starts_with(editor_prefix)) {
            editor = arg.substr(size(editor_prefix));
            continue;
        }
        std::cerr << "ignoring unrecognized argument ";
        std::cerr << std::quoted(arg) << "\n";
    }
    if ((editor != vi_editor_str) && (editor != emacs_editor_str)) {
        std::cerr << "unrecognized editor " << std::quoted(editor);
        std::cerr << ", using " << emacs_editor_str << "\n";
        editor = emacs_editor_str;
    }

    HistEvent ev{};
    auto hist = history_ptr{history_init()};
    history(hist.get(), &ev, H_SETSIZE, hist_size);

    auto tok = tokenizer_ptr{tok_init(NULL)};

    auto el = edit_line_ptr{el_init(argv[0], stdin, stdout, stderr)};
    el_set(el.get(), EL_SIGNAL, 1); // installs sig handlers for resizing, etc.
    el_set(el.get(), EL_HIST, history, hist.get());
    el_set(el.get(), EL_PROMPT_ESC, prompt, '\1');
    el_set(el.get(), EL_EDITOR, editor.c_str());
    el_source(el.get(), NULL);

    const auto show_components_lambda = [&](const string_span& args){
        do_show_components(composition, args);
    };
    const cmd_table component_cmds{
        {"", show_components_lambda},
        {"add", [&](const string_span& args){
            do_add_component(composition, args);
        }},
        {"show", show_components_lambda},
    };

    const auto show_endpoints_lambda = [&](const string_span& args){
        do_show_endpoints(composition, args);
    };
    const cmd_table endpoint_cmds{
        {"", show_endpoints_lambda},
        {"add", [&](const string_span& args){
            do_add_endpoint(composition, args);
        }},
        {"show", show_endpoints_lambda},
    };

    const auto show_behaviors_lambda = [&](const string_span& args){
        do_show_behaviors(composition, args);
    };
    const cmd_table behavior_cmds{
        {"", show_behaviors_lambda},
        {"add", [&](const string_span& args){
            do_add_behavior(composition, args);
        }},
        {"show", show_behaviors_lambda},
    };

    const auto show_contracts_lambda = [&](const string_span& args){
        do_show_contracts(composition, args);
    };
    const cmd_table contract_cmds{
        {"", show_contracts_lambda},
        {"add", [&](const string_span& args){
            do_add_contract(composition, args);
        }},
        {"associate", [&](const string_span& args){
            do_associate(composition, args);
        }},
        {"field", [&](const string_span& args){
            do_add_field(composition, args);
        }},
        {"show", show_contracts_lambda},
    };

    const cmd_table cmds{
        {"exit", [&](const string_span& args){
            if (handle_info(args, "exits this shell.", "")) {
                return;
            }
            do_loop = false;
        }},
        {"help", [&](const string_span& args){
            if (size(args) == 1u) {
                std::cout << "Builtin commands (and their sub-commands):\n\n";
            }
            do_help(cmds, args);
        }},
        {"usage", [&](const string_span& args){
            do_usage(cmds, args);
        }},
        {"editor", [&](const string_span& args){
            do_editor(el, args);
        }},
        {"history", [&](const string_span& args){
            do_history(hist, hist_size, args);
        }},
        {"name", [&](const string_span& args){
            do_name(composition, args);
        }},
        {"components", [&](const string_span& args){
            do_cmds(component_cmds, args.subspan(1u));
        }},
        {"endpoints", [&](const string_span& args){
            do_cmds(endpoint_cmds, args.subspan(1u));
        }},
        {"behaviors", [&](const string_span& args){
            do_cmds(behavior_cmds, args.subspan(1u));
        }},
        {"contracts", [&](const string_span& args){
            do_cmds(contract_cmds, args.subspan(1u));
        }},
        {"show", [&](const string_span& args){
            do_show(composition, args);
        }},
        {"validate", [&](const string_span& args){
            do_validate(composition, args);
        }},
        {"export", [&](const string_span& args){
            do_export(composition, args);
        }},
    };

    while (do_loop) {
        auto count = 0;
        const auto buf = el_gets(el.get(), &count);
        if (!buf || count == 0) {
            const auto err = errno;
            if (err == EINTR) {
                std::cerr << "el_gets was interrupted\n";
                continue;
            }
            if (err != 0) {
                std::cerr << "aborting: el_gets returned null, errno=";
                std::cerr << std::error_code{err, std::generic_category()}.message();
                std::cerr << "\n";
            }
            break;
        }
        if (!continuation && (count == 1)) {
            continue;
        }
        const auto li = el_line(el.get());
        auto ac = 0; // arg count
        auto av = static_cast<const char**>(nullptr);
        auto cc = 0;
        auto co = 0;
        const auto tok_line_rv = tok_line(tok.get(), li, &ac, &av, &cc, &co);
        if (tok_line_rv == -1) {
            std::cerr << "Internal error\n";
            continuation = false;
            continue;
        }
        const auto hist_rv = history(hist.get(), &ev,
                                     continuation? H_APPEND: H_ENTER, buf);
        if (hist_rv == -1) {
            std::cerr << "history error (" << ev.num << ")" << ev.str << "\n";
        }
        continuation = tok_line_rv > 0;
        if (continuation) {
            continue;
        }
        if (ac < 1 || !av) {
            tok_reset(tok.get());
            continue;
        }
        const auto args = make_arguments(ac, av);
        if (const auto it = cmds.find(args[0]); it != cmds.end()) {
            run(it->second, args);
        }
        else if (el_parse(el.get(), ac, av) == -1) {
            std::cerr << "unrecognized command " << av[0] << "\n";
            std::cerr << "enter " << std::quoted("help") << " for help.\n";
        }
        tok_reset(tok.get());
    }
    return 0;
}
