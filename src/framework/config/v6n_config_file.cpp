#include <algorithm>
#include <cerrno>
#include <cstring>
#include <mutex>
#include <numeric>
#include <vector>

#include <unistd.h>

#include "config/v6n_config_file.hpp"
#include "core/v6n_log.h"

namespace v6net::config::file {

using path_iterator = std::vector<std::string>::const_iterator;

constexpr static std::string_view path_delimiter(".");

/* Configuration is loaded at start-up and read-only afterwards */
static std::mutex config_mutex;
static std::string config_file_name;
static YAML::Node config_root;

static std::vector<std::string> split_string(std::string_view input,
                                             std::string_view delimiters)
{
    std::vector<std::string> output;
    size_t beg = 0, pos = 0;
    while ((beg = input.find_first_not_of(delimiters, pos))
           != std::string::npos) {
        pos = input.find_first_of(delimiters, beg + 1);

        output.emplace_back(input.substr(beg, pos - beg));
    }
    return (output);
}

static std::optional<YAML::Node> get_param_by_path(
    const YAML::Node& parent_node, path_iterator pos, const path_iterator end)
{
    if (pos == end) { return (parent_node); }

    if (!parent_node.IsMap()) { return (std::nullopt); }

    if (parent_node[*pos]) {
        const YAML::Node child_node = parent_node[*pos];
        return (get_param_by_path(child_node, ++pos, end));
    }

    return (std::nullopt);
}

/*
 * We support two top level nodes: `core` and `format`.  Anything else is
 * ignored, but we let the user know about it.
 */
static void check_top_level_nodes(const YAML::Node& root_node,
                                  std::string_view source)
{
    if (!root_node.IsMap()) { return; }

    auto top_level_nodes =
        std::initializer_list<std::string_view>{"core", "format"};

    std::vector<std::string> unknown_nodes;
    for (const auto& node : root_node) {
        auto key = node.first.as<std::string>();
        if (auto found = std::find(
                std::begin(top_level_nodes), std::end(top_level_nodes), key);
            found == std::end(top_level_nodes)) {
            unknown_nodes.push_back(std::move(key));
        }
    }

    if (unknown_nodes.empty()) { return; }

    auto names = std::accumulate(
        std::begin(unknown_nodes),
        std::end(unknown_nodes),
        std::string(),
        [](const std::string& a, const std::string& b) -> std::string {
            return (a + (a.empty() ? "" : ", ") + "\"" + b + "\"");
        });

    V6N_LOG(V6N_LOG_WARNING,
            "Ignoring %zu unrecognized top-level node%s in %.*s: %s",
            unknown_nodes.size(),
            unknown_nodes.size() == 1 ? "" : "s",
            static_cast<int>(source.size()),
            source.data(),
            names.c_str());
}

static tl::expected<void, std::string> validate_root(const YAML::Node& root)
{
    if (root.IsNull() || root.IsMap()) { return {}; }
    return (tl::make_unexpected(
        std::string("top level of configuration must be a map")));
}

std::string v6n_config_get_file_name()
{
    auto guard = std::lock_guard<std::mutex>(config_mutex);
    return (config_file_name);
}

tl::expected<void, std::string> v6n_config_file_load(std::string_view file_name)
{
    auto name = std::string(file_name);

    /* Make sure the file exists and is readable. */
    if (access(name.c_str(), R_OK) == -1) {
        return (tl::make_unexpected("Error (" + std::string(strerror(errno))
                                    + ") while attempting to access config "
                                      "file: "
                                    + name));
    }

    /* yaml-cpp throws exceptions when the parser runs into invalid YAML. */
    YAML::Node root_node;
    try {
        root_node = YAML::LoadFile(name);
    } catch (const YAML::Exception& e) {
        return (tl::make_unexpected("Error parsing configuration file " + name
                                    + ": " + e.what()));
    }

    if (auto valid = validate_root(root_node); !valid) {
        return (tl::make_unexpected(name + ": " + valid.error()));
    }

    V6N_LOG(V6N_LOG_DEBUG, "Reading from configuration file %s", name.c_str());
    check_top_level_nodes(root_node, name);

    auto guard = std::lock_guard<std::mutex>(config_mutex);
    config_file_name = std::move(name);
    config_root = root_node;

    return {};
}

tl::expected<void, std::string> v6n_config_load_string(std::string_view yaml)
{
    YAML::Node root_node;
    try {
        root_node = YAML::Load(std::string(yaml));
    } catch (const YAML::Exception& e) {
        return (tl::make_unexpected(std::string("Error parsing configuration: ")
                                    + e.what()));
    }

    if (auto valid = validate_root(root_node); !valid) { return (valid); }

    check_top_level_nodes(root_node, "configuration string");

    auto guard = std::lock_guard<std::mutex>(config_mutex);
    config_file_name.clear();
    config_root = root_node;

    return {};
}

void v6n_config_reset()
{
    auto guard = std::lock_guard<std::mutex>(config_mutex);
    config_file_name.clear();
    config_root = YAML::Node();
}

std::optional<YAML::Node> v6n_config_get_param(std::string_view path)
{
    auto path_components = split_string(path, path_delimiter);

    auto guard = std::lock_guard<std::mutex>(config_mutex);
    if (!config_root.IsDefined() || config_root.IsNull()) {
        return (std::nullopt);
    }

    /* Hand out a copy so callers can't modify the stored tree */
    auto node = get_param_by_path(
        config_root, path_components.begin(), path_components.end());
    if (!node) { return (std::nullopt); }

    return (YAML::Clone(*node));
}

static const char* find_config_file_option(int argc, char* const argv[])
{
    for (int idx = 0; idx < argc - 1; idx++) {
        if (strcmp(argv[idx], "--config") == 0
            || strcmp(argv[idx], "-c") == 0) {
            return (argv[idx + 1]);
        }
    }

    return (nullptr);
}

tl::expected<void, std::string> v6n_config_file_find(int argc,
                                                     char* const argv[])
{
    const char* file_name = find_config_file_option(argc, argv);

    if (!file_name) { return {}; }

    return (v6n_config_file_load(file_name));
}

} // namespace v6net::config::file
