#include "config/v6n_config_file.hpp"
#include "config/v6n_config_utils.hpp"

namespace v6net::config {

static constexpr std::string_view log_level_path = "core.log.level";
static constexpr std::string_view profiles_path = "format.profiles";

/* Scalars come back as strings whether they were written as 4 or "debug" */
static std::optional<std::string> get_scalar(std::string_view path)
{
    auto node = file::v6n_config_get_param(path);
    if (!node || !node->IsScalar()) { return (std::nullopt); }
    return (node->Scalar());
}

tl::expected<v6n_log_level, std::string> v6n_config_log_level()
{
    auto value = get_scalar(log_level_path);
    if (!value) { return (v6n_log_level_get()); }

    auto level = parse_log_optarg(value->c_str());
    if (level == V6N_LOG_NONE) {
        return (tl::make_unexpected("Invalid log level \"" + *value + "\" at "
                                    + std::string(log_level_path)));
    }

    v6n_log_level_set(level);
    V6N_LOG(V6N_LOG_DEBUG,
            "Log level set to %s from configuration",
            v6n_log_level_name(level));

    return (level);
}

tl::expected<format_options, std::string>
v6n_config_format_profile(std::string_view name)
{
    auto path = std::string(profiles_path) + "." + std::string(name);

    auto value = get_scalar(path);
    if (!value) {
        return (tl::make_unexpected("No format profile named \""
                                    + std::string(name) + "\""));
    }

    auto options = parse_format_spec(*value);
    if (!options) {
        return (tl::make_unexpected("Format profile \"" + std::string(name)
                                    + "\": " + to_string(options.error())));
    }

    return (*options);
}

} // namespace v6net::config
