#ifndef _V6N_CONFIG_FILE_HPP_
#define _V6N_CONFIG_FILE_HPP_

#include <optional>
#include <string>
#include <string_view>
#include <type_traits>

#include "tl/expected.hpp"
#include "yaml-cpp/yaml.h"

namespace v6net::config::file {

/*
 * Find configuration file CLI argument (--config or -c) and, if found,
 * load it.
 *
 * @param[in] argc
 *   number of cli arguments
 * @param[in] argv
 *   array of cli strings
 *
 * @return
 *  nothing on success, an error message otherwise.
 *
 * @note users are allowed to not specify a configuration file.
 *   In this case the function succeeds and nothing is loaded.
 */
tl::expected<void, std::string> v6n_config_file_find(int argc,
                                                     char* const argv[]);

/*
 * Load, parse, and sanity check a configuration file, replacing any
 * previously loaded configuration.
 */
tl::expected<void, std::string> v6n_config_file_load(std::string_view file_name);

/*
 * Load configuration from a YAML document held in memory.
 */
tl::expected<void, std::string> v6n_config_load_string(std::string_view yaml);

/*
 * Drop any loaded configuration.
 */
void v6n_config_reset();

/*
 * Get configuration file name.
 *
 * @return
 *  configuration file name, or an empty string if none was loaded.
 */
std::string v6n_config_get_file_name();

/*
 * Get configuration parameter(s) for the specified path.
 * @param[in]  period-deliniated path to the requested parameter node
 *
 * @return
 *  a YAML::Node object representing configuration prameters, if any.
 */
std::optional<YAML::Node> v6n_config_get_param(std::string_view param);

/*
 * Get a specific configuration parameter.
 * @param[in]  period-deliniated path to the requested parameter.
 *
 * @note this will throw on any type conversion error. YAML::BadConversion.

 * @return
 *  std::optional<> object that contains the requested value if it exists,
 *  otherwise empty.
 */
template <typename T>
std::enable_if_t<!std::is_same_v<T, YAML::Node>, std::optional<T>>
v6n_config_get_param(std::string_view param)
{
    auto res = v6n_config_get_param(param);
    if (!res) { return (std::nullopt); }

    auto node = *res;
    if (node.IsNull()) { return (std::nullopt); }

    /* This can throw a YAML::BadConversion exception. */
    return (std::make_optional(node.as<T>()));
}

} // namespace v6net::config::file

#endif /* _V6N_CONFIG_FILE_HPP_ */
