#ifndef _V6N_CONFIG_UTILS_HPP_
#define _V6N_CONFIG_UTILS_HPP_

#include <string>
#include <string_view>

#include "tl/expected.hpp"

#include "core/v6n_log.h"
#include "v6net/ipv6_format.hpp"

namespace v6net::config {

/*
 * Apply the `core.log.level` configuration value, if any.
 *
 * @return
 *  the level now in effect, or an error message if the configured
 *  value is not a valid log level.
 */
tl::expected<v6n_log_level, std::string> v6n_config_log_level();

/*
 * Look up the named formatting profile under `format.profiles`.
 */
tl::expected<format_options, std::string>
v6n_config_format_profile(std::string_view name);

} // namespace v6net::config

#endif /* _V6N_CONFIG_UTILS_HPP_ */
