#pragma once

#include <tint/markup.hpp>
#include <tint/util/log.hpp>

namespace tint::config {

namespace defaults {

/**
 * @brief The log level to start with. Taken from the TINT_LOG_LEVEL environment variable (one of
 * the `tint::log::level` names), otherwise `info`.
 */
log::level default_log_level();

/**
 * @brief Whether unknown markup classes are an error. Returns false if the TINT_LENIENT_MARKUP
 * environment variable is set to a truthy value, in which case unknown classes are logged and
 * ignored.
 */
bool strict_markup();

/**
 * @brief Whether markup should be rendered with escape sequences. Returns `never` if the TINT_PLAIN
 * environment variable is set to a truthy value.
 */
should_style default_should_style();

}  // namespace defaults

using namespace defaults;

}  // namespace tint::config
