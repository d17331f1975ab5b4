#include "./config.hpp"

#include <tint/util/env.hpp>
#include <tint/util/log.hpp>

#include <magic_enum.hpp>

using namespace tint;

log::level config::defaults::default_log_level() {
    auto given = tint::getenv("TINT_LOG_LEVEL");
    if (!given) {
        return log::level::info;
    }
    auto lvl = magic_enum::enum_cast<log::level>(*given);
    if (!lvl) {
        tint_log(warn, "Ignoring unknown TINT_LOG_LEVEL value '{}'", *given);
        return log::level::info;
    }
    return *lvl;
}

bool config::defaults::strict_markup() { return !tint::getenv_bool("TINT_LENIENT_MARKUP"); }

should_style config::defaults::default_should_style() {
    return tint::getenv_bool("TINT_PLAIN") ? should_style::never : should_style::force;
}
