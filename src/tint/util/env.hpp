#pragma once

#include <optional>
#include <string>
#include <string_view>

namespace tint {

std::optional<std::string> getenv(const std::string& env) noexcept;

bool getenv_bool(const std::string& env) noexcept;

/// "1", "true", "on", "yes" (and their upper-case spellings) are truthy
bool is_truthy_string(std::string_view s) noexcept;

}  // namespace tint
