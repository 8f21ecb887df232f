#pragma once

#include <span>
#include <string_view>

namespace sarfile::tools {
/**
 * @brief Remove every occurrence of @p flag from @p args.
 * @return true when @p flag was present.
 */
bool get_flag(std::span<char *> &args, std::string_view flag) noexcept;

/**
 * @brief Remove the first "@p option value" pair from @p args.
 *
 * A value starting with '-' is not taken as the option's value. Call in a
 * loop to collect a repeated option in command line order.
 *
 * @return const char* The value, or nullptr when the option is absent.
 */
const char *get_option(std::span<char *> &args,
                       std::string_view option) noexcept;
} // namespace sarfile::tools
