#ifndef ARGUMENT_LINE_HPP
#define ARGUMENT_LINE_HPP

#include <string>       // for string
#include <string_view>  // for string_view
#include <vector>       // for vector

namespace cryptophage::utils {

/// @brief Split an argument line into individual arguments.
///
/// Whitespace separates arguments. Single quotes keep their content literally,
/// double quotes keep their content except for backslash escapes of '"', '\' and
/// whitespace. Outside quotes a backslash escapes only whitespace and quotes and is
/// otherwise kept. Empty quoted arguments ("" or '') are preserved.
/// @param line The argument line.
/// @return The arguments in order.
auto split_argument_line(std::string_view line) noexcept -> std::vector<std::string>;

/// @brief Quote a value so that split_argument_line yields it back as one argument.
auto quote_argument(std::string_view value) noexcept -> std::string;

}  // namespace cryptophage::utils

#endif  // ARGUMENT_LINE_HPP
