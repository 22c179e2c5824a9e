/**
 * @file assets.hpp
 * @brief Locating runtime asset files
 */

#pragma once

#include <string>
#include <vector>

namespace Assets {

/**
 * @brief First path in @p candidates that can be opened for reading
 *
 * @return The path, or an empty string if none of them can be read
 */
std::string findFirstReadable(const std::vector<std::string>& candidates);

} // namespace Assets
