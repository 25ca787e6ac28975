#pragma once

/**
 * @file path_utils.h
 * @brief Path resolution for data files named in the config
 */

#include <string>

namespace coop_assist {

/**
 * Expands leading ~ to $HOME (getenv("HOME")). ~user not supported.
 * Returns path unchanged if path is empty or ~ expansion not applicable.
 */
std::string expand_path(const std::string& path);

/**
 * Directory part of a file path ("config/app.json" -> "config").
 * Returns "." when the path has no directory component.
 */
std::string parent_directory(const std::string& path);

/**
 * Resolves path against base_dir unless it is empty or absolute.
 * Applies ~ expansion first.
 */
std::string resolve_path(const std::string& base_dir, const std::string& path);

} // namespace coop_assist
