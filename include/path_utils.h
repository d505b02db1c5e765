#pragma once

/**
 * @file path_utils.h
 * @brief Path resolution: ~ expansion and install-relative defaults
 */

#include <string>

namespace live_relay {

/**
 * Expands leading ~ to $HOME (getenv("HOME")). ~user not supported.
 * Returns path unchanged if path is empty or ~ expansion not applicable.
 */
std::string expand_path(const std::string& path);

/**
 * Directory holding the running executable (via /proc/self/exe), or empty.
 */
std::string executable_dir();

/**
 * Default config location: <exe_dir>/../config when it holds config.json,
 * otherwise "config".
 */
std::string default_config_path();

} // namespace live_relay
