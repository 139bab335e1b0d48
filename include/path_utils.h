#pragma once

/**
 * @file path_utils.h
 * @brief Path resolution and credential file helpers
 */

#include <map>
#include <string>

namespace voice_os {

/**
 * Expands leading ~ to $HOME (getenv("HOME")). ~user not supported.
 * Returns path unchanged if path is empty or ~ expansion not applicable.
 */
std::string expand_path(const std::string& path);

/**
 * Parse a .env file into a key=value map. Strips surrounding quotes, an optional
 * leading "export ", and skips comments and empty lines. Missing file yields an empty map.
 */
std::map<std::string, std::string> parse_env_file(const std::string& path);

/**
 * Resolve a credential: the environment variable `name` wins, otherwise the
 * same key from `env_file`. Empty string when neither has it.
 */
std::string resolve_credential(const std::string& name, const std::string& env_file);

} // namespace voice_os
