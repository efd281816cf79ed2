#pragma once

/**
 * @file path_utils.h
 * @brief Path resolution: ~ expansion and model defaults
 */

#include <string>

namespace parley {

/**
 * Expands leading ~ to $HOME (getenv("HOME")). ~user not supported.
 * Returns path unchanged if path is empty or ~ expansion not applicable.
 */
std::string expand_path(const std::string& path);

/**
 * Returns the first existing whisper model among the usual install
 * locations (~/models/whisper, /usr/local/share/whisper, /usr/share/whisper),
 * or an empty string when none is found.
 */
std::string default_whisper_model_path();

} // namespace parley
