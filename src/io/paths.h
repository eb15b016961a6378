// src/io/paths.h
#ifndef KERMIT_PATHS_H
#define KERMIT_PATHS_H

#include <string>

namespace kermit {

/**
 * Expand a leading "~" (from $HOME) and any $VAR or ${VAR} references.
 * Unset variables are left as written.
 */
std::string expand_path(const std::string& path);

/// Create the parent directory of path if it is missing
bool ensure_parent_directory(const std::string& path);

} // namespace kermit

#endif
