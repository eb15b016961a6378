// src/common/spawn.h
#ifndef KERMIT_SPAWN_H
#define KERMIT_SPAWN_H

#include <string>
#include <vector>

namespace kermit {

/**
 * Start argv[0] (searched on PATH) and return without waiting.
 * The child is reaped by a detached thread so no zombie is left behind.
 * Returns false if the process could not be started.
 */
bool spawn_detached(const std::vector<std::string>& argv);

} // namespace kermit

#endif
