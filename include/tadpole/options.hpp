#pragma once
#include <cstddef>
#include <string>

namespace Tadpole {

size_t default_threads();

struct EngineConfig {
    size_t hashMB = 64;
    size_t threads = default_threads();
    int maxDepth = 7;
    int aspirationDelta = 100;
};

// Applies one "setoption" pair, names are case insensitive. Returns false
// for an option the engine does not know. A malformed value throws
// std::invalid_argument, an out of range one std::out_of_range.
bool set_option(EngineConfig& config, const std::string& name, const std::string& value);

}
