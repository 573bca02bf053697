#include "tadpole/options.hpp"
#include <algorithm>
#include <cctype>
#include <stdexcept>
#include <thread>

namespace Tadpole {

namespace {

std::string lowercase(std::string s) {
    std::transform(s.begin(), s.end(), s.begin(), [](unsigned char c) { return char(std::tolower(c)); });
    return s;
}

long parse_spin(const std::string& name, const std::string& value, long min, long max) {
    size_t used = 0;
    const long v = std::stol(value, &used);
    if (used != value.size())
        throw std::invalid_argument("option " + name + " expects an integer, got " + value);
    if (v < min || v > max)
        throw std::out_of_range("option " + name + " must be in [" + std::to_string(min)
                                + ", " + std::to_string(max) + "], got " + value);
    return v;
}

}

size_t default_threads() {
    return std::max(1u, std::thread::hardware_concurrency());
}

bool set_option(EngineConfig& config, const std::string& name, const std::string& value) {
    const std::string key = lowercase(name);

    if (key == "hash")
        config.hashMB = size_t(parse_spin(name, value, 1, 4096));
    else if (key == "threads")
        config.threads = size_t(parse_spin(name, value, 1, 256));
    else if (key == "depth")
        config.maxDepth = int(parse_spin(name, value, 1, 32));
    else if (key == "aspirationwindow")
        config.aspirationDelta = int(parse_spin(name, value, 1, 10000));
    else
        return false;

    return true;
}

}
