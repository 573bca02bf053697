#pragma once
#include <iostream>
#include <sstream>
#include <string>

namespace Tadpole {

std::string engine_info(bool toUci = false);

// Whole lines written between IO_LOCK and IO_UNLOCK never interleave
enum SyncCout { IO_LOCK, IO_UNLOCK };
std::ostream& operator<<(std::ostream& os, SyncCout sc);

#define sync_cout std::cout << Tadpole::IO_LOCK
#define sync_endl std::endl << Tadpole::IO_UNLOCK

// Debug log file. Every call is a no-op until start() has opened a file.
namespace Log {

void start(const std::string& path);
void stop();
bool enabled();
void write(const char* level, const std::string& message);

template<typename... Args>
void debug(const Args&... args) {
    if (!enabled())
        return;
    std::ostringstream ss;
    (ss << ... << args);
    write("debug", ss.str());
}

template<typename... Args>
void info(const Args&... args) {
    if (!enabled())
        return;
    std::ostringstream ss;
    (ss << ... << args);
    write("info", ss.str());
}

template<typename... Args>
void error(const Args&... args) {
    if (!enabled())
        return;
    std::ostringstream ss;
    (ss << ... << args);
    write("error", ss.str());
}

}

}
