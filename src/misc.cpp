#include "tadpole/misc.hpp"
#include <atomic>
#include <chrono>
#include <fstream>
#include <iomanip>
#include <mutex>
#include <stdexcept>

namespace Tadpole {

namespace {

const char* Version = "1.0";

std::mutex ioMutex;

std::mutex logMutex;
std::ofstream logFile;
std::atomic<bool> logOpen{false};

}

std::string engine_info(bool toUci) {
    std::ostringstream ss;
    ss << "Tadpole " << Version;
    if (toUci)
        ss << "\nid author the Tadpole developers";
    return ss.str();
}

std::ostream& operator<<(std::ostream& os, SyncCout sc) {
    if (sc == IO_LOCK)
        ioMutex.lock();

    if (sc == IO_UNLOCK)
        ioMutex.unlock();

    return os;
}

namespace Log {

void start(const std::string& path) {
    std::lock_guard lock(logMutex);
    if (logFile.is_open())
        logFile.close();
    logOpen = false;

    logFile.open(path, std::ios::out | std::ios::app);
    if (!logFile.is_open())
        throw std::runtime_error("unable to open log file " + path);
    logOpen = true;
}

void stop() {
    std::lock_guard lock(logMutex);
    logOpen = false;
    if (logFile.is_open())
        logFile.close();
}

bool enabled() {
    return logOpen.load(std::memory_order_relaxed);
}

void write(const char* level, const std::string& message) {
    const auto now = std::chrono::duration_cast<std::chrono::milliseconds>(
                         std::chrono::steady_clock::now().time_since_epoch()).count();

    std::lock_guard lock(logMutex);
    if (!logFile.is_open())
        return;
    logFile << std::setw(12) << now << " [" << level << "] " << message << std::endl;
}

}

}
