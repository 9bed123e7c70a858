#include "console.hpp"
#include <cmath>
#include <chrono>
#include <ctime>
#include <iomanip>
#include <iostream>
#include <sstream>

namespace prism {
Console::Console() = default;

void Console::log(const std::string& message) {
    addEntry(message, Level::Info);
}

void Console::logWarning(const std::string& message) {
    addEntry(message, Level::Warning, "Warning");
}

void Console::logError(const std::string& message) {
    addEntry(message, Level::Error, "Error");
}

void Console::logDebug(const std::string& message) {
    {
        std::lock_guard<std::mutex> lock(mutex);
        if (!verbose) return;
    }
    addEntry(message, Level::Debug, "Debug");
}

void Console::clear() {
    std::lock_guard<std::mutex> lock(mutex);
    entries.clear();
}

void Console::setVerbose(bool enable) {
    std::lock_guard<std::mutex> lock(mutex);
    verbose = enable;
}

bool Console::isVerbose() const {
    std::lock_guard<std::mutex> lock(mutex);
    return verbose;
}

void Console::setEcho(bool enable) {
    std::lock_guard<std::mutex> lock(mutex);
    echo = enable;
}

std::vector<Console::LogEntry> Console::getEntries() const {
    std::lock_guard<std::mutex> lock(mutex);
    return std::vector<LogEntry>(entries.begin(), entries.end());
}

size_t Console::getEntryCount() const {
    std::lock_guard<std::mutex> lock(mutex);
    return entries.size();
}

void Console::addEntry(const std::string& message, Level level,
                       const std::string& category) {
    static auto startTime = std::chrono::high_resolution_clock::now();
    auto now = std::chrono::high_resolution_clock::now();
    float relativeTime = std::chrono::duration<float>(now - startTime).count();

    std::string timeStr = formatTimestamp(relativeTime);

    std::lock_guard<std::mutex> lock(mutex);
    if (echo) {
        std::cerr << "[" << timeStr << "] [" << category << "] " << message << std::endl;
    }

    entries.push_back({message, level, relativeTime, category, timeStr});
    if (entries.size() > kMaxEntries) {
        entries.pop_front();
    }
}

std::string Console::formatTimestamp(float relativeTime) const {
    auto timeT = std::chrono::system_clock::to_time_t(std::chrono::system_clock::now());
    std::tm timeInfo{};
    localtime_r(&timeT, &timeInfo);

    char buffer[32];
    std::strftime(buffer, sizeof(buffer), "%H:%M:%S", &timeInfo);

    std::stringstream ss;
    ss << buffer << "." << std::setfill('0') << std::setw(3)
       << static_cast<int>((relativeTime - std::floor(relativeTime)) * 1000);
    return ss.str();
}


}
