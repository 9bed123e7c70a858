#pragma once
#include <deque>
#include <vector>
#include <string>
#include <mutex>

namespace prism {
class Console {
public:
    enum class Level {
        Debug,
        Info,
        Warning,
        Error
    };

    struct LogEntry {
        std::string message;
        Level level{Level::Info};
        float relativeTime{0.0f};
        std::string category;
        std::string timeStr;
    };

    ~Console() = default;

    // Thread-safe logging methods
    void log(const std::string& message);
    void logWarning(const std::string& message);
    void logError(const std::string& message);
    void logDebug(const std::string& message);
    void clear();

    // Debug entries are dropped unless verbose
    void setVerbose(bool enable);
    bool isVerbose() const;

    // Mirror entries to stderr (on by default)
    void setEcho(bool enable);

    std::vector<LogEntry> getEntries() const;
    size_t getEntryCount() const;

    // Singleton access
    static Console& get() {
        static Console instance;
        return instance;
    }

private:
    Console();

    static constexpr size_t kMaxEntries = 2000;

    std::deque<LogEntry> entries;
    bool verbose{false};
    bool echo{true};
    mutable std::mutex mutex;  // For thread-safe logging

    void addEntry(const std::string& message, Level level, const std::string& category = "Info");
    std::string formatTimestamp(float relativeTime) const;
};

// Global logging functions
#define PRISM_LOG(msg) prism::Console::get().log(msg)
#define PRISM_LOG_INFO(msg) prism::Console::get().log(msg)
#define PRISM_LOG_WARNING(msg) prism::Console::get().logWarning(msg)
#define PRISM_LOG_ERROR(msg) prism::Console::get().logError(msg)
#define PRISM_LOG_DEBUG(msg) prism::Console::get().logDebug(msg)
}
