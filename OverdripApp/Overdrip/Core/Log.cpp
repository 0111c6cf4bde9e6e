#include "Log.h"
#include <algorithm>
#include <atomic>
#include <cctype>

namespace od {

    static ILogSink* g_sink = nullptr;
    static std::atomic<LogLevel> g_level{ LogLevel::Info };

    ILogSink* Log::SetSink(ILogSink* s) { auto* old = g_sink; g_sink = s; return old; }
    void Log::SetLevel(LogLevel level) { g_level = level; }
    LogLevel Log::Level() { return g_level.load(); }
    bool Log::Enabled(LogLevel level) { return g_sink && level >= g_level.load(); }

    void Log::Debug(const std::string& m) { if (Enabled(LogLevel::Debug)) g_sink->debug(m); }
    void Log::Info(const std::string& m) { if (Enabled(LogLevel::Info)) g_sink->info(m); }
    void Log::Warn(const std::string& m) { if (Enabled(LogLevel::Warn)) g_sink->warn(m); }
    void Log::Error(const std::string& m) { if (Enabled(LogLevel::Error)) g_sink->error(m); }

    LogLevel Log::ParseLevel(const std::string& s) {
        std::string v = s;
        std::transform(v.begin(), v.end(), v.begin(),
            [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
        if (v == "debug" || v == "trace") return LogLevel::Debug;
        if (v == "warn" || v == "warning") return LogLevel::Warn;
        if (v == "error") return LogLevel::Error;
        return LogLevel::Info;
    }

}
