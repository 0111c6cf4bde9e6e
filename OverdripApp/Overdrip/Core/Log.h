#pragma once
#include <string>

namespace od {

    enum class LogLevel { Debug = 0, Info, Warn, Error };

    struct ILogSink {
        virtual ~ILogSink() = default;
        virtual void debug(const std::string& m) = 0;
        virtual void info(const std::string& m) = 0;
        virtual void warn(const std::string& m) = 0;
        virtual void error(const std::string& m) = 0;
    };

    struct NullLogSink : ILogSink {
        void debug(const std::string&) override {}
        void info(const std::string&) override {}
        void warn(const std::string&) override {}
        void error(const std::string&) override {}
    };

    namespace Log {
        ILogSink* SetSink(ILogSink* s);   // devuelve el anterior
        void SetLevel(LogLevel level);
        LogLevel Level();
        bool Enabled(LogLevel level);

        void Debug(const std::string& m);
        void Info(const std::string& m);
        void Warn(const std::string& m);
        void Error(const std::string& m);

        // "debug", "info", "warn", "error" (sin distinguir mayúsculas); si no reconoce, Info
        LogLevel ParseLevel(const std::string& s);
    }

}
