#pragma once
#include "Core/Log.h"
#include <iostream>
#include <mutex>

namespace od {

    // stdout queda libre para la salida del comando (URL de login, config show)
    struct ConsoleLogSink : ILogSink {
        void debug(const std::string& m) override { write("[DBG ] ", m); }
        void info(const std::string& m) override { write("[INFO] ", m); }
        void warn(const std::string& m) override { write("[WARN] ", m); }
        void error(const std::string& m) override { write("[ERR ] ", m); }

    private:
        void write(const char* tag, const std::string& m) {
            std::lock_guard<std::mutex> lock(m_Mutex);
            std::cerr << tag << m << '\n';
        }
        std::mutex m_Mutex;
    };

}
