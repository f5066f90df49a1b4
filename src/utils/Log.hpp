#pragma once
#include <atomic>
#include <iostream>
#include <mutex>
#include <sstream>
#include <string>

// Line-oriented console logging shared by every task thread.
class Log {
public:
    template <typename... Args>
    static void info(const Args&... args) {
        write(std::cout, "", args...);
    }

    template <typename... Args>
    static void warn(const Args&... args) {
        write(std::cerr, "warning: ", args...);
    }

    template <typename... Args>
    static void error(const Args&... args) {
        write(std::cerr, "error: ", args...);
    }

    // Only printed in verbose mode
    template <typename... Args>
    static void debug(const Args&... args) {
        if (verbose) {
            write(std::cout, "debug: ", args...);
        }
    }

    static void setVerbose(bool value) { verbose = value; }
    static bool isVerbose() { return verbose; }

private:
    template <typename... Args>
    static void write(std::ostream& out, const char* prefix, const Args&... args) {
        std::ostringstream ss;
        ss << prefix;
        (ss << ... << args);
        std::lock_guard<std::mutex> lock(output_mutex);
        out << ss.str() << std::endl;
    }

    static inline std::mutex output_mutex;
    static inline std::atomic<bool> verbose{false};
};
