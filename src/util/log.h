/*
 * SPDX-License-Identifier: AGPL-3.0-or-later
 *
 * The Lucenia project is free software: you can redistribute it
 * and/or modify it under the terms of the GNU Affero General
 * Public License as published by the Free Software Foundation,
 * either version 3 of the License, or (at your option) any later
 * version.
 *
 * This program is distributed in the hope that it will be useful,
 * but WITHOUT ANY WARRANTY; without even the implied warranty of
 * MERCHANTABILITY or FITNESS FOR A PARTICULAR PURPOSE. See the
 * GNU Affero General Public License for more details.
 *
 * You should have received a copy of the GNU Affero General Public
 * License along with this program. If not, see:
 * https://www.gnu.org/licenses/agpl-3.0.html
 */

#pragma once

#include "../pch.h"
#include <boost/optional.hpp>
#include "../config.h"
#include <cctype>
#include <cstdlib>
#include <algorithm>
#include <atomic>

namespace arbor {

    enum LogLevel {
        LOG_TRACE,    // Support engineering: detailed tracing
        LOG_DEBUG,    // Developer: debug information
        LOG_INFO,     // Production: normal operation
        LOG_WARNING,  // Production: warning conditions
        LOG_ERROR,    // Production: error conditions
        LOG_SEVERE    // Production: fatal errors
    };

    const char* logLevelToString( LogLevel l );

    class Logger {
        static boost::mutex sm;
        stringstream ss;
        int indent;
        LogLevel logLevel;
        static FILE* logfile;
        string _threadName;
    public:

        /**
         * set the log file, nullptr restores stderr
         */
        static void setLogFile(FILE* f);

        void flush();

        /**
         * converts time_t to a string
         */
        static string time_t_to_String(time_t t = time(0)) {
            char buf[26];
            ctime_r(&t, buf);
            buf[24] = 0; // don't want the \n
            return buf;
        }

        inline string getThreadName() { return _threadName; }
        inline void setThreadName(const string& name) { _threadName = name; }

        /**
         * set the log level
         */
        inline Logger& setLogLevel(LogLevel l) {
            logLevel = l;
            return *this;
        }

        Logger& operator<<(const char *x) { ss << x; return *this; }
        Logger& operator<<(const string& x) { ss << x; return *this; }
        Logger& operator<<(char x)        { ss << x; return *this; }
        Logger& operator<<(int x)         { ss << x; return *this; }
        Logger& operator<<(long x)          { ss << x; return *this; }
        Logger& operator<<(unsigned long x) { ss << x; return *this; }
        Logger& operator<<(unsigned x)      { ss << x; return *this; }
        Logger& operator<<(double x)        { ss << x; return *this; }
        Logger& operator<<(const void *x)   { ss << x; return *this; }
        Logger& operator<<(long long x)     { ss << x; return *this; }
        Logger& operator<<(unsigned long long x) { ss << x; return *this; }
        Logger& operator<<(bool x)               { ss << x; return *this; }

        Logger& operator<< (ostream& ( *_endl )(ostream&)) {
            ss << '\n';
            flush();
            return *this;
        }

        void indentInc(){ indent++; }
        void indentDec(){ indent--; }
        int getIndent() const { return indent; }

    private:
        static boost::thread_specific_ptr<Logger> tsp;
        Logger() : _threadName(config::logging::kThreadName) {
            indent = 0;
            _init();
        }
        void _init() {
            ss.str("");
            logLevel = LOG_INFO;
        }
    public:
        static Logger& get() {
            Logger *p = tsp.get();
            if( p == 0 )
                tsp.reset( p = new Logger() );
            return *p;
        }
    };

    extern std::atomic<int> logLevel;

    // Auto-flushing wrapper for log messages
    class LoggerWrapper {
        Logger* logger_;
        bool should_flush_;
    public:
        __attribute__((always_inline))
        LoggerWrapper(Logger* logger, bool should_flush)
            : logger_(logger), should_flush_(should_flush) {}

        ~LoggerWrapper() {
            // Only do work if we have a logger (filtered messages have nullptr)
            if (should_flush_ && logger_) {
                (*logger_) << '\n';
                logger_->flush();
            }
        }

        template<typename T>
        __attribute__((always_inline))
        LoggerWrapper& operator<<(const T& value) {
            // Short-circuit for filtered messages
            if (logger_) {
                (*logger_) << value;
            }
            return *this;
        }

        LoggerWrapper& operator<<(ostream& (*endl)(ostream&)) {
            if (logger_) {
                (*logger_) << endl;
                should_flush_ = false; // endl already flushes
            }
            return *this;
        }
    };

    inline LoggerWrapper log( LogLevel l ) {
        if ( l < logLevel.load(std::memory_order_relaxed) )  // LogLevel enum: lower value = more verbose
            return LoggerWrapper(nullptr, false);   // Return no-op wrapper
        Logger& logger = Logger::get().setLogLevel( l );
        return LoggerWrapper(&logger, true);  // Auto-flush on destruction
    }

    inline string errnoWithDescription(int x = errno) {
        stringstream s;
        s << "errno:" << x << ' ' << strerror(x);
        return s.str();
    }

    struct LogIndentLevel {
        LogIndentLevel() {
            Logger::get().indentInc();
        }
        ~LogIndentLevel() {
            Logger::get().indentDec();
        }
    };

    // Helper functions for specific log levels
    // These return lightweight wrappers that compiler can optimize away
    __attribute__((always_inline))
    inline LoggerWrapper trace() {
        return log(LOG_TRACE);
    }

    __attribute__((always_inline))
    inline LoggerWrapper debug() {
        return log(LOG_DEBUG);
    }

    __attribute__((always_inline))
    inline LoggerWrapper info() {
        return log(LOG_INFO);
    }

    __attribute__((always_inline))
    inline LoggerWrapper warning() {
        return log(LOG_WARNING);
    }

    __attribute__((always_inline))
    inline LoggerWrapper error() {
        return log(LOG_ERROR);
    }

    __attribute__((always_inline))
    inline LoggerWrapper severe() {
        return log(LOG_SEVERE);
    }

    // Parse a level name (case-insensitive); WARN and FATAL are accepted aliases
    inline boost::optional<LogLevel> parseLogLevel(const std::string& level) {
        std::string upper = level;
        for (auto& c : upper) c = static_cast<char>(std::toupper(static_cast<unsigned char>(c)));

        if (upper == "TRACE")   return LOG_TRACE;
        if (upper == "DEBUG")   return LOG_DEBUG;
        if (upper == "INFO")    return LOG_INFO;
        if (upper == "WARNING" || upper == "WARN") return LOG_WARNING;
        if (upper == "ERROR")   return LOG_ERROR;
        if (upper == "SEVERE" || upper == "FATAL") return LOG_SEVERE;

        return boost::none;
    }

    // Set log level from string (for configuration)
    inline bool setLogLevelFromString(const std::string& level) {
        boost::optional<LogLevel> parsed = parseLogLevel(level);
        if (!parsed) {
            return false;
        }
        logLevel.store(*parsed, std::memory_order_relaxed);
        return true;
    }

}
