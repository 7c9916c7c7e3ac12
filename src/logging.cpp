#include "logging.hpp"

#include <cctype>
#include <chrono>
#include <cstdio>
#include <ctime>
#include <map>
#include <syslog.h>

namespace Log {
    static Level _level = Level::Error;
    static bool _syslog = false;
    static std::string _ident = "dnscombine";
    static FILE* _output = stderr;

    inline int level2prio(Level level) {
        switch (level) {
            case Level::Info:       return LOG_INFO;
            case Level::Warning:    return LOG_WARNING;
            case Level::Verbose:    return LOG_NOTICE;
            case Level::Debug:      return LOG_DEBUG;
            default:                return LOG_ERR;
        }
    }

    inline const char* level2str(Level level) {
        switch (level) {
            case Level::Info:       return "INFO";
            case Level::Warning:    return "WARNING";
            case Level::Verbose:    return "VERBOSE";
            case Level::Debug:      return "DEBUG";
            default:                return "ERROR";
        }
    }

    void init(const std::string& id, const std::string& syslogFacility, Level lvl)
    {
        static const std::map<std::string, int> facilities = {
            { "LOCAL0", LOG_LOCAL0 }, { "LOCAL1", LOG_LOCAL1 },
            { "LOCAL2", LOG_LOCAL2 }, { "LOCAL3", LOG_LOCAL3 },
            { "LOCAL4", LOG_LOCAL4 }, { "LOCAL5", LOG_LOCAL5 },
            { "LOCAL6", LOG_LOCAL6 }, { "LOCAL7", LOG_LOCAL7 },
            { "USER",   LOG_USER   }, { "SYSLOG", LOG_SYSLOG },
            { "DAEMON", LOG_DAEMON },
        };

        _level = lvl;
        if (id.empty() == false) {
            _ident = id;
        }

        if (syslogFacility.empty() == false) {
            int facility = LOG_LOCAL0;
            auto it = facilities.find(syslogFacility);
            if (it != facilities.end()) {
                facility = it->second;
            }
            // openlog() keeps the pointer, _ident must not change afterwards
            openlog(_ident.c_str(), LOG_CONS | LOG_PID, facility);
            _syslog = true;
        }
    };

    bool parseLevel(const std::string& name, Level& lvl)
    {
        std::string lower;
        for (auto c: name) {
            lower += static_cast<char>(std::tolower(static_cast<unsigned char>(c)));
        }

        if      (lower == "debug")   { lvl = Level::Debug; }
        else if (lower == "verbose") { lvl = Level::Verbose; }
        else if (lower == "info")    { lvl = Level::Info; }
        else if (lower == "warning") { lvl = Level::Warning; }
        else if (lower == "warn")    { lvl = Level::Warning; }
        else if (lower == "error")   { lvl = Level::Error; }
        else { return false; }
        return true;
    }

    Level getLogLevel()
    {
        return _level;
    }

    void setLogLevel(Level lvl)
    {
        _level = lvl;
    }

    void setOutput(FILE* out)
    {
        _output = (out != nullptr) ? out : stderr;
    }

    void write(Level lvl, std::ostringstream &msg)
    {
        if (lvl < _level) {
            return;
        }

        if (_syslog == true) {
            syslog(level2prio(lvl), "%s", msg.str().c_str());
            return;
        }

        // Library users print their results on stdout, keep it clean
        const auto now = std::chrono::system_clock::now();
        auto millis = std::chrono::duration_cast<std::chrono::milliseconds>(now.time_since_epoch()).count() % 1000;
        const std::time_t now_t = std::chrono::system_clock::to_time_t(now);
        struct tm timeinfo;
        localtime_r(&now_t, &timeinfo);
        char buffer[64] = {0};
        strftime(buffer, sizeof(buffer) - 1, "%Y-%m-%d %H:%M:%S", &timeinfo);
        fprintf(_output, "%s.%03d %s %s: %s\n", buffer, static_cast<int>(millis), _ident.c_str(), level2str(lvl), msg.str().c_str());
    }

};
