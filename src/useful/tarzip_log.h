/******************************************************************************\
 * tarzip_log.h - Header file for the log interface.
 *
 * Copyright 2024 Hewlett Packard Enterprise Development LP.
 * SPDX-License-Identifier: Linux-OpenIB
 ******************************************************************************/

#ifndef _TARZIP_LOG_H
#define _TARZIP_LOG_H

#include <stdarg.h>
#include <stdio.h>

#ifdef __cplusplus
extern "C" {
#endif

typedef FILE tarzip_log_t;

// if logging is enabled,
// create a new logfile in directory with format <filename>.<suffix>.log
// otherwise, returns NULL tarzip_log_t that can be passed to logging functions with no effect
tarzip_log_t* _tarzip_create_log(char const *directory, char const* filename, int suffix);

// finalize log and close its file (if nonnull)
int _tarzip_close_log(tarzip_log_t* log_file);

// write the given formatted string to the log file (if nonnull)
int _tarzip_write_log(tarzip_log_t* log_file, const char *fmt, ...);

#ifdef __cplusplus
}

#include <string>
#include <memory>
#include <utility>

namespace tarzip {

class Logger
{
private: // types
    using LogPtr = std::unique_ptr<tarzip_log_t, int(*)(tarzip_log_t*)>;

private: // variables
    LogPtr logFile;

public: // interface
    Logger(bool enable, std::string const& directory, std::string const& filename, int suffix) : logFile{nullptr, _tarzip_close_log}
    {
        // determine if logging mode is enabled
        if (enable) {
            char const *dir = nullptr;
            if (!directory.empty()) {
                dir = directory.c_str();
            }
            logFile = LogPtr{_tarzip_create_log(dir, filename.c_str(), suffix), _tarzip_close_log};
        }
    }

    bool enabled() const { return logFile != nullptr; }

    template <typename... Args>
    void write(char const* fmt, Args&&... args)
    {
        if (logFile) {
            _tarzip_write_log(logFile.get(), fmt, std::forward<Args>(args)...);
        }
    }
};

// process-wide logger. configured once by the first call to configureLogger,
// or disabled if getLogger is called first
void configureLogger(bool enable);
Logger& getLogger();

} /* namespace tarzip */

#endif /* __cplusplus */

#endif /* _TARZIP_LOG_H */
