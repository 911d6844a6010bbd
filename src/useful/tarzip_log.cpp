/******************************************************************************\
 * tarzip_log.cpp - Functions used to create log files.
 *
 * Copyright 2024 Hewlett Packard Enterprise Development LP.
 * SPDX-License-Identifier: Linux-OpenIB
 ******************************************************************************/

#include "tarzip_defs.h"

#include <errno.h>
#include <stdarg.h>
#include <stdio.h>
#include <stdlib.h>
#include <string.h>
#include <sys/time.h>
#include <time.h>
#include <unistd.h>

#include <mutex>
#include <optional>
#include <string>

#include "useful/tarzip_log.h"
#include "useful/tarzip_wrappers.hpp"

tarzip_log_t*
_tarzip_create_log(char const* directory, char const* filename, int suffix)
{
    if (filename == nullptr) {
        return nullptr;
    }

    // fall back to the default log directory
    if (directory == nullptr) {
        directory = TARZIP_DEFAULT_LOG_DIR;
    }

    char logfile[PATH_MAX];
    if (snprintf(logfile, sizeof(logfile), "%s/%s.%d.log", directory, filename, suffix) >= (int)sizeof(logfile)) {
        fprintf(stderr, "tarzip: log path too long in %s\n", directory);
        return nullptr;
    }

    // open for appending so that reruns with the same suffix are not lost
    auto const fp = fopen(logfile, "a");
    if (fp == nullptr) {
        fprintf(stderr, "tarzip: failed to open log file %s: %s\n", logfile, strerror(errno));
        return nullptr;
    }

    // lines are flushed as they are written so that the log survives a crash
    setvbuf(fp, nullptr, _IOLBF, 0);

    return fp;
}

int
_tarzip_close_log(tarzip_log_t* log_file)
{
    if (log_file == nullptr) {
        return 0;
    }

    _tarzip_write_log(log_file, "log closed\n");
    return fclose(log_file);
}

int
_tarzip_write_log(tarzip_log_t* log_file, const char* fmt, ...)
{
    if (log_file == nullptr) {
        return 0;
    }

    struct timeval tv;
    gettimeofday(&tv, nullptr);
    struct tm tm;
    localtime_r(&tv.tv_sec, &tm);

    char stamp[32];
    strftime(stamp, sizeof(stamp), "%Y-%m-%d %H:%M:%S", &tm);

    // hold the stream lock so lines from worker threads do not interleave
    flockfile(log_file);

    int rc = fprintf(log_file, "[%s.%03ld] ", stamp, (long)(tv.tv_usec / 1000));
    if (rc >= 0) {
        va_list vargs;
        va_start(vargs, fmt);
        rc = vfprintf(log_file, fmt, vargs);
        va_end(vargs);
    }

    funlockfile(log_file);

    return (rc < 0) ? -1 : 0;
}

namespace tarzip {

static std::once_flag s_loggerOnce;
static std::optional<Logger> s_logger;

static void
initLogger(bool enable)
{
    // debug logging can be requested from the environment as well
    enable = enable || (::getenv(TARZIP_DBG_ENV_VAR) != nullptr);
    if (enable) {
        auto const logDir = getenvOrDefault(TARZIP_LOG_DIR_ENV_VAR, TARZIP_DEFAULT_LOG_DIR);

        // Check directory permissions
        if (dirHasPerms(logDir, R_OK | W_OK | X_OK)) {
            s_logger.emplace(true, std::string{logDir}, TARZIP_LOG_NAME, getpid());
            return;
        }

        fprintf(stderr, "tarzip: log directory %s is not accessible, logging disabled\n", logDir);
    }

    // Logging disabled
    s_logger.emplace(false, "", "", 0);
}

void
configureLogger(bool enable)
{
    std::call_once(s_loggerOnce, initLogger, enable);
}

Logger&
getLogger()
{
    std::call_once(s_loggerOnce, initLogger, false);
    return *s_logger;
}

} /* namespace tarzip */
