/******************************************************************************\
 * ingest_log.cpp - Functions relating to creating and writing log files.
 *
 * Copyright 2011-2023 Hewlett Packard Enterprise Development LP.
 * SPDX-License-Identifier: Linux-OpenIB
 ******************************************************************************/

#include "ingest_defs.h"

#include <errno.h>
#include <limits.h>
#include <stdlib.h>
#include <string.h>
#include <time.h>
#include <unistd.h>

#include <string>

#include "useful/ingest_log.h"
#include "useful/ingest_wrappers.hpp"
#include "transfer/IngestError.hpp"
#include "transfer/TempDirectory.hpp"

ingest_log_t*
_ingest_create_log(char const* directory, char const* filename, int suffix)
{
    if (filename == nullptr) {
        return nullptr;
    }

    // fall back to /tmp if no directory was given
    auto const logDir = std::string{(directory != nullptr) ? directory : "/tmp"};
    if (!ingest::dirHasPerms(logDir.c_str(), R_OK | W_OK | X_OK)) {
        return nullptr;
    }

    auto const logPath = logDir + "/dbglog_" + filename + "." + std::to_string(suffix) + ".log";
    auto logFile = fopen(logPath.c_str(), "a");
    if (logFile == nullptr) {
        fprintf(stderr, "warning: could not open log file %s: %s\n", logPath.c_str(), strerror(errno));
        return nullptr;
    }

    // write the log header
    char hostname[HOST_NAME_MAX + 1] = {};
    if (::gethostname(hostname, HOST_NAME_MAX) < 0) {
        strncpy(hostname, "unknown", HOST_NAME_MAX);
    }
    fprintf(logFile, "%s:%d log started\n", hostname, suffix);
    fflush(logFile);

    return logFile;
}

int
_ingest_close_log(ingest_log_t* log_file)
{
    if (log_file == nullptr) {
        return 0;
    }

    return fclose(log_file);
}

int
_ingest_write_log(ingest_log_t* log_file, const char* fmt, ...)
{
    if (log_file == nullptr) {
        return 0;
    }

    // prefix each entry with a timestamp
    struct timespec ts;
    clock_gettime(CLOCK_REALTIME, &ts);
    fprintf(log_file, "[%ld.%06ld] ", (long)ts.tv_sec, (long)(ts.tv_nsec / 1000));

    va_list ap;
    va_start(ap, fmt);
    auto const rc = vfprintf(log_file, fmt, ap);
    va_end(ap);

    fflush(log_file);
    return (rc < 0) ? 1 : 0;
}

namespace ingest {

// an unusable log directory disables the log rather than failing the caller
static std::string
findLogDir()
{
    if (char const* env_var = ::getenv(INGEST_LOG_DIR_ENV_VAR)) {
        if (!dirHasPerms(env_var, R_OK | W_OK | X_OK)) {
            fprintf(stderr, "warning: bad directory specified by environment variable %s, "
                "debug log disabled\n", INGEST_LOG_DIR_ENV_VAR);
            return std::string{};
        }
        return std::string{env_var};
    }

    try {
        return defaultTempRoot();
    } catch (LocalIOError const& ex) {
        fprintf(stderr, "warning: %s, debug log disabled\n", ex.what());
        return std::string{};
    }
}

std::unique_ptr<Logger>
makeLogger(std::string const& filename, int suffix)
{
    if (::getenv(INGEST_DBG_ENV_VAR) == nullptr) {
        return std::make_unique<Logger>(false, std::string{}, filename, suffix);
    }

    auto const logDir = findLogDir();
    return std::make_unique<Logger>(!logDir.empty(), logDir, filename, suffix);
}

Logger&
getLogger()
{
    // logger is created on first use and lives until process exit
    static auto logger = makeLogger(INGEST_LOG_NAME, ::getpid());

    return *logger;
}

} /* namespace ingest */
