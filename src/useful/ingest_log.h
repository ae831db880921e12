/******************************************************************************\
 * ingest_log.h - Header file for the log interface.
 *
 * Copyright 2011-2023 Hewlett Packard Enterprise Development LP.
 * SPDX-License-Identifier: Linux-OpenIB
 ******************************************************************************/

#ifndef _INGEST_LOG_H
#define _INGEST_LOG_H

#include <stdarg.h>
#include <stdio.h>

#ifdef __cplusplus
extern "C" {
#endif

typedef FILE ingest_log_t;

// if logging is enabled,
// create a new logfile in directory with format dbglog_<filename>.<suffix>.log
// otherwise, returns NULL ingest_log_t that can be passed to logging functions with no effect
ingest_log_t* _ingest_create_log(char const *directory, char const* filename, int suffix);

// finalize log and close its file (if nonnull)
int _ingest_close_log(ingest_log_t* log_file);

// write the given formatted string to the log file (if nonnull)
int _ingest_write_log(ingest_log_t* log_file, const char *fmt, ...);

#ifdef __cplusplus
}

#include <string>
#include <memory>

namespace ingest {

class Logger
{
private: // types
    using LogPtr = std::unique_ptr<ingest_log_t, int(*)(ingest_log_t*)>;

private: // variables
    LogPtr logFile;
    std::string m_path;

public: // interface
    Logger(bool enable, std::string const& directory, std::string const& filename, int suffix) : logFile{nullptr, _ingest_close_log}
    {
        // determine if logging mode is enabled
        if (enable) {
            char const *dir = nullptr;
            if (!directory.empty()) {
                dir = directory.c_str();
            }
            logFile = LogPtr{_ingest_create_log(dir, filename.c_str(), suffix), _ingest_close_log};
            if (logFile) {
                m_path = (dir ? std::string{dir} : std::string{"/tmp"})
                    + "/dbglog_" + filename + "." + std::to_string(suffix) + ".log";
            }
        }
    }

    template <typename... Args>
    void write(char const* fmt, Args&&... args)
    {
        if (logFile) {
            _ingest_write_log(logFile.get(), fmt, std::forward<Args>(args)...);
        }
    }

    bool enabled() const { return logFile != nullptr; }
    std::string const& path() const { return m_path; }
};

// logger configured from INGEST_DEBUG and INGEST_LOG_DIR. never throws for a bad
// log directory, the returned logger is disabled instead
std::unique_ptr<Logger> makeLogger(std::string const& filename, int suffix);

// process-wide logger. enabled by INGEST_DEBUG, written to INGEST_LOG_DIR or the temp root
Logger& getLogger();

} /* namespace ingest */

#endif /* __cplusplus */

#endif /* _INGEST_LOG_H */
