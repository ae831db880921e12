/******************************************************************************\
 * ingest_wrappers.hpp - A header file for utility wrappers. This is for helper
 *                       wrappers to C-style allocation and error handling routines.
 *
 * Copyright 2019-2023 Hewlett Packard Enterprise Development LP.
 * SPDX-License-Identifier: Linux-OpenIB
 ******************************************************************************/
#pragma once

#include "ingest_defs.h"

#include <cerrno>
#include <cstdlib>
#include <cstring>
#include <memory>
#include <stdexcept>
#include <string>
#include <type_traits>
#include <utility>
#include <vector>

#include <sys/types.h>
#include <sys/stat.h>
#include <pwd.h>

#include <fcntl.h>
#include <libgen.h>
#include <unistd.h>

namespace ingest {

// there is an std::make_unique<T> which constructs a unique_ptr of type T from its arguments.
// however, there is no equivalent that accepts a custom destructor function. normally, one would
// have to explicitly provide the types of T and its destructor function:
//     std::unique_ptr<T, decltype(&destructor)>{new T{}, destructor}
// this is a helper function to perform this deduction:
//     take_pointer_ownership(new T{}, destructor)
// for example:
//     auto const cstr = take_pointer_ownership(strdup(...), std::free);
template <typename T, typename Destr>
inline static auto
take_pointer_ownership(T*&& expiring, Destr&& destructor) -> std::unique_ptr<T, decltype(&destructor)>
{
    // type of Destr&& is deduced at the same time as Destr -> universal reference
    static_assert(!std::is_rvalue_reference<decltype(destructor)>::value);

    // type of T is deduced from T* first, then parameter as T*&& -> rvalue reference
    static_assert(std::is_rvalue_reference<decltype(expiring)>::value);

    return std::unique_ptr<T, decltype(&destructor)>
    { std::move(expiring) // then we take ownership of the expiring raw pointer
    , destructor          // and merely capture a reference to the destructor
    };
}

// Return value of environment variable, or default string if unset
inline static std::string getenvOrDefault(char const* env_var, std::string const& default_value)
{
    if (char const* env_value = ::getenv(env_var)) {
        return env_value;
    }
    return default_value;
}

/* cstring wrappers */
namespace cstr {
    // lifted mkdtemp
    static inline std::string mkdtemp(std::string const& pathTemplate) {
        auto rawPathTemplate = take_pointer_ownership(strdup(pathTemplate.c_str()), std::free);
        if (::mkdtemp(rawPathTemplate.get())) {
            return std::string(rawPathTemplate.get());
        } else {
            throw std::runtime_error("mkdtemp failed on " + pathTemplate + ": " + strerror(errno));
        }
    }

    // lifted basename
    static inline std::string basename(std::string const& path) {
        auto rawPath = take_pointer_ownership(strdup(path.c_str()), std::free);
        if (auto const baseName = ::basename(rawPath.get())) {
            return std::string(baseName);
        } else {
            throw std::runtime_error("basename failed on " + path);
        }
    }

    // lifted dirname
    static inline std::string dirname(std::string const& path) {
        auto rawPath = take_pointer_ownership(strdup(path.c_str()), std::free);
        if (auto const dirName = ::dirname(rawPath.get())) {
            return std::string(dirName);
        } else {
            throw std::runtime_error("dirname failed on " + path);
        }
    }
} /* namespace ingest::cstr */

/*
** Class to manage c style file descriptors. Ensures closure on destruction.
*/
class fd_handle {
private:
    int m_fd;
public:
    // Default constructor
    fd_handle()
    : m_fd{-1}
    { }
    // Default constructor with fd
    fd_handle(int fd)
    : m_fd{fd}
    {
        if (fd < 0) { throw std::runtime_error("File descriptor creation failed: " + std::string{strerror(errno)}); }
    }
    // Delete copy constructor
    fd_handle(const fd_handle&) = delete;
    fd_handle& operator=(const fd_handle&) = delete;
    // Move constructor
    fd_handle(fd_handle&& old)
    {
        m_fd = old.m_fd;
        old.m_fd = -1;
    }
    fd_handle& operator=(fd_handle&& other)
    {
        if (m_fd >= 0) close(m_fd);
        m_fd = other.m_fd;
        other.m_fd = -1;
        return *this;
    }
    // custom destructor
    ~fd_handle()
    {
        if (m_fd >= 0 ) close(m_fd);
    }
    // getter
    int fd() const { return m_fd; }
};

// write the entire buffer to fd, retrying on short writes
static inline void
writeLoop(int const fd, char const* buf, size_t len)
{
    while (len > 0) {
        auto const written = ::write(fd, buf, len);
        if (written < 0) {
            if (errno == EINTR) {
                continue;
            }
            throw std::runtime_error("write failed: " + std::string{strerror(errno)});
        }
        buf += written;
        len -= static_cast<size_t>(written);
    }
}

// Test if a directory has the specified permissions
static inline bool
dirHasPerms(char const* dirPath, int const perms)
{
    struct stat st;
    return dirPath != nullptr
        && !stat(dirPath, &st) // make sure this directory exists
        && S_ISDIR(st.st_mode) // make sure it is a directory
        && !access(dirPath, perms); // check that the directory has the desired permissions
}

// Test if a file has the specified permissions
static inline bool
fileHasPerms(char const* filePath, int const perms)
{
    struct stat st;
    return filePath != nullptr
        && !stat(filePath, &st) // make sure this directory exists
        && S_ISREG(st.st_mode)  // make sure it is a regular file
        && !access(filePath, perms); // check that the file has the desired permissions
}

// Test if a file exists
static inline bool
pathExists(char const* filePath)
{
    struct stat st;
    return !stat(filePath, &st);
}

// Read passwd file and resize buffer as needed
static inline auto
getpwuid(uid_t const uid)
{
    auto pwd = passwd{};
    auto pwd_buf = std::vector<char>{};

    size_t buf_len = 4096;
    long rl = sysconf(_SC_GETPW_R_SIZE_MAX);
    if (rl != -1) {
        buf_len = static_cast<size_t>(rl);
    }

    // Resize the vector
    pwd_buf.resize(buf_len);

    // Get the password file
    struct passwd *result = nullptr;
    if (getpwuid_r(uid,
                   &pwd,
                   pwd_buf.data(),
                   pwd_buf.size(),
                   &result)) {
        throw std::runtime_error("getpwuid_r failed: " + std::string{strerror(errno)});
    }

    // Ensure we obtained a result
    if (result == nullptr) {
        throw std::runtime_error("password file entry not found for uid " + std::to_string(uid));
    }

    return std::make_pair(std::move(pwd), std::move(pwd_buf));
}

} /* namespace ingest */
