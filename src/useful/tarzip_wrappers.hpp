/******************************************************************************\
 * tarzip_wrappers.hpp - A header file for utility wrappers. This is for helper
 *                       wrappers to C-style allocation and error handling
 *                       routines.
 *
 * Copyright 2024 Hewlett Packard Enterprise Development LP.
 * SPDX-License-Identifier: Linux-OpenIB
 ******************************************************************************/
#pragma once

#include <cerrno>
#include <cstdio>
#include <cstdlib>
#include <cstring>
#include <filesystem>
#include <iostream>
#include <memory>
#include <stdexcept>
#include <string>
#include <system_error>
#include <type_traits>
#include <utility>

#include <sys/types.h>
#include <sys/stat.h>

#include <dirent.h>
#include <fcntl.h>
#include <limits.h>
#include <unistd.h>

namespace tarzip {

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
inline static auto getenvOrDefault(char const* env_var, char const* default_value)
{
    if (char const* env_value = ::getenv(env_var)) {
        return env_value;
    }
    return default_value;
};

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

    // lifted mkstemp. returns the generated path and the open descriptor
    static inline std::pair<std::string, int> mkstemp(std::string const& pathTemplate) {
        auto rawPathTemplate = take_pointer_ownership(strdup(pathTemplate.c_str()), std::free);
        auto const fd = ::mkstemp(rawPathTemplate.get());
        if (fd < 0) {
            throw std::runtime_error("mkstemp failed on " + pathTemplate + ": " + strerror(errno));
        }
        return std::make_pair(std::string(rawPathTemplate.get()), fd);
    }

    // lifted getcwd
    static inline std::string getcwd() {
        char buf[PATH_MAX + 1];
        if (auto const cwd = ::getcwd(buf, PATH_MAX)) {
            return std::string{cwd};
        }

        throw std::runtime_error("getcwd failed: " + std::string{strerror(errno)});
    }

    // lifted readlink
    static inline std::string readlink(std::string const& path) {
        char buf[PATH_MAX + 1];
        auto const len = ::readlink(path.c_str(), buf, PATH_MAX);
        if (len < 0) {
            throw std::runtime_error("readlink " + path + " failed: " + strerror(errno));
        }
        return std::string(buf, len);
    }
} /* namespace tarzip::cstr */

namespace dir {
    namespace {
        using CloseDirFn = int(*)(DIR*);
    }

    // open a directory path and return a unique DIR* or nullptr
    static inline auto try_open(std::string const& path) ->
        std::unique_ptr<DIR, CloseDirFn>
    {
        return take_pointer_ownership(opendir(path.c_str()), closedir);
    }

    // open a directory and return a unique DIR* or throw
    static inline auto open(std::string const& path) ->
        std::unique_ptr<DIR, CloseDirFn>
    {
        if (auto udp = try_open(path)) {
            return udp;
        }
        throw std::runtime_error("failed to open directory " + path + ": " + strerror(errno));
    }
} /* namespace tarzip::dir */

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
        if (fd < 0) { throw std::runtime_error("File descriptor creation failed."); }
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

// create a temporary directory from a mkdtemp template and remove it and
// everything below it on destruction
class temp_dir_handle
{
private:
    std::string m_path;

public:
    temp_dir_handle(std::string const& templ)
        : m_path{cstr::mkdtemp(templ)}
    {}

    temp_dir_handle(temp_dir_handle&& moved)
        : m_path{std::move(moved.m_path)}
    {
        moved.m_path.clear();
    }

    ~temp_dir_handle()
    {
        if (!m_path.empty()) {
            auto ec = std::error_code{};
            std::filesystem::remove_all(m_path, ec);
            if (ec) {
                std::cerr << "warning: remove " << m_path << " failed: " << ec.message() << std::endl;
            }
        }
    }

    std::string const& get() const { return m_path; }
};

// Resolve every symlink and . or .. component of an existing path
static inline std::string
getRealPath(std::string const& filePath) {
    if (auto realPath = take_pointer_ownership(realpath(filePath.c_str(), nullptr), std::free)) {
        return std::string{realPath.get()};
    } else { // realpath failed with nullptr result
        throw std::runtime_error("realpath " + filePath + " failed: " + strerror(errno));
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
        && !stat(filePath, &st) // make sure this path exists
        && S_ISREG(st.st_mode)  // make sure it is a regular file
        && !access(filePath, perms); // check that the file has the desired permissions
}

// Test if anything exists at a path, without following a final symlink
static inline bool
pathExists(char const* filePath)
{
    struct stat st;
    return !lstat(filePath, &st);
}

// Test if a path is a directory, without following a final symlink
static inline bool
isDirectory(char const* dirPath)
{
    struct stat st;
    return !lstat(dirPath, &st) && S_ISDIR(st.st_mode);
}

} /* namespace tarzip */
