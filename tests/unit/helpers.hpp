#pragma once
#include <string>
#include <cstdlib>
#include <stdexcept>
#include <filesystem>
#include <fstream>

namespace wasmbox::test {

// mkdtemp() directory removed on destruction
class TempDir {
public:
    TempDir() {
        std::string pattern = (std::filesystem::temp_directory_path() / "wasmbox-test-XXXXXX").string();
        if (!mkdtemp(pattern.data())) {
            throw std::runtime_error("mkdtemp failed");
        }
        path_ = pattern;
    }

    ~TempDir() {
        std::error_code ec;
        std::filesystem::remove_all(path_, ec);
    }

    TempDir(const TempDir&) = delete;
    TempDir& operator=(const TempDir&) = delete;

    const std::filesystem::path& path() const { return path_; }

private:
    std::filesystem::path path_;
};

inline std::string write_file(const std::filesystem::path& path, const std::string& content,
                              bool executable = false) {
    std::filesystem::create_directories(path.parent_path());
    {
        std::ofstream out(path);
        out << content;
    }
    if (executable) {
        std::filesystem::permissions(path,
            std::filesystem::perms::owner_all | std::filesystem::perms::group_read |
            std::filesystem::perms::group_exec);
    }
    return path.string();
}

// Sets an environment variable for the lifetime of the guard
class ScopedEnv {
public:
    ScopedEnv(const std::string& name, const std::string& value) : name_(name) {
        if (const char* old = std::getenv(name.c_str())) {
            old_ = old;
            had_old_ = true;
        }
        setenv(name.c_str(), value.c_str(), 1);
    }

    // Unset name, restoring any previous value afterwards
    explicit ScopedEnv(const std::string& name) : name_(name) {
        if (const char* old = std::getenv(name.c_str())) {
            old_ = old;
            had_old_ = true;
        }
        unsetenv(name.c_str());
    }

    ~ScopedEnv() {
        if (had_old_) {
            setenv(name_.c_str(), old_.c_str(), 1);
        } else {
            unsetenv(name_.c_str());
        }
    }

    ScopedEnv(const ScopedEnv&) = delete;
    ScopedEnv& operator=(const ScopedEnv&) = delete;

private:
    std::string name_;
    std::string old_;
    bool had_old_ = false;
};

// Changes the working directory for the lifetime of the guard
class ScopedCwd {
public:
    explicit ScopedCwd(const std::filesystem::path& dir)
        : old_(std::filesystem::current_path()) {
        std::filesystem::current_path(dir);
    }

    ~ScopedCwd() {
        std::error_code ec;
        std::filesystem::current_path(old_, ec);
    }

    ScopedCwd(const ScopedCwd&) = delete;
    ScopedCwd& operator=(const ScopedCwd&) = delete;

private:
    std::filesystem::path old_;
};

} // namespace wasmbox::test
