// Small file/console helpers shared by the unit tests.
#pragma once

#include <chrono>
#include <cstdio>
#include <filesystem>
#include <fstream>
#include <iostream>
#include <sstream>
#include <string>
#include <vector>

namespace test_utils {

inline bool check(const char *suite, bool cond, const std::string &msg) {
    if (!cond) {
        std::fprintf(stderr, "[%s] FAIL: %s\n", suite, msg.c_str());
    }
    return cond;
}

// Scratch directory under the system temp dir, removed again on destruction.
class TempDir {
public:
    explicit TempDir(const std::string &name) {
        const auto stamp = std::chrono::steady_clock::now().time_since_epoch().count();
        path_ = std::filesystem::temp_directory_path() /
                ("vttforge_" + name + "_" + std::to_string(stamp));
        std::filesystem::create_directories(path_);
    }
    ~TempDir() {
        std::error_code ec;
        std::filesystem::remove_all(path_, ec);
    }
    TempDir(const TempDir &) = delete;
    TempDir &operator=(const TempDir &) = delete;

    const std::filesystem::path &path() const { return path_; }
    std::string file(const std::string &name) const { return (path_ / name).string(); }

private:
    std::filesystem::path path_;
};

inline void write_file(const std::string &path, const std::string &text) {
    std::ofstream f(path, std::ios::binary);
    f << text;
}

inline std::string read_file(const std::string &path) {
    std::ifstream f(path, std::ios::binary);
    if (!f.is_open()) {
        return {};
    }
    std::ostringstream ss;
    ss << f.rdbuf();
    return ss.str();
}

// Helper to capture stderr while a function runs.
template <typename Fn>
std::string capture_stderr(Fn &&fn) {
    std::ostringstream oss;
    auto *old_buf = std::cerr.rdbuf(oss.rdbuf());
    fn();
    std::cerr.rdbuf(old_buf);
    return oss.str();
}

}  // namespace test_utils
