#pragma once

#include <cstdlib>
#include <filesystem>
#include <fstream>
#include <functional>
#include <iostream>
#include <sstream>
#include <string>

// Fresh directory under the system temp dir, removed again on destruction.
class TestScratch {
public:
    explicit TestScratch(const std::string& name)
        : path_(std::filesystem::temp_directory_path() / ("logcollector-tests") / name) {
        std::filesystem::remove_all(path_);
        std::filesystem::create_directories(path_);
    }
    ~TestScratch() {
        std::error_code ec;
        std::filesystem::remove_all(path_, ec);
    }

    const std::filesystem::path& path() const { return path_; }

private:
    std::filesystem::path path_;
};

inline void expect(bool cond, const std::string& msg) {
    if (!cond) {
        std::cerr << "Test failed: " << msg << std::endl;
        std::exit(1);
    }
}

template <typename E>
inline void expectThrows(const std::function<void()>& fn, const std::string& msg) {
    try {
        fn();
    } catch (const E&) {
        return;
    } catch (const std::exception& e) {
        std::cerr << "Test failed: " << msg << " (wrong exception: " << e.what() << ")" << std::endl;
        std::exit(1);
    }
    std::cerr << "Test failed: " << msg << " (nothing thrown)" << std::endl;
    std::exit(1);
}

inline std::string readFile(const std::filesystem::path& path) {
    std::ifstream in(path, std::ios::binary);
    expect(static_cast<bool>(in), "could not open " + path.string());
    std::ostringstream ss;
    ss << in.rdbuf();
    return ss.str();
}

inline std::size_t countEntries(const std::filesystem::path& dir) {
    std::size_t n = 0;
    for (auto it = std::filesystem::recursive_directory_iterator(dir);
         it != std::filesystem::recursive_directory_iterator(); ++it) {
        ++n;
    }
    return n;
}
