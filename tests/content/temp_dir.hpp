#pragma once

/// @file temp_dir.hpp
/// @brief Scoped temporary presentation folder for file-system tests

#include <atomic>
#include <filesystem>
#include <fstream>
#include <random>
#include <sstream>
#include <string>
#include <system_error>

namespace slate_test {

/// Creates a fresh directory under the system temp path; removed on destruction
class TempDir {
public:
    TempDir() {
        static std::atomic<unsigned> counter{0};
        std::random_device rd;
        std::string name = "slate_test_" + std::to_string(rd()) + "_" + std::to_string(counter++);
        m_path = std::filesystem::temp_directory_path() / name;
        std::filesystem::create_directories(m_path);
    }

    ~TempDir() {
        std::error_code ec;
        std::filesystem::remove_all(m_path, ec);
    }

    TempDir(const TempDir&) = delete;
    TempDir& operator=(const TempDir&) = delete;

    [[nodiscard]] const std::filesystem::path& path() const noexcept { return m_path; }

    /// Write a file relative to the directory, creating parents
    void write(const std::string& relative, const std::string& content) const {
        auto file = m_path / relative;
        std::filesystem::create_directories(file.parent_path());
        std::ofstream out(file, std::ios::binary);
        out << content;
    }

    /// Read a file relative to the directory ("" when absent)
    [[nodiscard]] std::string read(const std::string& relative) const {
        std::ifstream in(m_path / relative, std::ios::binary);
        std::stringstream ss;
        ss << in.rdbuf();
        return ss.str();
    }

    [[nodiscard]] bool exists(const std::string& relative) const {
        return std::filesystem::exists(m_path / relative);
    }

private:
    std::filesystem::path m_path;
};

} // namespace slate_test
