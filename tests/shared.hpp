#pragma once

#include <filesystem>
#include <fstream>
#include <iterator>
#include <random>
#include <string>

// a fresh directory under the system temp dir, removed on destruction
class CTempDir {
  public:
    CTempDir() {
        std::random_device rd;
        m_path = std::filesystem::temp_directory_path() / ("memlane-test-" + std::to_string(rd()));
        std::filesystem::create_directories(m_path);
    }

    ~CTempDir() {
        std::error_code ec;
        std::filesystem::remove_all(m_path, ec);
    }

    CTempDir(const CTempDir&) = delete;

    std::string file(const std::string& name) const {
        return (m_path / name).string();
    }

    const std::filesystem::path& path() const {
        return m_path;
    }

  private:
    std::filesystem::path m_path;
};

inline void writeFile(const std::string& path, const std::string& content) {
    std::ofstream of(path, std::ios::binary | std::ios::trunc);
    of << content;
}

inline std::string readFile(const std::string& path) {
    std::ifstream file(path, std::ios::binary);
    return std::string((std::istreambuf_iterator<char>(file)), (std::istreambuf_iterator<char>()));
}
