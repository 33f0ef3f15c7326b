#pragma once
#include <gtest/gtest.h>
#include <filesystem>
#include <fstream>
#include <string>

/// Unique path under the GoogleTest temp dir, removed on destruction
class TempFile {
public:
    explicit TempFile(const std::string& stem) {
        const auto* info = ::testing::UnitTest::GetInstance()->current_test_info();
        std::string name = stem;
        if (info) {
            name += std::string("_") + info->test_suite_name() + "_" + info->name();
        }
        path_ = (std::filesystem::path(::testing::TempDir()) / (name + ".json")).string();
        std::filesystem::remove(path_);
    }

    ~TempFile() {
        std::error_code ec;
        std::filesystem::remove(path_, ec);
    }

    TempFile(const TempFile&) = delete;
    TempFile& operator=(const TempFile&) = delete;

    const std::string& path() const { return path_; }

    void write(const std::string& content) const {
        std::ofstream out(path_, std::ios::trunc);
        out << content;
    }

    std::string read() const {
        std::ifstream in(path_);
        return std::string(std::istreambuf_iterator<char>(in), std::istreambuf_iterator<char>());
    }

private:
    std::string path_;
};
