#pragma once

#include <filesystem>
#include <fstream>
#include <random>
#include <string>

namespace fsnap::test {

// Scratch directory under the system temp dir, removed on destruction.
class TempTree {
public:
    TempTree() {
        std::random_device rd;
        root_ = std::filesystem::temp_directory_path() / ("fsnap-test-" + std::to_string(rd()) + std::to_string(rd()));
        std::filesystem::create_directories(root_);
    }

    ~TempTree() {
        std::error_code ec;
        std::filesystem::permissions(root_, std::filesystem::perms::owner_all, ec);
        std::filesystem::remove_all(root_, ec);
    }

    TempTree(const TempTree&) = delete;
    TempTree& operator=(const TempTree&) = delete;

    [[nodiscard]] const std::filesystem::path& root() const { return root_; }

    std::filesystem::path write(const std::string& rel, const std::string& content) const {
        const auto p = root_ / rel;
        std::filesystem::create_directories(p.parent_path());
        std::ofstream out(p, std::ios::binary);
        out << content;
        return p;
    }

    void move(const std::string& from, const std::string& to) const {
        const auto dst = root_ / to;
        std::filesystem::create_directories(dst.parent_path());
        std::filesystem::rename(root_ / from, dst);
    }

    void copy(const std::string& from, const std::string& to) const {
        const auto dst = root_ / to;
        std::filesystem::create_directories(dst.parent_path());
        std::filesystem::copy_file(root_ / from, dst);
    }

private:
    std::filesystem::path root_;
};

}
