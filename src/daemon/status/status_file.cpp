#include "daemon/status/status_file.h"

#include <cstdio>
#include <filesystem>
#include <fstream>
#include <sstream>
#include <string>
#include <system_error>

namespace daemon_status {

StatusFile::StatusFile(std::string path) : path_(std::move(path)) {}

StatusFile::StatusFile(StatusFile&& other) noexcept : path_(std::move(other.path_)) {}

StatusFile& StatusFile::operator=(StatusFile&& other) noexcept {
    if (this == &other) {
        return *this;
    }
    path_ = std::move(other.path_);
    return *this;
}

const std::string& StatusFile::path() const {
    return path_;
}

void StatusFile::removeIfExists() const {
    if (path_.empty()) {
        return;
    }
    std::error_code ec;
    std::filesystem::remove(path_, ec);
}

bool StatusFile::writeAtomically(const std::string& content) const {
    if (path_.empty()) {
        return false;
    }

    std::string tmpPath = path_ + ".tmp";
    std::ofstream ofs(tmpPath, std::ios::trunc);
    if (!ofs) {
        return false;
    }
    ofs << content;
    ofs.close();
    if (!ofs) {
        std::remove(tmpPath.c_str());
        return false;
    }
    if (std::rename(tmpPath.c_str(), path_.c_str()) != 0) {
        std::remove(tmpPath.c_str());
        return false;
    }
    return true;
}

std::optional<std::string> StatusFile::read() const {
    if (path_.empty()) {
        return std::nullopt;
    }
    std::ifstream ifs(path_);
    if (!ifs) {
        return std::nullopt;
    }
    std::ostringstream oss;
    oss << ifs.rdbuf();
    if (ifs.bad()) {
        return std::nullopt;
    }
    return oss.str();
}

}  // namespace daemon_status
