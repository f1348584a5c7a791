#pragma once

#include <optional>
#include <string>

namespace daemon_status {

// Small text file replaced atomically (write to "<path>.tmp", then rename),
// so a polling reader never observes a partial value.
class StatusFile {
   public:
    explicit StatusFile(std::string path);

    StatusFile(const StatusFile&) = delete;
    StatusFile& operator=(const StatusFile&) = delete;

    StatusFile(StatusFile&& other) noexcept;
    StatusFile& operator=(StatusFile&& other) noexcept;

    const std::string& path() const;

    void removeIfExists() const;
    bool writeAtomically(const std::string& content) const;

    // nullopt when missing or unreadable.
    std::optional<std::string> read() const;

   private:
    std::string path_;
};

}  // namespace daemon_status
