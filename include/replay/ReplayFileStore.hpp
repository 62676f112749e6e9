#pragma once

#include <filesystem>
#include <string>
#include <vector>

#include "replay/ReplayTypes.hpp"

namespace blockdrop::replay {

/// Stores replays as `<directory>/<name>.replay` text files.
/// I/O and decode failures are reported with std::runtime_error.
class ReplayFileStore {
public:
    static constexpr const char* FileExtension = ".replay";

    explicit ReplayFileStore(std::filesystem::path directory);

    /// Default location: $HOME/.blockdrop/replays (./replays without HOME).
    static std::filesystem::path defaultDirectory();

    const std::filesystem::path& directory() const noexcept { return m_directory; }

    void save(const std::string& name, const ReplayData& replay) const;
    ReplayData load(const std::string& name) const;

    /// Names of stored replays, sorted. Empty when the directory does not exist.
    std::vector<std::string> list() const;

    bool exists(const std::string& name) const;
    void remove(const std::string& name) const;

private:
    std::filesystem::path m_directory;

    std::filesystem::path pathFor(const std::string& name) const;
};

} // namespace blockdrop::replay
