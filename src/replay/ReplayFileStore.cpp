#include "replay/ReplayFileStore.hpp"
#include "replay/Serialization.hpp"

#include <algorithm>
#include <cstdlib>
#include <fstream>
#include <sstream>
#include <stdexcept>
#include <utility>

namespace fs = std::filesystem;

namespace blockdrop::replay {

namespace {
    bool endsWith(const std::string& s, const std::string& suffix) {
        return s.size() >= suffix.size()
            && s.compare(s.size() - suffix.size(), suffix.size(), suffix) == 0;
    }
}

ReplayFileStore::ReplayFileStore(fs::path directory)
    : m_directory(std::move(directory))
{
}

fs::path ReplayFileStore::defaultDirectory()
{
    if (const char* home = std::getenv("HOME")) {
        return fs::path(home) / ".blockdrop" / "replays";
    }
    return fs::path("replays");
}

fs::path ReplayFileStore::pathFor(const std::string& name) const
{
    if (name.empty() || name.find('/') != std::string::npos || name == "." || name == "..") {
        throw std::invalid_argument("ReplayFileStore: invalid replay name '" + name + "'");
    }
    return m_directory / (name + FileExtension);
}

void ReplayFileStore::save(const std::string& name, const ReplayData& replay) const
{
    const fs::path path = pathFor(name);

    std::error_code ec;
    fs::create_directories(m_directory, ec);
    if (ec) {
        throw std::runtime_error("ReplayFileStore: cannot create " + m_directory.string()
                                 + ": " + ec.message());
    }

    std::ofstream out(path, std::ios::binary | std::ios::trunc);
    if (!out) {
        throw std::runtime_error("ReplayFileStore: cannot open " + path.string() + " for writing");
    }
    out << serialize(replay);
    out.flush();
    if (!out) {
        throw std::runtime_error("ReplayFileStore: write failed for " + path.string());
    }
}

ReplayData ReplayFileStore::load(const std::string& name) const
{
    const fs::path path = pathFor(name);

    std::ifstream in(path, std::ios::binary);
    if (!in) {
        throw std::runtime_error("Replay not found: " + name);
    }

    std::ostringstream content;
    content << in.rdbuf();

    auto replay = deserialize(content.str());
    if (!replay) {
        throw std::runtime_error("Malformed replay data: " + name);
    }
    return std::move(*replay);
}

std::vector<std::string> ReplayFileStore::list() const
{
    std::vector<std::string> names;

    std::error_code ec;
    if (!fs::is_directory(m_directory, ec)) {
        return names;
    }

    const std::string ext = FileExtension;
    for (const auto& entry : fs::directory_iterator(m_directory, ec)) {
        if (!entry.is_regular_file()) continue;
        const std::string file = entry.path().filename().string();
        if (endsWith(file, ext)) {
            names.push_back(file.substr(0, file.size() - ext.size()));
        }
    }
    if (ec) {
        throw std::runtime_error("ReplayFileStore: cannot list " + m_directory.string()
                                 + ": " + ec.message());
    }

    std::sort(names.begin(), names.end());
    return names;
}

bool ReplayFileStore::exists(const std::string& name) const
{
    std::error_code ec;
    return fs::is_regular_file(pathFor(name), ec);
}

void ReplayFileStore::remove(const std::string& name) const
{
    std::error_code ec;
    fs::remove(pathFor(name), ec);
    if (ec) {
        throw std::runtime_error("ReplayFileStore: cannot delete " + name + ": " + ec.message());
    }
}

} // namespace blockdrop::replay
