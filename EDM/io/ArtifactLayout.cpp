#include "ArtifactLayout.h"

#include <filesystem>
#include <system_error>

namespace fs = std::filesystem;

namespace {
bool endsWith(const std::string& s, const std::string& suffix) {
    return s.size() >= suffix.size() &&
        s.compare(s.size() - suffix.size(), suffix.size(), suffix) == 0;
}
}

ArtifactLayout::ArtifactLayout(const std::string& rootDir, const std::string& suffix)
    : root(rootDir), artifactSuffix(suffix) {
}

std::string ArtifactLayout::sanitize(const std::string& name) {
    static const std::string illegal = "/\\:*?\"<>|";

    std::string out = name;
    for (auto& c : out) {
        if (illegal.find(c) != std::string::npos)
            c = '_';
    }
    return out;
}

std::string ArtifactLayout::folderFor(const Entity& entity) const {
    auto year = yearOf(entity.startAt);
    const std::string yearDir = year ? std::to_string(*year) : "unknown";
    return (fs::path(root) / yearDir / sanitize(entity.name)).string();
}

bool ArtifactLayout::hasArtifact(const Entity& entity) const {
    std::error_code ec;
    const fs::path folder = folderFor(entity);
    if (!fs::is_directory(folder, ec))
        return false;

    for (fs::directory_iterator it(folder, ec), end; !ec && it != end; it.increment(ec)) {
        if (it->is_regular_file(ec) && endsWith(it->path().filename().string(), artifactSuffix))
            return true;
    }
    return false;
}

bool ArtifactLayout::destinationFor(const Entity& entity, const std::string& filename, std::string& out) const {
    const fs::path folder = folderFor(entity);

    std::error_code ec;
    fs::create_directories(folder, ec);
    if (ec)
        return false;

    std::string name = sanitize(filename);
    if (name.empty())
        name = std::to_string(entity.id);
    // The suffix is what marks the entity as done on later runs
    if (!endsWith(name, artifactSuffix))
        name += artifactSuffix;

    out = (folder / name).string();
    return true;
}
