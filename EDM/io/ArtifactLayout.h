#pragma once
#include <string>

#include "../core/utils.h"

// <root>/<start year>/<sanitized entity name>/<artifact>
class ArtifactLayout {
public:
    ArtifactLayout(const std::string& rootDir, const std::string& artifactSuffix);

    std::string folderFor(const Entity& entity) const;

    // True when the entity folder already holds a finished artifact.
    bool hasArtifact(const Entity& entity) const;

    // Creates the entity folder and yields the final artifact path.
    bool destinationFor(const Entity& entity, const std::string& filename, std::string& out) const;

    static std::string sanitize(const std::string& name);

private:
    std::string root;
    std::string artifactSuffix;
};
