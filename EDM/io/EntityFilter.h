#pragma once
#include <string>
#include <vector>
#include <set>
#include <optional>
#include <cstdint>

#include "../core/utils.h"

// Narrows the entity listing to the codes named in a ';'-separated CSV and
// to entities starting at or after a minimum date.
class EntityFilter {
public:
    EntityFilter() = default;

    bool loadCsv(const std::string& path, const std::string& column, std::string& error);
    void setMinStart(std::optional<std::int64_t> minStart) { minStartDate = minStart; }

    bool matches(const Entity& entity) const;
    std::vector<Entity> apply(const std::vector<Entity>& entities) const;

    bool usesCodes() const { return codesLoaded; }
    std::size_t codeCount() const { return codes.size(); }

private:
    std::set<std::string> codes;
    bool codesLoaded = false;
    std::optional<std::int64_t> minStartDate;
};
