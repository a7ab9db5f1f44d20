#include "EntityFilter.h"

#include <fstream>
#include <sstream>

namespace {
std::vector<std::string> splitFields(const std::string& line) {
    std::vector<std::string> fields;
    std::string field;
    std::istringstream in(line);
    while (std::getline(in, field, ';'))
        fields.push_back(field);
    return fields;
}

std::string clean(std::string s) {
    // UTF-8 BOM on the header line
    if (s.rfind("\xEF\xBB\xBF", 0) == 0)
        s.erase(0, 3);

    auto begin = s.find_first_not_of(" \t\r\n");
    if (begin == std::string::npos)
        return {};
    auto end = s.find_last_not_of(" \t\r\n");
    s = s.substr(begin, end - begin + 1);

    if (s.size() >= 2 && s.front() == '"' && s.back() == '"')
        s = s.substr(1, s.size() - 2);
    return s;
}

std::string codeOf(const std::string& name) {
    auto space = name.find(' ');
    return space == std::string::npos ? name : name.substr(0, space);
}
}

bool EntityFilter::loadCsv(const std::string& path, const std::string& column, std::string& error) {
    std::ifstream in(path);
    if (!in.is_open()) {
        error = "cannot open " + path;
        return false;
    }

    std::string line;
    if (!std::getline(in, line)) {
        error = path + " is empty";
        return false;
    }

    const auto header = splitFields(line);
    std::size_t index = header.size();
    for (std::size_t i = 0; i < header.size(); ++i) {
        if (clean(header[i]) == column) {
            index = i;
            break;
        }
    }

    if (index == header.size()) {
        error = path + " has no column '" + column + "'";
        return false;
    }

    codes.clear();
    while (std::getline(in, line)) {
        if (clean(line).empty())
            continue;

        const auto fields = splitFields(line);
        if (index < fields.size()) {
            auto code = clean(fields[index]);
            if (!code.empty())
                codes.insert(code);
        }
    }

    codesLoaded = true;
    return true;
}

bool EntityFilter::matches(const Entity& entity) const {
    if (codesLoaded && codes.count(codeOf(entity.name)) == 0)
        return false;

    if (minStartDate) {
        auto start = parseTimestamp(entity.startAt);
        if (!start || *start < *minStartDate)
            return false;
    }

    return true;
}

std::vector<Entity> EntityFilter::apply(const std::vector<Entity>& entities) const {
    std::vector<Entity> out;
    for (const auto& e : entities) {
        if (matches(e))
            out.push_back(e);
    }
    return out;
}
