#pragma once
#include <string>

// Remembers which URL a partial file was downloaded from, so a partial file
// is only resumed against the source that produced it.
class SourceRecord
{
public:
    explicit SourceRecord(const std::string& path);

    bool load(std::string& url) const;
    bool save(const std::string& url) const;
    bool remove() const;

    const std::string& path() const { return recordPath; }

private:
    std::string recordPath;
};
