#pragma once
#include <string>
#include "../core/utils.h"

class ArgumentParser {
public:
    bool parse(int argc, char* argv[], ExportConfig& out);

    const std::string& lastError() const { return error; }

private:
    void printUsage() const;

private:
    std::string error;
};
