#include "ArgumentParser.h"
#include <iostream>
#include <cerrno>
#include <cstdlib>

namespace {
bool parseNumber(const std::string& text, std::uint64_t& out) {
    if (text.empty() || text[0] == '-')
        return false;

    errno = 0;
    char* end = nullptr;
    const unsigned long long value = std::strtoull(text.c_str(), &end, 10);
    if (errno != 0 || end == text.c_str() || *end != '\0')
        return false;

    out = static_cast<std::uint64_t>(value);
    return true;
}

std::string fromEnv(const char* name) {
    const char* value = std::getenv(name);
    return value ? std::string(value) : std::string();
}

void setDefaults(ExportConfig& out) {
    out = ExportConfig{};
    out.accountId = "1";
    out.rootDir = "./exports";
    out.artifactSuffix = ".imscc";
    out.exportType = "common_cartridge";
    out.cutoff = 0;
    out.maxConcurrent = 10;
    out.maxRetries = 5;
    out.backoffBaseMs = 1000;
    out.backoffCapMs = 60000;
    out.pollIntervalMs = 30000;
    out.checkDelayMs = 250;
    out.filterColumn = "kod";
    out.refreshListing = false;
    out.awaitInFlight = false;
}
}

bool ArgumentParser::parse(int argc, char* argv[], ExportConfig& out) {
    setDefaults(out);
    error.clear();

    std::string cutoff;
    std::string minStart;

    for (int i = 1; i < argc; ++i) {
        std::string arg = argv[i];
        const bool hasValue = i + 1 < argc;
        std::uint64_t number = 0;

        if (arg == "-h" || arg == "--help") {
            printUsage();
            return false;
        }
        else if (arg == "--refresh") {
            out.refreshListing = true;
        }
        else if (arg == "-w") {
            out.awaitInFlight = true;
        }
        else if (!hasValue) {
            error = "missing value for " + arg;
        }
        else if (arg == "-b") {
            out.apiBase = argv[++i];
        }
        else if (arg == "-k") {
            out.apiToken = argv[++i];
        }
        else if (arg == "-a") {
            out.accountId = argv[++i];
        }
        else if (arg == "-o") {
            out.rootDir = argv[++i];
        }
        else if (arg == "-c") {
            cutoff = argv[++i];
        }
        else if (arg == "-x") {
            out.artifactSuffix = argv[++i];
        }
        else if (arg == "-e") {
            out.exportType = argv[++i];
        }
        else if (arg == "-f") {
            out.filterCsv = argv[++i];
        }
        else if (arg == "--filter-column") {
            out.filterColumn = argv[++i];
        }
        else if (arg == "-s") {
            minStart = argv[++i];
        }
        else if (arg == "-n" && parseNumber(argv[++i], number)) {
            out.maxConcurrent = static_cast<std::size_t>(number);
        }
        else if (arg == "-r" && parseNumber(argv[++i], number)) {
            out.maxRetries = static_cast<std::size_t>(number);
        }
        else if (arg == "--backoff-base" && parseNumber(argv[++i], number)) {
            out.backoffBaseMs = number;
        }
        else if (arg == "--backoff-cap" && parseNumber(argv[++i], number)) {
            out.backoffCapMs = number;
        }
        else if (arg == "-p" && parseNumber(argv[++i], number)) {
            out.pollIntervalMs = number;
        }
        else if (arg == "-d" && parseNumber(argv[++i], number)) {
            out.checkDelayMs = number;
        }
        else {
            error = "invalid argument " + arg;
        }

        if (!error.empty()) {
            printUsage();
            return false;
        }
    }

    if (out.apiBase.empty())
        out.apiBase = fromEnv("EDM_API_BASE");
    if (out.apiToken.empty())
        out.apiToken = fromEnv("EDM_API_TOKEN");

    if (out.apiBase.empty())
        error = "no API base URL (-b or EDM_API_BASE)";
    else if (out.apiToken.empty())
        error = "no API token (-k or EDM_API_TOKEN)";
    else if (out.maxConcurrent == 0)
        error = "concurrency limit must be at least 1";
    else if (out.artifactSuffix.empty())
        error = "artifact suffix must not be empty";

    if (error.empty() && !cutoff.empty()) {
        auto ts = parseTimestamp(cutoff);
        if (ts)
            out.cutoff = *ts;
        else
            error = "cannot parse cutoff '" + cutoff + "'";
    }

    if (error.empty() && !minStart.empty()) {
        auto ts = parseTimestamp(minStart);
        if (ts)
            out.minStartDate = *ts;
        else
            error = "cannot parse start date '" + minStart + "'";
    }

    if (!error.empty()) {
        printUsage();
        return false;
    }

    return true;
}

void ArgumentParser::printUsage() const {
    if (!error.empty())
        std::cerr << "edm: " << error << "\n\n";

    std::cout <<
        "Usage:\n"
        "  edm -b <api base> -k <token> [options]\n\n"
        "Options:\n"
        "  -b <url>              API base, e.g. https://host/api/v1 (env EDM_API_BASE)\n"
        "  -k <token>            Bearer token (env EDM_API_TOKEN)\n"
        "  -a <id>               Account whose entities are listed (default: 1)\n"
        "  -o <dir>              Artifact root directory (default: ./exports)\n"
        "  -c <date>             Ignore exports created before this date\n"
        "  -n <count>            Concurrent downloads (default: 10)\n"
        "  -r <count>            Retries per download (default: 5)\n"
        "  --backoff-base <ms>   First retry delay (default: 1000)\n"
        "  --backoff-cap <ms>    Longest retry delay (default: 60000)\n"
        "  -p <ms>               Wait between polling rounds (default: 30000)\n"
        "  -d <ms>               Wait between status checks (default: 250)\n"
        "  -x <suffix>           Artifact file suffix (default: .imscc)\n"
        "  -e <type>             Export type to request (default: common_cartridge)\n"
        "  -f <csv>              Only entities whose code is listed in this CSV\n"
        "  --filter-column <c>   CSV column holding the codes (default: kod)\n"
        "  -s <date>             Only entities starting at or after this date\n"
        "  -w                    Do not request a new export while one is in progress\n"
        "  --refresh             Ignore the cached entity listing\n";
}
