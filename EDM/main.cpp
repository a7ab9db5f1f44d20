#include <csignal>
#include <iostream>
#include <curl/curl.h>
#include "cli/ArgumentParser.h"
#include "core/ExportController.h"

namespace {
volatile std::sig_atomic_t gStopRequested = 0;

void handleSignal(int) {
    gStopRequested = 1;
}

struct CurlGlobal {
    CurlGlobal() { ok = curl_global_init(CURL_GLOBAL_DEFAULT) == CURLE_OK; }
    ~CurlGlobal() { if (ok) curl_global_cleanup(); }
    bool ok = false;
};
}

int main(int argc, char* argv[]) {
    ExportConfig config;
    ArgumentParser parser;

    std::signal(SIGINT, handleSignal);
    std::signal(SIGTERM, handleSignal);

    if (!parser.parse(argc, argv, config))
        return 2;

    // Must precede any worker thread touching libcurl
    CurlGlobal curl;
    if (!curl.ok) {
        std::cerr << "edm: cannot initialise libcurl" << std::endl;
        return 1;
    }

    ExportController controller(config, &gStopRequested);
    return controller.start() ? 0 : 1;
}
