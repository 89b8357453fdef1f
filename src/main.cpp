// main.cpp
//
// hapdb-tool: load an accessory database document, print its tree and
// optionally dump the re-serialized document.

#include <glib.h>
#include <iostream>
#include <optional>
#include <stdexcept>
#include <string>

#include "Accessories.h"
#include "GLibTypes.h"
#include "HapError.h"
#include "Logger.h"

using namespace hapdb;

namespace {

gchar* optFile = nullptr;
gchar* optLogLevel = nullptr;
gchar* optServiceType = nullptr;
gint64 optAid = 0;
gboolean optDump = FALSE;

GOptionEntry optionEntries[] = {
    { "file", 'f', 0, G_OPTION_ARG_FILENAME, &optFile, "Accessory database document", "PATH" },
    { "log-level", 'l', 0, G_OPTION_ARG_STRING, &optLogLevel, "trace, debug, info, status, warn, error, fatal", "LEVEL" },
    { "service-type", 't', 0, G_OPTION_ARG_STRING, &optServiceType, "Only list services of this type", "TYPE" },
    { "aid", 'a', 0, G_OPTION_ARG_INT64, &optAid, "Only list this accessory", "AID" },
    { "dump", 'd', 0, G_OPTION_ARG_NONE, &optDump, "Print the re-serialized document", nullptr },
    { nullptr, 0, 0, G_OPTION_ARG_NONE, nullptr, nullptr, nullptr }
};

void initLogger() {
    Logger::registerTraceReceiver([](const char* msg) { std::cerr << "TRACE: " << msg << std::endl; });
    Logger::registerDebugReceiver([](const char* msg) { std::cerr << "DEBUG: " << msg << std::endl; });
    Logger::registerInfoReceiver([](const char* msg) { std::cerr << "INFO: " << msg << std::endl; });
    Logger::registerStatusReceiver([](const char* msg) { std::cerr << "STATUS: " << msg << std::endl; });
    Logger::registerWarnReceiver([](const char* msg) { std::cerr << "WARN: " << msg << std::endl; });
    Logger::registerErrorReceiver([](const char* msg) { std::cerr << "ERROR: " << msg << std::endl; });
    Logger::registerFatalReceiver([](const char* msg) { std::cerr << "FATAL: " << msg << std::endl; });
    Logger::registerAlwaysReceiver([](const char* msg) { std::cerr << msg << std::endl; });
}

void printService(const Service& service) {
    std::cout << "  [" << service.getIid() << "] " << service.getTypeName();
    if (service.getName()) {
        std::cout << " \"" << *service.getName() << "\"";
    }
    if (!service.getLinkedIids().empty()) {
        std::cout << " linked:";
        for (uint64_t iid : service.getLinkedIids()) {
            std::cout << " " << iid;
        }
    }
    std::cout << std::endl;

    for (const auto& characteristic : service.getCharacteristics()) {
        std::cout << "    [" << characteristic->getIid() << "] " << characteristic->getTypeName()
                  << " (" << formatToString(characteristic->getFormat()) << ")";
        if (characteristic->getValue()) {
            std::cout << " = " << valueToString(*characteristic->getValue());
        }
        std::cout << std::endl;
    }
}

void printAccessory(const Accessory& accessory) {
    std::cout << "Accessory aid " << accessory.getAid() << std::endl;

    ServiceFilter filter;
    if (optServiceType) {
        filter.serviceType = std::string(optServiceType);
    }
    for (const Service* service : accessory.services().filter(filter)) {
        printService(*service);
    }
}

int run() {
    Accessories accessories = Accessories::fromFile(optFile);

    for (const auto& accessory : accessories) {
        if (optAid > 0 && accessory->getAid() != static_cast<uint64_t>(optAid)) {
            continue;
        }
        printAccessory(*accessory);
    }

    if (optDump) {
        std::cout << accessories.toJsonString(2) << std::endl;
    }

    return 0;
}

} // namespace

int main(int argc, char** argv) {
    initLogger();

    GOptionContextPtr context(g_option_context_new("- inspect a HomeKit accessory database"));
    g_option_context_add_main_entries(context.get(), optionEntries, nullptr);

    GError* rawError = nullptr;
    if (!g_option_context_parse(context.get(), &argc, &argv, &rawError)) {
        GErrorPtr error = makeGErrorPtr(rawError);
        std::cerr << "Option parsing failed: " << (error ? error->message : "unknown error") << std::endl;
        return 2;
    }

    GCharPtr file = makeGCharPtr(optFile);
    GCharPtr logLevel = makeGCharPtr(optLogLevel);
    GCharPtr serviceType = makeGCharPtr(optServiceType);

    if (!file) {
        std::cerr << "Missing required option --file" << std::endl;
        return 2;
    }

    try {
        Logger::setLogLevel(Logger::parseLevel(logLevel ? logLevel.get() : "info"));
    } catch (const std::invalid_argument& e) {
        std::cerr << e.what() << std::endl;
        return 2;
    }

    try {
        return run();
    } catch (const HapError& e) {
        Logger::fatal(e.toString());
        return 1;
    }
}
