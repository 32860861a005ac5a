#include "CatalogApp.hpp"
#include "ServiceInfo.hpp"
#include <csignal>
#include <iostream>

namespace {

catalog::CatalogApp* runningApp = nullptr;

void onShutdownSignal(int signal) {
    std::cout << "[main] Signal " << signal << ", stopping " << catalog::kServiceName << std::endl;
    if (runningApp) {
        runningApp->stop();
    }
}

} // namespace

int main(int argc, char* argv[]) {
    try {
        catalog::CatalogApp app;
        runningApp = &app;

        std::signal(SIGINT, onShutdownSignal);
        std::signal(SIGTERM, onShutdownSignal);

        std::cout << "[main] " << catalog::kServiceName << " " << catalog::kServiceVersion
                  << " starting" << std::endl;

        // Блокирует до stop(): настройки, DI, очистка истёкших токенов, HTTP
        app.run(argc, argv);

        runningApp = nullptr;
        std::cout << "[main] " << catalog::kServiceName << " stopped" << std::endl;
        return 0;

    } catch (const std::exception& e) {
        std::cerr << "[main] Startup failed: " << e.what() << std::endl;
        return 1;
    }
}
