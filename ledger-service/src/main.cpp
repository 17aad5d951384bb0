#include "LedgerApp.hpp"
#include <iostream>
#include <csignal>

// Global pointer for signal handler
ledger::LedgerApp* g_app = nullptr;

void signalHandler(int signal) {
    std::cout << "\n[main] Received signal " << signal << ", shutting down..." << std::endl;
    if (g_app) {
        g_app->stop();
    }
}

int main(int argc, char* argv[]) {
    try {
        ledger::LedgerApp app;
        g_app = &app;

        std::signal(SIGINT, signalHandler);
        std::signal(SIGTERM, signalHandler);

        std::cout << "========================================" << std::endl;
        std::cout << "  Paper Ledger Service v1.0.0 Starting" << std::endl;
        std::cout << "  Press Ctrl+C to stop" << std::endl;
        std::cout << "========================================" << std::endl;

        // 1. loadEnvironment()
        // 2. configureInjection()
        // 3. ожидание stop(), затем shutdown()
        app.run(argc, argv);

        g_app = nullptr;
        std::cout << "[main] Ledger Service stopped" << std::endl;
        return 0;

    } catch (const std::exception& e) {
        std::cerr << "[main] Fatal error: " << e.what() << std::endl;
        return 1;
    }
}
