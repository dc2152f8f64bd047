#include "BankApp.hpp"
#include <atomic>
#include <csignal>
#include <iostream>

namespace {

std::atomic<bank::BankApp*> runningApp{nullptr};

extern "C" void onShutdownSignal(int signal) {
    if (auto* app = runningApp.load()) {
        std::cout << "\n[main] Signal " << signal << ", stopping bank-service" << std::endl;
        app->stop();
    }
}

/**
 * @brief Регистрирует приложение для SIGINT/SIGTERM на время run()
 */
class ShutdownGuard {
public:
    explicit ShutdownGuard(bank::BankApp& app) {
        runningApp.store(&app);
        std::signal(SIGINT, onShutdownSignal);
        std::signal(SIGTERM, onShutdownSignal);
    }

    ~ShutdownGuard() {
        std::signal(SIGINT, SIG_DFL);
        std::signal(SIGTERM, SIG_DFL);
        runningApp.store(nullptr);
    }

    ShutdownGuard(const ShutdownGuard&) = delete;
    ShutdownGuard& operator=(const ShutdownGuard&) = delete;
};

} // namespace

int main(int argc, char* argv[]) {
    std::cout << "[main] bank-service: ledger orchestration core" << std::endl;

    try {
        bank::BankApp app;
        ShutdownGuard guard(app);

        // Мастер-счета создаются в configureInjection() до приёма запросов
        app.run(argc, argv);
    } catch (const std::exception& e) {
        std::cerr << "[main] Startup or runtime failure: " << e.what() << std::endl;
        return 1;
    }

    std::cout << "[main] bank-service stopped" << std::endl;
    return 0;
}
