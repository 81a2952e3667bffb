#include "ruida/core/Worker.hpp"
#include "ruida/log/Log.hpp"

namespace ruida::core {

Worker::Worker(std::string name)
: workerName(std::move(name)) {}

Worker::~Worker() {
    stop();
}

void Worker::start() {
    if (running) return; // Already running.
    if (worker.joinable()) {
        worker.join();   // a previous run() returned on its own
    }
    running = true;
    worker = std::thread([this] {
        this->run(); // Calls the virtual run(), so subclass overrides execute.
    });
}

void Worker::stop() {
    const bool wasRunning = running.exchange(false);
    if (wasRunning) {
        logDebug("[", workerName, "] stop()\n");
    }
    wake();
    if (worker.joinable() && worker.get_id() != std::this_thread::get_id()) {
        worker.join();
    }
}

} // namespace ruida::core
