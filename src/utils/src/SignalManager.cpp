#include "SignalManager.hpp"
#include "LogUtils.hpp"
#include <atomic>
#include <csignal>
#include <map>
#include <mutex>
#include <pthread.h>
#include <stdexcept>
#include <system_error>
#include <thread>
#include <vector>

namespace SignalManager {

namespace {

std::map<int, std::vector<SignalCallback>> callbacks;
std::mutex cb_mutex;
std::thread watcher;
std::atomic<bool> stopping{false};
sigset_t watched;
sigset_t previous_mask;

void watch() {
    while (true) {
        int signum = 0;
        const int rc = ::sigwait(&watched, &signum);
        if (rc != 0) {
            LogUtils::error("sigwait failed: {}", std::system_category().message(rc));
            return;
        }
        if (stopping) {
            return;
        }

        std::vector<SignalCallback> handlers;
        {
            std::lock_guard<std::mutex> lock(cb_mutex);
            auto it = callbacks.find(signum);
            if (it != callbacks.end()) {
                handlers = it->second;
            }
        }
        for (auto& handler : handlers) {
            try {
                handler(signum);
            } catch (const std::exception& e) {
                LogUtils::error("Handler for signal {} failed: {}", signum, e.what());
            }
        }
    }
}

}

void register_signal(int signum, SignalCallback cb) {
    std::lock_guard<std::mutex> lock(cb_mutex);
    callbacks[signum].push_back(std::move(cb));
}

void setup() {
    std::lock_guard<std::mutex> lock(cb_mutex);
    if (watcher.joinable()) {
        throw std::logic_error("SignalManager::setup called twice");
    }
    if (callbacks.empty()) {
        return;
    }

    sigemptyset(&watched);
    for (const auto& kv : callbacks) {
        sigaddset(&watched, kv.first);
    }
    const int rc = ::pthread_sigmask(SIG_BLOCK, &watched, &previous_mask);
    if (rc != 0) {
        throw std::system_error(rc, std::system_category(), "pthread_sigmask");
    }
    stopping = false;
    watcher = std::thread(watch);
}

void shutdown() {
    std::thread running;
    int wake_signal = 0;
    {
        std::lock_guard<std::mutex> lock(cb_mutex);
        if (watcher.joinable()) {
            running = std::move(watcher);
            wake_signal = callbacks.begin()->first;
        }
        callbacks.clear();
    }
    if (!running.joinable()) {
        return;
    }

    stopping = true;
    ::pthread_kill(running.native_handle(), wake_signal);
    running.join();
    ::pthread_sigmask(SIG_SETMASK, &previous_mask, nullptr);
}

}
