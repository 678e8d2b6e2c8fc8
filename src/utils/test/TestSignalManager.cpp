#include "SignalManager.hpp"
#include <atomic>
#include <cassert>
#include <chrono>
#include <csignal>
#include <iostream>
#include <mutex>
#include <stdexcept>
#include <thread>
#include <unistd.h>

static bool wait_for_count(const std::atomic<int>& count, int expected) {
    for (int i = 0; i < 200; ++i) {
        if (count == expected) return true;
        std::this_thread::sleep_for(std::chrono::milliseconds(10));
    }
    return count == expected;
}

void test_callbacks_run_on_watcher_thread() {
    std::atomic<int> count{0};
    std::mutex mutex;
    std::thread::id handler_thread;

    SignalManager::register_signal(SIGUSR1, [&](int signum) {
        // A mutex is fine here: this is not signal context
        std::lock_guard<std::mutex> lock(mutex);
        handler_thread = std::this_thread::get_id();
        assert(signum == SIGUSR1);
        count += 1;
    });
    SignalManager::register_signal(SIGUSR1, [&](int) { count += 10; });
    SignalManager::setup();

    ::kill(::getpid(), SIGUSR1);
    assert(wait_for_count(count, 11));
    {
        std::lock_guard<std::mutex> lock(mutex);
        assert(handler_thread != std::this_thread::get_id());
    }

    ::kill(::getpid(), SIGUSR1);
    assert(wait_for_count(count, 22));

    SignalManager::shutdown();
    std::cout << "test_callbacks_run_on_watcher_thread passed" << std::endl;
}

void test_throwing_callback_keeps_watcher() {
    std::atomic<int> count{0};
    SignalManager::register_signal(SIGUSR2, [](int) { throw std::runtime_error("handler failure"); });
    SignalManager::register_signal(SIGUSR2, [&](int) { ++count; });
    SignalManager::setup();

    ::kill(::getpid(), SIGUSR2);
    assert(wait_for_count(count, 1));
    ::kill(::getpid(), SIGUSR2);
    assert(wait_for_count(count, 2));

    SignalManager::shutdown();
    std::cout << "test_throwing_callback_keeps_watcher passed" << std::endl;
}

void test_setup_twice_and_idle_shutdown() {
    SignalManager::shutdown();

    SignalManager::register_signal(SIGUSR1, [](int) {});
    SignalManager::setup();
    bool threw = false;
    try {
        SignalManager::setup();
    } catch (const std::logic_error&) {
        threw = true;
    }
    assert(threw);
    SignalManager::shutdown();
    SignalManager::shutdown();
    std::cout << "test_setup_twice_and_idle_shutdown passed" << std::endl;
}

int main() {
    test_callbacks_run_on_watcher_thread();
    test_throwing_callback_keeps_watcher();
    test_setup_twice_and_idle_shutdown();

    std::cout << "All SignalManager tests passed!" << std::endl;
    return 0;
}
