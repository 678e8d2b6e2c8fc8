#pragma once
#include <functional>

// Process signals turned into ordinary callbacks on a watcher thread
namespace SignalManager {

using SignalCallback = std::function<void(int)>;

void register_signal(int signum, SignalCallback cb);

// Blocks the registered signals in the calling thread and starts the watcher.
// Call from main before any other thread exists, so every thread inherits the mask.
void setup();

// Stops the watcher, restores the signal mask and forgets all callbacks
void shutdown();

}
