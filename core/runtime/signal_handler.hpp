#pragma once

#include <atomic>

namespace tactile {
namespace runtime {

// SIGINT / SIGTERM set a flag the runtime loop polls
class SignalHandler {
public:
    static void install();
    static bool is_shutdown_requested();

    // Clears the flag; used by tests that run the loop more than once
    static void reset();

private:
    static void handle_signal(int signal);
    static std::atomic<bool> shutdown_requested_;
};

}  // namespace runtime
}  // namespace tactile
