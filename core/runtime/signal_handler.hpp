#pragma once

#include <atomic>

namespace vrm {
namespace runtime {

class SignalHandler {
public:
    // Installs SIGINT/SIGTERM handlers that set the shutdown flag
    static void install();

    static bool is_shutdown_requested();

    // Lets tests and embedding code request shutdown without a signal
    static void request_shutdown();
    static void reset();

private:
    static void handle_signal(int signal);
    static std::atomic<bool> shutdown_requested_;
};

}  // namespace runtime
}  // namespace vrm
