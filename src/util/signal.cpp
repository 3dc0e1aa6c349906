#include <atomic>
#include <csignal>
#include <string_view>

#include <util/signal.h>

namespace util {

static std::atomic<bool> signal_received{false};
static std::atomic<int> last_signal{0};

static void signal_handler(int signal) {
    if (signal == SIGINT || signal == SIGTERM) {
        signal_received.store(true);
        last_signal.store(signal);
    }
}

void set_signal_catcher() {
    signal_received.store(false);
    struct sigaction h;

    h.sa_handler = signal_handler;
    sigemptyset(&h.sa_mask);
    h.sa_flags = SA_RESETHAND;
    sigaction(SIGINT, &h, nullptr);
    sigaction(SIGTERM, &h, nullptr);
}

void reset_signal_catcher() {
    struct sigaction h;

    h.sa_handler = SIG_DFL;
    sigemptyset(&h.sa_mask);
    h.sa_flags = 0;
    sigaction(SIGINT, &h, nullptr);
    sigaction(SIGTERM, &h, nullptr);
}

bool signal_raised() {
    return signal_received.exchange(false);
}

int last_signal_raised() {
    return last_signal.load();
}

std::string_view signal_name(int signal) {
    switch (signal) {
    case SIGINT:
        return "SIGINT";
    case SIGTERM:
        return "SIGTERM";
    }
    return "unknown signal";
}

} // namespace util
