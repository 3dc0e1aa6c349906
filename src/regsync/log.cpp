#include <atomic>
#include <memory>

#include <spdlog/sinks/stdout_color_sinks.h>
#include <spdlog/spdlog.h>

#include "log.h"

namespace regsync {

namespace impl {
std::atomic<bool> reveal{false};
}

void init_log(spdlog::level::level_enum console_log_level) {
    // transfers run on worker threads, hence the multi-threaded sink
    auto console_sink = std::make_shared<spdlog::sinks::stderr_color_sink_mt>();
    if (console_log_level >= spdlog::level::level_enum::info) {
        console_sink->set_pattern("[%^%l%$] %v");
    } else {
        console_sink->set_pattern("[%Y-%m-%d %H:%M:%S.%e] [%n] [%^%l%$] %v");
    }
    // Make it the default logger
    spdlog::set_default_logger(
        std::make_shared<spdlog::logger>("regsync", console_sink));
    spdlog::set_level(console_log_level);
}

void set_reveal_sensitive(bool reveal) {
    impl::reveal.store(reveal);
}

bool reveal_sensitive() {
    return impl::reveal.load();
}

} // namespace regsync
