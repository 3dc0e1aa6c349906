#pragma once

#include <string_view>

namespace util {

// install handlers for SIGINT and SIGTERM that record the signal instead of
// terminating the process.
// the handlers are reset after the first signal, so that a second interrupt
// terminates the application immediately.
void set_signal_catcher();

// restore the default handlers for SIGINT and SIGTERM
void reset_signal_catcher();

// returns true if a signal has been caught since the last call, and clears
// the flag.
bool signal_raised();

int last_signal_raised();

std::string_view signal_name(int signal);

} // namespace util
