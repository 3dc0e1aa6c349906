#include <stdio.h>
#include <unistd.h>

#include <util/color.h>
#include <util/envvars.h>

namespace color {

namespace impl {
bool use = true;
}

bool default_color(const envvars::state& calling_env) {
    // disable color if NO_COLOR env. variable is set
    if (calling_env.get("NO_COLOR")) {
        return false;
    }

    // force color, e.g. when the output is piped through a pager, if
    // CLICOLOR_FORCE is set to anything other than 0
    if (auto force = calling_env.get("CLICOLOR_FORCE");
        force && !force->empty() && *force != "0") {
        return true;
    }

    // disable color unless both stdout and stderr are terminals: results are
    // printed to stdout, warnings and errors to stderr.
    if (!isatty(fileno(stdout)) || !isatty(fileno(stderr))) {
        return false;
    }

    return true;
}

void set_color(bool v) {
    impl::use = v;
}

bool use_color() {
    return impl::use;
}

} // namespace color
