#pragma once

#include <string>
#include <string_view>

#include <util/expected.h>

namespace util {

// decode standard (RFC 4648) base64 with '=' padding.
// returns an error if the input contains characters outside the alphabet or
// its length is not a multiple of 4.
expected<std::string, std::string> base64_decode(std::string_view input);

} // namespace util
