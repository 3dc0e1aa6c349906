#include <exception>
#include <string>
#include <string_view>

#include <boost/archive/iterators/binary_from_base64.hpp>
#include <boost/archive/iterators/transform_width.hpp>
#include <fmt/core.h>

#include <util/base64.h>
#include <util/expected.h>

namespace util {

expected<std::string, std::string> base64_decode(std::string_view input) {
    namespace bai = boost::archive::iterators;
    // convert 6 bit base64 values to 8 bit bytes
    using decoder = bai::transform_width<
        bai::binary_from_base64<std::string::const_iterator>, 8, 6>;

    std::string encoded(input);
    if (encoded.empty()) {
        return std::string{};
    }
    if (encoded.size() % 4) {
        return unexpected(
            fmt::format("invalid base64: length {} is not a multiple of 4",
                        encoded.size()));
    }

    const auto last = encoded.find_last_not_of('=');
    const auto padding =
        last == std::string::npos ? encoded.size() : encoded.size() - last - 1;
    if (padding > 2) {
        return unexpected("invalid base64: too much padding");
    }
    if (encoded.find('=') < encoded.size() - padding) {
        return unexpected("invalid base64: padding before the end of input");
    }

    std::string decoded;
    try {
        decoded.assign(decoder(encoded.cbegin()), decoder(encoded.cend()));
    } catch (std::exception& e) {
        return unexpected(fmt::format("invalid base64: {}", e.what()));
    }
    // the padding decodes to zero bytes that are not part of the output
    decoded.resize(decoded.size() - padding);
    return decoded;
}

} // namespace util
