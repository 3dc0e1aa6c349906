#pragma once

#include <expected>

namespace util {

template <typename T, typename E> using expected = std::expected<T, E>;

using std::unexpected;

} // namespace util
