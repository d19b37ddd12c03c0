#pragma once

#include <expected>
#include <string>

namespace codebox::core {

template<typename T, typename U = std::string>
using Result = std::expected<T, U>;

} // namespace codebox::core
