#pragma once

#include <string>

namespace echoexec::utils {

/**
 * @brief Привести байты к корректному UTF-8
 *
 * Каждая некорректная последовательность (обрезанная, overlong, суррогат,
 * больше U+10FFFF) заменяется на U+FFFD.
 */
std::string toUtf8Lossy(const std::string& bytes);

} // namespace echoexec::utils
