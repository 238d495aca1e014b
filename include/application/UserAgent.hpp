#pragma once

#include <string>

namespace echoexec::application {

/**
 * @brief Значение заголовка User-Agent: "<имя библиотеки>/<версия>"
 *
 * Вычисляется один раз при первом обращении.
 */
const std::string& userAgent();

} // namespace echoexec::application
