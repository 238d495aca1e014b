#pragma once

#include <boost/uuid/uuid.hpp>
#include <string>

namespace echoexec::domain {

/**
 * @brief UUID (correlation id события)
 *
 * Обёртка над boost::uuids::uuid. Разбор принимает верхний и нижний регистр
 * и фигурные скобки, toString() всегда отдаёт нижний регистр.
 */
class Uuid {
public:
    Uuid();
    explicit Uuid(const boost::uuids::uuid& value) : value_(value) {}

    /**
     * @brief Разобрать UUID из строки
     * @throws errors::EchoException (ErrorKind::ParseUuid) при некорректной строке
     */
    static Uuid parse(const std::string& text);

    /**
     * @brief Сгенерировать случайный UUID v4
     */
    static Uuid random();

    std::string toString() const;

    const boost::uuids::uuid& value() const { return value_; }

    bool isNil() const { return value_.is_nil(); }

    bool operator==(const Uuid& other) const { return value_ == other.value_; }
    bool operator!=(const Uuid& other) const { return !(*this == other); }

private:
    boost::uuids::uuid value_;
};

} // namespace echoexec::domain
