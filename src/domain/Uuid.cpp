#include "domain/Uuid.hpp"
#include "errors/EchoException.hpp"

#include <boost/uuid/nil_generator.hpp>
#include <boost/uuid/random_generator.hpp>
#include <boost/uuid/string_generator.hpp>
#include <boost/uuid/uuid_io.hpp>

namespace echoexec::domain {

Uuid::Uuid() : value_(boost::uuids::nil_uuid()) {}

Uuid Uuid::parse(const std::string& text) {
    try {
        boost::uuids::string_generator gen;
        return Uuid(gen(text));
    } catch (const std::exception& e) {
        throw errors::EchoException(
            errors::ErrorKind::ParseUuid,
            "'" + text + "': " + e.what(),
            std::current_exception()
        );
    }
}

Uuid Uuid::random() {
    // random_generator не потокобезопасен, держим по экземпляру на поток
    thread_local boost::uuids::random_generator gen;
    return Uuid(gen());
}

std::string Uuid::toString() const {
    return boost::uuids::to_string(value_);
}

} // namespace echoexec::domain
