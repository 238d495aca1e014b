#include "application/UserAgent.hpp"

#ifndef ECHOEXEC_NAME
#define ECHOEXEC_NAME "libechoexec"
#endif

#ifndef ECHOEXEC_VERSION
#define ECHOEXEC_VERSION "0.0.0"
#endif

namespace echoexec::application {

const std::string& userAgent() {
    static const std::string agent = std::string(ECHOEXEC_NAME) + "/" + ECHOEXEC_VERSION;
    return agent;
}

} // namespace echoexec::application
