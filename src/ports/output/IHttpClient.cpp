#include "ports/output/IHttpClient.hpp"

#include <boost/algorithm/string/predicate.hpp>

namespace echoexec::ports::output {

std::string HttpRequest::header(const std::string& name) const {
    for (const auto& [key, value] : headers) {
        if (boost::algorithm::iequals(key, name)) {
            return value;
        }
    }
    return "";
}

} // namespace echoexec::ports::output
