#include "adapters/secondary/http/Url.hpp"
#include "errors/EchoException.hpp"

#include <boost/algorithm/string/case_conv.hpp>
#include <algorithm>
#include <cctype>

namespace echoexec::adapters::secondary {

std::string Url::hostHeader() const {
    if ((isTls() && port == "443") || (!isTls() && port == "80")) {
        return host;
    }
    return host + ":" + port;
}

Url parseUrl(const std::string& text) {
    auto schemeEnd = text.find("://");
    if (schemeEnd == std::string::npos) {
        throw errors::EchoException(errors::ErrorKind::Http, "missing scheme in url '" + text + "'");
    }

    Url url;
    url.scheme = boost::algorithm::to_lower_copy(text.substr(0, schemeEnd));
    if (url.scheme != "https" && url.scheme != "http") {
        throw errors::EchoException(errors::ErrorKind::Http, "unsupported scheme '" + url.scheme + "'");
    }

    auto authorityStart = schemeEnd + 3;
    auto targetStart = text.find_first_of("/?", authorityStart);
    std::string authority = text.substr(authorityStart, targetStart - authorityStart);

    if (targetStart == std::string::npos) {
        url.target = "/";
    } else {
        url.target = text.substr(targetStart);
        if (url.target.front() == '?') {
            url.target.insert(url.target.begin(), '/');
        }
    }

    auto colon = authority.rfind(':');
    if (colon != std::string::npos) {
        url.host = authority.substr(0, colon);
        url.port = authority.substr(colon + 1);
        bool numeric = !url.port.empty() &&
            std::all_of(url.port.begin(), url.port.end(), [](unsigned char c) { return std::isdigit(c); });
        if (!numeric) {
            throw errors::EchoException(errors::ErrorKind::Http, "invalid port in url '" + text + "'");
        }
    } else {
        url.host = authority;
        url.port = url.isTls() ? "443" : "80";
    }

    if (url.host.empty()) {
        throw errors::EchoException(errors::ErrorKind::Http, "empty host in url '" + text + "'");
    }
    return url;
}

} // namespace echoexec::adapters::secondary
