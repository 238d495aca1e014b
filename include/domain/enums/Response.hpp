#pragma once

#include <string>

namespace echoexec::domain {

/**
 * @brief Обобщённый результат, когда HTTP код не подходит
 */
enum class Response {
    Success,
    Failure
};

inline std::string toString(Response response) {
    switch (response) {
        case Response::Success: return "success";
        case Response::Failure: return "failure";
        default: return "success";
    }
}

} // namespace echoexec::domain
