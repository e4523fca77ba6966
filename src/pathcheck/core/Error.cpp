#include "core/Error.hpp"

#include <cerrno>
#include <cstring>

namespace PC {

auto systemError(std::string_view what) -> Error {
    return systemError(what, errno);
}

auto systemError(std::string_view what, int errnum) -> Error {
    std::string message{what};
    message.append(": ");
    message.append(std::strerror(errnum));
    return Error{Error::Code::SystemError, std::move(message)};
}

} // namespace PC
