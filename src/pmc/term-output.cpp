#include <pmc/term-output.h>
#include <cerrno>
#include <cstring>
#include <unistd.h>

namespace pmc {

Result<void> FdTermOutput::write(std::string_view data) {
    const char* ptr = data.data();
    size_t remaining = data.size();
    while (remaining > 0) {
        ssize_t n = ::write(_fd, ptr, remaining);
        if (n < 0) {
            if (errno == EINTR || errno == EAGAIN) continue;
            return Err<void>(std::string("write failed: ") + strerror(errno));
        }
        if (n == 0) {
            return Err<void>("write returned 0 bytes");
        }
        ptr += n;
        remaining -= static_cast<size_t>(n);
    }
    return Ok();
}

Result<void> FdTermOutput::flush() {
    // Writes are unbuffered at this level
    return Ok();
}

Result<void> StringTermOutput::write(std::string_view data) {
    ++_writes;
    if (_failing) {
        return Err<void>("terminal not attached");
    }
    _buffer.append(data);
    return Ok();
}

Result<void> StringTermOutput::flush() {
    if (_failing) {
        return Err<void>("terminal not attached");
    }
    return Ok();
}

} // namespace pmc
