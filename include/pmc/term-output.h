#pragma once

#include <pmc/result.hpp>
#include <memory>
#include <string>
#include <string_view>

namespace pmc {

//=============================================================================
// TermOutput - where escape sequences go
//=============================================================================

class TermOutput {
public:
    using Ptr = std::shared_ptr<TermOutput>;

    virtual ~TermOutput() = default;

    virtual Result<void> write(std::string_view data) = 0;
    virtual Result<void> flush() = 0;
};

// Writes to a POSIX file descriptor (usually STDOUT_FILENO)
class FdTermOutput : public TermOutput {
public:
    explicit FdTermOutput(int fd) : _fd(fd) {}

    Result<void> write(std::string_view data) override;
    Result<void> flush() override;

    int fd() const { return _fd; }

private:
    int _fd;
};

// Captures output in memory; can be told to fail
class StringTermOutput : public TermOutput {
public:
    Result<void> write(std::string_view data) override;
    Result<void> flush() override;

    const std::string& buffer() const { return _buffer; }
    void clear() { _buffer.clear(); }

    void setFailing(bool failing) { _failing = failing; }
    int writeCount() const { return _writes; }

private:
    std::string _buffer;
    bool _failing = false;
    int _writes = 0;
};

} // namespace pmc
