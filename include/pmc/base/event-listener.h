#pragma once

#include <pmc/base/event.h>
#include <pmc/result.hpp>
#include <memory>

namespace pmc {
namespace base {

class EventListener {
public:
    using Ptr = std::shared_ptr<EventListener>;

    virtual ~EventListener() = default;

    // Handle event. Returns Ok(true) if consumed, Ok(false) if not, Err on failure.
    virtual Result<bool> onEvent(const Event& event) = 0;
};

} // namespace base
} // namespace pmc
