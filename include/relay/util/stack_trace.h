#ifndef RELAY_UTIL_STACK_TRACE_H
#define RELAY_UTIL_STACK_TRACE_H

#include <relay/relay_export.h>

#include <string>

namespace relay {
    /**
     * The stack of the caller as text, used when reporting a failed callback.
     * Uses backward-cpp when built with RELAY_WITH_BACKWARD, otherwise returns an empty string.
     */
    RELAY_EXPORT std::string get_stack_trace();
} // namespace relay

#endif // RELAY_UTIL_STACK_TRACE_H
