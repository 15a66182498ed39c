#include <relay/util/stack_trace.h>

#if RELAY_WITH_BACKWARD
#include <backward.hpp>

#include <sstream>

namespace relay {
    std::string get_stack_trace() {
        backward::StackTrace st;
        st.load_here(32);
        // Drop the frames of this function and of the error hook that asked for it.
        st.skip_n_firsts(2);
        backward::Printer p;
        p.object = true;
        p.color_mode = backward::ColorMode::never;
        p.address = true;

        std::ostringstream oss;
        p.print(st, oss);
        return oss.str();
    }
} // namespace relay

#else

namespace relay {
    std::string get_stack_trace() { return {}; }
} // namespace relay

#endif
