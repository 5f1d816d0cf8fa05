#ifndef TRACE_HPP
#define TRACE_HPP

namespace kumo {
    // Master flag - set to true to enable debug tracing at compile time.
    // Runtime instruction tracing goes through an InstructionSink instead.
    inline constexpr bool ENABLE_TRACING = false;

    // Frame push/pop tracing in the dispatcher.
    inline constexpr bool TRACE_FRAMES = ENABLE_TRACING && true;

    // Global variable stores.
    inline constexpr bool TRACE_GLOBALS = ENABLE_TRACING && false;

    // Module container and loader tracing.
    inline constexpr bool TRACE_LOADER = ENABLE_TRACING && false;

    // Main program tracing.
    inline constexpr bool TRACE_MAIN = ENABLE_TRACING && false;
}

#endif // TRACE_HPP
