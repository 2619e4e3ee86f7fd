#pragma once

#include <lfq/config.hpp>

#if defined(__clang__) || defined(__GNUC__)
#define LFQ_UNLIKELY(x) (__builtin_expect(!!(x), 0))
#else
#define LFQ_UNLIKELY(x) (!!(x))
#endif

namespace lfq::detail {

// Logs the failed condition through the library logger and aborts the process.
[[noreturn]] void check_failed(const char* expr, const char* msg, const char* file,
                               int line) noexcept;

}  // namespace lfq::detail

// Fatal internal-consistency check. Always on, independent of NDEBUG.
#define LFQ_CHECK(cond, msg)                                                     \
    do {                                                                         \
        if (LFQ_UNLIKELY(!(cond))) {                                             \
            ::lfq::detail::check_failed(#cond, (msg), __FILE__, __LINE__);       \
        }                                                                        \
    } while (0)
