#include <lfq/detail/check.hpp>
#include <lfq/log.hpp>

#include <cstdio>
#include <cstdlib>

namespace lfq::detail {

void check_failed(const char* expr, const char* msg, const char* file, int line) noexcept {
    try {
        const auto log = logger();
        log->critical("check failed: {} ({}) at {}:{}", msg, expr, file, line);
        log->flush();
    } catch (...) {
        // The logger itself is unusable; report on stderr directly.
        std::fprintf(stderr, "lfq: check failed: %s (%s) at %s:%d\n", msg, expr, file, line);
        std::fflush(stderr);
    }
    std::abort();
}

}  // namespace lfq::detail
