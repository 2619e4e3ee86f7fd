#include <lfq/queue.hpp>

#include <cstdint>

namespace lfq {

template class Queue<std::uint64_t>;
template class Queue<std::uint32_t>;

}  // namespace lfq
