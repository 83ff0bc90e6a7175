#include "id_allocator.h"

#include <limits>
#include <stdexcept>

uint64_t IdAllocator::allocate() {
    uint64_t current = next_.load(std::memory_order_relaxed);
    do {
        if (current == std::numeric_limits<uint64_t>::max()) {
            throw std::runtime_error("Identifier space exhausted for " +
                                     kind_);
        }
    } while (!next_.compare_exchange_weak(current, current + 1,
                                          std::memory_order_acq_rel,
                                          std::memory_order_relaxed));
    return current;
}
