#pragma once

#include <atomic>
#include <cstdint>
#include <string>

// Hands out strictly increasing identifiers for one entity kind. Seeded once
// at startup from the store's persisted high-water mark; identifiers are
// never handed out twice, even when the transaction that asked for one is
// rolled back.
class IdAllocator {
  public:
    IdAllocator(const std::string &kind, uint64_t next)
        : kind_(kind), next_(next) {}
    ~IdAllocator() = default;

    IdAllocator(const IdAllocator &) = delete;
    IdAllocator &operator=(const IdAllocator &) = delete;

    // Throws std::runtime_error once the identifier space is exhausted.
    uint64_t allocate();

    uint64_t peek() const { return next_.load(std::memory_order_acquire); }

    const std::string &kind() const { return kind_; }

  private:
    std::string kind_;
    std::atomic<uint64_t> next_;
};
