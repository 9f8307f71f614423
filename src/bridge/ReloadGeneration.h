#pragma once
#include <atomic>
#include <cstdint>

/**
 * @brief Counter bumped exactly once per host reload
 *
 * A request tagged with anything other than current() belongs to a host
 * state that no longer exists.
 */
class ReloadGeneration {
public:
    uint64_t current() const { return value.load(std::memory_order_acquire); }
    uint64_t advance() { return value.fetch_add(1, std::memory_order_acq_rel) + 1; }
    bool isCurrent(uint64_t tag) const { return tag == current(); }

private:
    std::atomic<uint64_t> value{0};
};
