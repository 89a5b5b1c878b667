#pragma once

#include <atomic>
#include <cstdint>

namespace sta::client {

/**
 * @brief Read counters shared by every stream of one client. Safe to update from any thread.
 */
class ClientMetrics {
public:
    struct Snapshot {
        int64_t bytes_read_local;
        int64_t bytes_read_memory;
        int64_t buffer_refills;
        int64_t direct_reads;
    };

    void inc_bytes_read_local(int64_t n) noexcept {
        bytes_read_local_.fetch_add(n, std::memory_order_relaxed);
    }

    void inc_bytes_read_memory(int64_t n) noexcept {
        bytes_read_memory_.fetch_add(n, std::memory_order_relaxed);
    }

    void inc_buffer_refills() noexcept {
        buffer_refills_.fetch_add(1, std::memory_order_relaxed);
    }

    void inc_direct_reads() noexcept {
        direct_reads_.fetch_add(1, std::memory_order_relaxed);
    }

    Snapshot snapshot() const noexcept {
        return Snapshot {
            .bytes_read_local = bytes_read_local_.load(std::memory_order_relaxed),
            .bytes_read_memory = bytes_read_memory_.load(std::memory_order_relaxed),
            .buffer_refills = buffer_refills_.load(std::memory_order_relaxed),
            .direct_reads = direct_reads_.load(std::memory_order_relaxed),
        };
    }

private:
    std::atomic<int64_t> bytes_read_local_ {0};
    std::atomic<int64_t> bytes_read_memory_ {0};
    std::atomic<int64_t> buffer_refills_ {0};
    std::atomic<int64_t> direct_reads_ {0};
};

} // namespace sta::client
