// lsconf/lsp/request_generation.hpp - "Latest wins" request counter
#pragma once

#include <atomic>
#include <cstdint>

namespace lsconf::lsp
{

/**
 * Monotonic generation counter for one request channel (diagnostics,
 * completion, ...).
 *
 * Each request gets a generation. A result whose generation is older than
 * the newest one seen on the channel is stale and should be dropped.
 */
class RequestGeneration
{
public:
  /// Issue a new generation.
  uint64_t next() noexcept { return latest_.fetch_add(1, std::memory_order_acq_rel) + 1; }

  /// Record a generation chosen by the client.
  void observe(uint64_t generation) noexcept
  {
    uint64_t cur = latest_.load(std::memory_order_acquire);
    while (generation > cur &&
           !latest_.compare_exchange_weak(cur, generation, std::memory_order_acq_rel)) {
    }
  }

  /// True if no newer generation has been issued or observed.
  [[nodiscard]] bool is_current(uint64_t generation) const noexcept
  {
    return generation >= latest_.load(std::memory_order_acquire);
  }

  [[nodiscard]] uint64_t latest() const noexcept
  {
    return latest_.load(std::memory_order_acquire);
  }

private:
  std::atomic<uint64_t> latest_{0};
};

}  // namespace lsconf::lsp
