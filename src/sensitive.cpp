#include <allium/onion/sensitive.hpp>

#include <atomic>

namespace allium { namespace onion {

    namespace {
        std::atomic<bool> _safe_logging { true };
    }

    void set_safe_logging(bool enabled) noexcept
    {
        _safe_logging.store(enabled, std::memory_order_relaxed);
    }

    bool safe_logging() noexcept
    {
        return _safe_logging.load(std::memory_order_relaxed);
    }

}}
