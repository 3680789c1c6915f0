#include <allium/onion/dispatch_stats.hpp>

#include <ostream>

namespace allium { namespace onion {

    std::ostream& operator<<(std::ostream& os, const dispatch_stats& stats)
    {
        return os << "{ received=" << stats.received.load()
        << ", rejected=" << stats.rejected.load()
        << ", reject_failed=" << stats.reject_failed.load()
        << ", accepted=" << stats.accepted.load()
        << ", accept_failed=" << stats.accept_failed.load()
        << ", handshake_failed=" << stats.handshake_failed.load()
        << ", serve_failed=" << stats.serve_failed.load()
        << ", served=" << stats.served.load()
        << ", active=" << stats.active.load()
        << " }";
    }

}}
