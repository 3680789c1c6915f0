#pragma once

#include <atomic>
#include <cstddef>
#include <iosfwd>

namespace allium { namespace onion {

    /// Counters kept by a connection_dispatcher and its connection tasks. They
    /// may be read from any thread at any time.
    struct dispatch_stats
    {
        using counter_type = std::atomic<std::size_t>;

        counter_type received { 0 };        ///< requests taken from the transport
        counter_type rejected { 0 };        ///< requests on which reject() was called
        counter_type reject_failed { 0 };   ///< of those, the ones where reject() reported an error
        counter_type accepted { 0 };        ///< requests that produced a raw stream
        counter_type accept_failed { 0 };
        counter_type handshake_failed { 0 };
        counter_type serve_failed { 0 };
        counter_type served { 0 };          ///< connections served to an orderly end
        counter_type active { 0 };          ///< admitted connections not yet finished
    };

    std::ostream& operator<<(std::ostream& os, const dispatch_stats& stats);

}}
