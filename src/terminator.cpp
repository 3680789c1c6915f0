#include <allium/onion/terminator.hpp>

namespace allium { namespace onion {

    void plain_terminator::async_terminate(duplex_stream raw,
                                           std::chrono::milliseconds,
                                           handler_type handler)
    {
        auto executor = raw.get_executor();
        asio::post(executor, [raw = std::move(raw), handler = std::move(handler)]() mutable
        {
            handler(error_code(), std::move(raw));
        });
    }

}}
