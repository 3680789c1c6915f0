#pragma once

#include <allium/onion/transport_source.hpp>

#include <functional>

namespace allium { namespace onion {

    /// The registration of the onion service for the life of the accept loop.
    ///
    /// Construction reports the service name. The handle is released exactly
    /// once, by release() or on destruction, whichever comes first.
    ///
    class service_handle
    {
    public:
        using release_function = std::function<void()>;

        explicit service_handle(service_identity identity,
                                release_function on_release = release_function());

        service_handle(const service_handle&) = delete;
        service_handle& operator=(const service_handle&) = delete;

        ~service_handle();

        const service_identity& identity() const { return _identity; }

        bool released() const { return _released; }

        /// Has no effect after the first call.
        void release();

    private:
        service_identity _identity;
        release_function _on_release;
        bool _released = false;
    };

}}
