#include <allium/onion/service_handle.hpp>

namespace allium { namespace onion {

    service_handle::service_handle(service_identity identity, release_function on_release)
    : _identity(std::move(identity))
    , _on_release(std::move(on_release))
    {
        if (_identity.name.empty())
            BOOST_LOG_TRIVIAL(warning) << "service name for " << _identity.nickname << " is not available";
        else
            BOOST_LOG_TRIVIAL(info) << "service name: " << _identity.name;
    }

    service_handle::~service_handle()
    {
        try {
            release();
        }
        catch(const std::exception& e)
        {
            BOOST_LOG_TRIVIAL(error) << "releasing onion service: " << e.what();
        }
    }

    void service_handle::release()
    {
        if (_released)
            return;
        _released = true;

        auto on_release = std::move(_on_release);
        if (on_release)
            on_release();
        BOOST_LOG_TRIVIAL(info) << "onion service exited cleanly";
    }

}}
