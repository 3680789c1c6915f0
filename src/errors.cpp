#include <allium/onion/errors.hpp>

namespace allium { namespace onion {

    namespace {

        struct _dispatch_error_category : error_category
        {
            const char *     name() const noexcept override {
                return "allium::onion::dispatch_error";
            }
            
            std::string message( int ev ) const override
            {
                switch (static_cast<dispatch_error>(ev))
                {
                    case dispatch_error::request_already_consumed:
                        return "stream request already accepted or rejected";

                    case dispatch_error::connection_limit_reached:
                        return "connection limit reached";

                    case dispatch_error::handshake_timeout:
                        return "handshake timed out";

                    case dispatch_error::idle_timeout:
                        return "connection idle for too long";

                    case dispatch_error::transport_failed:
                        return "transport failed";

                    default:
                        return "unknown error: " + std::to_string(ev);
                }
            }
        };
    }
    
    const error_category& dispatch_error_category()
    {
        static const _dispatch_error_category _ {};
        return _;
    }
    
    error_code make_error_code(dispatch_error code)
    {
        return error_code(static_cast<int>(code), dispatch_error_category());
    }
    
    error_condition make_error_condition(dispatch_error code)
    {
        return error_condition(static_cast<int>(code), dispatch_error_category());
    }

}}
