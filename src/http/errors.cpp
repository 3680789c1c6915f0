#include <allium/onion/http/errors.hpp>

namespace allium { namespace onion { namespace http {

    namespace {

        struct _protocol_error_category : error_category
        {
            const char *     name() const noexcept override {
                return "allium::onion::http::protocol_error";
            }
            
            std::string message( int ev ) const override
            {
                switch (static_cast<protocol_error_code>(ev))
                {
                    case protocol_error_code::malformed_request:
                        return "malformed request";
                        
                    case protocol_error_code::body_too_large:
                        return "request body too large";

                    case protocol_error_code::incomplete_request:
                        return "connection closed in the middle of a request";

                    default:
                        return "unknown error: " + std::to_string(ev);
                }
            }
        };
    }
    
    const error_category& http_error_category()
    {
        static const _protocol_error_category _ {};
        return _;
    }
    
    error_code make_error_code(protocol_error_code code)
    {
        return error_code(static_cast<int>(code), http_error_category());
    }
    
    error_condition make_error_condition(protocol_error_code code)
    {
        return error_condition(static_cast<int>(code), http_error_category());
    }
    
}}}
