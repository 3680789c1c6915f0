#pragma once
#include <allium/onion/config.hpp>

namespace allium { namespace onion { namespace http {

	enum class protocol_error_code
	{
        malformed_request = 1,
        body_too_large,
        incomplete_request,
	};

    const error_category& http_error_category();
    error_code make_error_code(protocol_error_code code);
    error_condition make_error_condition(protocol_error_code code);

}}}

namespace boost { namespace system {
    template<>
    struct is_error_code_enum<allium::onion::http::protocol_error_code>
    : std::true_type {};
}}
