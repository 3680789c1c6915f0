#pragma once
#include <http_parser.h>

#include <memory>
#include <string>

namespace allium { namespace onion { namespace http {
    
    using http_parser = ::http_parser;
    
    inline
    http_errno parser_error(const http_parser* parser)
    {
        return HTTP_PARSER_ERRNO(parser);
    }

    inline
    http_errno parser_error(const http_parser& parser)
    {
        return parser_error(std::addressof(parser));
    }

    inline
    std::string describe(http_errno en)
    {
        return std::string(http_errno_name(en)) + ": " + http_errno_description(en);
    }
    
}}}
