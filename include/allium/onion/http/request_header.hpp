#pragma once

#include <allium/onion/config.hpp>
#include <allium/onion/http.pb.h>

#include <functional>
#include <string>
#include <vector>

namespace allium { namespace onion { namespace http {
    
    template<class StringLike>
    struct unary_match_header_name
    {
        unary_match_header_name(StringLike value) : r(std::move(value)) {}
        
        bool operator()(const Header& l) const;

        const StringLike r;
    };

    /// case-insensitive match of a header's name
    bool header_name_equals(const std::string& l, const std::string& r);

    template<class StringLike>
    bool unary_match_header_name<StringLike>::operator()(const Header& l) const
    {
        return header_name_equals(l.name(), r);
    }
    
    template<class StringLike>
    auto match_header_name(StringLike&& r)
    {
        using string_type = std::decay_t<StringLike>;
        using unary_function_type = unary_match_header_name<string_type>;
        return unary_function_type(std::forward<StringLike>(r));
    }
    
    using header_list = google::protobuf::RepeatedPtrField<Header>;

    /// @returns the only header called like, or nullptr
    /// @throws std::runtime_error if there is more than one
    const Header* find_only_header_like(const header_list& headers, const std::string& like);
    std::vector<std::reference_wrapper<const Header>>
    find_headers_like(const header_list& headers, const std::string& like);

    /// true if any header called name carries token in its comma separated
    /// value list, compared without regard to case. e.g. Connection: keep-alive, Upgrade
    bool has_header_token(const header_list& headers,
                          const std::string& name,
                          const std::string& token);

    // HttpRequest
    
    const Header* find_only_header_like(const HttpRequestHeader& request,
                                        const std::string& like);
    std::vector<std::reference_wrapper<const Header>>
    find_headers_like(const HttpRequestHeader& request,
                      const std::string& like);

    // HttpResponse

    /// The status line and headers, terminated by an empty line
    std::string to_response_buffer(const HttpResponseHeader& rmsg);
    
    void set_status(HttpResponseHeader& rmsg, int code, const std::string& message);

    void add_header(HttpResponseHeader& rmsg, const std::string& name, const std::string& value);

    /// replace all ocurrences of a given header name with just one header of
    /// the same name with a new value.
    Header& set_header(HttpResponseHeader& response,
                       const std::string& name,
                       const std::string& value);

    /// The standard reason phrase for a status code, or "Unknown"
    const char* reason_phrase(int code);

}}}
