#include <allium/onion/http/request_header.hpp>

#include <boost/algorithm/string.hpp>
#include <boost/format.hpp>

#include <algorithm>
#include <numeric>
#include <stdexcept>

namespace allium { namespace onion { namespace http {

    bool header_name_equals(const std::string& l, const std::string& r)
    {
        return boost::iequals(l, r);
    }

    const Header* find_only_header_like(const header_list& headers, const std::string& like)
    {
        const Header* found = nullptr;
        
        for (auto& header : headers)
        {
            if (boost::iequals(header.name(), like)) {
                if (found) {
                    throw std::runtime_error("duplicate header: " + like);
                }
                found = std::addressof(header);
            }
        }
        return found;
    }

    std::vector<std::reference_wrapper<const Header>>
    find_headers_like(const header_list& headers, const std::string& like)
    {
        std::vector<std::reference_wrapper<const Header>> results;

        for (auto& header : headers)
        {
            if (boost::iequals(header.name(), like)) {
                results.push_back(header);
            }
        }
        return results;
    }

    bool has_header_token(const header_list& headers,
                          const std::string& name,
                          const std::string& token)
    {
        for (const Header& header : find_headers_like(headers, name))
        {
            std::vector<std::string> parts;
            boost::split(parts, header.value(), boost::is_any_of(","));
            for (auto& part : parts)
            {
                if (boost::iequals(boost::trim_copy(part), token))
                    return true;
            }
        }
        return false;
    }
    
    // HttpRequest
    
    const Header* find_only_header_like(const HttpRequestHeader& request,
                                        const std::string& like)
    {
        return find_only_header_like(request.headers(), like);
    }

    std::vector<std::reference_wrapper<const Header>>
    find_headers_like(const HttpRequestHeader& request,
                      const std::string& like)
    {
        return find_headers_like(request.headers(), like);
    }
    
    // HttpResponse

    void set_status(HttpResponseHeader& rmsg, int code,
                    const std::string& message)
    {
        auto status = rmsg.mutable_status();
        status->set_code(code);
        status->set_message(message);
    }
    
    void add_header(HttpResponseHeader& rmsg, const std::string& name,
                    const std::string& value)
    {
        auto hdr = rmsg.add_headers();
        hdr->set_name(name);
        hdr->set_value(value);
    }
    
    Header& set_header(HttpResponseHeader& response,
                       const std::string& name,
                       const std::string& value)
    {
        auto& headers = *response.mutable_headers();
        auto i = std::find_if(headers.begin(), headers.end(),
                              match_header_name(name));
        if (i == headers.end()) {
            auto pheader = response.add_headers();
            pheader->set_name(name);
            pheader->set_value(value);
            return *pheader;
        }

        i->set_value(value);
        auto first_rest = std::next(i);
        auto last_rest = std::end(headers);

        headers.erase(std::remove_if(first_rest, last_rest,
                                     match_header_name(name)),
                      last_rest);
        
        return *i;
    }

    const char* reason_phrase(int code)
    {
        switch(code)
        {
            case 100: return "Continue";
            case 101: return "Switching Protocols";
            case 200: return "OK";
            case 201: return "Created";
            case 202: return "Accepted";
            case 204: return "No Content";
            case 301: return "Moved Permanently";
            case 302: return "Found";
            case 304: return "Not Modified";
            case 400: return "Bad Request";
            case 401: return "Unauthorized";
            case 403: return "Forbidden";
            case 404: return "Not Found";
            case 405: return "Method Not Allowed";
            case 408: return "Request Timeout";
            case 413: return "Payload Too Large";
            case 426: return "Upgrade Required";
            case 500: return "Internal Server Error";
            case 501: return "Not Implemented";
            case 503: return "Service Unavailable";
            default: return "Unknown";
        }
    }
    
    struct add_representation_length
    {
        std::size_t operator()(std::size_t x, const Header& hdr) const
        {
            return x + hdr.name().length() + 2 + hdr.value().length() + 2;
        }
    };
    
    std::string to_response_buffer(const HttpResponseHeader& rmsg)
    {
        static const char colon[2] = { ':', ' ' };
        static const char crlf[2] = { '\r', '\n' };

        auto& message = rmsg.status().message();
        auto status_line = (boost::format("HTTP/%1%.%2% %3% %4%\r\n")
        % rmsg.version_major()
        % rmsg.version_minor()
        % rmsg.status().code()
        % (message.empty() ? reason_phrase(rmsg.status().code()) : message)).str();
        
        auto response_length = status_line.size()
        + std::accumulate(std::begin(rmsg.headers()),
                          std::end(rmsg.headers()),
                          std::size_t(0),
                          add_representation_length())
        + 2;
        
        std::string buffer;
        buffer.reserve(response_length);
        buffer.append(status_line);
        for (auto& header : rmsg.headers())
        {
            buffer.append(header.name());
            buffer.append(std::begin(colon), std::end(colon));
            buffer.append(header.value());
            buffer.append(std::begin(crlf), std::end(crlf));
        }
        buffer.append(std::begin(crlf), std::end(crlf));
        return buffer;
    }
    
}}}
