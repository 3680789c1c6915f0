#include <allium/onion/http/message.hpp>
#include <allium/onion/http/request_header.hpp>
#include <allium/onion/api/json.hpp>

namespace allium { namespace onion { namespace http {

    response make_response(int code,
                           std::string body,
                           const std::string& content_type)
    {
        response r;
        r.header.set_version_major(1);
        r.header.set_version_minor(1);
        set_status(r.header, code, reason_phrase(code));
        if (not body.empty()) {
            add_header(r.header, "Content-Type", content_type);
        }
        r.body = std::move(body);
        return r;
    }

    response make_upgrade_response(const std::string& protocol, upgrade_function upgrade)
    {
        auto r = make_response(101);
        add_header(r.header, "Connection", "Upgrade");
        add_header(r.header, "Upgrade", protocol);
        r.upgrade = std::move(upgrade);
        return r;
    }

    response make_exception_response(const Exception& report)
    {
        auto r = make_response(500,
                               api::as_json(report, api::json_options(api::compact_json)),
                               "application/json");
        add_header(r.header, "X-Allium-Message-Type", report.GetDescriptor()->full_name());
        return r;
    }

    int status_code(const response& r)
    {
        return r.header.status().code();
    }

}}}
