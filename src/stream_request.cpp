#include <allium/onion/stream_request.hpp>
#include <allium/onion/errors.hpp>
#include <allium/onion/sensitive.hpp>

namespace allium { namespace onion {

    stream_request::stream_request(request_descriptor descriptor)
    : _descriptor(std::move(descriptor))
    {
    }

    stream_request::~stream_request()
    {
        if (not _consumed) {
            BOOST_LOG_TRIVIAL(warning) << "stream request " << sensitive(_descriptor)
            << " destroyed without being accepted or rejected";
        }
    }

    bool stream_request::consume(error_code& ec)
    {
        if (_consumed) {
            ec = dispatch_error::request_already_consumed;
            return false;
        }
        _consumed = true;
        ec.clear();
        return true;
    }

    void stream_request::async_accept(accept_handler handler)
    {
        ALLIUM_ONION_TRACE_METHOD("stream_request", __func__);
        error_code ec;
        if (not consume(ec))
            throw system_error(ec, "accept");
        handle_accept(std::move(handler));
    }

    void stream_request::reject(error_code& ec)
    {
        ALLIUM_ONION_TRACE_METHOD("stream_request", __func__);
        if (consume(ec))
            handle_reject(ec);
    }

    void stream_request::reject()
    {
        error_code ec;
        reject(ec);
        if (ec)
            throw system_error(ec, "reject");
    }

}}
