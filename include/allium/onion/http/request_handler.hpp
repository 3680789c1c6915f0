#pragma once

#include <allium/onion/http/message.hpp>

#include <memory>
#include <utility>

namespace allium { namespace onion { namespace http {

    /// Application logic. One instance is shared by every connection, so
    /// handle() may run concurrently on several threads. Any mutable state the
    /// handler keeps is its own to guard.
    struct request_handler
    {
        virtual response handle(const request& req) const = 0;

        virtual ~request_handler() = default;
    };

    template<class Function>
    struct function_request_handler : request_handler
    {
        function_request_handler(Function f) : _f(std::move(f)) {}

        response handle(const request& req) const override
        {
            return _f(req);
        }

    private:
        Function _f;
    };

    template<class Function>
    std::shared_ptr<const request_handler> make_request_handler(Function&& f)
    {
        using function_type = std::decay_t<Function>;
        return std::make_shared<function_request_handler<function_type>>(std::forward<Function>(f));
    }

}}}
