#pragma once
#include <boost/asio.hpp>
#include <boost/asio/ssl.hpp>
#include <boost/log/trivial.hpp>
#include <future>
#include <ostream>
#include <tuple>
#include <utility>

namespace allium { namespace onion {
  
    namespace asio = boost::asio;
    namespace ssl = boost::asio::ssl;
    using error_code = boost::system::error_code;
    using error_condition = boost::system::error_condition;
    using error_category = boost::system::error_category;
    using system_error = boost::system::system_error;
    namespace errc = boost::system::errc;

    /// The executor every stream, timer and source in the project completes on.
    using executor_type = asio::any_io_executor;
    
    template<class Type> using future = std::future<Type>;
    template<class Type> using shared_future = std::shared_future<Type>;
    template<class Type> using promise = std::promise<Type>;

    namespace detail {

        template<class...Args>
        struct traced_args
        {
            std::tuple<const Args&...> args;
        };

        template<class...Args, std::size_t...Is>
        void print_traced(std::ostream& os, const std::tuple<const Args&...>& args, std::index_sequence<Is...>)
        {
            using expand = int [];
            void(expand{
                0,
                ((os << (Is ? ", " : "") << std::get<Is>(args)), 0)...
            });
        }

        template<class...Args>
        std::ostream& operator<<(std::ostream& os, const traced_args<Args...>& t)
        {
            os << '(';
            print_traced(os, t.args, std::index_sequence_for<Args...>());
            return os << ')';
        }

        template<class...Args>
        traced_args<Args...> trace_args(const Args&...args)
        {
            return traced_args<Args...> { std::tie(args...) };
        }
    }
    
}}

#define ALLIUM_ONION_TRACE 0

#if ALLIUM_ONION_TRACE
#define ALLIUM_ONION_TRACE_METHOD_N(CLASS,METHOD,...) \
    BOOST_LOG_TRIVIAL(trace) << CLASS << "::" << METHOD << ::allium::onion::detail::trace_args(__VA_ARGS__)

#define ALLIUM_ONION_TRACE_METHOD(CLASS,METHOD) BOOST_LOG_TRIVIAL(trace) << CLASS << "::" << METHOD

#else
#define ALLIUM_ONION_TRACE_METHOD_N(CLASS,METHOD,...)
#define ALLIUM_ONION_TRACE_METHOD(CLASS,METHOD)

#endif
