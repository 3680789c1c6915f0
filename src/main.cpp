#include <allium/onion/api/json.hpp>
#include <allium/onion/connection_dispatcher.hpp>
#include <allium/onion/logging.hpp>
#include <allium/onion/service_config.hpp>
#include <allium/onion/service_handle.hpp>
#include <allium/onion/tcp_transport.hpp>
#include <allium/onion/tls_terminator.hpp>

#include <csignal>
#include <thread>
#include <vector>

using namespace allium::onion;

namespace {

    http::response hello_world(const http::request& req)
    {
        auto& method = req.header.method();
        if (req.header.query().path() == "/" and (method == "GET" or method == "HEAD"))
            return http::make_response(200, "Hello, World!");
        return http::make_response(404, "Not Found");
    }

    std::shared_ptr<terminator> make_terminator(const ServiceConfig& config)
    {
        if (not config.tls().enabled())
        {
            BOOST_LOG_TRIVIAL(warning) << "tls is disabled: relying on the overlay for encryption";
            return std::make_shared<plain_terminator>();
        }
        return std::make_shared<tls_terminator>(load_server_context(config.tls().certificate_file(),
                                                                    config.tls().private_key_file()));
    }

    int run(const ServiceConfig& config)
    {
        auto threads = static_cast<int>(config.threads());
        asio::io_context ioc(threads);
        executor_type executor = ioc.get_executor();

        auto identity = service_identity { config.nickname(), read_hostname_file(config.hostname_file()) };
        auto transport = std::make_shared<tcp_transport>(executor, make_forwarded_ports(config), identity);
        transport->listen();

        auto dispatcher = std::make_shared<connection_dispatcher>(executor,
                                                                  transport,
                                                                  make_port_gate(config),
                                                                  make_terminator(config),
                                                                  http::make_request_handler(&hello_world),
                                                                  make_dispatcher_options(config));

        service_handle service(transport->identity());

        // first signal: stop taking connections. second signal: stop everything.
        asio::signal_set signals(ioc, SIGINT, SIGTERM);
        int signals_seen = 0;
        std::function<void(const error_code&, int)> on_signal;
        on_signal = [&](const error_code& ec, int signal_number)
        {
            if (ec)
                return;
            if (++signals_seen == 1)
            {
                BOOST_LOG_TRIVIAL(info) << "signal " << signal_number << ": closing transport";
                transport->close();
                signals.async_wait(on_signal);
            }
            else
            {
                BOOST_LOG_TRIVIAL(warning) << "signal " << signal_number << ": stopping";
                ioc.stop();
            }
        };
        signals.async_wait(on_signal);

        error_code result;
        dispatcher->async_run([&](const error_code& ec)
        {
            result = ec;
            service.release();

            // connections still in flight run to completion
            error_code cancel_ec;
            signals.cancel(cancel_ec);
            if (cancel_ec)
                BOOST_LOG_TRIVIAL(debug) << "cancelling signal wait: " << cancel_ec.message();
        });

        std::vector<std::thread> pool;
        for (int i = 1 ; i < threads ; ++i)
            pool.emplace_back([&ioc] { ioc.run(); });
        ioc.run();
        for (auto& t : pool)
            t.join();

        if (result and result != asio::error::operation_aborted)
        {
            BOOST_LOG_TRIVIAL(fatal) << "onion service failed: " << result.message();
            return 1;
        }
        return 0;
    }
}

int main(int argc, char** argv)
{
    try {
        auto config = argc > 1
        ? load_service_config(argv[1])
        : parse_service_config(std::string());

        init_logging(config.logging());
        BOOST_LOG_TRIVIAL(debug) << "effective configuration:\n" << api::as_json(config);
        return run(config);
    }
    catch(const std::exception& e)
    {
        BOOST_LOG_TRIVIAL(fatal) << "allium_onion_server: " << e.what();
        return 2;
    }
}
