#include <allium/onion/service_config.hpp>
#include <allium/onion/api/json.hpp>

#include <boost/format.hpp>

#include <fstream>
#include <set>
#include <sstream>

namespace allium { namespace onion {

    namespace {
        void check_port(std::uint32_t port, const char* field)
        {
            if (port < 1 or port > 65535)
                throw invalid_config(str(boost::format("%1%: port %2% is outside 1..65535") % field % port));
        }
    }

    void apply_defaults(ServiceConfig& config)
    {
        if (config.nickname().empty())
            config.set_nickname(default_nickname);

        if (config.allowed_ports_size() == 0)
        {
            for (auto port : port_gate::default_ports())
                config.add_allowed_ports(port);
        }

        auto& tls = *config.mutable_tls();
        if (not tls.has_enabled())
            tls.set_enabled(true);
        if (tls.certificate_file().empty())
            tls.set_certificate_file("cert.pem");
        if (tls.private_key_file().empty())
            tls.set_private_key_file("key.pem");

        if (not config.has_handshake_timeout_ms())
            config.set_handshake_timeout_ms(30000);
        if (not config.has_idle_timeout_ms())
            config.set_idle_timeout_ms(120000);
        if (not config.has_shutdown_timeout_ms())
            config.set_shutdown_timeout_ms(1000);
        if (not config.has_max_body_bytes())
            config.set_max_body_bytes(1024 * 1024);
        if (not config.has_threads())
            config.set_threads(1);

        for (auto& port : *config.mutable_forwarded_ports())
        {
            if (port.listen_address().empty())
                port.set_listen_address("127.0.0.1");
        }

        auto& logging = *config.mutable_logging();
        if (logging.level().empty())
            logging.set_level("info");
    }

    void validate(const ServiceConfig& config)
    {
        for (auto port : config.allowed_ports())
            check_port(port, "allowed_ports");

        std::set<std::uint32_t> virtual_ports;
        for (auto& port : config.forwarded_ports())
        {
            check_port(port.virtual_port(), "forwarded_ports.virtual_port");
            if (port.listen_port() > 65535)
                throw invalid_config(str(boost::format("forwarded_ports.listen_port: port %1% is outside 0..65535")
                                         % port.listen_port()));
            if (not virtual_ports.insert(port.virtual_port()).second)
                throw invalid_config(str(boost::format("forwarded_ports: virtual port %1% is forwarded twice")
                                         % port.virtual_port()));
        }

        if (config.has_threads() and config.threads() == 0)
            throw invalid_config("threads: must be at least 1");

        static const std::set<std::string> levels {
            "trace", "debug", "info", "warning", "error", "fatal"
        };
        if (config.has_logging() and not config.logging().level().empty()
            and levels.count(config.logging().level()) == 0)
        {
            throw invalid_config("logging.level: unknown severity " + config.logging().level());
        }
    }

    ServiceConfig parse_service_config(const std::string& json)
    {
        ServiceConfig config;
        if (json.find_first_not_of(" \t\r\n") != std::string::npos)
        {
            try {
                api::from_json(config, json);
            }
            catch(const std::runtime_error& e)
            {
                throw invalid_config(e.what());
            }
        }
        apply_defaults(config);
        validate(config);
        return config;
    }

    ServiceConfig load_service_config(const std::string& path)
    {
        std::ifstream in(path);
        if (not in)
            throw invalid_config("cannot open configuration file " + path);
        std::ostringstream ss;
        ss << in.rdbuf();
        return parse_service_config(ss.str());
    }

    port_gate make_port_gate(const ServiceConfig& config)
    {
        port_gate::port_set ports;
        for (auto port : config.allowed_ports())
            ports.insert(static_cast<std::uint16_t>(port));
        return port_gate(std::move(ports));
    }

    dispatcher_options make_dispatcher_options(const ServiceConfig& config)
    {
        dispatcher_options options;
        options.handshake_timeout = std::chrono::milliseconds(config.handshake_timeout_ms());
        options.max_connections = config.max_connections();
        options.connection.idle_timeout = std::chrono::milliseconds(config.idle_timeout_ms());
        options.connection.shutdown_timeout = std::chrono::milliseconds(config.shutdown_timeout_ms());
        options.connection.max_body_bytes = config.max_body_bytes();
        return options;
    }

    std::vector<forwarded_port> make_forwarded_ports(const ServiceConfig& config)
    {
        std::vector<forwarded_port> result;
        for (auto& port : config.forwarded_ports())
        {
            error_code ec;
            auto address = asio::ip::make_address(port.listen_address(), ec);
            if (ec)
                throw invalid_config("forwarded_ports.listen_address: " + port.listen_address()
                                     + ": " + ec.message());
            result.push_back(forwarded_port {
                static_cast<std::uint16_t>(port.virtual_port()),
                asio::ip::tcp::endpoint(address, static_cast<unsigned short>(port.listen_port()))
            });
        }
        return result;
    }

}}
