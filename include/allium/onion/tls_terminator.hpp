#pragma once

#include <allium/onion/terminator.hpp>

#include <memory>
#include <string>

namespace allium { namespace onion {

    /// A server TLS context holding the service's certificate chain and
    /// private key, both PEM encoded.
    /// @throws system_error if either cannot be used
    std::shared_ptr<ssl::context> make_server_context(const std::string& certificate_chain_pem,
                                                      const std::string& private_key_pem);

    /// As make_server_context, reading the PEM data from files.
    /// @throws system_error if a file cannot be read or its contents used
    std::shared_ptr<ssl::context> load_server_context(const std::string& certificate_chain_file,
                                                      const std::string& private_key_file);

    /// Performs the server side of a TLS handshake over the raw stream.
    ///
    /// The context is shared by every connection and must not be modified
    /// once handed to the terminator.
    ///
    class tls_terminator : public terminator
    {
    public:
        explicit tls_terminator(std::shared_ptr<ssl::context> context);

        void async_terminate(duplex_stream raw,
                             std::chrono::milliseconds handshake_timeout,
                             handler_type handler) override;

        const char* name() const override { return "tls"; }

    private:
        struct handshake_op;

        std::shared_ptr<ssl::context> _context;
    };

}}
