#pragma once

#include <allium/onion/config.hpp>
#include <allium/onion/ownership.hpp>

#include <cassert>
#include <functional>
#include <memory>
#include <utility>

namespace allium { namespace onion {

    /// A move-only, type erased bidirectional byte stream.
    ///
    /// @note   It models:
    ///         AsyncReadStream
    ///         AsyncWriteStream
    /// and provides lowest_layer(), close(), cancel() and shutdown() so that it can
    /// be used as the next layer of an asio::ssl::stream. A raw stream handed over
    /// by a transport and the encrypted stream produced by the tls_terminator are
    /// both carried by this type.
    ///
    struct duplex_stream
    {
        using executor_type = onion::executor_type;
        using lowest_layer_type = duplex_stream;

        struct io_completion_handler {
            virtual void run(const error_code& ec, std::size_t bytes_transferred) = 0;
            virtual ~io_completion_handler() = default;
        };
        using completion_ptr = std::shared_ptr<io_completion_handler>;

        struct stream_concept {

            virtual void async_read_some(asio::mutable_buffer buffer, completion_ptr handler) = 0;
            virtual void async_write_some(asio::const_buffer buffer, completion_ptr handler) = 0;

            virtual void async_shutdown(completion_ptr handler) = 0;

            virtual void close(error_code& ec) = 0;
            virtual void cancel(error_code& ec) = 0;
            virtual void shutdown(asio::socket_base::shutdown_type, error_code& ec) = 0;

            virtual executor_type get_executor() = 0;

            virtual ~stream_concept() = default;
        };
        using concept_ptr_type = std::unique_ptr<stream_concept>;

        template<class OwnershipWrapper>
        struct stream_model : stream_concept {
            using wrapper_type = OwnershipWrapper;
            using stream_type = typename wrapper_type::element_type;

            stream_model(wrapper_type stream_wrapper) : _stream_wrapper(std::move(stream_wrapper)) {}

            void async_read_some(asio::mutable_buffer buffer,
                                 completion_ptr handler) override
            {
                stream().async_read_some(asio::buffer(buffer),
                                         [handler = std::move(handler)]
                                         (const error_code& ec, std::size_t size) {
                                             handler->run(ec, size);
                                         });
            }

            void async_write_some(asio::const_buffer buffer,
                                  completion_ptr handler) override
            {
                stream().async_write_some(asio::buffer(buffer),
                                          [handler = std::move(handler)]
                                          (const error_code& ec, std::size_t size) {
                                              handler->run(ec, size);
                                          });
            }

            void async_shutdown(completion_ptr handler) override
            {
                graceful_shutdown(stream(), std::move(handler), 0);
            }

            void close(error_code& ec) override
            {
                stream().lowest_layer().close(ec);
            }

            void cancel(error_code& ec) override
            {
                stream().lowest_layer().cancel(ec);
            }

            void shutdown(asio::socket_base::shutdown_type type, error_code& ec) override
            {
                stream().lowest_layer().shutdown(type, ec);
            }

            executor_type get_executor() override
            {
                return stream().get_executor();
            }

            stream_type& stream() { return _stream_wrapper.get(); }

            wrapper_type _stream_wrapper;

        private:
            using shutdown_function = std::function<void(const error_code&)>;

            // streams with a closing handshake (TLS) provide async_shutdown
            template<class Stream>
            static auto graceful_shutdown(Stream& s, completion_ptr handler, int)
            -> decltype(s.async_shutdown(std::declval<shutdown_function>()), void())
            {
                s.async_shutdown(shutdown_function([handler = std::move(handler)](const error_code& ec)
                                                   {
                                                       handler->run(ec, 0);
                                                   }));
            }

            template<class Stream>
            static void graceful_shutdown(Stream& s, completion_ptr handler, long)
            {
                asio::post(s.get_executor(), [handler = std::move(handler)]
                {
                    handler->run(error_code(), 0);
                });
            }
        };

        /// Invokes the handler through its associated executor, so that a
        /// handler bound to a strand stays on that strand.
        template<class Handler>
        struct completion_model : io_completion_handler
        {
            completion_model(Handler handler, executor_type io_executor)
            : _handler(std::move(handler))
            , _io_executor(std::move(io_executor))
            {}

            void run(const error_code& ec, std::size_t bytes_transferred) override
            {
                auto executor = asio::get_associated_executor(_handler, _io_executor);
                asio::dispatch(executor,
                               [handler = std::move(_handler), ec, bytes_transferred]() mutable
                               {
                                   handler(ec, bytes_transferred);
                               });
            }

            Handler _handler;
            executor_type _io_executor;
        };

        template<class Handler>
        completion_ptr make_completion(Handler&& handler)
        {
            using handler_type = std::decay_t<Handler>;
            return std::make_shared<completion_model<handler_type>>(std::forward<Handler>(handler),
                                                                    get_executor());
        }

        /// Each call transfers at most one buffer, which is what write_some and
        /// read_some promise anyway. Composed operations issue the next call.
        template<class Buffer, class BufferSequence>
        static Buffer first_buffer(const BufferSequence& buffers)
        {
            auto first = asio::buffer_sequence_begin(buffers);
            auto last = asio::buffer_sequence_end(buffers);
            for ( ; first != last ; ++first)
            {
                Buffer b(*first);
                if (b.size())
                    return b;
            }
            return Buffer();
        }

        template<class StreamType>
        static concept_ptr_type create_model(is_owner_type, StreamType&& stream)
        {
            using wrapper_type = decltype(wrap_ownership(std::forward<StreamType>(stream)));
            using model_type = stream_model<wrapper_type>;
            return std::make_unique<model_type>(wrap_ownership(std::forward<StreamType>(stream)));
        }

        template<class StreamType>
        duplex_stream(is_owner_type is_owner, StreamType&& stream)
        : _impl { create_model(is_owner, std::forward<StreamType>(stream)) }
        {
        }

        template<
        class StreamType,
        std::enable_if_t<not std::is_same<std::decay_t<StreamType>, duplex_stream>::value>* = nullptr>
        explicit duplex_stream(StreamType&& stream)
        : duplex_stream { is_owner, std::forward<StreamType>(stream) }
        {
        }

        /// An empty stream, as handed to a completion handler that reports failure.
        duplex_stream() = default;

        duplex_stream(duplex_stream&&) = default;
        duplex_stream& operator=(duplex_stream&&) = default;

        /// false once the stream has been moved from
        bool valid() const noexcept { return bool(_impl); }

        template<class MutableBufferSequence, class ReadHandler>
        void async_read_some(const MutableBufferSequence& buffers, ReadHandler&& handler)
        {
            assert(valid());
            _impl->async_read_some(first_buffer<asio::mutable_buffer>(buffers),
                                   make_completion(std::forward<ReadHandler>(handler)));
        }

        template<class ConstBufferSequence, class WriteHandler>
        void async_write_some(const ConstBufferSequence& buffers, WriteHandler&& handler)
        {
            assert(valid());
            _impl->async_write_some(first_buffer<asio::const_buffer>(buffers),
                                    make_completion(std::forward<WriteHandler>(handler)));
        }

        /// End the session gracefully. Completes once a TLS stream has
        /// exchanged close_notify with the peer, and at once for streams that
        /// have no closing handshake. The stream still has to be closed.
        template<class ShutdownHandler>
        void async_shutdown(ShutdownHandler&& handler)
        {
            assert(valid());
            using handler_type = std::decay_t<ShutdownHandler>;
            auto executor = asio::get_associated_executor(handler, get_executor());
            _impl->async_shutdown(make_completion(
                asio::bind_executor(executor,
                                    [handler = handler_type(std::forward<ShutdownHandler>(handler))]
                                    (const error_code& ec, std::size_t) mutable
                                    {
                                        handler(ec);
                                    })));
        }

        void shutdown(asio::socket_base::shutdown_type type)
        {
            error_code ec;
            shutdown(type, ec);
            if (ec)
                throw system_error(ec, "shutdown");
        }

        void shutdown(asio::socket_base::shutdown_type type, error_code& ec)
        {
            if (not _impl) {
                ec = asio::error::bad_descriptor;
                return;
            }
            _impl->shutdown(type, ec);
        }

        void close() {
            error_code ec;
            close(ec);
            if (ec)
                throw system_error(ec, "close");
        }

        void close(error_code& ec) {
            if (not _impl) {
                ec = asio::error::bad_descriptor;
                return;
            }
            _impl->close(ec);
        }

        void cancel(error_code& ec) {
            if (not _impl) {
                ec = asio::error::bad_descriptor;
                return;
            }
            _impl->cancel(ec);
        }

        void cancel() {
            error_code ec;
            cancel(ec);
            if (ec)
                throw system_error(ec, "cancel");
        }

        executor_type get_executor() {
            return _impl->get_executor();
        }

        lowest_layer_type& lowest_layer() { return *this; }
        const lowest_layer_type& lowest_layer() const { return *this; }

    private:
        concept_ptr_type _impl;
    };

}}
