#pragma once
#include <boost/uuid/uuid.hpp>
#include <boost/uuid/uuid_io.hpp>
#include <boost/uuid/uuid_generators.hpp>

namespace allium { namespace onion {
   
    struct self_generating_uuid : boost::uuids::uuid
    {
        struct generate_type {};
        static constexpr auto generate = generate_type {};

        // hijack the constructor
        explicit self_generating_uuid(generate_type)
        : boost::uuids::uuid(boost::uuids::random_generator()())
        {
            
        }
        
    };

    /// names one connection task in the logs. It carries nothing about the peer.
    struct connection_id : self_generating_uuid
    {
        using self_generating_uuid::self_generating_uuid;
    };

}}
