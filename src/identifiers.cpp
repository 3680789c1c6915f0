#include <allium/onion/identifiers.hpp>

namespace allium { namespace onion {

    constexpr self_generating_uuid::generate_type self_generating_uuid::generate;

}}
