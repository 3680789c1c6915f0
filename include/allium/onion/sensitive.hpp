#pragma once

#include <ostream>
#include <type_traits>
#include <utility>

namespace allium { namespace onion {

    /// Globally enable or disable redaction of sensitive values in log output.
    /// Redaction is on unless explicitly switched off.
    void set_safe_logging(bool enabled) noexcept;
    bool safe_logging() noexcept;

    /// A value that must not reach the logs in plain text while safe logging is
    /// enabled. Printing is the only way to observe it through this wrapper.
    template<class T>
    struct sensitive_value
    {
        using value_type = T;

        const value_type& unwrap() const { return _value; }

        value_type _value;
    };

    template<class T>
    auto sensitive(T&& value)
    {
        using value_type = std::decay_t<T>;
        return sensitive_value<value_type> { std::forward<T>(value) };
    }

    template<class T>
    std::ostream& operator<<(std::ostream& os, const sensitive_value<T>& s)
    {
        if (safe_logging())
            return os << "[scrubbed]";
        return os << s.unwrap();
    }

}}
