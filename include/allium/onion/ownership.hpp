#pragma once

#include <utility>
#include <memory>
#include <type_traits>

namespace allium { namespace onion {

    /// Uniform access to an object that is held by value or through a
    /// unique_ptr. Type erased streams hold their concrete stream through one
    /// of these.
    template<class Object>
    struct ownership_wrapper
    {
        using element_type = Object;
        using reference = std::add_lvalue_reference_t<element_type>;
        using const_reference = std::add_lvalue_reference_t<std::add_const_t<element_type>>;
        
        explicit ownership_wrapper(element_type object)
        : _object(std::move(object))
        {}
        
        reference get() { return _object; }
        const_reference get() const { return _object; }
    private:
        element_type _object;
    };
    
    template<class Object, class Deleter>
    struct ownership_wrapper< std::unique_ptr<Object, Deleter> >
    {
        using element_type = Object;
        using pointer_type = std::unique_ptr<element_type, Deleter>;
        using reference = std::add_lvalue_reference_t<element_type>;
        using const_reference = std::add_lvalue_reference_t<std::add_const_t<element_type>>;
        
        explicit ownership_wrapper(pointer_type ptr)
        : _ptr(std::move(ptr))
        {}
        
        reference get() { return *_ptr; }
        const_reference get() const { return *_ptr; }
    private:
        pointer_type _ptr;
    };

    template<class Thing>
    auto wrap_ownership(Thing&& thing)
    {
        using thing_type = std::decay_t<Thing>;
        return ownership_wrapper<thing_type>(std::forward<Thing>(thing));
    }
    
    // ownership tags
    
    struct is_owner_type {
        constexpr operator bool() const { return true; }
    };
    
    static constexpr auto is_owner = is_owner_type {};

}}
