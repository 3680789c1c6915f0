#include <allium/onion/api/exception.hpp>

#include <boost/algorithm/string/predicate.hpp>
#include <boost/core/demangle.hpp>

#include <initializer_list>
#include <memory>
#include <sstream>
#include <typeinfo>

namespace allium { namespace onion { namespace api {

    namespace {

        /// std::throw_with_nested wraps the thrown type. Report the type the
        /// caller threw.
        std::string thrown_type_name(const std::exception& e)
        {
            auto name = boost::core::demangle(typeid(e).name());
            for (auto prefix : { "std::_Nested_exception<", "std::__nested<" })
            {
                if (boost::algorithm::starts_with(name, prefix) and boost::algorithm::ends_with(name, ">"))
                {
                    auto length = std::string(prefix).size();
                    return name.substr(length, name.size() - length - 1);
                }
            }
            return name;
        }

        void set_cause(Exception::Cause& cause, std::string name, std::string what)
        {
            cause.set_name(std::move(name));
            cause.set_what(std::move(what));
        }

    }

    Exception describe_exception(const std::exception_ptr& ep, std::string stage)
    {
        Exception report;
        report.set_stage(std::move(stage));

        auto current = ep;
        while (current)
        {
            auto& cause = *report.add_causes();
            std::exception_ptr next;
            try {
                std::rethrow_exception(current);
            }
            catch(const std::exception& e)
            {
                set_cause(cause, thrown_type_name(e), e.what());
                if (auto nested = dynamic_cast<const std::nested_exception*>(std::addressof(e)))
                    next = nested->nested_ptr();
            }
            catch(const char* text)
            {
                set_cause(cause, "text", text);
            }
            catch(const std::string& text)
            {
                set_cause(cause, "text", text);
            }
            catch(...)
            {
                set_cause(cause, "unknown", "an exception of unknown type");
            }
            current = next;
        }
        return report;
    }

    std::string summary(const Exception& report)
    {
        std::ostringstream ss;
        ss << report.stage();
        const char* separator = ": ";
        for (auto& cause : report.causes())
        {
            ss << separator << cause.name() << ": " << cause.what();
            separator = "; caused by ";
        }
        return ss.str();
    }

}}}
