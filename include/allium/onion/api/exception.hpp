#pragma once

#include <allium/onion/exception.pb.h>

#include <exception>
#include <string>

namespace allium { namespace onion { namespace api {

    /// Describe the exception in ep, and every exception nested inside it.
    /// Exceptions not derived from std::exception are described as well as
    /// their type allows. A null ep gives a report with no causes.
    Exception describe_exception(const std::exception_ptr& ep, std::string stage);

    /// One line for the logs: "stage: name: what; caused by name: what"
    std::string summary(const Exception& report);

}}}
