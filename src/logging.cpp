#include <allium/onion/logging.hpp>
#include <allium/onion/sensitive.hpp>

#include <boost/log/core.hpp>
#include <boost/log/expressions.hpp>
#include <boost/log/trivial.hpp>
#include <boost/log/utility/setup/common_attributes.hpp>
#include <boost/log/utility/setup/console.hpp>
#include <boost/log/utility/setup/formatter_parser.hpp>

#include <stdexcept>

namespace allium { namespace onion {

    void init_logging(const LoggingConfig& config)
    {
        namespace logging = boost::log;

        auto level = logging::trivial::info;
        if (not config.level().empty()
            and not logging::trivial::from_string(config.level().data(), config.level().size(), level))
        {
            throw std::invalid_argument("unknown log severity: " + config.level());
        }

        logging::register_simple_formatter_factory<logging::trivial::severity_level, char>("Severity");
        logging::add_console_log(std::clog,
                                 logging::keywords::format = "[%TimeStamp%] [%Severity%] %Message%",
                                 logging::keywords::auto_flush = true);
        logging::add_common_attributes();
        logging::core::get()->set_filter(logging::trivial::severity >= level);

        set_safe_logging(not config.unsafe_logging());
        if (config.unsafe_logging())
            BOOST_LOG_TRIVIAL(warning) << "safe logging is off: sensitive values will be logged in plain text";
    }

}}
