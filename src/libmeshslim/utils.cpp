#include "Utils.hpp"

#include <atomic>
#include <map>

#include <boost/log/core.hpp>
#include <boost/log/trivial.hpp>
#include <boost/log/expressions.hpp>

namespace MeshSlim {

static boost::log::trivial::severity_level logSeverity = boost::log::trivial::warning;
// Set once the filter was installed, by the application or by the library default.
static std::atomic<bool> logFilterInstalled { false };

static boost::log::trivial::severity_level level_to_boost(unsigned level)
{
    switch (level) {
    // Report fatal errors only.
    case 0: return boost::log::trivial::fatal;
    // Report fatal errors and errors.
    case 1: return boost::log::trivial::error;
    // Report fatal errors, errors and warnings.
    case 2: return boost::log::trivial::warning;
    // Report all errors, warnings and infos.
    case 3: return boost::log::trivial::info;
    // Report all errors, warnings, infos and debugging.
    case 4: return boost::log::trivial::debug;
    // Report everyting including fine level tracing information.
    default: return boost::log::trivial::trace;
    }
}

void set_logging_level(unsigned int level)
{
    logSeverity = level_to_boost(level);
    logFilterInstalled = true;

    boost::log::core::get()->set_filter
    (
        boost::log::trivial::severity >= logSeverity
    );
}

unsigned int level_string_to_boost(std::string level)
{
    static const std::map<std::string, unsigned int> levels {
        { "fatal",   0 },
        { "error",   1 },
        { "warning", 2 },
        { "info",    3 },
        { "debug",   4 },
        { "trace",   5 }
    };

    auto it = levels.find(level);
    // Unknown names fall back to errors only.
    return it == levels.end() ? 1 : it->second;
}

std::string get_string_logging_level(unsigned level)
{
    switch (level) {
    case 0: return "fatal";
    case 1: return "error";
    case 2: return "warning";
    case 3: return "info";
    case 4: return "debug";
    case 5: return "trace";
    default: return "error";
    }
}

unsigned get_logging_level()
{
    switch (logSeverity) {
    case boost::log::trivial::fatal : return 0;
    case boost::log::trivial::error : return 1;
    case boost::log::trivial::warning : return 2;
    case boost::log::trivial::info : return 3;
    case boost::log::trivial::debug : return 4;
    case boost::log::trivial::trace : return 5;
    default: return 1;
    }
}

void init_default_logging_level()
{
    // Warnings and worse, the per pass output stays quiet unless asked for.
    if (! logFilterInstalled.exchange(true))
        boost::log::core::get()->set_filter
        (
            boost::log::trivial::severity >= boost::log::trivial::warning
        );
}

void trace(unsigned int level, const char *message)
{
    boost::log::trivial::severity_level severity = level_to_boost(level);

    BOOST_LOG_STREAM_WITH_PARAMS(::boost::log::trivial::logger::get(),\
        (::boost::log::keywords::severity = severity)) << message;
}

} // namespace MeshSlim
