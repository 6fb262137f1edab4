#ifndef CPSWAP_TRACE_HPP
#define CPSWAP_TRACE_HPP

#include <cstdlib>
#include <string>

namespace cpswap {

// TRACE=1 prints intermediate terms of every formula to stdout
inline bool trace_enabled() {
    static const bool enabled = (std::getenv("TRACE") && std::string(std::getenv("TRACE")) == "1");
    return enabled;
}

} // namespace cpswap

#endif // CPSWAP_TRACE_HPP
