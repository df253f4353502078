#include "error_report.hpp"

#include <cxxabi.h>

#include <cstdlib>
#include <memory>
#include <sstream>
#include <typeinfo>

namespace minder {
namespace messages {

namespace {

std::string demangle(const char *name) {
    int status = 0;
    std::unique_ptr<char, void (*)(void *)> demangled(abi::__cxa_demangle(name, nullptr, nullptr, &status),
                                                       std::free);
    if (status == 0 && demangled) {
        return demangled.get();
    }
    return name;
}

std::string banner(const std::string &where, const std::string &body) {
    std::ostringstream out;
    std::string header = "---- worker failure (in " + where + ") ----";
    out << header << "\n" << body << "\n" << std::string(header.size(), '-');
    return out.str();
}

}  // namespace

std::string format_error_report(const std::string &where, const std::exception &e) {
    return banner(where, demangle(typeid(e).name()) + ": " + e.what());
}

std::string format_error_report(const std::string &where, const std::string &description) {
    return banner(where, description);
}

}  // namespace messages
}  // namespace minder
