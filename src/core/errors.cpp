/**
 * @file errors.cpp
 * @brief Trace rendering for captured exceptions.
 */

#include "core/errors.hpp"

#include <cxxabi.h>

#include <cstdlib>
#include <memory>
#include <string_view>
#include <typeinfo>

namespace dagbuild {

namespace {

void append_trace(std::string& out, std::exception_ptr eptr, size_t depth) {
    if (!eptr) return;

    auto prefix = [&] {
        if (depth == 0) return std::string{};
        return std::string(depth * 2, ' ') + "caused by: ";
    };

    try {
        std::rethrow_exception(eptr);
    } catch (const IsolatedBuildError& e) {
        if (depth > 0) out += '\n' + prefix();
        out += e.what();
    } catch (const std::exception& e) {
        if (depth > 0) out += '\n';
        out += prefix() + exception_type_name(e) + ": " + e.what();
        try {
            std::rethrow_if_nested(e);
        } catch (...) {
            append_trace(out, std::current_exception(), depth + 1);
        }
    } catch (const std::string& s) {
        if (depth > 0) out += '\n';
        out += prefix() + "std::string: " + s;
    } catch (const char* s) {
        if (depth > 0) out += '\n';
        out += prefix() + "const char*: " + s;
    } catch (...) {
        if (depth > 0) out += '\n';
        out += prefix() + "unknown exception";
    }
}

// std::throw_with_nested throws an implementation type deriving from the
// user's exception; report the user's type instead.
std::string strip_nested_wrapper(std::string name) {
    for (std::string_view wrapper : {"std::_Nested_exception<", "std::__nested<"}) {
        if (name.size() > wrapper.size() && name.compare(0, wrapper.size(), wrapper) == 0
            && name.back() == '>') {
            return name.substr(wrapper.size(), name.size() - wrapper.size() - 1);
        }
    }
    return name;
}

}  // namespace

std::string exception_type_name(const std::exception& e) {
    const char* mangled = typeid(e).name();
    int status = 0;
    std::unique_ptr<char, void (*)(void*)> demangled(
        abi::__cxa_demangle(mangled, nullptr, nullptr, &status), std::free);
    if (status == 0 && demangled) {
        return strip_nested_wrapper(demangled.get());
    }
    return mangled;
}

std::string describe_exception(std::exception_ptr eptr) {
    std::string out;
    append_trace(out, eptr, 0);
    return out;
}

}  // namespace dagbuild
