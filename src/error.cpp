#include <litedoc-cpp/error.hpp>

#include <string>

namespace litedoc_cpp {

auto to_string(const ParseError& error) -> std::string {
    return error.message + " at bytes " + std::to_string(error.span.start) + ".." +
           std::to_string(error.span.end);
}

}  // namespace litedoc_cpp
