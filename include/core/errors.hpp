// errors.hpp — typed failures raised by the engine
#pragma once

#include <stdexcept>
#include <string>

namespace core {

/**
 * @brief Violated precondition of an engine operation (invalid parameters or
 *        a degenerate input that has no defined result). Fatal for the
 *        computation that raised it; never retried.
 */
class precondition_error : public std::invalid_argument {
public:
    explicit precondition_error(const std::string& what) : std::invalid_argument(what) {}
    explicit precondition_error(const char* what) : std::invalid_argument(what) {}
};

} // namespace core

// Always-on precondition check for public entry points (not hot paths).
#define CORE_REQUIRE(cond, msg) do { if(!(cond)) throw ::core::precondition_error(msg); } while(0)
