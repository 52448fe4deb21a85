#pragma once

#include <stdexcept>

namespace unflake {

// Thrown when a rewrite routine receives input that the line classifier
// should have filtered out. Never caught inside the core.
class InternalError : public std::logic_error {
public:
    using std::logic_error::logic_error;
};

[[noreturn]] auto fail_assertion(const char* condition, const char* message, const char* file,
                                 int line) -> void;

} // namespace unflake

#define UNFLAKE_ASSERT(cond, msg)                                                                  \
    do {                                                                                           \
        if (!(cond)) {                                                                             \
            ::unflake::fail_assertion(#cond, msg, __FILE__, __LINE__);                             \
        }                                                                                          \
    } while (0)
