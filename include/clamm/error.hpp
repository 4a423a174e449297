#ifndef CLAMM_ERROR_HPP
#define CLAMM_ERROR_HPP

#include <cstdint>
#include <stdexcept>
#include <string>

#include "types.hpp"

namespace clamm {

// Error taxonomy: every code in `errors` belongs to exactly one kind
enum class ErrorKind : uint8_t {
    Validation = 0,
    Arithmetic = 1,
    Invariant = 2,
    Access = 3
};

const char* error_name(int32_t code);
ErrorKind error_kind(int32_t code);
const char* to_string(ErrorKind kind);

// Thrown by every failing engine operation. The enclosing lock is aborted and
// its state changes discarded.
class CoreError : public std::runtime_error {
public:
    explicit CoreError(int32_t code);
    CoreError(int32_t code, const std::string& detail);

    int32_t code() const noexcept { return code_; }
    ErrorKind kind() const noexcept { return error_kind(code_); }

private:
    int32_t code_;
};

} // namespace clamm

#endif // CLAMM_ERROR_HPP
