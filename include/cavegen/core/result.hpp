// CaveGen Core
// result.hpp - Structured success/failure values for attempt-bounded operations

#pragma once

#include <optional>
#include <stdexcept>
#include <string>
#include <utility>

namespace cavegen::core {

// Outcome of an operation that may legitimately run out of attempts or time.
// Exhaustion is reported here; exceptions are reserved for invalid arguments
// and broken invariants.
template <typename T>
struct Result {
    bool success = false;
    std::optional<T> value;
    std::string error;

    [[nodiscard]] static Result ok(T v) {
        Result result;
        result.success = true;
        result.value = std::move(v);
        return result;
    }

    [[nodiscard]] static Result fail(std::string message) {
        Result result;
        result.success = false;
        result.error = std::move(message);
        return result;
    }

    [[nodiscard]] explicit operator bool() const { return success; }

    /// Access the value; calling this on a failed result is a logic error
    [[nodiscard]] const T& get() const {
        if (!success || !value) {
            throw std::logic_error("Result accessed without a value: " + error);
        }
        return *value;
    }

    [[nodiscard]] T& get() {
        if (!success || !value) {
            throw std::logic_error("Result accessed without a value: " + error);
        }
        return *value;
    }
};

}  // namespace cavegen::core
