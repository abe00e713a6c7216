#pragma once

#include <string>
#include <utility>

namespace TRV {

enum class EngineErrorKind {
    UNKNOWN_OPERATION,      // operation name not supported by the engine
    INCOMPATIBLE_ARGUMENT,  // argument kind not accepted at its position
    ARITY_MISMATCH          // missing or surplus arguments
};

std::string toString(EngineErrorKind kind);

/**
 * @brief Outcome of an engine call: a value or an error kind plus message
 */
template <typename T> struct EngineResult {
    T value{};
    EngineErrorKind errorKind = EngineErrorKind::UNKNOWN_OPERATION;
    std::string errorMessage;
    bool success = false;

    static EngineResult createSuccess(T resultValue) {
        EngineResult result;
        result.value = std::move(resultValue);
        result.success = true;
        return result;
    }

    static EngineResult createError(EngineErrorKind kind, const std::string &message) {
        EngineResult result;
        result.errorKind = kind;
        result.errorMessage = message;
        return result;
    }

    template <typename U> static EngineResult propagateError(const EngineResult<U> &other) {
        return createError(other.errorKind, other.errorMessage);
    }

    bool has_value() const {
        return success;
    }

    explicit operator bool() const {
        return success;
    }
};

template <> struct EngineResult<void> {
    EngineErrorKind errorKind = EngineErrorKind::UNKNOWN_OPERATION;
    std::string errorMessage;
    bool success = false;

    static EngineResult createSuccess() {
        EngineResult result;
        result.success = true;
        return result;
    }

    static EngineResult createError(EngineErrorKind kind, const std::string &message) {
        EngineResult result;
        result.errorKind = kind;
        result.errorMessage = message;
        return result;
    }

    template <typename U> static EngineResult propagateError(const EngineResult<U> &other) {
        return createError(other.errorKind, other.errorMessage);
    }

    bool has_value() const {
        return success;
    }

    explicit operator bool() const {
        return success;
    }
};

}  // namespace TRV
