#pragma once

#include <cstddef>
#include <optional>
#include <stdexcept>
#include <string>

namespace TRV {

enum class TranslationErrorKind {
    UNSUPPORTED_OPERATION,      // operator name has no mapping in the target
    UNSUPPORTED_ARGUMENT_TYPE,  // argument has no rendering/adaptation rule
    MALFORMED_BYTECODE          // structurally invalid input
};

std::string toString(TranslationErrorKind kind);

/**
 * @brief Where in the bytecode a translation failure happened
 *
 * Depth 0 is the translated bytecode itself; nested traversals increase it.
 */
struct TranslationLocation {
    std::string phase;  // "source" or "step"
    size_t instructionIndex = 0;
    std::string operatorName;
    std::optional<size_t> argumentIndex;
    size_t depth = 0;

    std::string toString() const;
};

/**
 * @brief Translation failure reported synchronously from translate()
 *
 * No partial result accompanies the exception.
 */
class TranslationException : public std::runtime_error {
public:
    TranslationException(TranslationErrorKind kind, const std::string &detail, const std::string &targetLanguage,
                         std::optional<TranslationLocation> location = std::nullopt);

    TranslationErrorKind getKind() const {
        return kind_;
    }

    const std::string &getDetail() const {
        return detail_;
    }

    const std::string &getTargetLanguage() const {
        return targetLanguage_;
    }

    const std::optional<TranslationLocation> &getLocation() const {
        return location_;
    }

private:
    static std::string buildMessage(TranslationErrorKind kind, const std::string &detail,
                                    const std::string &targetLanguage,
                                    const std::optional<TranslationLocation> &location);

    TranslationErrorKind kind_;
    std::string detail_;
    std::string targetLanguage_;
    std::optional<TranslationLocation> location_;
};

}  // namespace TRV
