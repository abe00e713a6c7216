#include "translator/TranslationException.h"
#include <utility>

namespace TRV {

std::string toString(TranslationErrorKind kind) {
    switch (kind) {
    case TranslationErrorKind::UNSUPPORTED_OPERATION:
        return "UnsupportedOperation";
    case TranslationErrorKind::UNSUPPORTED_ARGUMENT_TYPE:
        return "UnsupportedArgumentType";
    case TranslationErrorKind::MALFORMED_BYTECODE:
        return "MalformedBytecode";
    }
    return "Unknown";
}

std::string TranslationLocation::toString() const {
    std::string result = phase + "[" + std::to_string(instructionIndex) + "] " + operatorName;
    if (argumentIndex) {
        result += " argument[" + std::to_string(*argumentIndex) + "]";
    }
    if (depth > 0) {
        result += " (nested depth " + std::to_string(depth) + ")";
    }
    return result;
}

TranslationException::TranslationException(TranslationErrorKind kind, const std::string &detail,
                                           const std::string &targetLanguage,
                                           std::optional<TranslationLocation> location)
    : std::runtime_error(buildMessage(kind, detail, targetLanguage, location)), kind_(kind), detail_(detail),
      targetLanguage_(targetLanguage), location_(std::move(location)) {}

std::string TranslationException::buildMessage(TranslationErrorKind kind, const std::string &detail,
                                               const std::string &targetLanguage,
                                               const std::optional<TranslationLocation> &location) {
    std::string message = TRV::toString(kind) + " (" + targetLanguage + "): " + detail;
    if (location) {
        message += " at " + location->toString();
    }
    return message;
}

}  // namespace TRV
