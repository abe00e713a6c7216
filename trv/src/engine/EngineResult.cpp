#include "engine/EngineResult.h"

namespace TRV {

std::string toString(EngineErrorKind kind) {
    switch (kind) {
    case EngineErrorKind::UNKNOWN_OPERATION:
        return "UnknownOperation";
    case EngineErrorKind::INCOMPATIBLE_ARGUMENT:
        return "IncompatibleArgument";
    case EngineErrorKind::ARITY_MISMATCH:
        return "ArityMismatch";
    }
    return "Unknown";
}

}  // namespace TRV
