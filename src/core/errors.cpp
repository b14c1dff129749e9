/**
 * @file errors.cpp
 * @brief String conversions for the engine error taxonomy
 *
 * @date 2025
 */

#include "sandexec/core/errors.hpp"

namespace sandexec {
namespace core {

std::string ToString(ErrorKind kind) {
    switch (kind) {
        case ErrorKind::INPUT:          return "input";
        case ErrorKind::INFRASTRUCTURE: return "infrastructure";
        case ErrorKind::CLEANUP:        return "cleanup";
    }
    return "unknown";
}

std::string ToString(InputErrorCode code) {
    switch (code) {
        case InputErrorCode::MALFORMED_PAYLOAD:    return "malformed_payload";
        case InputErrorCode::SCHEMA_VIOLATION:     return "schema_violation";
        case InputErrorCode::MISSING_FIELD:        return "missing_field";
        case InputErrorCode::EMPTY_CODE:           return "empty_code";
        case InputErrorCode::CODE_TOO_LARGE:       return "code_too_large";
        case InputErrorCode::UNSUPPORTED_LANGUAGE: return "unsupported_language";
    }
    return "unknown";
}

std::string ToString(ExecutionStage stage) {
    switch (stage) {
        case ExecutionStage::RESOLVE:          return "resolve";
        case ExecutionStage::ENSURE_IMAGE:     return "image";
        case ExecutionStage::CREATE_CONTAINER: return "create";
        case ExecutionStage::START_CONTAINER:  return "start";
        case ExecutionStage::WAIT_FOR_EXIT:    return "wait";
        case ExecutionStage::COLLECT_LOGS:     return "logs";
        case ExecutionStage::REMOVE_CONTAINER: return "remove";
    }
    return "unknown";
}

} // namespace core
} // namespace sandexec
