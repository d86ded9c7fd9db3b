#include "../include/errors.hpp"
#include <nlohmann/json.hpp>

using json = nlohmann::json;

const char* to_string(FailureKind kind) {
    switch (kind) {
        case FailureKind::Transient: return "transient";
        case FailureKind::Fatal: return "fatal";
        case FailureKind::Integrity: return "integrity";
    }
    return "unknown";
}

IntegrityMismatch::IntegrityMismatch(const std::string& expected, const std::string& actual)
    : StageFailure(FailureKind::Integrity,
                   "integrity mismatch: expected sha256 " + expected + ", destination has " + actual,
                   json({{"expected", expected}, {"actual", actual}}).dump()) {}
