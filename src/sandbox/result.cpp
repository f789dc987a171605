#include "result.hpp"

namespace sciclaw {

const char* sandbox_error_kind_name(SandboxErrorKind kind) {
    switch (kind) {
        case SandboxErrorKind::None:          return "none";
        case SandboxErrorKind::Code:          return "code";
        case SandboxErrorKind::Policy:        return "policy";
        case SandboxErrorKind::Timeout:       return "timeout";
        case SandboxErrorKind::Crash:         return "crash";
        case SandboxErrorKind::Configuration: return "configuration";
        case SandboxErrorKind::Dependency:    return "dependency";
    }
    return "none";
}

SandboxErrorKind sandbox_error_kind_from_string(const std::string& s) {
    if (s == "code") return SandboxErrorKind::Code;
    if (s == "policy") return SandboxErrorKind::Policy;
    if (s == "timeout") return SandboxErrorKind::Timeout;
    if (s == "crash") return SandboxErrorKind::Crash;
    if (s == "configuration") return SandboxErrorKind::Configuration;
    if (s == "dependency") return SandboxErrorKind::Dependency;
    return SandboxErrorKind::None;
}

ResultValue ResultValue::of_scalar(nlohmann::json value) {
    ResultValue v;
    v.kind = value.is_null() ? Kind::None : Kind::Scalar;
    v.scalar = std::move(value);
    return v;
}

ResultValue ResultValue::of_table(Dataset table) {
    ResultValue v;
    v.kind = Kind::Table;
    v.table = std::move(table);
    return v;
}

ResultValue ResultValue::from_envelope(const nlohmann::json& j) {
    ResultValue v;
    if (!j.is_object()) return v;
    std::string kind = j.value("kind", "none");
    if (kind == "scalar" && j.contains("value")) {
        return of_scalar(j["value"]);
    }
    if (kind == "table" && j.contains("table")) {
        try {
            return of_table(Dataset::from_json(j["table"]));
        } catch (const std::invalid_argument& e) {
            v.kind = Kind::Opaque;
            v.repr = std::string("<unreadable table: ") + e.what() + ">";
            return v;
        }
    }
    if (kind == "opaque") {
        v.kind = Kind::Opaque;
        v.repr = j.value("repr", "");
    }
    return v;
}

nlohmann::json ResultValue::to_json() const {
    switch (kind) {
        case Kind::None:   return {{"kind", "none"}};
        case Kind::Scalar: return {{"kind", "scalar"}, {"value", scalar}};
        case Kind::Table:  return {{"kind", "table"}, {"table", table.to_json()}};
        case Kind::Opaque: return {{"kind", "opaque"}, {"repr", repr}};
    }
    return {{"kind", "none"}};
}

} // namespace sciclaw
