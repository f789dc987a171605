#pragma once
#include "../dataset.hpp"
#include <map>
#include <optional>
#include <string>
#include <vector>
#include <nlohmann/json.hpp>

namespace sciclaw {

enum class SandboxErrorKind {
    None,
    Code,           // user code raised / R error
    Policy,         // rejected before running
    Timeout,
    Crash,          // worker died without a result
    Configuration,  // interpreter missing
    Dependency,     // package install failed
};

const char* sandbox_error_kind_name(SandboxErrorKind kind);
SandboxErrorKind sandbox_error_kind_from_string(const std::string& s);

// Value returned across the process boundary. Anything the worker cannot
// express as JSON or a table is downgraded to its repr.
struct ResultValue {
    enum class Kind { None, Scalar, Table, Opaque };

    Kind kind = Kind::None;
    nlohmann::json scalar;  // Scalar: any JSON value
    Dataset table;          // Table
    std::string repr;       // Opaque

    // {"kind": "none"|"scalar"|"table"|"opaque", "value"|"table"|"repr": ...}
    static ResultValue from_envelope(const nlohmann::json& j);
    nlohmann::json to_json() const;

    static ResultValue of_scalar(nlohmann::json value);
    static ResultValue of_table(Dataset table);
};

struct Figure {
    std::string library;  // "plotly" | "matplotlib" | "r"
    std::string title;
    std::string var_name;
    std::string plotly_json;  // plotly
    std::string svg_base64;   // matplotlib
    std::string png_base64;   // matplotlib
    std::string path;         // R: file written under plots/
    std::string format;       // R: pdf | png | svg | html
};

struct SandboxRequest {
    std::string session_id;
    std::string code;
    std::map<std::string, Dataset> datasets;  // snapshot, never written back by the executor
    std::optional<std::string> active_dataset;
    bool persist = false;
};

struct SandboxResult {
    bool success = false;
    std::string stdout_text;
    std::string stderr_text;
    ResultValue result;
    std::map<std::string, Dataset> updated_datasets;  // only when persist was requested
    std::vector<Figure> figures;
    std::string error;
    std::string traceback;
    SandboxErrorKind error_kind = SandboxErrorKind::None;

    static SandboxResult failure(SandboxErrorKind kind, const std::string& message) {
        SandboxResult r;
        r.error_kind = kind;
        r.error = message;
        return r;
    }
};

// Runs code in isolation. Code-level failures come back as results; execute()
// does not throw for them.
class CodeExecutor {
public:
    virtual ~CodeExecutor() = default;
    virtual SandboxResult execute(const SandboxRequest& request) = 0;
    virtual std::string language() const = 0;  // "python" | "r"
};

} // namespace sciclaw
