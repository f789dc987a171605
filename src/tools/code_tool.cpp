#include "code_tool.hpp"
#include "tool_util.hpp"
#include "../session.hpp"
#include "../util.hpp"
#include "../workspace.hpp"
#include <cstdio>
#include <filesystem>
#include <iostream>

namespace sciclaw {

namespace {

constexpr size_t kMaxBaseName = 40;

std::string figure_base_name(const Figure& fig, const std::string& label, size_t idx,
                             size_t count, const std::string& ts) {
    std::string fallback = "fig_" + std::to_string(idx);
    std::string base;
    if (!label.empty()) {
        base = Workspace::sanitize_filename(label, fallback).substr(0, kMaxBaseName);
    } else if (!fig.title.empty()) {
        base = Workspace::sanitize_filename(replace_all(fig.title, " ", "_"), fallback)
                   .substr(0, kMaxBaseName);
    } else {
        base = (fig.var_name.empty() ? fallback : fig.var_name) + "_" + ts;
    }
    if (count > 1) base += "_" + std::to_string(idx + 1);
    return base;
}

std::string plotly_html(const std::string& title, const std::string& figure_json) {
    // The figure JSON goes inside a <script>; keep "</" from closing it
    std::string safe = replace_all(figure_json, "</", "<\\/");
    return "<!DOCTYPE html>\n<html>\n<head>\n<meta charset=\"utf-8\">\n<title>" + title +
           "</title>\n<script src=\"https://cdn.plot.ly/plotly-2.35.2.min.js\"></script>\n"
           "</head>\n<body>\n<div id=\"chart\" style=\"width:100%;height:90vh\"></div>\n"
           "<script>\nvar fig = " + safe + ";\n"
           "Plotly.newPlot('chart', fig.data || [], fig.layout || {}, {responsive: true});\n"
           "</script>\n</body>\n</html>\n";
}

nlohmann::json artifact_entry(const nlohmann::json& record) {
    return {
        {"name", record.value("name", "")},
        {"type", record.value("type", "")},
        {"format", record.value("format", "")},
        {"path", record.value("path", "")},
        {"download_url", record.value("download_url", "")},
    };
}

std::string with_output(std::string msg, size_t figure_count,
                        const std::string& out, const std::string& err) {
    if (figure_count > 0) {
        msg += "\nexported " + std::to_string(figure_count) + " chart artifact(s)";
    }
    std::string o = trim(out);
    std::string e = trim(err);
    if (!o.empty()) msg += "\nstdout:\n" + o;
    if (!e.empty()) msg += "\nstderr:\n" + e;
    return msg;
}

} // namespace

CodeTool::CodeTool(std::unique_ptr<CodeExecutor> executor, std::string sessions_dir)
    : executor_(std::move(executor)), sessions_dir_(std::move(sessions_dir)) {}

std::string CodeTool::parameters_json() const {
    return R"({"type":"object","properties":{)"
           R"("code":{"type":"string","description":"Code to run"},)"
           R"("dataset_name":{"type":"string","description":"Dataset bound as df"},)"
           R"("persist_df":{"type":"boolean","default":false,"description":"Write the modified df back to the dataset"},)"
           R"("save_as":{"type":"string","description":"Store a table result as a new dataset"},)"
           R"("purpose":{"type":"string","enum":["exploration","transformation","visualization","export"],"default":"exploration"},)"
           R"("label":{"type":"string","description":"Short name for the code, used for artifact names"},)"
           R"("intent":{"type":"string","description":"One-line summary of what the run is for"})"
           R"(},"required":["code"]})";
}

ToolResult CodeTool::execute(Session& session, const nlohmann::json& args) {
    std::string code = trim(optional_string(args, "code"));
    std::string dataset_name = optional_string(args, "dataset_name");
    bool persist = optional_bool(args, "persist_df", false);
    std::string save_as = optional_string(args, "save_as");
    std::string purpose = trim(optional_string(args, "purpose", "exploration"));
    std::string label = trim(optional_string(args, "label"));
    std::string intent = trim(optional_string(args, "intent", label));

    nlohmann::json meta = nlohmann::json::object();
    if (!intent.empty()) meta["intent"] = intent;

    if (code.empty()) {
        ToolResult r = ToolResult::failure("code must not be empty");
        r.metadata = meta;
        r.metadata["purpose"] = purpose;
        return r;
    }
    if (!dataset_name.empty() && session.datasets.count(dataset_name) == 0) {
        return ToolResult::failure("dataset '" + dataset_name + "' does not exist");
    }

    SandboxRequest request;
    request.session_id = session.id;
    request.code = code;
    request.datasets = session.datasets;
    if (!dataset_name.empty()) request.active_dataset = dataset_name;
    request.persist = persist;

    SandboxResult out = executor_->execute(request);

    if (!out.success) {
        switch (out.error_kind) {
            case SandboxErrorKind::Policy:
                return ToolResult::failure("sandbox policy blocked: " + out.error);
            case SandboxErrorKind::Configuration:
                throw ConfigurationError(out.error);
            default:
                break;
        }
        std::string err = out.error.empty() ? language_label() + " code execution failed"
                                            : out.error;
        ToolResult r = ToolResult::failure(
            "code execution failed: " + err,
            {{"stdout", out.stdout_text},
             {"stderr", out.stderr_text},
             {"traceback", out.traceback}});
        r.metadata = meta;
        r.metadata["error_kind"] = sandbox_error_kind_name(out.error_kind);
        return r;
    }

    for (auto& [name, ds] : out.updated_datasets) {
        session.datasets[name] = std::move(ds);
    }

    ToolResult result;
    result.metadata = meta;
    Workspace workspace(sessions_dir_, session.id);
    result.artifacts = save_figures(workspace, out.figures, label, result);
    size_t figure_count = result.artifacts.size();

    if (out.result.kind == ResultValue::Kind::Table) {
        const Dataset& table = out.result.table;
        if (!save_as.empty()) session.datasets[save_as] = table;
        result.has_dataframe = true;
        result.dataframe_preview = table.preview();
        result.data = {{"result_type", "dataframe"}};
        std::string msg = "code executed, returned a table (" +
                          std::to_string(table.row_count()) + " rows x " +
                          std::to_string(table.column_count()) + " columns)";
        if (!save_as.empty()) msg += ", saved as dataset '" + save_as + "'";
        result.message = with_output(msg, figure_count, out.stdout_text, out.stderr_text);
        return result;
    }

    nlohmann::json data;
    switch (out.result.kind) {
        case ResultValue::Kind::Scalar:
            data["result"] = out.result.scalar;
            data["result_type"] = "scalar";
            break;
        case ResultValue::Kind::Opaque:
            data["result"] = nullptr;
            data["result_repr"] = out.result.repr;
            data["result_type"] = "opaque";
            break;
        default:
            data["result"] = nullptr;
            data["result_type"] = "none";
            break;
    }
    result.data = data;
    result.message = with_output("code executed", figure_count, out.stdout_text,
                                 out.stderr_text);
    return result;
}

nlohmann::json CodeTool::save_figures(Workspace& workspace, const std::vector<Figure>& figures,
                                      const std::string& label, ToolResult& result) const {
    nlohmann::json artifacts = nlohmann::json::array();
    if (figures.empty()) return artifacts;
    std::string ts = compact_timestamp();

    auto save = [&](const std::string& name, const std::string& content,
                    const std::string& format) {
        try {
            artifacts.push_back(artifact_entry(workspace.save_artifact(name, content, "chart", format)));
        } catch (const std::exception& e) {
            std::cerr << "[tools] Failed to save chart " << name << ": " << e.what() << "\n";
        }
    };

    for (size_t idx = 0; idx < figures.size(); ++idx) {
        const Figure& fig = figures[idx];
        std::string base = figure_base_name(fig, label, idx, figures.size(), ts);

        if (fig.library == "matplotlib") {
            if (!fig.svg_base64.empty()) save(base + ".svg", base64_decode(fig.svg_base64), "svg");
            if (!fig.png_base64.empty()) save(base + ".png", base64_decode(fig.png_base64), "png");
        } else if (fig.library == "plotly") {
            if (fig.plotly_json.empty()) continue;
            save(base + ".plotly.json", fig.plotly_json, "json");
            save(base + ".html", plotly_html(fig.title.empty() ? base : fig.title, fig.plotly_json),
                 "html");
            if (!result.has_chart) {
                try {
                    result.chart_data = nlohmann::json::parse(fig.plotly_json);
                    result.has_chart = true;
                } catch (const nlohmann::json::parse_error& e) {
                    std::cerr << "[tools] Unreadable plotly figure " << base << ": " << e.what() << "\n";
                }
            }
        } else if (!fig.path.empty()) {
            std::string content;
            try {
                content = read_file(fig.path);
            } catch (const std::runtime_error& e) {
                std::cerr << "[tools] " << e.what() << "\n";
                continue;
            }
            std::string format = fig.format;
            if (format.empty()) {
                std::string ext = std::filesystem::path(fig.path).extension().string();
                format = ext.size() > 1 ? ext.substr(1) : "bin";
            }
            std::string stem = !label.empty()
                ? Workspace::sanitize_filename(label, "r_plot").substr(0, kMaxBaseName)
                : Workspace::sanitize_filename(fig.title, "r_plot").substr(0, kMaxBaseName);
            char suffix[8];
            std::snprintf(suffix, sizeof(suffix), "%02zu", idx);
            save(stem + "_" + ts + "_" + suffix + "." + format, content, format);
        }
    }
    return artifacts;
}

} // namespace sciclaw
