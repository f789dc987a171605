#include "python_worker.hpp"

namespace sciclaw {

// Runs as: python3 -I -c <source> <request.json> <result fd>
// The request carries code, datasets, the active dataset name, the persist
// flag and the import/call policy lists. The response envelope is written as
// JSON to the result fd, which is then closed.
static const char* const kWorkerSource = R"PY(
import ast
import base64
import builtins
import io
import json
import math
import os
import sys
import traceback

_REAL_IMPORT = builtins.__import__


class PolicyViolation(Exception):
    pass


def check_policy(code, allowed, banned):
    try:
        tree = ast.parse(code, "<sandbox>", "exec")
    except SyntaxError as exc:
        raise PolicyViolation("syntax error: %s (line %s)" % (exc.msg, exc.lineno))
    for node in ast.walk(tree):
        line = getattr(node, "lineno", None)
        where = " (line %d)" % line if line else ""
        if isinstance(node, ast.Import):
            for alias in node.names:
                if alias.name.split(".", 1)[0] not in allowed:
                    raise PolicyViolation("import of module %s is not allowed%s" % (alias.name, where))
        elif isinstance(node, ast.ImportFrom):
            if node.level:
                raise PolicyViolation("relative imports are not allowed%s" % where)
            module = node.module or ""
            if not module or module.split(".", 1)[0] not in allowed:
                raise PolicyViolation("import of module %s is not allowed%s" % (module or "<empty>", where))
        elif isinstance(node, ast.Call) and isinstance(node.func, ast.Name):
            if node.func.id in banned:
                raise PolicyViolation("call to %s is not allowed%s" % (node.func.id, where))
        elif isinstance(node, ast.Attribute):
            if node.attr.startswith("__") and node.attr.endswith("__"):
                raise PolicyViolation("access to attribute %s is not allowed%s" % (node.attr, where))


def make_builtins(allowed):
    def guarded_import(name, globals=None, locals=None, fromlist=(), level=0):
        if level:
            raise ImportError("relative imports are not allowed")
        if name.split(".", 1)[0] not in allowed:
            raise ImportError("import of module %s is not allowed" % name)
        return _REAL_IMPORT(name, globals, locals, fromlist, level)

    names = [
        "abs", "all", "any", "bool", "bytearray", "bytes", "callable", "chr", "complex",
        "dict", "divmod", "enumerate", "filter", "float", "format", "frozenset", "hash",
        "int", "isinstance", "issubclass", "iter", "len", "list", "map", "max", "min",
        "next", "object", "ord", "pow", "print", "range", "repr", "reversed", "round",
        "set", "slice", "sorted", "str", "sum", "tuple", "zip",
        "ArithmeticError", "AssertionError", "AttributeError", "Exception", "IndexError",
        "KeyError", "LookupError", "MemoryError", "NameError", "NotImplementedError",
        "OverflowError", "RuntimeError", "StopIteration", "TypeError", "ValueError",
        "ZeroDivisionError", "True", "False", "None",
    ]
    safe = {n: getattr(builtins, n) for n in names if hasattr(builtins, n)}
    safe["__import__"] = guarded_import
    safe["__build_class__"] = builtins.__build_class__
    return safe


def plain(value, depth=0):
    if depth > 32:
        raise TypeError("nested too deeply")
    if value is None or isinstance(value, (bool, str)):
        return value
    if isinstance(value, int):
        return value
    if isinstance(value, float):
        return value if math.isfinite(value) else None
    if isinstance(value, (list, tuple)):
        return [plain(v, depth + 1) for v in value]
    if isinstance(value, dict):
        return {str(k): plain(v, depth + 1) for k, v in value.items()}
    item = getattr(value, "item", None)
    if callable(item) and getattr(value, "shape", None) == ():
        return plain(item(), depth + 1)
    tolist = getattr(value, "tolist", None)
    if callable(tolist) and type(value).__module__.split(".", 1)[0] == "numpy":
        return plain(tolist(), depth + 1)
    raise TypeError("not representable")


def cell(value):
    try:
        v = plain(value)
    except TypeError:
        iso = getattr(value, "isoformat", None)
        v = iso() if callable(iso) else str(value)
    if isinstance(v, (list, dict)):
        return json.dumps(v)
    return v


def table_from_records(records):
    columns = []
    for rec in records:
        for key in rec:
            if str(key) not in columns:
                columns.append(str(key))
    rows = [[cell(rec.get(c)) for c in columns] for rec in records]
    return {"columns": columns, "rows": rows}


def as_table(obj, pd):
    if pd is not None:
        if isinstance(obj, pd.Series):
            obj = obj.to_frame()
        if isinstance(obj, pd.DataFrame):
            frame = obj.astype(object).where(pd.notna(obj), None)
            return {
                "columns": [str(c) for c in frame.columns],
                "rows": [[cell(v) for v in row] for row in frame.itertuples(index=False, name=None)],
            }
    if isinstance(obj, list) and obj and all(isinstance(r, dict) for r in obj):
        return table_from_records(obj)
    return None


def envelope(obj, pd):
    if obj is None:
        return {"kind": "none"}
    table = as_table(obj, pd)
    if table is not None:
        return {"kind": "table", "table": table}
    try:
        return {"kind": "scalar", "value": plain(obj)}
    except TypeError:
        pass
    try:
        text = repr(obj)
    except Exception as exc:
        text = "<unrepresentable %s: %s>" % (type(obj).__name__, exc)
    return {"kind": "opaque", "repr": text[:20000]}


def load_dataset(spec, pd):
    columns = spec.get("columns", [])
    rows = spec.get("rows", [])
    if pd is not None:
        return pd.DataFrame(rows, columns=columns)
    return [dict(zip(columns, row)) for row in rows]


def figure_title_mpl(fig):
    title = ""
    sup = getattr(fig, "_suptitle", None)
    if sup is not None:
        title = sup.get_text()
    if not title and fig.get_axes():
        title = fig.get_axes()[0].get_title()
    return title or ""


def mpl_entry(fig, var_name):
    entry = {"library": "matplotlib", "var_name": var_name, "title": figure_title_mpl(fig)}
    buf = io.BytesIO()
    fig.savefig(buf, format="svg", bbox_inches="tight")
    entry["svg_base64"] = base64.b64encode(buf.getvalue()).decode("ascii")
    buf = io.BytesIO()
    fig.savefig(buf, format="png", bbox_inches="tight", dpi=150)
    entry["png_base64"] = base64.b64encode(buf.getvalue()).decode("ascii")
    return entry


def collect_figures(namespace):
    plotly_cls = None
    mpl_cls = None
    go = sys.modules.get("plotly.graph_objects") or sys.modules.get("plotly.graph_objs")
    if go is not None:
        plotly_cls = getattr(go, "Figure", None)
    mfig = sys.modules.get("matplotlib.figure")
    if mfig is not None:
        mpl_cls = getattr(mfig, "Figure", None)
    figures = []
    notes = []
    seen = set()
    for var_name, obj in list(namespace.items()):
        if var_name.startswith("_") or id(obj) in seen:
            continue
        try:
            if plotly_cls is not None and isinstance(obj, plotly_cls):
                seen.add(id(obj))
                title = ""
                layout_title = getattr(obj.layout, "title", None)
                if layout_title is not None and getattr(layout_title, "text", None):
                    title = str(layout_title.text)
                figures.append({"library": "plotly", "var_name": var_name,
                                "title": title, "plotly_json": obj.to_json()})
            elif mpl_cls is not None and isinstance(obj, mpl_cls):
                seen.add(id(obj))
                if obj.get_axes():
                    figures.append(mpl_entry(obj, var_name))
        except Exception as exc:
            notes.append("figure %s skipped: %s" % (var_name, exc))
    plt = sys.modules.get("matplotlib.pyplot")
    if plt is not None:
        try:
            current = plt.gcf()
            if current.get_axes() and id(current) not in seen:
                figures.append(mpl_entry(current, "__gcf__"))
        except Exception as exc:
            notes.append("current figure skipped: %s" % exc)
    return figures, notes


def run(req):
    allowed = set(req["allowed_imports"])
    banned = set(req["banned_calls"])
    out = io.StringIO()
    err = io.StringIO()
    response = {"success": False, "stdout": "", "stderr": ""}
    try:
        check_policy(req["code"], allowed, banned)
    except PolicyViolation as exc:
        response.update(error=str(exc), error_kind="policy")
        return response

    try:
        import pandas as pd
    except ImportError:
        pd = None

    datasets = {name: load_dataset(spec, pd) for name, spec in req["datasets"].items()}
    namespace = {"__builtins__": make_builtins(allowed), "__name__": "__sandbox__",
                 "datasets": datasets}
    if pd is not None:
        namespace["pd"] = pd
    active = req.get("active_dataset")
    if active:
        if active not in datasets:
            response.update(error="dataset '%s' does not exist" % active, error_kind="code")
            return response
        namespace["df"] = datasets[active]

    saved = sys.stdout, sys.stderr
    sys.stdout, sys.stderr = out, err
    try:
        exec(compile(req["code"], "<sandbox>", "exec"), namespace)
    except BaseException as exc:
        sys.stdout, sys.stderr = saved
        response.update(stdout=out.getvalue(), stderr=err.getvalue(),
                        error="%s: %s" % (type(exc).__name__, exc),
                        traceback=traceback.format_exc(), error_kind="code")
        return response
    finally:
        sys.stdout, sys.stderr = saved

    result_obj = namespace.get("result")
    output_df = namespace.get("output_df")
    if output_df is not None and as_table(output_df, pd) is not None:
        result_obj = output_df

    updated = {}
    if req.get("persist"):
        if active and "df" in namespace:
            datasets[active] = namespace["df"]
        for name, value in datasets.items():
            table = as_table(value, pd)
            if table is not None:
                updated[name] = table

    figures, notes = collect_figures(namespace)
    stderr_text = err.getvalue()
    if notes:
        stderr_text += "\n".join(notes) + "\n"
    response.update(success=True, stdout=out.getvalue(), stderr=stderr_text,
                    result=envelope(result_obj, pd), datasets=updated, figures=figures,
                    error_kind="none")
    return response


def write_all(fd, data):
    view = memoryview(data)
    while view:
        written = os.write(fd, view)
        view = view[written:]


def main():
    request_path = sys.argv[1]
    fd = int(sys.argv[2])
    with open(request_path, "r", encoding="utf-8") as fh:
        req = json.load(fh)
    try:
        response = run(req)
    except MemoryError:
        response = {"success": False, "stdout": "", "stderr": "",
                    "error": "MemoryError: out of memory", "error_kind": "code"}
    except Exception as exc:
        response = {"success": False, "stdout": "", "stderr": "",
                    "error": "worker failure: %s" % exc,
                    "traceback": traceback.format_exc(), "error_kind": "crash"}
    try:
        payload = json.dumps(response, ensure_ascii=False, allow_nan=False)
    except (TypeError, ValueError) as exc:
        payload = json.dumps({"success": False, "stdout": "", "stderr": "",
                              "error": "result could not be encoded: %s" % exc,
                              "error_kind": "code"})
    write_all(fd, payload.encode("utf-8"))
    os.close(fd)


main()
)PY";

const char* python_worker_source() {
    return kWorkerSource;
}

} // namespace sciclaw
