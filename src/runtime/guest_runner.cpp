#include "runtime/guest_runner.hpp"

namespace sandcell::runtime {

const std::string& GuestRunnerScript() {
    static const std::string kScript = R"PY(import ast
import base64
import builtins
import importlib
import json
import linecache
import os
import pickle
import sys
import traceback
import types

try:
    import cloudpickle as _pickler
except ImportError:
    _pickler = pickle

_compile = builtins.compile
_exec = builtins.exec
_eval = builtins.eval
_GUEST_FILE = "<guest>"
_JSON_SCALARS = (bool, int, float, str, type(None))


def _read_json(path):
    with open(path, "r", encoding="utf-8") as handle:
        return json.load(handle)


def _write_json(path, data):
    temp = path + ".tmp"
    with open(temp, "w", encoding="utf-8") as handle:
        json.dump(data, handle)
    os.replace(temp, path)


def _is_json_value(value, depth=0):
    kind = type(value)
    if kind is float:
        return value == value and value not in (float("inf"), float("-inf"))
    if kind in _JSON_SCALARS:
        return True
    if depth > 32:
        return False
    if kind is list:
        return all(_is_json_value(item, depth + 1) for item in value)
    if kind is dict:
        return all(type(key) is str and _is_json_value(item, depth + 1) for key, item in value.items())
    return False


def _matches(root, pattern):
    if pattern == "*":
        return True
    if pattern.endswith(".*"):
        return root == pattern[:-2]
    return root == pattern


def _called_from_guest(namespace, depth=2):
    return sys._getframe(depth).f_globals is namespace


class ImportGuard:
    """Wraps builtins.__import__ for imports issued by guest frames."""

    def __init__(self, policy, namespace, warnings):
        self._allowed = list(policy.get("allowed_modules", []))
        self._authorized = list(policy.get("authorized_imports", []))
        self._denied = set(policy.get("denied_modules", []))
        self._namespace = namespace
        self._warnings = warnings
        self._warned = set()
        self._original = None

    def check(self, name):
        root = name.split(".")[0]
        denied = root in self._denied
        if self._allowed:
            allowed = any(_matches(root, pattern) for pattern in self._allowed)
        else:
            allowed = not denied
        if not allowed:
            if denied:
                raise ImportError("Import of module '%s' is blocked by the sandbox safety policy" % name)
            raise ImportError("Import of module '%s' is not in the authorized imports list: %s"
                              % (name, ", ".join(self._authorized)))
        if denied and root not in self._warned:
            self._warned.add(root)
            self._warnings.append("Importing dangerous module '%s' was allowed due to "
                                  "authorized_imports configuration." % root)

    def __enter__(self):
        original = builtins.__import__
        self._original = original
        guard = self

        def guarded_import(name, globals=None, locals=None, fromlist=(), level=0):
            if level == 0 and _called_from_guest(guard._namespace):
                guard.check(name)
            return original(name, globals, locals, fromlist, level)

        builtins.__import__ = guarded_import
        return self

    def __exit__(self, exc_type, exc, tb):
        if self._original is not None:
            builtins.__import__ = self._original
        return False


class FunctionBlocker:
    """Replaces blocked built-ins with stubs that raise when guest frames call them."""

    def __init__(self, names, namespace):
        # __import__ stays with ImportGuard so that import statements keep working.
        self._names = [name for name in names if name != "__import__"]
        self._namespace = namespace
        self._saved = {}

    def _stub(self, name, original):
        namespace = self._namespace

        def stub(*args, **kwargs):
            caller = sys._getframe(1)
            if caller.f_globals is namespace:
                raise PermissionError("Call to '%s' is blocked in untrusted code." % name)
            if not args and not kwargs:
                if name == "globals":
                    return caller.f_globals
                if name in ("locals", "vars"):
                    return caller.f_locals
            return original(*args, **kwargs)

        stub.__name__ = name
        return stub

    def __enter__(self):
        for name in self._names:
            if hasattr(builtins, name):
                original = getattr(builtins, name)
                self._saved[name] = original
                setattr(builtins, name, self._stub(name, original))
        return self

    def __exit__(self, exc_type, exc, tb):
        for name, original in self._saved.items():
            setattr(builtins, name, original)
        self._saved.clear()
        return False


def _restore(snapshot, namespace, warnings, guard):
    for name, entry in snapshot.get("values", {}).items():
        try:
            encoding = entry.get("encoding")
            if encoding == "json":
                namespace[name] = entry.get("value")
            elif encoding == "module":
                if guard is not None:
                    guard.check(entry.get("value", ""))
                namespace[name] = importlib.import_module(entry.get("value", ""))
            elif encoding == "pickle":
                namespace[name] = pickle.loads(base64.b64decode(entry["data"]))
            else:
                raise ValueError("unknown encoding %r" % encoding)
        except Exception as exc:
            warnings.append("SnapshotCorrupt: variable '%s' could not be restored (%s: %s)"
                            % (name, type(exc).__name__, exc))


def _capture(namespace, warnings):
    values = {}
    for name, value in namespace.items():
        if name.startswith("__"):
            continue
        type_name = type(value).__name__
        if isinstance(value, types.ModuleType):
            values[name] = {"encoding": "module", "value": value.__name__, "type": "module"}
            continue
        if _is_json_value(value):
            values[name] = {"encoding": "json", "value": value, "type": type_name}
            continue
        try:
            data = _pickler.dumps(value)
        except Exception as exc:
            warnings.append("Variable '%s' of type %s was not saved: %s" % (name, type_name, exc))
            continue
        values[name] = {"encoding": "pickle", "data": base64.b64encode(data).decode("ascii"), "type": type_name}
    return values


def _format_error(exc):
    frames = [frame for frame in traceback.extract_tb(exc.__traceback__) if frame.filename == _GUEST_FILE]
    text = "Traceback (most recent call last):\n" if frames else ""
    text += "".join(traceback.format_list(frames))
    text += "".join(traceback.format_exception_only(type(exc), exc))
    message = "".join(traceback.format_exception_only(type(exc), exc)).strip()
    return {"kind": "GuestRuntimeError", "type": type(exc).__name__, "message": message, "traceback": text}


def _compile_source(source):
    tree = ast.parse(source, filename=_GUEST_FILE, mode="exec")
    last = None
    if tree.body and isinstance(tree.body[-1], ast.Expr):
        last = ast.Expression(tree.body.pop().value)
    body = _compile(tree, _GUEST_FILE, "exec")
    tail = _compile(last, _GUEST_FILE, "eval") if last is not None else None
    return body, tail


def main(argv):
    job_path = os.path.abspath(argv[1])
    base = os.path.dirname(job_path)
    if sys.path and os.path.abspath(sys.path[0] or ".") == base:
        del sys.path[0]
    job = _read_json(job_path)

    def resolve(key, default):
        return os.path.join(base, job.get(key, default))

    result = {"ok": True, "return_value": None, "error": None, "warnings": []}
    warnings = result["warnings"]
    namespace = {"__name__": "__main__", "__builtins__": builtins}
    source = job.get("source", "")
    policy = job.get("policy", {})
    trusted = bool(job.get("trusted", False))

    # Module references are re-imported, so they pass the same import check.
    restore_guard = None if trusted else ImportGuard(policy, namespace, warnings)
    snapshot_in = resolve("snapshot_in", "snapshot_in.json")
    if os.path.exists(snapshot_in):
        try:
            _restore(_read_json(snapshot_in), namespace, warnings, restore_guard)
        except Exception as exc:
            warnings.append("SnapshotCorrupt: snapshot file could not be read (%s)" % exc)
    linecache.cache[_GUEST_FILE] = (len(source), None, source.splitlines(True), _GUEST_FILE)

    try:
        body, tail = _compile_source(source)
        if trusted:
            _exec(body, namespace)
            value = _eval(tail, namespace) if tail is not None else None
        else:
            blocked = policy.get("blocked_functions", []) if policy.get("function_blocking_active", True) else []
            with ImportGuard(policy, namespace, warnings), FunctionBlocker(blocked, namespace):
                _exec(body, namespace)
                value = _eval(tail, namespace) if tail is not None else None
        if value is not None:
            result["return_value"] = repr(value)
    except SystemExit as exc:
        if exc.code not in (None, 0):
            result["ok"] = False
            result["error"] = {"kind": "GuestRuntimeError", "type": "SystemExit",
                               "message": "SystemExit: %s" % (exc.code,), "traceback": ""}
    except BaseException as exc:
        result["ok"] = False
        result["error"] = _format_error(exc)

    sys.stdout.flush()
    sys.stderr.flush()
    _write_json(resolve("snapshot_out", "snapshot_out.json"), {"values": _capture(namespace, warnings)})
    _write_json(resolve("result", "result.json"), result)
    return 0


if __name__ == "__main__":
    sys.exit(main(sys.argv))
)PY";
    return kScript;
}

}  // namespace sandcell::runtime
