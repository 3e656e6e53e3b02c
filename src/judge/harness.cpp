#include "judge/harness.hpp"
#include <fmt/core.h>
#include <algorithm>
#include <filesystem>
#include "common/json_utils.hpp"
#include "common/utils.hpp"
#include "execution/project.hpp"

namespace runner {
using namespace std;
using namespace nlohmann;

static const char *HARNESS_TEMPLATE = R"PY(import json as _runner_json
import os as _runner_os
import sys as _runner_sys
import traceback as _runner_traceback
import importlib.util as _runner_importlib


def _runner_describe(exc):
    text = ''.join(_runner_traceback.format_exception_only(type(exc), exc)).strip()
    return text.replace(_runner_os.path.join(_runner_os.getcwd(), ''), '')


def _runner_emit(kind, detail=None):
    line = {prefix} + kind
    if detail is not None:
        line += ':' + _runner_json.dumps(detail)
    _runner_sys.stdout.write('\n' + line + '\n')
    _runner_sys.stdout.flush()


try:
    _runner_spec = _runner_importlib.spec_from_file_location(
        {module}, _runner_os.path.join(_runner_os.path.dirname(_runner_os.path.abspath(__file__)), {file}))
    _runner_entry = _runner_importlib.module_from_spec(_runner_spec)
    _runner_sys.modules[{module}] = _runner_entry
    _runner_spec.loader.exec_module(_runner_entry)
except (Exception, SystemExit) as _runner_exc:
    _runner_sys.modules.pop({module}, None)
    _runner_emit('ERROR', 'Unable to import ' + {entry} + ': ' + _runner_describe(_runner_exc))
else:
    _runner_names = getattr(_runner_entry, '__all__', None)
    if _runner_names is None:
        _runner_names = [n for n in dir(_runner_entry) if not n.startswith('_')]
    for _runner_name in _runner_names:
        globals()[_runner_name] = getattr(_runner_entry, _runner_name)
    try:
        exec(compile({code}, {name}, 'exec'), globals())
    except AssertionError as _runner_exc:
        _runner_emit('FAIL', str(_runner_exc) or 'Assertion failed')
    except (Exception, SystemExit) as _runner_exc:
        _runner_emit('ERROR', _runner_describe(_runner_exc))
    else:
        _runner_emit('PASS')
)PY";

// 生成一个 Python 字符串字面量，JSON 字符串的转义规则是 Python 的子集
static string python_literal(const string &text) {
    return dump_lossy(json(text));
}

static string random_nonce() {
    string nonce = random_uuid();
    nonce.erase(remove(nonce.begin(), nonce.end(), '-'), nonce.end());
    return nonce.substr(0, 16);
}

harness_builder::harness_builder(string marker)
    : marker_prefix(move(marker)) {}

const string &harness_builder::marker() const {
    return marker_prefix;
}

string harness_builder::render(const string &module, const string &entry_path, const test_definition &test, const string &nonce) const {
    return fmt::format(fmt::runtime(HARNESS_TEMPLATE),
                       fmt::arg("prefix", python_literal(marker_prefix + ":" + nonce + ":")),
                       fmt::arg("module", python_literal(module)),
                       fmt::arg("file", python_literal(filesystem::path(entry_path).filename().string())),
                       fmt::arg("entry", python_literal(entry_path)),
                       fmt::arg("code", python_literal(test.code)),
                       fmt::arg("name", python_literal("<" + (test.name.empty() ? test.id : test.name) + ">")));
}

harness harness_builder::build(const vector<project_file> &files, const string &entry_point, const test_definition &test, backend_kind backend, int timeout_ms) const {
    const project_file &entry = resolve_entry_point(files, entry_point);
    filesystem::path entry_path(entry.path);
    string module = entry_path.stem().string();
    string directory = entry_path.parent_path().string();

    harness result;
    string path;
    do {
        result.nonce = random_nonce();
        path = (directory.empty() ? "" : directory + "/") + "_runner_harness_" + result.nonce.substr(0, 8) + ".py";
    } while (any_of(files.begin(), files.end(), [&](const project_file &file) { return file.path == path; }));

    result.path = path;
    result.request.id = random_uuid();
    result.request.mode = execution_mode::PROJECT;
    result.request.files = files;
    result.request.files.push_back({path, render(module, entry.path, test, result.nonce)});
    result.request.entry_point = path;
    result.request.backend = backend;
    result.request.timeout_ms = timeout_ms;
    return result;
}

}  // namespace runner
