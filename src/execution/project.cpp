#include "execution/project.hpp"
#include <fmt/core.h>
#include <cctype>
#include <filesystem>
#include <unordered_set>
#include "common/exceptions.hpp"
#include "common/io_utils.hpp"
#include "common/stl_utils.hpp"
#include "config.hpp"

namespace runner {
using namespace std;

static string extension_of(const string &path) {
    string ext = filesystem::path(path).extension().string();
    for (char &c : ext) c = (char)tolower((unsigned char)c);
    return ext;
}

void validate_path(const string &path, const set<string> &extensions) {
    if (path.empty())
        throw validation_error("File path must not be empty");
    if (path.find('\0') != string::npos)
        throw validation_error("File path contains a NUL character");
    if (path.find('\\') != string::npos)
        throw validation_error(fmt::format("File path {} must use '/' as separator", path));
    if (path.front() == '/')
        throw validation_error(fmt::format("File path {} must be relative", path));
    if (path.size() >= 2 && isalpha((unsigned char)path[0]) && path[1] == ':')
        throw validation_error(fmt::format("File path {} must be relative", path));

    for (const string &segment : split(path, '/')) {
        if (segment.empty())
            throw validation_error(fmt::format("File path {} contains an empty segment", path));
        if (segment == "..")
            throw validation_error(fmt::format("File path {} must not refer to a parent directory", path));
        if (segment == ".")
            throw validation_error(fmt::format("File path {} is not normalized", path));
    }

    string ext = extension_of(path);
    if (!extensions.count(ext))
        throw validation_error(fmt::format("File {} has an extension that is not allowed", path));
}

const project_file &resolve_entry_point(const vector<project_file> &files, const string &entry_point) {
    if (entry_point.empty())
        throw validation_error("Entry point must not be empty");

    for (auto &file : files)
        if (file.path == entry_point) return file;

    const project_file *found = nullptr;
    for (auto &file : files) {
        if (!ends_with(file.path, "/" + entry_point)) continue;
        if (found)
            throw validation_error(fmt::format("Entry point {} matches both {} and {}", entry_point, found->path, file.path));
        found = &file;
    }
    if (!found)
        throw validation_error(fmt::format("Entry point {} not found in files", entry_point));
    return *found;
}

void validate_project(const vector<project_file> &files, const string &entry_point) {
    if (files.empty())
        throw validation_error("Project must contain at least one file");
    if (files.size() > MAX_PROJECT_FILES)
        throw validation_error(fmt::format("Project contains {} files, at most {} are allowed", files.size(), MAX_PROJECT_FILES));

    unordered_set<string> paths;
    for (auto &file : files) {
        validate_path(file.path, ALLOWED_EXTENSIONS);
        if (!paths.insert(file.path).second)
            throw validation_error(fmt::format("File path {} is duplicated", file.path));
        if (file.content.size() > MAX_FILE_SIZE)
            throw validation_error(fmt::format("File {} exceeds {} bytes", file.path, MAX_FILE_SIZE));
        if (!utf8_check_is_valid(file.content))
            throw validation_error(fmt::format("File {} is not valid UTF-8", file.path));
    }

    // 文件路径不能同时是另一个文件的目录，比如 "a.py" 与 "a.py/b.py"
    for (auto &file : files) {
        for (size_t pos = file.path.find('/'); pos != string::npos; pos = file.path.find('/', pos + 1))
            if (paths.count(file.path.substr(0, pos)))
                throw validation_error(fmt::format("File path {} conflicts with file {}", file.path, file.path.substr(0, pos)));
    }

    const project_file &entry = resolve_entry_point(files, entry_point);
    if (extension_of(entry.path) != ".py")
        throw validation_error(fmt::format("Entry point {} is not a Python file", entry.path));
}

void validate_request(const execution_request &request) {
    if (request.mode == execution_mode::SINGLE && request.files.size() != 1)
        throw validation_error(fmt::format("Single mode requires exactly one file, got {}", request.files.size()));
    validate_project(request.files, request.entry_point);
}

}  // namespace runner
