#include "store/file_store.hpp"
#include <glog/logging.h>
#include <fstream>
#include "common/exceptions.hpp"
#include "common/io_utils.hpp"
#include "common/json_utils.hpp"

namespace runner {
using namespace std;
using namespace nlohmann;

file_submission_store::file_submission_store(filesystem::path path)
    : file(filesystem::absolute(path)) {}

const filesystem::path &file_submission_store::path() const {
    return file;
}

void file_submission_store::save(const submission_record &record) {
    string line = dump_lossy(json(record));
    scoped_lock lock(mut);
    try {
        append_line(file, line);
    } catch (std::exception &ex) {
        throw persistence_error("Unable to save submission " + record.submission_id + ": " + ex.what());
    }
}

vector<submission_record> file_submission_store::find(const submission_filter &filter) {
    vector<submission_record> records;
    scoped_lock lock(mut);
    if (!filesystem::exists(file)) return records;

    ifstream fin(file);
    if (!fin) throw persistence_error("Unable to open " + file.string());

    string line;
    for (size_t lineno = 1; getline(fin, line); ++lineno) {
        if (line.empty()) continue;
        try {
            submission_record record = json::parse(line).get<submission_record>();
            if (filter.matches(record)) records.push_back(move(record));
        } catch (std::exception &ex) {
            LOG(WARNING) << "Skipping malformed submission record at " << file << ":" << lineno << ": " << ex.what();
        }
    }
    return records;
}

}  // namespace runner
