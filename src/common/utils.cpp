#include "common/utils.hpp"
#include <stdlib.h>
#include <boost/lexical_cast.hpp>
#include <boost/uuid/uuid.hpp>
#include <boost/uuid/uuid_generators.hpp>
#include <boost/uuid/uuid_io.hpp>
#include <iomanip>
#include <sstream>
using namespace std;

string get_env(const string &key, const string &def_value) {
    char *result = getenv(key.c_str());
    return !result ? def_value : string(result);
}

void set_env(const string &key, const string &value, bool replace) {
    setenv(key.c_str(), value.c_str(), replace);
}

string random_uuid() {
    // random_generator 不是线程安全的，每个线程各自持有一个
    thread_local boost::uuids::random_generator generator;
    return boost::lexical_cast<string>(generator());
}

string format_time(chrono::system_clock::time_point time) {
    time_t t = chrono::system_clock::to_time_t(time);
    tm utc;
    gmtime_r(&t, &utc);
    stringstream ss;
    ss << put_time(&utc, "%Y-%m-%dT%H:%M:%SZ");
    return ss.str();
}

chrono::system_clock::time_point parse_time(const string &text) {
    tm utc = {};
    stringstream ss(text);
    ss >> get_time(&utc, "%Y-%m-%dT%H:%M:%SZ");
    if (ss.fail()) return chrono::system_clock::time_point();
    return chrono::system_clock::from_time_t(timegm(&utc));
}

elapsed_time::elapsed_time() {
    start = chrono::steady_clock::now();
}

double elapsed_time::milliseconds() const {
    return chrono::duration<double, milli>(chrono::steady_clock::now() - start).count();
}
