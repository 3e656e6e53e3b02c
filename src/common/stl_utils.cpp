#include "common/stl_utils.hpp"

using namespace std;

vector<string> split(const string &str, char delim) {
    vector<string> result;
    size_t begin = 0;
    while (true) {
        size_t end = str.find(delim, begin);
        if (end == string::npos) {
            result.push_back(str.substr(begin));
            break;
        }
        result.push_back(str.substr(begin, end - begin));
        begin = end + 1;
    }
    return result;
}

bool ends_with(const string &str, const string &suffix) {
    return str.size() >= suffix.size() && str.compare(str.size() - suffix.size(), suffix.size(), suffix) == 0;
}
