#include "common/utils.hpp"
#include <fmt/core.h>
#include <stdlib.h>
#include <time.h>
#include <boost/uuid/uuid.hpp>
#include <boost/uuid/uuid_generators.hpp>
#include <boost/uuid/uuid_io.hpp>
#include <algorithm>

namespace verifier {
using namespace std;

string get_env(const string &key, const string &def_value) {
    char *result = getenv(key.c_str());
    return !result ? def_value : string(result);
}

void set_env(const string &key, const string &value, bool replace) {
    setenv(key.c_str(), value.c_str(), replace);
}

string generate_uuid() {
    // random_generator 不是线程安全的，每个线程持有自己的生成器
    thread_local boost::uuids::random_generator generator;
    return boost::uuids::to_string(generator());
}

string to_base36(uint64_t value) {
    static const char digits[] = "0123456789abcdefghijklmnopqrstuvwxyz";
    if (value == 0) return "0";
    string result;
    while (value > 0) {
        result.push_back(digits[value % 36]);
        value /= 36;
    }
    reverse(result.begin(), result.end());
    return result;
}

int64_t current_time_millis() {
    return chrono::duration_cast<chrono::milliseconds>(chrono::system_clock::now().time_since_epoch()).count();
}

string format_timestamp(int64_t millis) {
    time_t seconds = millis / 1000;
    struct tm tm;
    gmtime_r(&seconds, &tm);
    return fmt::format("{:04}-{:02}-{:02}T{:02}:{:02}:{:02}.{:03}Z",
                       tm.tm_year + 1900, tm.tm_mon + 1, tm.tm_mday,
                       tm.tm_hour, tm.tm_min, tm.tm_sec, (int)(millis % 1000));
}

elapsed_time::elapsed_time() {
    start = chrono::steady_clock::now();
}

}  // namespace verifier
