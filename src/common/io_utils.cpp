#include "common/io_utils.hpp"
#include <fstream>
#include <stdexcept>
#include <system_error>

namespace verifier {
using namespace std;
namespace fs = std::filesystem;

string read_file_content(fs::path const &path) {
    ifstream fin(path.string());
    if (!fin)
        throw system_error(errno, generic_category(), "unable to open " + path.string());
    string str((istreambuf_iterator<char>(fin)),
               (istreambuf_iterator<char>()));
    return str;
}

string read_file_content(fs::path const &path, const string &def) {
    if (!fs::exists(path)) {
        return def;
    } else {
        return read_file_content(path);
    }
}

void write_file_content(const fs::path &path, const string &content) {
    if (path.has_parent_path())
        fs::create_directories(path.parent_path());
    ofstream fout(path.string(), ios::binary | ios::trunc);
    if (!fout)
        throw system_error(errno, generic_category(), "unable to create " + path.string());
    fout << content;
    if (!fout)
        throw system_error(errno, generic_category(), "unable to write " + path.string());
}

bool is_safe_path(const string &subpath) {
    if (subpath.empty()) return false;
    fs::path p(subpath);
    if (p.is_absolute() || p.has_root_name()) return false;
    for (auto &part : p)
        if (part == "..") return false;
    return true;
}

string assert_safe_path(const string &subpath) {
    if (!is_safe_path(subpath))
        throw invalid_argument("subpath is not safe " + subpath);
    return subpath;
}

}  // namespace verifier
