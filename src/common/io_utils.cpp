#include "common/io_utils.hpp"
#include <glog/logging.h>
#include <fstream>
#include <iterator>
#include <system_error>
#include "common/exceptions.hpp"

namespace pocketjudge {
using namespace std;
namespace fs = std::filesystem;

string read_file_content(fs::path const &path) {
    ifstream fin(path, ios::binary);
    if (!fin)
        throw internal_error("unable to open file " + path.string());
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

string read_file_prefix(const fs::path &path, size_t limit, bool *truncated) {
    if (truncated) *truncated = false;
    ifstream fin(path, ios::binary);
    if (!fin) return "";

    string str(limit, '\0');
    fin.read(str.data(), limit);
    str.resize(fin.gcount());
    if (truncated && str.size() == limit)
        *truncated = fin.peek() != ifstream::traits_type::eof();
    return str;
}

void write_file_content(const fs::path &path, const string &content) {
    ofstream fout(path, ios::binary | ios::trunc);
    if (!fout)
        throw internal_error("unable to create file " + path.string());
    fout.write(content.data(), content.size());
    if (!fout)
        throw internal_error("unable to write file " + path.string());
}

string assert_safe_path(const string &subpath) {
    if (subpath.find("../") != string::npos || subpath == ".." || fs::path(subpath).is_absolute())
        throw invalid_argument("subpath is not safe " + subpath);
    return subpath;
}

void remove_directory_quietly(const fs::path &dir) noexcept {
    error_code ec;
    fs::remove_all(dir, ec);
    if (ec)
        LOG(ERROR) << "Unable to delete directory " << dir << ": " << ec.message();
}

}  // namespace pocketjudge
