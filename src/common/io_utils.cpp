#include "ojudge/common/io_utils.hpp"
#include <cerrno>
#include <fstream>
#include <iterator>
#include <stdexcept>
#include <system_error>

namespace ojudge {
using namespace std;
namespace fs = std::filesystem;

string read_file_content(const fs::path &path) {
    ifstream fin(path, ios::in | ios::binary);
    if (!fin)
        throw system_error(errno, system_category(), "unable to open file " + path.string());
    string str((istreambuf_iterator<char>(fin)),
               (istreambuf_iterator<char>()));
    return str;
}

void write_file_content(const fs::path &path, const string &content) {
    ofstream fout(path, ios::out | ios::binary | ios::trunc);
    if (!fout)
        throw system_error(errno, system_category(), "unable to open file " + path.string());
    fout.write(content.data(), content.size());
    fout.flush();
    if (!fout)
        throw system_error(errno, system_category(), "unable to write file " + path.string());
}

string assert_safe_path(const string &name) {
    if (name.empty() || name == "." || name == ".." ||
        name.find('/') != string::npos || name.find('\0') != string::npos)
        throw invalid_argument("path is not safe: " + name);
    return name;
}

}  // namespace ojudge
