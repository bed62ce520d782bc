#include "common/io_utils.hpp"
#include <glog/logging.h>
#include <stdlib.h>
#include <string.h>
#include <fstream>
#include <iterator>
#include <system_error>
#include <vector>
#include "common/exceptions.hpp"

namespace codejudge {
using namespace std;
namespace fs = std::filesystem;

string read_file_content(const fs::path &path) {
    ifstream fin(path, ios::binary);
    if (!fin) throw internal_error("unable to open file " + path.string());
    string str((istreambuf_iterator<char>(fin)),
               (istreambuf_iterator<char>()));
    return str;
}

string read_file_content(const fs::path &path, const string &def) {
    if (!fs::exists(path)) {
        return def;
    } else {
        return read_file_content(path);
    }
}

void write_file_content(const fs::path &path, const string &content) {
    ofstream fout(path, ios::binary | ios::trunc);
    if (!fout) throw internal_error("unable to create file " + path.string());
    fout.write(content.data(), content.size());
    fout.close();
    if (!fout) throw internal_error("unable to write file " + path.string());
}

temporary_directory::temporary_directory(const fs::path &root, const string &prefix) {
    // mkdtemp 会修改传入的模板，因此需要可写的缓冲区
    string pattern = (root / (prefix + "XXXXXX")).string();
    vector<char> buffer(pattern.begin(), pattern.end());
    buffer.push_back('\0');
    if (!mkdtemp(buffer.data()))
        throw internal_error("unable to create temporary directory in " + root.string() + ": " + strerror(errno));
    dir = fs::path(buffer.data());
}

temporary_directory::~temporary_directory() {
    error_code ec;
    fs::remove_all(dir, ec);
    if (ec) LOG(ERROR) << "Unable to delete directory " << dir << ": " << ec.message();
}

const fs::path &temporary_directory::path() const {
    return dir;
}

}  // namespace codejudge
