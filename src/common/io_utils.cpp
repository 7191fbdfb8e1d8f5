#include "common/io_utils.hpp"
#include <glog/logging.h>
#include <boost/lexical_cast.hpp>
#include <boost/uuid/uuid.hpp>
#include <boost/uuid/uuid_generators.hpp>
#include <boost/uuid/uuid_io.hpp>
#include <cerrno>
#include <fstream>
#include <system_error>

namespace sandbox {
using namespace std;
namespace fs = std::filesystem;

string read_file_content(const fs::path &path) {
    ifstream fin(path.string(), ios::binary);
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
    ofstream fout(path.string(), ios::binary | ios::trunc);
    if (!fout)
        throw system_error(errno, system_category(), "unable to open " + path.string());
    fout << content;
    fout.close();
    if (!fout)
        throw system_error(errno, system_category(), "unable to write " + path.string());
}

bool utf8_check_is_valid(const string &string) {
    int c, i, ix, n, j;
    for (i = 0, ix = string.length(); i < ix; i++) {
        c = (unsigned char)string[i];
        if (0x00 <= c && c <= 0x7f)
            n = 0;  // 0bbbbbbb
        else if ((c & 0xE0) == 0xC0)
            n = 1;  // 110bbbbb
        else if (c == 0xed && i < (ix - 1) && ((unsigned char)string[i + 1] & 0xa0) == 0xa0)
            return false;  // U+d800 to U+dfff
        else if ((c & 0xF0) == 0xE0)
            n = 2;  // 1110bbbb
        else if ((c & 0xF8) == 0xF0)
            n = 3;  // 11110bbb
        else
            return false;
        for (j = 0; j < n && i < ix; j++) {  // n bytes matching 10bbbbbb follow ?
            if ((++i == ix) || (((unsigned char)string[i] & 0xC0) != 0x80))
                return false;
        }
    }
    return true;
}

fs::path make_run_directory(const fs::path &root, const string &prefix) {
    string uuid = boost::lexical_cast<string>(boost::uuids::random_generator()());
    fs::path dir = root / (prefix + uuid);
    fs::create_directories(root);
    if (!fs::create_directory(dir))
        throw system_error(EEXIST, system_category(), "run directory already exists " + dir.string());
    fs::permissions(dir, fs::perms::owner_all, fs::perm_options::replace);
    return dir;
}

void remove_directory(const fs::path &dir) noexcept {
    if (dir.empty()) return;
    error_code ec;
    fs::remove_all(dir, ec);
    if (ec)
        LOG(WARNING) << "unable to remove directory " << dir << ": " << ec.message();
}

}  // namespace sandbox
