#include "common/io_utils.hpp"
#include <errno.h>
#include <string.h>
#include <boost/lexical_cast.hpp>
#include <boost/uuid/uuid.hpp>
#include <boost/uuid/uuid_generators.hpp>
#include <boost/uuid/uuid_io.hpp>
#include <fstream>
#include "common/exceptions.hpp"

namespace assessor {
using namespace std;

string read_file_content(filesystem::path const &path) {
    ifstream fin(path.string());
    if (!fin)
        throw internal_error("Unable to open file " + path.string());
    string str((istreambuf_iterator<char>(fin)),
               (istreambuf_iterator<char>()));
    return str;
}

void write_file_content(const filesystem::path &path, const string &content) {
    ofstream fout(path.string(), ios::out | ios::trunc | ios::binary);
    if (!fout)
        throw internal_error("Unable to create file " + path.string() + ": " + strerror(errno));
    fout << content;
    fout.flush();
    if (!fout)
        throw internal_error("Unable to write file " + path.string());
}

string random_uuid() {
    // random_generator 不是线程安全的，每个线程持有自己的生成器
    thread_local boost::uuids::random_generator generator;
    return boost::lexical_cast<string>(generator());
}

}  // namespace assessor
