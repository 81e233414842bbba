#include "common/io_utils.hpp"
#include <fcntl.h>
#include <sys/stat.h>
#include <sys/types.h>
#include <unistd.h>
#include <fmt/core.h>
#include <fstream>
#include <system_error>
#include "common/defer.hpp"

namespace oibox {
using namespace std;

string read_file_content(filesystem::path const &path) {
    ifstream fin(path.string(), ios::binary);
    if (!fin) throw system_error(errno, generic_category(), fmt::format("unable to open {}", path.string()));
    string str((istreambuf_iterator<char>(fin)),
               (istreambuf_iterator<char>()));
    return str;
}

void write_file_content(const filesystem::path &path, const string &content) {
    // O_NOFOLLOW 使得 path 为符号链接时 open 失败
    int fd = open(path.c_str(), O_WRONLY | O_CREAT | O_TRUNC | O_NOFOLLOW | O_CLOEXEC, S_IRUSR | S_IWUSR);
    if (fd < 0) throw system_error(errno, generic_category(), fmt::format("unable to create {}", path.string()));
    defer { close(fd); };

    size_t written = 0;
    while (written < content.size()) {
        ssize_t n = write(fd, content.data() + written, content.size() - written);
        if (n < 0) {
            if (errno == EINTR) continue;
            throw system_error(errno, generic_category(), fmt::format("unable to write {}", path.string()));
        }
        written += n;
    }
}

}  // namespace oibox
