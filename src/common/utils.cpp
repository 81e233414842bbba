#include "common/utils.hpp"
#include <cstdlib>

namespace oibox {
using namespace std;

string get_env(const string &key, const string &def_value) {
    char *result = getenv(key.c_str());
    return !result ? def_value : string(result);
}

}  // namespace oibox
