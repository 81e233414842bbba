#include "common/status.hpp"
#include <map>
#include <string>

namespace oibox {
using namespace std;

// clang-format off
static const map<termination_cause, string> cause_string = {
    {termination_cause::COMPLETED, "completed"},
    {termination_cause::TIMED_OUT, "timed_out"},
    {termination_cause::MEMORY_EXCEEDED, "memory_exceeded"},
    {termination_cause::OUTPUT_TRUNCATED, "output_truncated"},
    {termination_cause::CRASHED, "crashed"}
};
// clang-format on

const char *to_string(termination_cause cause) {
    return cause_string.at(cause).c_str();
}

}  // namespace oibox
