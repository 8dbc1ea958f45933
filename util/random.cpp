#include "random.h"
#include <fstream>
#include <stdexcept>

namespace ecmath { namespace util {

void get_random_bytes(void* dest, size_t count) {
    std::ifstream urandom("/dev/urandom", std::ifstream::binary);
    if (!urandom || !urandom.is_open()) {
        throw std::runtime_error("Could not open /dev/urandom");
    }
    if (!urandom.read(reinterpret_cast<char*>(dest), count)) {
        throw std::runtime_error("Could not read from /dev/urandom");
    }
}

} } // namespace ecmath::util
