#ifndef ECMATH_UTIL_OSTREAM_ADAPTER_H_INCLUDED
#define ECMATH_UTIL_OSTREAM_ADAPTER_H_INCLUDED

#include <ostream>
#include <memory>
#include <functional>
#include <string>

namespace ecmath { namespace util {

// std::ostream that hands every complete line (without the trailing newline) to out_func.
// A trailing partial line is delivered when the stream is destroyed.
class ostream_adapter : public std::ostream {
public:
    using output_func_type = std::function<void (const std::string&)>;
    explicit ostream_adapter(const output_func_type& out_func);
    ~ostream_adapter();
private:
    std::unique_ptr<std::streambuf> buffer_;
};

} } // namespace ecmath::util

#endif
