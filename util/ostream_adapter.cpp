#include "ostream_adapter.h"
#include <sstream>

using namespace ecmath::util;

namespace {

class line_buffer : public std::stringbuf {
public:
    explicit line_buffer(const ostream_adapter::output_func_type& out_func) : out_func_(out_func) {
    }

    ~line_buffer() {
        emit_lines();
        if (!pending_.empty()) {
            out_func_(pending_);
        }
    }

    int sync() {
        emit_lines();
        return 0;
    }

private:
    ostream_adapter::output_func_type out_func_;
    std::string                       pending_;

    void emit_lines() {
        pending_ += str();
        str("");
        std::string::size_type pos;
        while ((pos = pending_.find('\n')) != std::string::npos) {
            const std::string line = pending_.substr(0, pos);
            pending_.erase(0, pos + 1);
            out_func_(line);
        }
    }
};

} // unnamed namespace

namespace ecmath { namespace util {

ostream_adapter::ostream_adapter(const output_func_type& out_func) : std::ostream(nullptr), buffer_(new line_buffer(out_func))
{
    rdbuf(buffer_.get());
}

ostream_adapter::~ostream_adapter()
{
    flush();
    rdbuf(nullptr);
}

} } // namespace ecmath::util
