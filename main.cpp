#include <iostream>
#include <sstream>
#include <string>
#include <vector>
#include <memory>
#include <stdexcept>

#include <int_util/int.h>
#include <int_util/int_util.h>
#include <field/field_element.h>
#include <ec/ec.h>
#include <util/ostream_adapter.h>

using namespace ecmath;

namespace {

const char* const program_name = "ecmath-tool";

void usage()
{
    std::cerr << "Usage: " << program_name << " [-v] command args...\n"
              << "Commands:\n"
              << "  on-curve X Y A B P          Check y^2 = a*x^3 + b (mod p)\n"
              << "  add P A B X1 Y1 X2 Y2       Add two points of y^2 = x^3 + ax + b over F_p\n"
              << "  mul P A B X Y K             Multiply a point by K >= 0\n"
              << "A point coordinate pair of 'inf inf' is the point at infinity\n";
}

class usage_error : public std::runtime_error {
public:
    explicit usage_error(const std::string& what) : std::runtime_error(what) {}
};

std::shared_ptr<std::ostream> make_log(bool verbose)
{
    if (!verbose) {
        return std::make_shared<util::ostream_adapter>([](const std::string&) {});
    }
    return std::make_shared<util::ostream_adapter>([](const std::string& s) { std::cerr << program_name << ": " << s << std::endl; });
}

large_int parse_int(const std::string& s)
{
    std::istringstream iss(s);
    large_int res;
    if (!(iss >> res) || !iss.eof()) {
        throw usage_error("Invalid integer \"" + s + "\"");
    }
    return res;
}

class command_args {
public:
    command_args(const std::vector<std::string>& args, size_t count) : args_(args), index_(0) {
        if (args_.size() != count) {
            throw usage_error("Expected " + std::to_string(count) + " arguments, got " + std::to_string(args_.size()));
        }
    }

    const std::string& next_string() {
        return args_.at(index_++);
    }

    large_int next_int() {
        return parse_int(next_string());
    }

private:
    const std::vector<std::string>& args_;
    size_t                          index_;
};

struct curve_args {
    large_int p;
    field::field_element a;
    field::field_element b;
};

curve_args read_curve(command_args& args, std::ostream& log)
{
    const large_int p = args.next_int();
    if (p < 2) {
        throw usage_error("Field order must be at least 2");
    }
    if (!is_prime(p)) {
        log << "Warning: " << p << " is not prime, division results are meaningless" << std::endl;
    }
    const field::field_element a(pmod(args.next_int(), p), p);
    const field::field_element b(pmod(args.next_int(), p), p);
    log << "Curve y^2 = x^3 + " << a.num() << "x + " << b.num() << " over F_" << p << std::endl;
    return curve_args{p, a, b};
}

ec::field_point read_point(command_args& args, const curve_args& curve)
{
    const std::string x = args.next_string();
    const std::string y = args.next_string();
    if (x == "inf" && y == "inf") {
        return ec::field_point::infinity(curve.a, curve.b);
    }
    return ec::field_point(field::field_element(pmod(parse_int(x), curve.p), curve.p),
                           field::field_element(pmod(parse_int(y), curve.p), curve.p),
                           curve.a, curve.b);
}

int on_curve_command(const std::vector<std::string>& argv, std::ostream& log)
{
    command_args args(argv, 5);
    const auto x = args.next_int();
    const auto y = args.next_int();
    const auto a = args.next_int();
    const auto b = args.next_int();
    const auto p = args.next_int();
    if (p < 1) {
        throw usage_error("Modulus must be positive");
    }
    log << "Checking y^2 = " << a << "*x^3 + " << b << " (mod " << p << ")" << std::endl;
    std::cout << "(" << x << ", " << y << ") on curve: " << std::boolalpha << ec::curve_check(x, y, a, b, p) << std::endl;
    return 0;
}

int add_command(const std::vector<std::string>& argv, std::ostream& log)
{
    command_args args(argv, 7);
    const auto curve = read_curve(args, log);
    const auto p1 = read_point(args, curve);
    const auto p2 = read_point(args, curve);
    std::cout << "p1: " << p1 << std::endl;
    std::cout << "p2: " << p2 << std::endl;
    std::cout << "p1 + p2 = " << (p1 + p2) << std::endl;
    return 0;
}

// Double-and-add over point addition
ec::field_point multiply(large_int k, ec::field_point p, std::ostream& log)
{
    auto res = ec::field_point::infinity(p.a(), p.b());
    int bit = 0;
    while (k != 0) {
        if ((k & 1) != 0) {
            res = res + p;
            log << "bit " << bit << ": accumulator " << res << std::endl;
        }
        k >>= 1;
        if (k != 0) {
            p = p + p;
        }
        ++bit;
    }
    return res;
}

int mul_command(const std::vector<std::string>& argv, std::ostream& log)
{
    command_args args(argv, 6);
    const auto curve = read_curve(args, log);
    const auto p = read_point(args, curve);
    const auto k = args.next_int();
    if (k < 0) {
        throw usage_error("Scalar must be non-negative");
    }
    const auto result = multiply(k, p, log);
    std::cout << k << " * " << p << " = " << result << std::endl;
    return 0;
}

} // unnamed namespace

int main(int argc, char* argv[])
{
    try {
        std::vector<std::string> args(argv + 1, argv + argc);
        bool verbose = false;
        if (!args.empty() && args.front() == "-v") {
            verbose = true;
            args.erase(args.begin());
        }
        if (args.empty()) {
            usage();
            return 1;
        }
        const std::string command = args.front();
        args.erase(args.begin());

        auto log = make_log(verbose);
        if (command == "on-curve") {
            return on_curve_command(args, *log);
        } else if (command == "add") {
            return add_command(args, *log);
        } else if (command == "mul") {
            return mul_command(args, *log);
        }
        std::cerr << "Unknown command " << command << std::endl;
        usage();
        return 1;
    } catch (const usage_error& e) {
        std::cerr << e.what() << std::endl;
        usage();
        return 1;
    } catch (const std::exception& e) {
        std::cerr << e.what() << std::endl;
        return 1;
    } catch (...) {
        std::cerr << "Unknown exception caught" << std::endl;
        return 1;
    }
    return 0;
}
