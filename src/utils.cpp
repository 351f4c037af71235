#include <cctype>
#include <cerrno>
#include <cmath>
#include <cstdlib>
#include <stdexcept>

#include "errors.hpp"
#include "utils.hpp"


namespace text {

    std::string_view trim(std::string_view s) {
        auto is_space = [](char c) { return std::isspace(static_cast<unsigned char>(c)); };
        while (not s.empty() and is_space(s.front())) {
            s.remove_prefix(1);
        }
        while (not s.empty() and is_space(s.back())) {
            s.remove_suffix(1);
        }
        return s;
    }

    bool is_blank(std::string_view line) {
        return trim(line).empty();
    }

    std::vector<std::string> split(std::string_view line) {
        std::vector<std::string> tokens;
        std::istringstream iss{std::string(line)};
        std::string token;
        while (iss >> token) {
            tokens.push_back(token);
        }
        return tokens;
    }

    double to_double(const std::string& token, std::string_view context) {
        const char* begin = token.c_str();
        char* end = nullptr;
        errno = 0;
        double value = std::strtod(begin, &end);
        if (end == begin or end != begin + token.size()) {
            throw ParseError(impl::Formatter() << "Expected number, got '" << token << "' "
                                               << context);
        }
        // underflow to a subnormal or zero is a valid value, only overflow is an error
        if (errno == ERANGE and std::isinf(value)) {
            throw ParseError(impl::Formatter()
                             << "Number '" << token << "' out of range " << context);
        }
        return value;
    }

    int to_int(const std::string& token, std::string_view context) {
        size_t pos = 0;
        int value;
        try {
            value = std::stoi(token, &pos);
        } catch (const std::invalid_argument&) {
            throw ParseError(impl::Formatter() << "Expected integer, got '" << token << "' "
                                               << context);
        } catch (const std::out_of_range&) {
            throw ParseError(impl::Formatter()
                             << "Integer '" << token << "' out of range " << context);
        }
        if (pos != token.size()) {
            throw ParseError(impl::Formatter() << "Expected integer, got '" << token << "' "
                                               << context);
        }
        return value;
    }

} // namespace text


namespace math {

    std::vector<double> linspace(double start, double stop, size_t num) {
        std::vector<double> result;
        if (num == 0) {
            return result;
        }
        result.reserve(num);
        if (num == 1) {
            result.push_back(start);
            return result;
        }
        const double step = (stop - start) / static_cast<double>(num - 1);
        for (size_t i = 0; i < num - 1; ++i) {
            result.push_back(start + i * step);
        }
        // last value exactly stop, without accumulated rounding error
        result.push_back(stop);
        return result;
    }

    std::vector<double> arange(double start, double stop, double step) {
        if (step == 0) {
            throw std::invalid_argument("Step size of arange can't be zero.");
        }
        auto num = static_cast<long>(std::ceil((stop - start) / step));
        std::vector<double> result;
        if (num <= 0) {
            return result;
        }
        result.reserve(num);
        for (long i = 0; i < num; ++i) {
            result.push_back(start + i * step);
        }
        return result;
    }

} // namespace math


namespace impl {

    impl::Formatter::operator std::string() const {
        return stream.str();
    }

    Formatter::Formatter(const std::string& sep) : separator(sep) {}

    std::ostream& operator<<(std::ostream& os, const Formatter& f) {
        return os << std::string(f);
    }
} // namespace impl
