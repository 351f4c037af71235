#ifndef CRUSTMODEL_UTILS_HPP
#define CRUSTMODEL_UTILS_HPP

#include <sstream>
#include <string>
#include <string_view>
#include <vector>


// Helper code used for implementation, not for user code
namespace impl {

    // Use to throw exceptions with customized error message by streaming into a Formatter instance.
    class Formatter {
    public:
        Formatter(const std::string& sep = "");

        template <typename T>
        Formatter& operator<<(const T& t) {
            if (not first_used) {
                // On first use, only stream t to avoid prepending a separator
                first_used = true;
                stream << t;
            } else {
                stream << separator << t;
            }
            return *this;
        }

        /**
         * Allow streaming Formatter to stream by converting it explicitly to a string.
         */
        friend std::ostream& operator<<(std::ostream& os, const Formatter& f);

        operator std::string() const;

    private:
        bool first_used = false;
        std::stringstream stream{};
        std::string separator;
    };

} // namespace impl


namespace text {

    /**
     * Remove leading and trailing whitespace.
     */
    std::string_view trim(std::string_view s);

    /**
     * Return true if line is empty or contains only whitespace.
     */
    bool is_blank(std::string_view line);

    /**
     * Split line at runs of whitespace. Leading and trailing whitespace produce no empty tokens.
     * @param line
     * @return Tokens in order of appearance.
     */
    std::vector<std::string> split(std::string_view line);

    /**
     * Convert token to double. The whole token has to be consumed.
     * Throws ParseError if token is not a number.
     * @param token
     * @param context Appended to the error message to locate the failure, eg. "line 5".
     */
    double to_double(const std::string& token, std::string_view context = "");

    /**
     * Convert token to int. The whole token has to be consumed.
     * Throws ParseError if token is not an integer.
     */
    int to_int(const std::string& token, std::string_view context = "");

} // namespace text


namespace math {

    /**
     * Create vector filled with num values from start to stop (inclusive).
     * For num == 1 only start is returned.
     * @param start
     * @param stop
     * @param num
     * @return
     */
    std::vector<double> linspace(double start, double stop, size_t num = 50);

    /**
     * Create vector of values start, start + step, ... excluding stop.
     * Step may be negative for a descending range.
     * Throws invalid_argument if step is zero.
     */
    std::vector<double> arange(double start, double stop, double step);

} // namespace math

#endif // CRUSTMODEL_UTILS_HPP
