#include "tesseroid.hpp"


double tesseroid_height(const Tesseroid& tesseroid) {
    return tesseroid.top - tesseroid.bottom;
}

bool operator==(const Tesseroid& t1, const Tesseroid& t2) {
    return t1.west == t2.west and t1.east == t2.east and t1.south == t2.south and
           t1.north == t2.north and t1.top == t2.top and t1.bottom == t2.bottom and
           t1.props == t2.props;
}

std::ostream& operator<<(std::ostream& os, const Tesseroid& tesseroid) {
    os << "Tesseroid(w = " << tesseroid.west << ", e = " << tesseroid.east
       << ", s = " << tesseroid.south << ", n = " << tesseroid.north << ", top = " << tesseroid.top
       << ", bottom = " << tesseroid.bottom;
    for (const auto& [name, value] : tesseroid.props) {
        os << ", " << name << " = " << value;
    }
    os << ")";
    return os;
}
