#ifndef CRUSTMODEL_TESSEROID_HPP
#define CRUSTMODEL_TESSEROID_HPP

#include <map>
#include <ostream>
#include <string>


/**
 * Geographic prism bounded by two meridians, two parallels and two elevation surfaces.
 * Physical properties are uniform inside the tesseroid.
 */
struct Tesseroid {
    // horizontal bounds in degrees
    double west;
    double east;
    double south;
    double north;
    // vertical bounds in m, positive up
    double top;
    double bottom;
    /**
     * Physical properties by name, eg. "density" (kg/m^3), "vp" and "vs" (m/s).
     */
    std::map<std::string, double> props;
};

/**
 * Vertical extent of the tesseroid (top - bottom) in m.
 */
double tesseroid_height(const Tesseroid& tesseroid);

bool operator==(const Tesseroid& t1, const Tesseroid& t2);

std::ostream& operator<<(std::ostream& os, const Tesseroid& tesseroid);

#endif // CRUSTMODEL_TESSEROID_HPP
