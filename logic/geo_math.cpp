/*
 * Geodesy helpers - implementation
 */

#include "logic/geo_math.hpp"
#include "config.h"
#include <cmath>

static constexpr double DEG_TO_RAD = M_PI / 180.0;

double haversine_m(double lat1, double lon1, double lat2, double lon2) {
    double dlat = (lat2 - lat1) * DEG_TO_RAD;
    double dlon = (lon2 - lon1) * DEG_TO_RAD;
    double s_lat = sin(dlat / 2.0);
    double s_lon = sin(dlon / 2.0);
    double a = s_lat * s_lat + cos(lat1 * DEG_TO_RAD) * cos(lat2 * DEG_TO_RAD) * s_lon * s_lon;
    if (a > 1.0) {
        a = 1.0; /* Rounding near antipodes */
    }
    double c = 2.0 * atan2(sqrt(a), sqrt(1.0 - a));
    return EARTH_RADIUS_KM * 1000.0 * c;
}

double initial_bearing_deg(double lat1, double lon1, double lat2, double lon2) {
    double phi1 = lat1 * DEG_TO_RAD;
    double phi2 = lat2 * DEG_TO_RAD;
    double dlon = (lon2 - lon1) * DEG_TO_RAD;
    double y = sin(dlon) * cos(phi2);
    double x = cos(phi1) * sin(phi2) - sin(phi1) * cos(phi2) * cos(dlon);
    double deg = atan2(y, x) / DEG_TO_RAD;
    return fmod(deg + 360.0, 360.0);
}

double wrap_deg_180(double deg) {
    double d = fmod(deg, 360.0);
    if (d > 180.0) {
        d -= 360.0;
    } else if (d < -180.0) {
        d += 360.0;
    }
    return d;
}
