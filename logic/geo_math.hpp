/*
 * Geodesy helpers - great-circle distance and bearing on a spherical earth
 */

#ifndef GEO_MATH_HPP
#define GEO_MATH_HPP

#include "types.h"

/*============================================================================
 * Haversine Distance
 *============================================================================
 * Great-circle distance in metres, R = EARTH_RADIUS_KM. Inputs in degrees.
 */
double haversine_m(double lat1, double lon1, double lat2, double lon2);

inline double haversine_m(const TrackPoint &a, const TrackPoint &b) {
    return haversine_m(a.latitude, a.longitude, b.latitude, b.longitude);
}

/*============================================================================
 * Initial Bearing
 *============================================================================
 * Forward azimuth from point 1 to point 2, degrees in [0, 360).
 */
double initial_bearing_deg(double lat1, double lon1, double lat2, double lon2);

/* Wrap an angle difference to [-180, 180]. */
double wrap_deg_180(double deg);

#endif // GEO_MATH_HPP
