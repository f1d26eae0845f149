#pragma once

#include <string>

namespace rcflex {

/**
 * @brief Rectangular reinforced-concrete cross-section
 *
 * Geometry in consistent units [mm]:
 * - b: Width perpendicular to the bending direction
 * - h: Depth along the bending direction (the neutral axis sweeps along h)
 * - cover: Distance from each face to the centre of the edge bars
 *
 * For a wall bent in its plane, b is the wall thickness and h the wall
 * length; for out-of-plane bending the two are swapped (see rotated()).
 */
class RectangularSection {
public:
    int id;             ///< Unique section identifier
    std::string name;   ///< Section name

    double b;           ///< Width perpendicular to bending [mm]
    double h;           ///< Depth along bending [mm]
    double cover;       ///< Cover to bar centre [mm]

    /**
     * @brief Construct a rectangular section
     *
     * Throws InputError(INVALID_GEOMETRY) if b or h are not positive and
     * InputError(INVALID_COVER) if the cover is negative or 2·cover ≥ h.
     *
     * @param b Width perpendicular to bending [mm]
     * @param h Depth along bending [mm]
     * @param cover Cover to bar centre [mm] (default 25)
     * @param id Section identifier
     * @param name Section name
     */
    RectangularSection(double b, double h, double cover = 25.0,
                       int id = 0, std::string name = "");

    /// Gross area Ag = b·h [mm²]
    double Ag() const { return b * h; }

    /// Gross moment of inertia about the bending axis Ig = b·h³/12 [mm⁴]
    double Ig() const { return b * h * h * h / 12.0; }

    /// Smallest dimension min(b, h) [mm]
    double min_dimension() const { return b < h ? b : h; }

    /**
     * @brief Section for bending about the other principal axis
     *
     * Swaps b and h, keeping cover, id and name.
     */
    RectangularSection rotated() const;
};

} // namespace rcflex
