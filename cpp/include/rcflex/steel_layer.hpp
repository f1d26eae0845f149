#pragma once

#include <vector>

namespace rcflex {

/**
 * @brief A layer of longitudinal reinforcement
 *
 * All bars at the same distance from the compression face are lumped
 * into one layer.
 */
struct SteelLayer {
    double position = 0.0;  ///< Distance from the extreme compression fibre [mm]
    double area = 0.0;      ///< Total bar area in the layer [mm²]

    SteelLayer() = default;
    SteelLayer(double pos, double as) : position(pos), area(as) {}

    bool operator==(const SteelLayer& other) const {
        return position == other.position && area == other.area;
    }
};

/**
 * @brief Nominal area of a standard reinforcing bar
 *
 * Uses the tabulated areas for 6-36 mm bars; other diameters fall back
 * to π·d²/4.
 *
 * @param diameter Nominal bar diameter [mm]
 * @return Bar area [mm²]
 */
double bar_area(int diameter);

/**
 * @brief Default two-layer idealization
 *
 * Half of As_total at the cover and half at h − cover.
 *
 * @param h Section depth along bending [mm]
 * @param cover Cover to bar centre [mm]
 * @param As_total Total longitudinal steel area [mm²]
 */
std::vector<SteelLayer> two_layer_layout(double h, double cover, double As_total);

/**
 * @brief Layers for a rectangular column with a regular bar grid
 *
 * n_layers rows of bars_per_layer bars, evenly spaced between cover and
 * dimension − cover. A single bar (1×1) is placed at mid-depth.
 * Throws InputError(INVALID_LAYOUT) for any other arrangement with fewer
 * than two layers.
 *
 * @param dimension Section depth along bending [mm]
 * @param cover Cover to bar centre [mm]
 * @param n_layers Number of bar rows along the bending direction
 * @param bars_per_layer Bars in each row
 * @param bar_area Area of one bar [mm²]
 */
std::vector<SteelLayer> column_layers(double dimension, double cover,
                                      int n_layers, int bars_per_layer,
                                      double bar_area);

/**
 * @brief Layers for a wall with edge bars and distributed mesh
 *
 * Edge layers at cover and length − cover hold n_edge_bars bars each.
 * Mesh bars (one per mesh and position) are distributed between the
 * edge layers at a spacing not larger than the given one.
 *
 * @param length Wall length along bending [mm]
 * @param cover Cover to bar centre [mm]
 * @param n_meshes Number of curtains (1 or 2)
 * @param n_edge_bars Edge bars at each end
 * @param bar_area_edge Area of one edge bar [mm²]
 * @param bar_area_mesh Area of one mesh bar [mm²]
 * @param spacing Mesh spacing [mm]
 */
std::vector<SteelLayer> wall_layers(double length, double cover,
                                    int n_meshes, int n_edge_bars,
                                    double bar_area_edge, double bar_area_mesh,
                                    double spacing);

/// Sum of layer areas [mm²]
double total_area(const std::vector<SteelLayer>& layers);

/// Farthest layer position from the compression face [mm] (0 if empty)
double effective_depth(const std::vector<SteelLayer>& layers);

/**
 * @brief Layers seen from the opposite face (reversed moment sign)
 *
 * Positions become h − position; the result is sorted by position.
 */
std::vector<SteelLayer> mirrored(const std::vector<SteelLayer>& layers, double h);

/**
 * @brief Check that every layer fits the section
 *
 * Throws InputError(INVALID_REINFORCEMENT) for negative areas or
 * positions outside [0, h].
 */
void validate_layers(const std::vector<SteelLayer>& layers, double h);

} // namespace rcflex
