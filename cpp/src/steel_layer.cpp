#include "rcflex/steel_layer.hpp"
#include "rcflex/errors.hpp"

#include <algorithm>
#include <cmath>
#include <map>
#include <string>

namespace rcflex {

namespace {

const std::map<int, double>& bar_area_table() {
    static const std::map<int, double> table = {
        {6, 28.3}, {8, 50.3}, {10, 78.5}, {12, 113.1},
        {16, 201.1}, {18, 254.5}, {20, 314.2}, {22, 380.1},
        {25, 490.9}, {28, 615.8}, {32, 804.2}, {36, 1017.9},
    };
    return table;
}

RcflexError invalid_layout(const std::string& reason) {
    RcflexError err(ErrorCode::INVALID_LAYOUT, "Invalid reinforcement layout: " + reason);
    return err;
}

} // namespace

double bar_area(int diameter) {
    const auto& table = bar_area_table();
    auto it = table.find(diameter);
    if (it != table.end()) {
        return it->second;
    }
    return M_PI * diameter * diameter / 4.0;
}

std::vector<SteelLayer> two_layer_layout(double h, double cover, double As_total) {
    return {
        SteelLayer(cover, As_total / 2.0),
        SteelLayer(h - cover, As_total / 2.0)
    };
}

std::vector<SteelLayer> column_layers(double dimension, double cover,
                                      int n_layers, int bars_per_layer,
                                      double bar_area) {
    std::vector<SteelLayer> layers;

    // Single centred bar (small unconfined piers)
    if (n_layers == 1 && bars_per_layer == 1) {
        layers.emplace_back(dimension / 2.0, bar_area);
        return layers;
    }

    if (n_layers < 2 || bars_per_layer < 1) {
        auto err = invalid_layout("column needs at least two bar rows");
        err.details["n_layers"] = std::to_string(n_layers);
        err.details["bars_per_layer"] = std::to_string(bars_per_layer);
        throw InputError(err);
    }

    const double d_first = cover;
    const double d_last = dimension - cover;
    const double spacing = (d_last - d_first) / (n_layers - 1);

    layers.reserve(n_layers);
    for (int i = 0; i < n_layers; ++i) {
        layers.emplace_back(d_first + i * spacing, bars_per_layer * bar_area);
    }
    return layers;
}

std::vector<SteelLayer> wall_layers(double length, double cover,
                                    int n_meshes, int n_edge_bars,
                                    double bar_area_edge, double bar_area_mesh,
                                    double spacing) {
    if (n_meshes < 1 || n_meshes > 2) {
        auto err = invalid_layout("walls have one or two meshes");
        err.details["n_meshes"] = std::to_string(n_meshes);
        throw InputError(err);
    }
    if (n_edge_bars < 0 || !(spacing > 0.0)) {
        auto err = invalid_layout("edge bar count must be non-negative and spacing positive");
        err.details["n_edge_bars"] = std::to_string(n_edge_bars);
        err.details["spacing"] = std::to_string(spacing) + " mm";
        throw InputError(err);
    }

    const double d_first = cover;
    const double d_last = length - cover;
    const double available = d_last - d_first;

    std::vector<SteelLayer> layers;
    layers.emplace_back(d_first, n_edge_bars * bar_area_edge);

    // Intervals are rounded up so the actual spacing never exceeds the nominal one
    int n_intervals = static_cast<int>(std::ceil(available / spacing - 1e-9));
    if (n_intervals < 1) n_intervals = 1;
    const double actual_spacing = available / n_intervals;

    for (int i = 1; i < n_intervals; ++i) {
        layers.emplace_back(d_first + i * actual_spacing, n_meshes * bar_area_mesh);
    }

    layers.emplace_back(d_last, n_edge_bars * bar_area_edge);
    return layers;
}

double total_area(const std::vector<SteelLayer>& layers) {
    double As = 0.0;
    for (const auto& layer : layers) {
        As += layer.area;
    }
    return As;
}

double effective_depth(const std::vector<SteelLayer>& layers) {
    double d = 0.0;
    for (const auto& layer : layers) {
        d = std::max(d, layer.position);
    }
    return d;
}

std::vector<SteelLayer> mirrored(const std::vector<SteelLayer>& layers, double h) {
    std::vector<SteelLayer> result;
    result.reserve(layers.size());
    for (const auto& layer : layers) {
        result.emplace_back(h - layer.position, layer.area);
    }
    std::stable_sort(result.begin(), result.end(),
        [](const SteelLayer& a, const SteelLayer& b) { return a.position < b.position; });
    return result;
}

void validate_layers(const std::vector<SteelLayer>& layers, double h) {
    for (size_t i = 0; i < layers.size(); ++i) {
        const auto& layer = layers[i];
        if (layer.area < 0.0 || !std::isfinite(layer.area)) {
            auto err = RcflexError::invalid_reinforcement("negative layer area");
            err.details["layer"] = std::to_string(i);
            err.details["area"] = std::to_string(layer.area) + " mm²";
            throw InputError(err);
        }
        if (layer.position < 0.0 || layer.position > h || !std::isfinite(layer.position)) {
            auto err = RcflexError::invalid_reinforcement("layer outside the section");
            err.details["layer"] = std::to_string(i);
            err.details["position"] = std::to_string(layer.position) + " mm";
            err.details["h"] = std::to_string(h) + " mm";
            throw InputError(err);
        }
    }
}

} // namespace rcflex
