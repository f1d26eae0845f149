#pragma once

#include "rcflex/interaction_curve.hpp"
#include <cstddef>
#include <memory>
#include <mutex>
#include <unordered_map>
#include <vector>

namespace rcflex {

/**
 * @brief Content key of an interaction curve
 *
 * Two keys are equal when every input that affects the curve is equal:
 * geometry, materials, layers and sampling settings.
 */
struct CurveKey {
    double b = 0.0;
    double h = 0.0;
    double cover = 0.0;
    double fc = 0.0;
    double fy = 0.0;
    double Es = 0.0;
    std::vector<SteelLayer> layers;
    InteractionCurveSettings settings;

    CurveKey() = default;
    CurveKey(const RectangularSection& section,
             const Concrete& concrete,
             const ReinforcingSteel& steel,
             std::vector<SteelLayer> layers,
             InteractionCurveSettings settings);

    bool operator==(const CurveKey& other) const;
};

struct CurveKeyHash {
    std::size_t operator()(const CurveKey& key) const;
};

/**
 * @brief Content-addressed cache of interaction curves
 *
 * Owned by the caller (one per session or project). Curves are shared as
 * immutable objects, so a returned pointer stays valid after invalidation.
 * All members are safe to call from several threads.
 */
class CurveCache {
public:
    using CurvePtr = std::shared_ptr<const InteractionCurve>;

    CurveCache() = default;
    CurveCache(const CurveCache&) = delete;
    CurveCache& operator=(const CurveCache&) = delete;

    /**
     * @brief Return the cached curve for these inputs, building it on a miss
     *
     * The curve is built outside the lock; if two threads miss on the same
     * key the first inserted curve wins and both receive it.
     */
    CurvePtr get_or_build(const InteractionCurveBuilder& builder,
                          const RectangularSection& section,
                          const Concrete& concrete,
                          const ReinforcingSteel& steel,
                          const std::vector<SteelLayer>& layers);

    /// Cached curve for a key, or nullptr
    CurvePtr find(const CurveKey& key) const;

    /// Remove one entry; returns true if it was present
    bool invalidate(const CurveKey& key);

    /// Remove all entries and reset statistics
    void clear();

    std::size_t size() const;

    std::size_t hits() const;

    std::size_t misses() const;

private:
    mutable std::mutex mutex_;
    std::unordered_map<CurveKey, CurvePtr, CurveKeyHash> curves_;
    std::size_t hits_ = 0;
    std::size_t misses_ = 0;
};

} // namespace rcflex
