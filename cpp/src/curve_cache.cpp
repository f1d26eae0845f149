#include "rcflex/curve_cache.hpp"

#include <functional>
#include <utility>

namespace rcflex {

namespace {

void hash_combine(std::size_t& seed, double value) {
    seed ^= std::hash<double>{}(value) + 0x9e3779b97f4a7c15ULL + (seed << 6) + (seed >> 2);
}

} // namespace

CurveKey::CurveKey(const RectangularSection& section,
                   const Concrete& concrete,
                   const ReinforcingSteel& steel,
                   std::vector<SteelLayer> layers,
                   InteractionCurveSettings settings)
    : b(section.b), h(section.h), cover(section.cover), fc(concrete.fc), fy(steel.fy), Es(steel.Es),
      layers(std::move(layers)), settings(std::move(settings)) {}

bool CurveKey::operator==(const CurveKey& other) const {
    return b == other.b && h == other.h && cover == other.cover &&
           fc == other.fc && fy == other.fy && Es == other.Es &&
           layers == other.layers &&
           settings == other.settings;
}

std::size_t CurveKeyHash::operator()(const CurveKey& key) const {
    std::size_t seed = 0;
    hash_combine(seed, key.b);
    hash_combine(seed, key.h);
    hash_combine(seed, key.cover);
    hash_combine(seed, key.fc);
    hash_combine(seed, key.fy);
    hash_combine(seed, key.Es);
    for (const auto& layer : key.layers) {
        hash_combine(seed, layer.position);
        hash_combine(seed, layer.area);
    }
    const auto& s = key.settings;
    hash_combine(seed, static_cast<double>(s.n_points));
    hash_combine(seed, s.epsilon_cu);
    hash_combine(seed, s.phi_compression);
    hash_combine(seed, s.phi_tension);
    hash_combine(seed, s.spiral ? 1.0 : 0.0);
    hash_combine(seed, s.compression_cap);
    return seed;
}

CurveCache::CurvePtr CurveCache::get_or_build(const InteractionCurveBuilder& builder,
                                              const RectangularSection& section,
                                              const Concrete& concrete,
                                              const ReinforcingSteel& steel,
                                              const std::vector<SteelLayer>& layers) {
    CurveKey key(section, concrete, steel, layers, builder.settings());

    {
        std::lock_guard<std::mutex> lock(mutex_);
        auto it = curves_.find(key);
        if (it != curves_.end()) {
            ++hits_;
            return it->second;
        }
        ++misses_;
    }

    auto curve = std::make_shared<const InteractionCurve>(
        builder.build(section, concrete, steel, layers));

    std::lock_guard<std::mutex> lock(mutex_);
    auto inserted = curves_.emplace(std::move(key), std::move(curve));
    return inserted.first->second;
}

CurveCache::CurvePtr CurveCache::find(const CurveKey& key) const {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = curves_.find(key);
    return it != curves_.end() ? it->second : nullptr;
}

bool CurveCache::invalidate(const CurveKey& key) {
    std::lock_guard<std::mutex> lock(mutex_);
    return curves_.erase(key) > 0;
}

void CurveCache::clear() {
    std::lock_guard<std::mutex> lock(mutex_);
    curves_.clear();
    hits_ = 0;
    misses_ = 0;
}

std::size_t CurveCache::size() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return curves_.size();
}

std::size_t CurveCache::hits() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return hits_;
}

std::size_t CurveCache::misses() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return misses_;
}

} // namespace rcflex
