#include "rcflex/section.hpp"
#include "rcflex/errors.hpp"

#include <utility>

namespace rcflex {

RectangularSection::RectangularSection(double b, double h, double cover,
                                       int id, std::string name)
    : id(id), name(std::move(name)), b(b), h(h), cover(cover) {
    if (!(b > 0.0)) {
        throw InputError(RcflexError::invalid_geometry("b", b));
    }
    if (!(h > 0.0)) {
        throw InputError(RcflexError::invalid_geometry("h", h));
    }
    if (cover < 0.0 || 2.0 * cover >= h) {
        RcflexError err(ErrorCode::INVALID_COVER,
            "Cover must be non-negative and leave room for reinforcement");
        err.details["cover"] = std::to_string(cover) + " mm";
        err.details["h"] = std::to_string(h) + " mm";
        throw InputError(err);
    }
}

RectangularSection RectangularSection::rotated() const {
    return RectangularSection(h, b, cover, id, name);
}

} // namespace rcflex
