#pragma once

#include "geoalign/errors.hpp"
#include "geoalign/feature.hpp"
#include "geoalign/geo_transform.hpp"
#include "geoalign/geometry.hpp"
#include "geoalign/logging.hpp"
#include "geoalign/path_lock.hpp"
#include "geoalign/raster.hpp"
#include "geoalign/roi.hpp"
#include "geoalign/srs.hpp"

namespace geoalign {

constexpr const char* VERSION = "0.1.0";

} // namespace geoalign
