#pragma once

#include "fence/calc/calculation_types.h"

#include <string>

namespace fence {

std::string encodeEstimateRequest(const EstimateRequest& request);

// Accepts either the bare reply object or one wrapped in {"message": ...}.
// Anything without `success: true` and complete materials/cost fields fails.
FenceError decodeEstimateReply(const std::string& body, EstimateReply& out);

} // namespace fence
