#pragma once

#include "studio_backend.h"
#include "tool_registry.h"

#include <string>

namespace voxrelay {

constexpr std::size_t kSearchResultLimit = 10;
constexpr int kSearchDescriptionChars = 100;
constexpr std::size_t kRecommendationLimit = 5;

// The eight tools the voice model may call. Handlers keep a reference to
// `backend`, which must outlive the returned registry.
ToolRegistry BuildStudioToolRegistry(StudioBackend& backend);

// Persona prompt sent in the upstream setup, with a project summary appended.
std::string BuildSystemInstruction(const std::string& theme, const ProjectSnapshot& project);

} // namespace voxrelay
