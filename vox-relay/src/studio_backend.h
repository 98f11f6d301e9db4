#pragma once

#include <cstddef>
#include <string>
#include <vector>

namespace voxrelay {

struct CatalogEntry {
    std::string id;
    std::string name;
    std::string description;
    std::string category = "library";
    std::vector<std::string> domains;
    std::string integration_prompt;
};

struct CatalogSearchResult {
    std::vector<CatalogEntry> entries; // ranked, at most `limit`
    std::size_t total = 0;             // matches before the limit was applied
};

struct ProjectSnapshot {
    bool present = false;
    std::string name;
    int files = 0;
    std::string stack;
    std::vector<std::string> frontend_deps;
    std::vector<std::string> backend_deps;
};

struct Recommendation {
    std::string tool_id;
    std::string reason;
};

// Collaborators the studio tools call out to. Shared by every session, so
// implementations must be safe to call from several session threads at once.
class StudioBackend {
public:
    virtual ~StudioBackend() = default;

    // Fire-and-forget; returns once the request is accepted.
    virtual bool StartGeneration(const std::string& prompt, std::string* error) = 0;

    virtual CatalogSearchResult SearchCatalog(
        const std::string& query,
        const std::string& domain,
        std::size_t limit) const = 0;

    virtual bool FindCatalogEntry(const std::string& id, CatalogEntry* out) const = 0;

    virtual ProjectSnapshot GetProjectStatus() const = 0;

    virtual std::vector<Recommendation> Recommend(const std::string& project_summary, std::size_t limit) const = 0;
};

} // namespace voxrelay
