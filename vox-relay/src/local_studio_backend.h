#pragma once

#include "studio_backend.h"

#include <QByteArray>

#include <cstdint>
#include <functional>
#include <mutex>
#include <string>
#include <vector>

namespace voxrelay {

// Parses a catalog snapshot: a JSON array of {id, name, description, category,
// domains[], integrationPrompt}. Entries without an id are skipped.
bool ParseCatalogJson(const QByteArray& json, std::vector<CatalogEntry>* out, std::string* error);
bool LoadCatalogFile(const std::string& path, std::vector<CatalogEntry>* out, std::string* error);

// Parses a project snapshot: {name, files[], stack, frontend_deps{}, backend_deps{}}.
// An empty object or `null` means no project is open.
bool ParseProjectJson(const QByteArray& json, ProjectSnapshot* out);

// Backend served from files on disk. The catalog is loaded once at construction;
// the project snapshot file is re-read on every status request.
class LocalStudioBackend : public StudioBackend {
public:
    using LogFn = std::function<void(const std::string&)>;

    LocalStudioBackend(std::vector<CatalogEntry> catalog, std::string project_state_path);

    void SetLogger(LogFn logger);

    bool StartGeneration(const std::string& prompt, std::string* error) override;
    CatalogSearchResult SearchCatalog(
        const std::string& query,
        const std::string& domain,
        std::size_t limit) const override;
    bool FindCatalogEntry(const std::string& id, CatalogEntry* out) const override;
    ProjectSnapshot GetProjectStatus() const override;
    std::vector<Recommendation> Recommend(const std::string& project_summary, std::size_t limit) const override;

    std::size_t catalog_size() const { return catalog_.size(); }
    std::uint64_t generation_requests() const;
    std::string last_generation_prompt() const;

private:
    void Log(const std::string& msg) const;

    const std::vector<CatalogEntry> catalog_;
    const std::string project_state_path_;
    LogFn logger_;

    mutable std::mutex generation_mu_;
    std::uint64_t generation_requests_ = 0;
    std::string last_generation_prompt_;
};

} // namespace voxrelay
