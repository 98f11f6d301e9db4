#include "local_studio_backend.h"

#include <QFile>
#include <QJsonArray>
#include <QJsonDocument>
#include <QJsonObject>
#include <QJsonValue>
#include <QRegularExpression>
#include <QString>
#include <QStringList>

#include <algorithm>
#include <sstream>
#include <utility>

namespace voxrelay {

namespace {

constexpr int kMinKeywordChars = 3;

std::string ReadString(const QJsonObject& obj, const char* key) {
    const QJsonValue v = obj.value(QString::fromUtf8(key));
    return v.isString() ? v.toString().toStdString() : std::string();
}

// Dependency maps arrive either as {name: version} or as [name, ...].
std::vector<std::string> ReadDependencyNames(const QJsonValue& v) {
    std::vector<std::string> out;
    if (v.isObject()) {
        const QStringList keys = v.toObject().keys();
        for (const auto& key : keys) {
            out.push_back(key.toStdString());
        }
    } else if (v.isArray()) {
        for (const auto& item : v.toArray()) {
            if (item.isString()) {
                out.push_back(item.toString().toStdString());
            }
        }
    }
    return out;
}

bool ReadFileBytes(const std::string& path, QByteArray* out, std::string* error) {
    QFile file(QString::fromStdString(path));
    if (!file.open(QIODevice::ReadOnly)) {
        if (error) {
            *error = "open_failed path=" + path + " reason=" + file.errorString().toStdString();
        }
        return false;
    }
    *out = file.readAll();
    return true;
}

QString Lower(const std::string& s) {
    return QString::fromStdString(s).toLower();
}

bool HasDomain(const CatalogEntry& entry, const std::string& domain) {
    return std::find(entry.domains.begin(), entry.domains.end(), domain) != entry.domains.end();
}

int SearchScore(const CatalogEntry& entry, const QString& query) {
    if (query.isEmpty()) {
        return 1;
    }
    const QString id = Lower(entry.id);
    const QString name = Lower(entry.name);
    if (id == query || name == query) {
        return 4;
    }
    if (id.contains(query) || name.contains(query)) {
        return 2;
    }
    if (Lower(entry.description).contains(query)) {
        return 1;
    }
    return 0;
}

QStringList Keywords(const std::string& text) {
    static const QRegularExpression kSplit(QStringLiteral("[^a-z0-9+#.-]+"));
    QStringList out;
    const QStringList parts = Lower(text).split(kSplit, Qt::SkipEmptyParts);
    for (const auto& part : parts) {
        if (part.size() >= kMinKeywordChars && !out.contains(part)) {
            out.append(part);
        }
    }
    return out;
}

struct Scored {
    std::size_t index = 0;
    int score = 0;
};

} // namespace

bool ParseCatalogJson(const QByteArray& json, std::vector<CatalogEntry>* out, std::string* error) {
    if (!out) {
        return false;
    }
    out->clear();
    QJsonParseError parse_error{};
    const QJsonDocument doc = QJsonDocument::fromJson(json, &parse_error);
    if (parse_error.error != QJsonParseError::NoError || !doc.isArray()) {
        if (error) {
            *error = "catalog_not_array detail=" + parse_error.errorString().toStdString();
        }
        return false;
    }
    for (const auto& item : doc.array()) {
        if (!item.isObject()) {
            continue;
        }
        const QJsonObject obj = item.toObject();
        CatalogEntry entry;
        entry.id = ReadString(obj, "id");
        if (entry.id.empty()) {
            continue;
        }
        entry.name = ReadString(obj, "name");
        if (entry.name.empty()) {
            entry.name = entry.id;
        }
        entry.description = ReadString(obj, "description");
        const std::string category = ReadString(obj, "category");
        if (!category.empty()) {
            entry.category = category;
        }
        entry.domains = ReadDependencyNames(obj.value(QStringLiteral("domains")));
        entry.integration_prompt = ReadString(obj, "integrationPrompt");
        out->push_back(std::move(entry));
    }
    return true;
}

bool LoadCatalogFile(const std::string& path, std::vector<CatalogEntry>* out, std::string* error) {
    QByteArray bytes;
    if (!ReadFileBytes(path, &bytes, error)) {
        return false;
    }
    return ParseCatalogJson(bytes, out, error);
}

bool ParseProjectJson(const QByteArray& json, ProjectSnapshot* out) {
    if (!out) {
        return false;
    }
    *out = ProjectSnapshot{};
    const QJsonDocument doc = QJsonDocument::fromJson(json);
    if (!doc.isObject()) {
        return false;
    }
    const QJsonObject obj = doc.object();
    if (obj.isEmpty()) {
        return true;
    }
    out->present = true;
    out->name = ReadString(obj, "name");
    const QJsonValue files = obj.value(QStringLiteral("files"));
    if (files.isArray()) {
        out->files = static_cast<int>(files.toArray().size());
    } else if (files.isObject()) {
        out->files = static_cast<int>(files.toObject().size());
    } else if (files.isDouble()) {
        out->files = files.toInt();
    }
    out->stack = ReadString(obj, "stack");
    out->frontend_deps = ReadDependencyNames(obj.value(QStringLiteral("frontend_deps")));
    out->backend_deps = ReadDependencyNames(obj.value(QStringLiteral("backend_deps")));
    return true;
}

LocalStudioBackend::LocalStudioBackend(std::vector<CatalogEntry> catalog, std::string project_state_path)
    : catalog_(std::move(catalog)),
      project_state_path_(std::move(project_state_path)) {}

void LocalStudioBackend::SetLogger(LogFn logger) {
    logger_ = std::move(logger);
}

bool LocalStudioBackend::StartGeneration(const std::string& prompt, std::string* error) {
    if (prompt.empty()) {
        if (error) *error = "empty prompt";
        return false;
    }
    std::uint64_t seq = 0;
    {
        std::lock_guard<std::mutex> lock(generation_mu_);
        seq = ++generation_requests_;
        last_generation_prompt_ = prompt;
    }
    std::ostringstream oss;
    oss << "generation requested seq=" << seq << " prompt_chars=" << prompt.size();
    Log(oss.str());
    return true;
}

CatalogSearchResult LocalStudioBackend::SearchCatalog(
    const std::string& query,
    const std::string& domain,
    std::size_t limit) const {
    const QString q = Lower(query).trimmed();
    std::vector<Scored> matches;
    for (std::size_t i = 0; i < catalog_.size(); ++i) {
        if (!domain.empty() && !HasDomain(catalog_[i], domain)) {
            continue;
        }
        const int score = SearchScore(catalog_[i], q);
        if (score > 0) {
            matches.push_back({i, score});
        }
    }
    std::stable_sort(matches.begin(), matches.end(), [](const Scored& a, const Scored& b) {
        return a.score > b.score;
    });

    CatalogSearchResult result;
    result.total = matches.size();
    for (std::size_t i = 0; i < matches.size() && i < limit; ++i) {
        result.entries.push_back(catalog_[matches[i].index]);
    }
    return result;
}

bool LocalStudioBackend::FindCatalogEntry(const std::string& id, CatalogEntry* out) const {
    const auto it = std::find_if(catalog_.begin(), catalog_.end(), [&id](const CatalogEntry& e) {
        return e.id == id;
    });
    if (it == catalog_.end()) {
        return false;
    }
    if (out) {
        *out = *it;
    }
    return true;
}

ProjectSnapshot LocalStudioBackend::GetProjectStatus() const {
    ProjectSnapshot snapshot;
    if (project_state_path_.empty() || !QFile::exists(QString::fromStdString(project_state_path_))) {
        return snapshot;
    }
    QByteArray bytes;
    std::string error;
    if (!ReadFileBytes(project_state_path_, &bytes, &error)) {
        Log("project state read failed " + error);
        return snapshot;
    }
    if (!ParseProjectJson(bytes, &snapshot)) {
        Log("project state parse failed path=" + project_state_path_);
        return ProjectSnapshot{};
    }
    return snapshot;
}

std::vector<Recommendation> LocalStudioBackend::Recommend(const std::string& project_summary, std::size_t limit) const {
    const QStringList keywords = Keywords(project_summary);
    std::vector<Scored> scored;
    std::vector<QStringList> hits(catalog_.size());
    for (std::size_t i = 0; i < catalog_.size(); ++i) {
        const CatalogEntry& entry = catalog_[i];
        QString haystack = Lower(entry.id) + QLatin1Char(' ') + Lower(entry.name) + QLatin1Char(' ') +
                           Lower(entry.description);
        for (const auto& d : entry.domains) {
            haystack += QLatin1Char(' ') + Lower(d);
        }
        for (const auto& word : keywords) {
            if (haystack.contains(word)) {
                hits[i].append(word);
            }
        }
        if (!hits[i].isEmpty()) {
            scored.push_back({i, static_cast<int>(hits[i].size())});
        }
    }
    std::stable_sort(scored.begin(), scored.end(), [](const Scored& a, const Scored& b) {
        return a.score > b.score;
    });

    std::vector<Recommendation> out;
    for (std::size_t i = 0; i < scored.size() && out.size() < limit; ++i) {
        const std::size_t idx = scored[i].index;
        Recommendation rec;
        rec.tool_id = catalog_[idx].id;
        rec.reason = "matches " + hits[idx].join(QStringLiteral(", ")).toStdString();
        out.push_back(std::move(rec));
    }
    return out;
}

std::uint64_t LocalStudioBackend::generation_requests() const {
    std::lock_guard<std::mutex> lock(generation_mu_);
    return generation_requests_;
}

std::string LocalStudioBackend::last_generation_prompt() const {
    std::lock_guard<std::mutex> lock(generation_mu_);
    return last_generation_prompt_;
}

void LocalStudioBackend::Log(const std::string& msg) const {
    if (logger_) {
        logger_(msg);
    }
}

} // namespace voxrelay
