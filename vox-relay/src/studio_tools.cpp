#include "studio_tools.h"

#include <QJsonArray>
#include <QJsonObject>
#include <QJsonValue>
#include <QString>
#include <QStringList>

#include <algorithm>
#include <iterator>
#include <sstream>
#include <utility>

namespace voxrelay {

namespace {

const char* const kNavigateTargets[] = {"welcome", "studio", "settings", "files", "preview", "chat"};
const char* const kCatalogDomains[] = {
    "general", "saas", "ai-ml", "music", "gaming", "productivity", "social",
    "ecommerce", "data-viz", "web-dev", "documentation", "animations", "visuals"};

QJsonObject StringParam(const char* description) {
    QJsonObject p;
    p.insert(QStringLiteral("type"), QStringLiteral("string"));
    p.insert(QStringLiteral("description"), QString::fromUtf8(description));
    return p;
}

template <std::size_t N>
QJsonObject EnumParam(const char* description, const char* const (&values)[N]) {
    QJsonObject p = StringParam(description);
    QJsonArray arr;
    for (const char* v : values) {
        arr.append(QString::fromUtf8(v));
    }
    p.insert(QStringLiteral("enum"), arr);
    return p;
}

QJsonObject ObjectSchema(const QJsonObject& properties, const QStringList& required) {
    QJsonObject schema;
    schema.insert(QStringLiteral("type"), QStringLiteral("object"));
    schema.insert(QStringLiteral("properties"), properties);
    if (!required.isEmpty()) {
        schema.insert(QStringLiteral("required"), QJsonArray::fromStringList(required));
    }
    return schema;
}

std::string ArgString(const QJsonObject& args, const char* key) {
    const QJsonValue v = args.value(QString::fromUtf8(key));
    if (!v.isString()) {
        return std::string();
    }
    return v.toString().trimmed().toStdString();
}

QJsonObject MissingArg(const char* key) {
    QJsonObject obj;
    obj.insert(QStringLiteral("error"), QStringLiteral("No %1 provided").arg(QString::fromUtf8(key)));
    return obj;
}

QJsonObject ErrorObject(const QString& message) {
    QJsonObject obj;
    obj.insert(QStringLiteral("error"), message);
    return obj;
}

QJsonArray ToJsonArray(const std::vector<std::string>& values) {
    QJsonArray arr;
    for (const auto& v : values) {
        arr.append(QString::fromStdString(v));
    }
    return arr;
}

QJsonObject UiAction(const char* action) {
    QJsonObject obj;
    obj.insert(QStringLiteral("action"), QString::fromUtf8(action));
    return obj;
}

template <std::size_t N>
bool Contains(const char* const (&values)[N], const std::string& v) {
    return std::any_of(std::begin(values), std::end(values), [&v](const char* item) { return v == item; });
}

QJsonObject GenerateApp(StudioBackend& backend, const QJsonObject& args, const ToolContext& ctx) {
    const std::string prompt = ArgString(args, "prompt");
    if (prompt.empty()) {
        return MissingArg("prompt");
    }
    std::string error;
    if (!backend.StartGeneration(prompt, &error)) {
        throw ToolExecutionError(error.empty() ? "generation unavailable" : error);
    }
    QJsonObject action = UiAction("generate");
    action.insert(QStringLiteral("prompt"), QString::fromStdString(prompt));
    ctx.EmitUiAction(action);

    QJsonObject out;
    out.insert(QStringLiteral("status"), QStringLiteral("generation_started"));
    out.insert(QStringLiteral("prompt"), QString::fromStdString(prompt));
    return out;
}

QJsonObject SearchTools(const StudioBackend& backend, const QJsonObject& args) {
    const std::string query = ArgString(args, "query");
    const std::string domain = ArgString(args, "domain");
    const CatalogSearchResult found = backend.SearchCatalog(query, domain, kSearchResultLimit);

    QJsonArray tools;
    for (const auto& entry : found.entries) {
        QJsonObject t;
        t.insert(QStringLiteral("id"), QString::fromStdString(entry.id));
        t.insert(QStringLiteral("name"), QString::fromStdString(entry.name));
        t.insert(
            QStringLiteral("description"),
            QString::fromStdString(entry.description).left(kSearchDescriptionChars));
        t.insert(QStringLiteral("category"), QString::fromStdString(entry.category));
        t.insert(QStringLiteral("domains"), ToJsonArray(entry.domains));
        tools.append(t);
    }
    QJsonObject out;
    out.insert(QStringLiteral("tools"), tools);
    out.insert(QStringLiteral("total"), static_cast<qint64>(found.total));
    return out;
}

QJsonObject GetProjectStatus(const StudioBackend& backend) {
    const ProjectSnapshot project = backend.GetProjectStatus();
    QJsonObject out;
    if (!project.present) {
        out.insert(QStringLiteral("status"), QStringLiteral("no_project"));
        out.insert(QStringLiteral("files"), 0);
        return out;
    }
    out.insert(QStringLiteral("status"), QStringLiteral("active"));
    out.insert(QStringLiteral("name"), QString::fromStdString(project.name.empty() ? "Untitled" : project.name));
    out.insert(QStringLiteral("files"), project.files);
    out.insert(QStringLiteral("stack"), QString::fromStdString(project.stack.empty() ? "unknown" : project.stack));
    out.insert(QStringLiteral("frontend_deps"), ToJsonArray(project.frontend_deps));
    out.insert(QStringLiteral("backend_deps"), ToJsonArray(project.backend_deps));
    return out;
}

QJsonObject NavigateUi(const QJsonObject& args, const ToolContext& ctx) {
    std::string target = ArgString(args, "target");
    if (target.empty()) {
        target = "studio";
    }
    if (!Contains(kNavigateTargets, target)) {
        return ErrorObject(QStringLiteral("Unknown target '%1'").arg(QString::fromStdString(target)));
    }
    QJsonObject action = UiAction("navigate");
    action.insert(QStringLiteral("target"), QString::fromStdString(target));
    ctx.EmitUiAction(action);

    QJsonObject out;
    out.insert(QStringLiteral("status"), QStringLiteral("navigated"));
    out.insert(QStringLiteral("target"), QString::fromStdString(target));
    return out;
}

QJsonObject AddTool(const StudioBackend& backend, const QJsonObject& args, const ToolContext& ctx) {
    const std::string tool_id = ArgString(args, "tool_id");
    if (tool_id.empty()) {
        return MissingArg("tool_id");
    }
    CatalogEntry entry;
    if (!backend.FindCatalogEntry(tool_id, &entry)) {
        return ErrorObject(QStringLiteral("Tool '%1' not found in catalog").arg(QString::fromStdString(tool_id)));
    }
    const QString tool_name = QString::fromStdString(entry.name.empty() ? tool_id : entry.name);

    QJsonObject action = UiAction("add_tool");
    action.insert(QStringLiteral("tool_id"), QString::fromStdString(tool_id));
    action.insert(QStringLiteral("tool_name"), tool_name);
    action.insert(QStringLiteral("integration_prompt"), QString::fromStdString(entry.integration_prompt));
    ctx.EmitUiAction(action);

    QJsonObject out;
    out.insert(QStringLiteral("status"), QStringLiteral("tool_added"));
    out.insert(QStringLiteral("tool_id"), QString::fromStdString(tool_id));
    out.insert(QStringLiteral("tool_name"), tool_name);
    return out;
}

// load_template and add_blueprint only forward an id to the UI.
QJsonObject ForwardId(
    const QJsonObject& args,
    const ToolContext& ctx,
    const char* arg_name,
    const char* action_name,
    const char* status) {
    const std::string id = ArgString(args, arg_name);
    if (id.empty()) {
        return MissingArg(arg_name);
    }
    QJsonObject action = UiAction(action_name);
    action.insert(QString::fromUtf8(arg_name), QString::fromStdString(id));
    ctx.EmitUiAction(action);

    QJsonObject out;
    out.insert(QStringLiteral("status"), QString::fromUtf8(status));
    out.insert(QString::fromUtf8(arg_name), QString::fromStdString(id));
    return out;
}

QJsonObject RecommendTools(const StudioBackend& backend, const QJsonObject& args) {
    const std::string summary = ArgString(args, "project_summary");
    if (summary.empty()) {
        return MissingArg("project_summary");
    }
    QJsonArray recs;
    for (const auto& rec : backend.Recommend(summary, kRecommendationLimit)) {
        QJsonObject r;
        r.insert(QStringLiteral("toolId"), QString::fromStdString(rec.tool_id));
        r.insert(QStringLiteral("reason"), QString::fromStdString(rec.reason));
        recs.append(r);
    }
    QJsonObject out;
    out.insert(QStringLiteral("recommendations"), recs);
    return out;
}

} // namespace

ToolRegistry BuildStudioToolRegistry(StudioBackend& backend) {
    StudioBackend* b = &backend;
    ToolRegistry::Builder builder;
    auto add = [&builder](RegisteredTool tool) {
        std::string error;
        if (!builder.Add(std::move(tool), &error)) {
            throw std::logic_error("studio tool registration failed: " + error);
        }
    };

    add({"recommend_tools",
         "Get tool recommendations based on the current project context. Returns a list of tool IDs "
         "with reasons.",
         ObjectSchema(
             QJsonObject{{QStringLiteral("project_summary"),
                          StringParam("Brief description of what the project does")}},
             {QStringLiteral("project_summary")}),
         SchedulingPolicy::NonBlocking,
         [b](const QJsonObject& args, const ToolContext&) { return RecommendTools(*b, args); }});

    add({"generate_app",
         "Start generating a full-stack web application from a natural language description.",
         ObjectSchema(
             QJsonObject{{QStringLiteral("prompt"),
                          StringParam("Natural language description of the app to build")}},
             {QStringLiteral("prompt")}),
         SchedulingPolicy::WhenIdle,
         [b](const QJsonObject& args, const ToolContext& ctx) { return GenerateApp(*b, args, ctx); }});

    add({"add_tool",
         "Add a specific tool or library to the current project by its ID.",
         ObjectSchema(
             QJsonObject{{QStringLiteral("tool_id"),
                          StringParam("The tool ID to add (e.g. 'langchain-js', 'd3-js', 'redis')")}},
             {QStringLiteral("tool_id")}),
         SchedulingPolicy::WhenIdle,
         [b](const QJsonObject& args, const ToolContext& ctx) { return AddTool(*b, args, ctx); }});

    add({"navigate_ui",
         "Navigate the Studio UI to a specific page or panel.",
         ObjectSchema(
             QJsonObject{{QStringLiteral("target"),
                          EnumParam("The UI target to navigate to", kNavigateTargets)}},
             {QStringLiteral("target")}),
         SchedulingPolicy::Silent,
         [](const QJsonObject& args, const ToolContext& ctx) { return NavigateUi(args, ctx); }});

    add({"get_project_status",
         "Get the current project state including file count and dependencies.",
         ObjectSchema(QJsonObject{}, {}),
         SchedulingPolicy::WhenIdle,
         [b](const QJsonObject&, const ToolContext&) { return GetProjectStatus(*b); }});

    add({"search_tools",
         "Search the tool registry by keyword or domain. Returns matching tool names and descriptions.",
         ObjectSchema(
             QJsonObject{
                 {QStringLiteral("query"), StringParam("Search query (tool name, keyword, or technology)")},
                 {QStringLiteral("domain"), EnumParam("Optional domain filter", kCatalogDomains)}},
             {QStringLiteral("query")}),
         SchedulingPolicy::WhenIdle,
         [b](const QJsonObject& args, const ToolContext&) { return SearchTools(*b, args); }});

    add({"load_template",
         "Load a project template by ID. Shows a pre-built project the user can customize.",
         ObjectSchema(
             QJsonObject{{QStringLiteral("template_id"), StringParam("The template ID to load")}},
             {QStringLiteral("template_id")}),
         SchedulingPolicy::WhenIdle,
         [](const QJsonObject& args, const ToolContext& ctx) {
             return ForwardId(args, ctx, "template_id", "load_template", "template_loading");
         }});

    add({"add_blueprint",
         "Add a reusable component blueprint to the current project.",
         ObjectSchema(
             QJsonObject{{QStringLiteral("blueprint_id"),
                          StringParam("The blueprint ID to add (e.g. 'zustand-store', 'recharts-dashboard')")}},
             {QStringLiteral("blueprint_id")}),
         SchedulingPolicy::WhenIdle,
         [](const QJsonObject& args, const ToolContext& ctx) {
             return ForwardId(args, ctx, "blueprint_id", "add_blueprint", "blueprint_added");
         }});

    return builder.Build();
}

std::string BuildSystemInstruction(const std::string& theme, const ProjectSnapshot& project) {
    std::ostringstream oss;
    oss << "You are VOX, the creative partner in Vox Code Studio. You help users build web "
           "applications through natural conversation.\n\n"
           "Your personality:\n"
           "- Confident but collaborative\n"
           "- Concise, prefer short responses over long explanations\n"
           "- Action-oriented, use your tools proactively when relevant\n\n"
           "Available actions:\n"
           "- Recommend tools from the tool registry\n"
           "- Start app generation from a natural language description\n"
           "- Add specific tools or libraries to an existing project\n"
           "- Navigate the Studio UI\n"
           "- Check project status\n"
           "- Search for tools by name, domain, or keyword\n"
           "- Load a project template\n"
           "- Add component blueprints\n\n"
           "Current theme: "
        << theme << "\n\n[Workspace Context]\n";
    if (!project.present) {
        oss << "No project is open.";
    } else {
        oss << "Project: " << (project.name.empty() ? "Untitled" : project.name) << " (" << project.files
            << " files, stack " << (project.stack.empty() ? "unknown" : project.stack) << ")";
    }
    return oss.str();
}

} // namespace voxrelay
