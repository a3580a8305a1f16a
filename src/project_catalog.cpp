#include "foundry/project_catalog.hpp"
#include "foundry/codec.hpp"
#include "foundry/error.hpp"
#include <algorithm>
#include <cctype>
#include <fstream>
#include <sstream>

namespace foundry {

namespace {

const nlohmann::json& array_field(const nlohmann::json& obj, const char* key) {
    static const nlohmann::json empty = nlohmann::json::array();
    auto it = obj.find(key);
    return (it != obj.end() && it->is_array()) ? *it : empty;
}

std::string text_field(const nlohmann::json& obj, const char* key, const std::string& fallback = "") {
    auto it = obj.find(key);
    return (it != obj.end() && it->is_string()) ? it->get<std::string>() : fallback;
}

nlohmann::json field_or_null(const nlohmann::json& obj, const char* key) {
    auto it = obj.find(key);
    return it == obj.end() ? nlohmann::json(nullptr) : *it;
}

std::string lower(std::string s) {
    std::transform(s.begin(), s.end(), s.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return s;
}

// Newest first; ISO-8601 strings sort lexically.
std::vector<nlohmann::json> newest_first(const nlohmann::json& items) {
    std::vector<nlohmann::json> out(items.begin(), items.end());
    std::stable_sort(out.begin(), out.end(), [](const nlohmann::json& a, const nlohmann::json& b) {
        return text_field(a, "created_at") > text_field(b, "created_at");
    });
    return out;
}

} // anonymous namespace

JsonProjectCatalog::JsonProjectCatalog(nlohmann::json document) : document_(std::move(document)) {
    if (!document_.is_object() || !document_.contains("projects") || !document_.at("projects").is_array()) {
        throw ConfigError("Project data must be an object with a 'projects' array");
    }
}

std::shared_ptr<JsonProjectCatalog> JsonProjectCatalog::load(const std::filesystem::path& path) {
    std::ifstream in(path);
    if (!in) throw ConfigError("Cannot open project data file: " + path.string());
    std::stringstream ss;
    ss << in.rdbuf();
    try {
        return std::make_shared<JsonProjectCatalog>(Codec::parse_json(ss.str()));
    } catch (const ParseError& e) {
        throw ConfigError("Invalid project data in " + path.string() + ": " + e.what());
    }
}

const nlohmann::json* JsonProjectCatalog::project(const std::string& project_id) const {
    for (const auto& p : document_.at("projects")) {
        if (text_field(p, "id") == project_id) return &p;
    }
    return nullptr;
}

std::optional<ProjectInfo> JsonProjectCatalog::find_project(const std::string& project_id) const {
    const auto* p = project(project_id);
    if (!p) return std::nullopt;
    return ProjectInfo{project_id, text_field(*p, "name", project_id), text_field(*p, "slug", project_id)};
}

std::optional<nlohmann::json> JsonProjectCatalog::project_summary(const std::string& project_id) const {
    const auto* p = project(project_id);
    if (!p) return std::nullopt;
    return nlohmann::json{
        {"id", project_id},
        {"name", text_field(*p, "name")},
        {"slug", text_field(*p, "slug")},
        {"description", field_or_null(*p, "description")},
        {"member_count", array_field(*p, "members").size()},
        {"canvas_count", array_field(*p, "canvases").size()},
        {"idea_count", array_field(*p, "ideas").size()},
        {"created_at", field_or_null(*p, "created_at")},
    };
}

nlohmann::json JsonProjectCatalog::list_canvases(const std::string& project_id) const {
    nlohmann::json out = nlohmann::json::array();
    const auto* p = project(project_id);
    if (!p) return out;
    for (const auto& c : array_field(*p, "canvases")) {
        out.push_back({
            {"id", text_field(c, "id")},
            {"name", text_field(c, "name")},
            {"component_count", array_field(c, "components").size()},
            {"created_at", field_or_null(c, "created_at")},
        });
    }
    return out;
}

std::optional<nlohmann::json> JsonProjectCatalog::canvas_components(const std::string& project_id,
                                                                     const std::string& canvas_id) const {
    const auto* p = project(project_id);
    if (!p) return std::nullopt;
    for (const auto& c : array_field(*p, "canvases")) {
        if (text_field(c, "id") != canvas_id) continue;
        nlohmann::json out = nlohmann::json::array();
        for (const auto& comp : array_field(c, "components")) {
            out.push_back({
                {"id", text_field(comp, "id")},
                {"shape_id", field_or_null(comp, "shape_id")},
                {"name", text_field(comp, "name")},
                {"component_type", field_or_null(comp, "component_type")},
                {"tech_stack", field_or_null(comp, "tech_stack")},
                {"description", field_or_null(comp, "description")},
                {"metadata", field_or_null(comp, "metadata")},
            });
        }
        return out;
    }
    return std::nullopt;
}

nlohmann::json JsonProjectCatalog::ideas(const std::string& project_id,
                                         const std::optional<std::string>& status) const {
    nlohmann::json out = nlohmann::json::array();
    const auto* p = project(project_id);
    if (!p) return out;
    for (const auto& i : newest_first(array_field(*p, "ideas"))) {
        if (status && !status->empty() && text_field(i, "status") != *status) continue;
        out.push_back({
            {"id", text_field(i, "id")},
            {"title", text_field(i, "title")},
            {"description", field_or_null(i, "description")},
            {"status", text_field(i, "status")},
            {"category", field_or_null(i, "category")},
            {"feasibility_score", field_or_null(i, "feasibility_score")},
            {"created_at", field_or_null(i, "created_at")},
        });
    }
    return out;
}

nlohmann::json JsonProjectCatalog::search_ideas(const std::string& project_id, const std::string& query,
                                                std::size_t limit) const {
    nlohmann::json out = nlohmann::json::array();
    const auto* p = project(project_id);
    if (!p) return out;
    const std::string needle = lower(query);
    for (const auto& i : newest_first(array_field(*p, "ideas"))) {
        if (out.size() >= limit) break;
        std::string title = text_field(i, "title");
        std::string description = text_field(i, "description");
        if (lower(title).find(needle) == std::string::npos
            && lower(description).find(needle) == std::string::npos) {
            continue;
        }
        if (description.size() > 200) description.resize(200);
        out.push_back({
            {"id", text_field(i, "id")},
            {"title", title},
            {"description", description},
            {"status", text_field(i, "status")},
            {"category", field_or_null(i, "category")},
        });
    }
    return out;
}

std::optional<nlohmann::json> JsonProjectCatalog::scaffold_job(const std::string& project_id,
                                                               const std::string& job_id) const {
    const auto* p = project(project_id);
    if (!p) return std::nullopt;
    for (const auto& j : array_field(*p, "scaffold_jobs")) {
        if (text_field(j, "id") != job_id) continue;
        return nlohmann::json{
            {"id", job_id},
            {"status", text_field(j, "status")},
            {"component_ids", field_or_null(j, "component_ids")},
            {"spec", field_or_null(j, "spec")},
            {"generated_files", field_or_null(j, "generated_files")},
            {"error_message", field_or_null(j, "error_message")},
            {"created_at", field_or_null(j, "created_at")},
            {"completed_at", field_or_null(j, "completed_at")},
        };
    }
    return std::nullopt;
}

nlohmann::json JsonProjectCatalog::deploy_environments(const std::string& project_id) const {
    nlohmann::json out = nlohmann::json::array();
    const auto* p = project(project_id);
    if (!p) return out;
    for (const auto& e : array_field(*p, "environments")) {
        out.push_back({
            {"id", text_field(e, "id")},
            {"name", text_field(e, "name")},
            {"config", field_or_null(e, "config")},
            {"compose_yaml", field_or_null(e, "compose_yaml")},
            {"created_at", field_or_null(e, "created_at")},
        });
    }
    return out;
}

} // namespace foundry
