#include "foundry/builtin_tools.hpp"
#include "foundry/error.hpp"

namespace foundry {

namespace {

nlohmann::json object_schema(nlohmann::json properties, std::vector<std::string> required) {
    return {
        {"type", "object"},
        {"properties", std::move(properties)},
        {"required", std::move(required)},
    };
}

const nlohmann::json kProjectId = {{"type", "string"}, {"description", "The project id"}};

std::string arg(const nlohmann::json& args, const char* key) {
    return args.at(key).get<std::string>();
}

} // anonymous namespace

void register_project_tools(ToolRegistry& registry, std::shared_ptr<const ProjectCatalog> catalog) {
    registry.add(
        "get_project_summary",
        "Get project overview including member count, canvas count, idea count.",
        object_schema({{"project_id", kProjectId}}, {"project_id"}),
        [catalog](const nlohmann::json& args) {
            auto summary = catalog->project_summary(arg(args, "project_id"));
            if (!summary) throw FoundryError("Project not found");
            return *summary;
        });

    registry.add(
        "list_canvases",
        "List all canvases in a project with their names and component counts.",
        object_schema({{"project_id", kProjectId}}, {"project_id"}),
        [catalog](const nlohmann::json& args) {
            return catalog->list_canvases(arg(args, "project_id"));
        });

    registry.add(
        "get_canvas_components",
        "Get all components on a canvas with their types, tech stacks, and descriptions.",
        object_schema({{"project_id", kProjectId}, {"canvas_id", {{"type", "string"}}}},
                      {"project_id", "canvas_id"}),
        [catalog](const nlohmann::json& args) {
            auto components = catalog->canvas_components(arg(args, "project_id"), arg(args, "canvas_id"));
            if (!components) throw FoundryError("Canvas not found");
            return *components;
        });

    registry.add(
        "get_ideas",
        "Get ideas in a project, optionally filtered by status "
        "(draft/proposed/approved/rejected/implemented).",
        object_schema({{"project_id", kProjectId},
                       {"status", {{"type", "string"}, {"description", "Filter by status. Optional."}}}},
                      {"project_id"}),
        [catalog](const nlohmann::json& args) {
            std::optional<std::string> status;
            if (args.contains("status")) status = arg(args, "status");
            return catalog->ideas(arg(args, "project_id"), status);
        });

    registry.add(
        "search_ideas",
        "Search across ideas in a project by keyword.",
        object_schema({{"project_id", kProjectId}, {"query", {{"type", "string"}, {"minLength", 1}}}},
                      {"project_id", "query"}),
        [catalog](const nlohmann::json& args) {
            return catalog->search_ideas(arg(args, "project_id"), arg(args, "query"), 20);
        });

    registry.add(
        "get_scaffold_job",
        "Get scaffold job details including generated files and status.",
        object_schema({{"project_id", kProjectId}, {"job_id", {{"type", "string"}}}},
                      {"project_id", "job_id"}),
        [catalog](const nlohmann::json& args) {
            auto job = catalog->scaffold_job(arg(args, "project_id"), arg(args, "job_id"));
            if (!job) throw FoundryError("Scaffold job not found");
            return *job;
        });

    registry.add(
        "get_deploy_config",
        "Get deployment environments with Docker Compose and env configuration.",
        object_schema({{"project_id", kProjectId}}, {"project_id"}),
        [catalog](const nlohmann::json& args) {
            return catalog->deploy_environments(arg(args, "project_id"));
        });
}

} // namespace foundry
