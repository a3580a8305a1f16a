#pragma once
#include <filesystem>
#include <memory>
#include <optional>
#include <string>
#include <nlohmann/json.hpp>

namespace foundry {

struct ProjectInfo {
    std::string id;
    std::string name;
    std::string slug;
};

/// Read-only view of project data (canvases, ideas, scaffold jobs,
/// deployment environments) that the built-in tools expose to the model.
/// Results are JSON documents shaped for the model, not storage rows.
class ProjectCatalog {
public:
    virtual ~ProjectCatalog() = default;

    [[nodiscard]] virtual std::optional<ProjectInfo> find_project(const std::string& project_id) const = 0;
    [[nodiscard]] virtual std::optional<nlohmann::json> project_summary(const std::string& project_id) const = 0;
    [[nodiscard]] virtual nlohmann::json list_canvases(const std::string& project_id) const = 0;
    [[nodiscard]] virtual std::optional<nlohmann::json> canvas_components(const std::string& project_id,
                                                                          const std::string& canvas_id) const = 0;
    [[nodiscard]] virtual nlohmann::json ideas(const std::string& project_id,
                                               const std::optional<std::string>& status) const = 0;
    [[nodiscard]] virtual nlohmann::json search_ideas(const std::string& project_id,
                                                      const std::string& query,
                                                      std::size_t limit) const = 0;
    [[nodiscard]] virtual std::optional<nlohmann::json> scaffold_job(const std::string& project_id,
                                                                     const std::string& job_id) const = 0;
    [[nodiscard]] virtual nlohmann::json deploy_environments(const std::string& project_id) const = 0;
};

/// ProjectCatalog over an in-memory JSON document:
///
///   {"projects": [{"id", "name", "slug", "description", "created_at",
///                  "members": [...], "canvases": [{..., "components": [...]}],
///                  "ideas": [...], "scaffold_jobs": [...], "environments": [...]}]}
class JsonProjectCatalog : public ProjectCatalog {
public:
    explicit JsonProjectCatalog(nlohmann::json document);

    /// Throws ConfigError if the file is missing or not valid JSON.
    static std::shared_ptr<JsonProjectCatalog> load(const std::filesystem::path& path);

    std::optional<ProjectInfo> find_project(const std::string& project_id) const override;
    std::optional<nlohmann::json> project_summary(const std::string& project_id) const override;
    nlohmann::json list_canvases(const std::string& project_id) const override;
    std::optional<nlohmann::json> canvas_components(const std::string& project_id,
                                                    const std::string& canvas_id) const override;
    nlohmann::json ideas(const std::string& project_id,
                         const std::optional<std::string>& status) const override;
    nlohmann::json search_ideas(const std::string& project_id, const std::string& query,
                                std::size_t limit) const override;
    std::optional<nlohmann::json> scaffold_job(const std::string& project_id,
                                               const std::string& job_id) const override;
    nlohmann::json deploy_environments(const std::string& project_id) const override;

private:
    const nlohmann::json* project(const std::string& project_id) const;

    nlohmann::json document_;
};

} // namespace foundry
