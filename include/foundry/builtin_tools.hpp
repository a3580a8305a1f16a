#pragma once
#include "project_catalog.hpp"
#include "tool_registry.hpp"
#include <memory>

namespace foundry {

/// Register the project query tools (get_project_summary, list_canvases,
/// get_canvas_components, get_ideas, search_ideas, get_scaffold_job,
/// get_deploy_config) backed by `catalog`.
void register_project_tools(ToolRegistry& registry, std::shared_ptr<const ProjectCatalog> catalog);

} // namespace foundry
