#include <format>

#include "ytassist/Services.h"
#include "ytassist/errors.h"
#include "ytassist/util.h"

using namespace std;
namespace asio = boost::asio;

namespace ytassist {

namespace {

constexpr string_view default_status = "planned";

void setOptional(const optional<string>& value, auto setter, auto clearer) {
    if (value) {
        setter(*value);
    } else {
        clearer();
    }
}

void applyDescription(pb::Project& project, string_view value) {
    setOptional(validate::optionalText(value, "description", validate::max_project_description),
                [&](const string& v) { project.set_description(v); },
                [&] { project.clear_description(); });
}

void applyVideoTitle(pb::Project& project, string_view value) {
    setOptional(validate::optionalText(value, "video_title", validate::max_video_title),
                [&](const string& v) { project.set_video_title(v); },
                [&] { project.clear_video_title(); });
}

} // anon ns

asio::awaitable<pb::Project> Projects::create(int32_t workspace, const pb::ProjectReq& req)
{
    if (!req.has_name()) {
        throw server_err{pb::Error::VALIDATION_FAILED, "name is required", "name"};
    }

    pb::Project project;
    project.set_workspace_id(workspace);
    project.set_name(validate::requiredText(req.name(), "name", validate::max_project_name));
    if (req.has_description()) {
        applyDescription(project, req.description());
    }
    project.set_status(req.has_status()
        ? validate::requiredText(req.status(), "status", validate::max_project_status)
        : string{default_status});
    if (req.has_video_title()) {
        applyVideoTitle(project, req.video_title());
    }

    if (!co_await db_.getWorkspace(workspace)) {
        throw server_err{pb::Error::NOT_FOUND, format("Workspace {} not found", workspace)};
    }

    co_await checkNameIsFree(workspace, project.name(), nullopt);

    *project.mutable_created_at() = now();
    *project.mutable_updated_at() = project.created_at();
    project.set_id(co_await db_.insertProject(project));

    LOG_INFO << "Created project #" << project.id() << " name=" << project.name()
             << " in workspace #" << workspace;
    co_return project;
}

asio::awaitable<vector<pb::Project>> Projects::list(int32_t workspace)
{
    co_return co_await db_.listProjects(workspace);
}

asio::awaitable<pb::Project> Projects::get(int32_t workspace, int32_t id)
{
    if (auto project = co_await db_.getProject(workspace, id)) {
        co_return std::move(*project);
    }

    throw server_err{pb::Error::NOT_FOUND, format("Project {} not found", id)};
}

asio::awaitable<pb::Project> Projects::update(int32_t workspace, int32_t id, const pb::ProjectReq& req)
{
    auto project = co_await get(workspace, id);

    if (req.has_name()) {
        auto name = validate::requiredText(req.name(), "name", validate::max_project_name);

        if (name != project.name()) {
            co_await checkNameIsFree(workspace, name, id);
        }
        project.set_name(std::move(name));
    }

    if (req.has_description()) {
        applyDescription(project, req.description());
    }

    if (req.has_status()) {
        project.set_status(validate::requiredText(req.status(), "status", validate::max_project_status));
    }

    if (req.has_video_title()) {
        applyVideoTitle(project, req.video_title());
    }

    *project.mutable_updated_at() = now();
    co_await db_.updateProject(project);

    LOG_DEBUG << "Updated project #" << project.id() << " in workspace #" << workspace;
    co_return project;
}

asio::awaitable<void> Projects::remove(int32_t workspace, int32_t id)
{
    if (!co_await db_.deleteProject(workspace, id)) {
        throw server_err{pb::Error::NOT_FOUND, format("Project {} not found", id)};
    }

    LOG_INFO << "Deleted project #" << id << " from workspace #" << workspace;
}

asio::awaitable<void> Projects::checkNameIsFree(int32_t workspace, string_view name, optional<int32_t> self)
{
    // A project never conflicts with itself
    if (auto existing = co_await db_.findProjectByName(workspace, name); existing && existing != self) {
        throw server_err{pb::Error::CONFLICT,
                         format("A project named '{}' already exists in this workspace", name), "name"};
    }
}

} // ns
