#include <format>

#include "ytassist/Services.h"
#include "ytassist/TemplateEngine.h"
#include "ytassist/errors.h"
#include "ytassist/util.h"

using namespace std;
namespace asio = boost::asio;

namespace ytassist {

namespace {

pb::Template withPlaceholders(pb::Template tmpl) {
    tmpl.clear_placeholders();
    for(auto& name : TemplateEngine::placeholders(tmpl.content())) {
        tmpl.add_placeholders(std::move(name));
    }
    return tmpl;
}

string validType(string_view type) {
    const auto trimmed = trim(type);
    if (!Templates::isValidType(trimmed)) {
        throw server_err{pb::Error::VALIDATION_FAILED, "type must be 'title' or 'description'", "type"};
    }
    return string{trimmed};
}

} // anon ns

bool Templates::isValidType(string_view type) noexcept
{
    return type == "title" || type == "description";
}

asio::awaitable<pb::Template> Templates::create(int32_t workspace, const pb::TemplateReq& req)
{
    for(const auto& [present, field] : {pair{req.has_type(), "type"},
                                         pair{req.has_name(), "name"},
                                         pair{req.has_content(), "content"}}) {
        if (!present) {
            throw server_err{pb::Error::VALIDATION_FAILED, format("{} is required", field), field};
        }
    }

    pb::Template tmpl;
    tmpl.set_workspace_id(workspace);
    tmpl.set_type(validType(req.type()));
    tmpl.set_name(validate::requiredText(req.name(), "name", validate::max_template_name));
    tmpl.set_content(validate::requiredText(req.content(), "content", validate::max_template_content));

    if (!co_await db_.getWorkspace(workspace)) {
        throw server_err{pb::Error::NOT_FOUND, format("Workspace {} not found", workspace)};
    }

    co_await checkContentIsFree(workspace, tmpl.type(), tmpl.content(), nullopt);

    *tmpl.mutable_created_at() = now();
    *tmpl.mutable_updated_at() = tmpl.created_at();
    tmpl.set_id(co_await db_.insertTemplate(tmpl));

    LOG_INFO << "Created " << tmpl.type() << " template #" << tmpl.id()
             << " in workspace #" << workspace;
    co_return withPlaceholders(std::move(tmpl));
}

asio::awaitable<vector<pb::Template>> Templates::list(int32_t workspace, string_view type)
{
    auto templates = co_await db_.listTemplates(workspace, type);
    for(auto& tmpl : templates) {
        tmpl = withPlaceholders(std::move(tmpl));
    }
    co_return templates;
}

asio::awaitable<pb::Template> Templates::get(int32_t workspace, int32_t id)
{
    if (auto tmpl = co_await db_.getTemplate(workspace, id)) {
        co_return withPlaceholders(std::move(*tmpl));
    }

    throw server_err{pb::Error::NOT_FOUND, format("Template {} not found", id)};
}

asio::awaitable<pb::Template> Templates::update(int32_t workspace, int32_t id, const pb::TemplateReq& req)
{
    auto tmpl = co_await get(workspace, id);

    bool check_duplicate = false;
    if (req.has_type()) {
        auto type = validType(req.type());
        check_duplicate |= type != tmpl.type();
        tmpl.set_type(std::move(type));
    }

    if (req.has_name()) {
        tmpl.set_name(validate::requiredText(req.name(), "name", validate::max_template_name));
    }

    if (req.has_content()) {
        auto content = validate::requiredText(req.content(), "content", validate::max_template_content);
        check_duplicate |= !iequals(content, tmpl.content());
        tmpl.set_content(std::move(content));
    }

    if (check_duplicate) {
        co_await checkContentIsFree(workspace, tmpl.type(), tmpl.content(), id);
    }

    *tmpl.mutable_updated_at() = now();
    co_await db_.updateTemplate(tmpl);

    LOG_DEBUG << "Updated template #" << id << " in workspace #" << workspace;
    co_return withPlaceholders(std::move(tmpl));
}

asio::awaitable<void> Templates::remove(int32_t workspace, int32_t id)
{
    if (!co_await db_.deleteTemplate(workspace, id)) {
        throw server_err{pb::Error::NOT_FOUND, format("Template {} not found", id)};
    }

    LOG_INFO << "Deleted template #" << id << " from workspace #" << workspace;
}

asio::awaitable<pb::Project> Templates::apply(int32_t workspace, int32_t id, const pb::ApplyTemplateReq& req)
{
    if (req.project_id() <= 0) {
        throw server_err{pb::Error::VALIDATION_FAILED, "project_id is required", "project_id"};
    }

    const auto tmpl = co_await get(workspace, id);

    auto project = co_await db_.getProject(workspace, req.project_id());
    if (!project) {
        throw server_err{pb::Error::NOT_FOUND, format("Project {} not found", req.project_id())};
    }

    TemplateEngine::values_t values;
    for(const auto& [key, value] : req.values()) {
        values.emplace(key, value);
    }
    const auto title = TemplateEngine::apply(tmpl.content(), values);

    if (auto vt = validate::optionalText(title, "video_title", validate::max_video_title)) {
        project->set_video_title(std::move(*vt));
    } else {
        project->clear_video_title();
    }

    *project->mutable_updated_at() = now();
    co_await db_.updateProject(*project);

    LOG_DEBUG << "Applied template #" << id << " to project #" << project->id()
              << " in workspace #" << workspace;
    co_return std::move(*project);
}

asio::awaitable<void> Templates::checkContentIsFree(int32_t workspace, string_view type,
                                                    string_view content, optional<int32_t> self)
{
    if (auto existing = co_await db_.findTemplateByContent(workspace, type, content)) {
        if (!self || *existing != *self) {
            throw server_err{pb::Error::CONFLICT,
                             format("A {} template with the same content already exists", type), "content"};
        }
    }
}

} // ns
