#include <format>

#include "ytassist/Services.h"
#include "ytassist/errors.h"
#include "ytassist/util.h"

using namespace std;
namespace asio = boost::asio;

namespace ytassist {

namespace {

void setDescription(pb::Workspace& ws, const optional<string>& descr) {
    if (descr) {
        ws.set_description(*descr);
    } else {
        ws.clear_description();
    }
}

} // anon ns

asio::awaitable<pb::Workspace> Workspaces::create(const pb::WorkspaceReq& req)
{
    if (!req.has_name()) {
        throw server_err{pb::Error::VALIDATION_FAILED, "name is required", "name"};
    }

    pb::Workspace ws;
    ws.set_name(validate::requiredText(req.name(), "name", validate::max_workspace_name));
    if (req.has_description()) {
        setDescription(ws, validate::optionalText(req.description(), "description",
                                                  validate::max_workspace_description));
    }

    co_await checkNameIsFree(ws.name(), nullopt);

    *ws.mutable_created_at() = now();
    ws.set_id(co_await db_.insertWorkspace(ws));

    LOG_INFO << "Created workspace #" << ws.id() << " name=" << ws.name();
    co_return ws;
}

asio::awaitable<vector<pb::Workspace>> Workspaces::list()
{
    co_return co_await db_.listWorkspaces();
}

asio::awaitable<pb::Workspace> Workspaces::get(int32_t id)
{
    if (auto ws = co_await db_.getWorkspace(id)) {
        co_return std::move(*ws);
    }

    throw server_err{pb::Error::NOT_FOUND, format("Workspace {} not found", id)};
}

asio::awaitable<pb::Workspace> Workspaces::update(int32_t id, const pb::WorkspaceReq& req)
{
    auto ws = co_await get(id);

    if (req.has_name()) {
        auto name = validate::requiredText(req.name(), "name", validate::max_workspace_name);
        if (name != ws.name()) {
            if (id == DEFAULT_WORKSPACE_ID) {
                throw server_err{pb::Error::FORBIDDEN, "The default workspace cannot be renamed", "name"};
            }
            co_await checkNameIsFree(name, id);
            ws.set_name(std::move(name));
        }
    }

    if (req.has_description()) {
        setDescription(ws, validate::optionalText(req.description(), "description",
                                                  validate::max_workspace_description));
    }

    co_await db_.updateWorkspace(ws);

    LOG_DEBUG << "Updated workspace #" << ws.id();
    co_return ws;
}

asio::awaitable<void> Workspaces::remove(int32_t id)
{
    if (id == DEFAULT_WORKSPACE_ID) {
        throw server_err{pb::Error::FORBIDDEN, "The default workspace cannot be deleted"};
    }

    const auto ws = co_await get(id);
    if (const auto count = co_await db_.countProjects(id); count > 0) {
        throw server_err{pb::Error::CONFLICT,
                         format("Workspace '{}' still has {} project(s). Delete them first.", ws.name(), count)};
    }

    if (!co_await db_.deleteWorkspace(id)) {
        throw server_err{pb::Error::NOT_FOUND, format("Workspace {} not found", id)};
    }

    LOG_INFO << "Deleted workspace #" << id << " name=" << ws.name();
}

asio::awaitable<void> Workspaces::checkNameIsFree(string_view name, optional<int32_t> self)
{
    if (auto existing = co_await db_.findWorkspaceByName(name)) {
        if (!self || *existing != *self) {
            throw server_err{pb::Error::CONFLICT, format("A workspace named '{}' already exists", name), "name"};
        }
    }
}

} // ns
