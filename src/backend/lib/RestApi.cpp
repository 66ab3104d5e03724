#include <format>
#include <ranges>

#include "ytassist/RestApi.h"
#include "ytassist/Services.h"
#include "ytassist/Metrics.h"
#include "ytassist/error_mapping.h"
#include "ytassist/errors.h"

using namespace std;
namespace asio = boost::asio;
using ytassist::logging::LogEvent;

namespace logfault {

std::pair<bool /* json */, std::string /* content or json */> toLog(const ytassist::RequestCtx& ctx, bool json) {

    if (json) {
        return make_pair(true, format(R"("request":{}, "method":"{}", "target":"{}", "workspace":{})",
                                      ctx.id, ctx.method, ctx.target, ctx.workspace));
    }

    return make_pair(false, format("RequestCtx{{request={}, method={}, target={}, workspace={}}}",
                                   ctx.id, ctx.method, ctx.target, ctx.workspace));
}

} // ns

namespace ytassist {

namespace {

constexpr string_view health_reply = R"({"status":"healthy"})";

struct method_not_allowed : public server_err {
    explicit method_not_allowed(string_view method)
        : server_err{pb::Error::METHOD_NOT_ALLOWED, format("Method {} is not allowed here", method)} {}
};

// Value of name in a query string like "a=1&type=title"
string_view queryArg(string_view query, string_view name) {
    for(const auto part : query | views::split('&')) {
        const string_view arg{part.begin(), part.end()};
        if (const auto eq = arg.find('='); eq != string_view::npos && arg.substr(0, eq) == name) {
            return arg.substr(eq + 1);
        }
    }
    return {};
}

} // anon ns

RestApi::RestApi(db::Database &db, const ServerOptions &options, Metrics& metrics)
    : db_{db}, options_{options}, metrics_{metrics}
{
}

template <ProtoMessage T>
T RestApi::parseBody(const ApiRequest& req) const
{
    T obj;
    if (!fromJson(trim(req.body), obj)) {
        throw server_err{pb::Error::INVALID_REQUEST, "The request body is not valid JSON for this resource"};
    }
    return obj;
}

template <ProtoMessage T>
ApiReply RestApi::reply(const T& obj, int code) const
{
    return {code, toJson(obj)};
}

template <typename T>
ApiReply RestApi::replyList(const T& list) const
{
    return {200, toJsonArray(list)};
}

ApiReply RestApi::errorReply(pb::Error error, string_view detail, const optional<string>& field)
{
    pb::ErrorReply err;
    err.set_error(error);
    err.set_detail(string{detail});
    if (field) {
        err.set_field(*field);
    }

    return {toHttpStatus(error), toJson(err)};
}

asio::awaitable<ApiReply> RestApi::handle(ApiRequest req)
{
    const auto latency = metrics_.api_request_latency().scoped();
    const RequestCtx rctx{next_request_id_++, req.method, req.target, resolveWorkspaceId(req.workspace_header)};

    LOG_TRACE_EX(rctx) << "Request " << req.method << ' ' << req.target
                       << (options_.log_json_messages && !req.body.empty() ? " body: " + req.body : string{});

    ApiReply result;
    try {
        Route route;
        string_view path = req.target;
        if (const auto q = path.find('?'); q != string_view::npos) {
            route.query = path.substr(q + 1);
            path = path.substr(0, q);
        }

        vector<string_view> segments;
        for(const auto part : path | views::split('/')) {
            if (!part.empty()) {
                segments.emplace_back(part.begin(), part.end());
            }
        }

        if (segments.empty() || (segments.size() == 2 && segments[0] == "api" && segments[1] == "health")) {
            if (req.method != "GET") {
                throw method_not_allowed{req.method};
            }

            if (segments.empty()) {
                pb::ServerInfo info;
                info.set_name("ytassist");
                info.set_version(YTASSIST_VERSION);
                info.set_status("running");
                result = reply(info);
            } else {
                result = {200, string{health_reply}};
            }
        } else {
            if (segments[0] != "api" || segments.size() < 2 || segments.size() > 4) {
                throw server_err{pb::Error::NOT_FOUND, "No such resource"};
            }

            route.resource = segments[1];
            if (segments.size() >= 3) {
                route.id = toPositiveInt(segments[2]);
                if (!route.id) {
                    throw server_err{pb::Error::INVALID_REQUEST, format("Invalid id: {}", segments[2]), "id"};
                }
            }
            if (segments.size() == 4) {
                route.action = segments[3];
            }

            result = co_await dispatch(rctx, req, route);
        }
    } catch (const server_err& ex) {
        LOG_DEBUG_EX(rctx) << "Request failed: " << make_error_code(ex.error()).message()
                           << ": " << ex.what();
        result = errorReply(ex.error(), ex.what(), ex.field());
    } catch (const std::exception& ex) {
        LOG_ERROR_EX(rctx) << LogEvent::LE_API_REQUEST_FAILED
                           << "Caught exception while handling request: " << ex.what();
        result = errorReply(pb::Error::GENERIC_ERROR, "Internal server error");
    }

    metrics_.countRequest(result.code);

    LOG_TRACE_EX(rctx) << "Replying " << result.code
                       << (options_.log_json_messages ? " body: " + result.body : string{});
    co_return result;
}

asio::awaitable<ApiReply> RestApi::dispatch(const RequestCtx& rctx, const ApiRequest& req, const Route& route)
{
    using handler_t = asio::awaitable<ApiReply> (RestApi::*)(const RequestCtx&, const ApiRequest&,
                                                            const Route&, db::Session&);
    handler_t handler{};

    if (route.resource == "workspaces" && route.action.empty()) {
        handler = &RestApi::onWorkspaces;
    } else if (route.resource == "projects" && route.action.empty()) {
        handler = &RestApi::onProjects;
    } else if (route.resource == "templates" && (route.action.empty() || route.action == "apply")) {
        handler = &RestApi::onTemplates;
    } else {
        throw server_err{pb::Error::NOT_FOUND, "No such resource"};
    }

    auto session = co_await db_.session();
    co_return co_await transaction(*session, [&]() -> asio::awaitable<ApiReply> {
        co_return co_await (this->*handler)(rctx, req, route, *session);
    });
}

asio::awaitable<ApiReply> RestApi::onWorkspaces(const RequestCtx& rctx, const ApiRequest& req,
                                                const Route& route, db::Session& session)
{
    Workspaces workspaces{session};

    if (!route.id) {
        if (req.method == "GET") {
            co_return replyList(co_await workspaces.list());
        }
        if (req.method == "POST") {
            co_return reply(co_await workspaces.create(parseBody<pb::WorkspaceReq>(req)), 201);
        }
    } else {
        const auto id = *route.id;
        if (req.method == "GET") {
            co_return reply(co_await workspaces.get(id));
        }
        if (req.method == "PUT") {
            co_return reply(co_await workspaces.update(id, parseBody<pb::WorkspaceReq>(req)));
        }
        if (req.method == "DELETE") {
            co_await workspaces.remove(id);
            co_return ApiReply{204, {}};
        }
    }

    throw method_not_allowed{req.method};
}

asio::awaitable<ApiReply> RestApi::onProjects(const RequestCtx& rctx, const ApiRequest& req,
                                              const Route& route, db::Session& session)
{
    Projects projects{session};
    const auto ws = rctx.workspace;

    if (!route.id) {
        if (req.method == "GET") {
            co_return replyList(co_await projects.list(ws));
        }
        if (req.method == "POST") {
            co_return reply(co_await projects.create(ws, parseBody<pb::ProjectReq>(req)), 201);
        }
    } else {
        const auto id = *route.id;
        if (req.method == "GET") {
            co_return reply(co_await projects.get(ws, id));
        }
        if (req.method == "PUT") {
            co_return reply(co_await projects.update(ws, id, parseBody<pb::ProjectReq>(req)));
        }
        if (req.method == "DELETE") {
            co_await projects.remove(ws, id);
            co_return ApiReply{204, {}};
        }
    }

    throw method_not_allowed{req.method};
}

asio::awaitable<ApiReply> RestApi::onTemplates(const RequestCtx& rctx, const ApiRequest& req,
                                               const Route& route, db::Session& session)
{
    Templates templates{session};
    const auto ws = rctx.workspace;

    if (route.action == "apply") {
        if (req.method == "POST") {
            co_return reply(co_await templates.apply(ws, *route.id, parseBody<pb::ApplyTemplateReq>(req)));
        }
    } else if (!route.id) {
        if (req.method == "GET") {
            co_return replyList(co_await templates.list(ws, queryArg(route.query, "type")));
        }
        if (req.method == "POST") {
            co_return reply(co_await templates.create(ws, parseBody<pb::TemplateReq>(req)), 201);
        }
    } else {
        const auto id = *route.id;
        if (req.method == "GET") {
            co_return reply(co_await templates.get(ws, id));
        }
        if (req.method == "PUT") {
            co_return reply(co_await templates.update(ws, id, parseBody<pb::TemplateReq>(req)));
        }
        if (req.method == "DELETE") {
            co_await templates.remove(ws, id);
            co_return ApiReply{204, {}};
        }
    }

    throw method_not_allowed{req.method};
}

} // ns
