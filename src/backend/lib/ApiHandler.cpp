#include "ytassist/ApiHandler.h"
#include "ytassist/error_mapping.h"
#include "ytassist/logging.h"

using namespace std;
namespace asio = boost::asio;

namespace ytassist {

string_view ApiHandler::toMethod(yahat::Request::Type type) noexcept
{
    using T = yahat::Request::Type;
    switch(type) {
    case T::GET:
        return "GET";
    case T::PUT:
        return "PUT";
    case T::PATCH:
        return "PATCH";
    case T::POST:
        return "POST";
    case T::DELETE:
        return "DELETE";
    case T::OPTIONS:
        return "OPTIONS";
    default:
        return "INVALID";
    }
}

yahat::Response ApiHandler::onReqest(const yahat::Request &req)
{
    ApiRequest api_req;
    api_req.method = toMethod(req.type);
    api_req.target = req.target;
    api_req.body = req.body;
    if (const auto ws = req.header("X-Workspace-Id"); !ws.empty()) {
        api_req.workspace_header = string{ws};
    }

    ApiReply reply;
    try {
        reply = asio::co_spawn(ctx_, api_.handle(std::move(api_req)), asio::use_future).get();
    } catch (const exception& ex) {
        // The io_context is stopping
        LOG_WARN << "Failed to process request " << req.uuid << ": " << ex.what();
        reply = RestApi::errorReply(pb::Error::GENERIC_ERROR, "Service unavailable");
    }

    yahat::Response resp;
    resp.code = reply.code;
    resp.reason = string{httpReason(reply.code)};
    resp.body = std::move(reply.body);
    if (!resp.body.empty()) {
        resp.mime_type = "application/json";
    }
    return resp;
}

} // ns
