#pragma once

#include <boost/asio.hpp>

#include "yahat/HttpServer.h"
#include "ytassist/RestApi.h"

namespace ytassist {

/*! Glue between the yahat HTTP server and RestApi.
 *
 *  yahat calls onReqest() from its own worker threads. The request is
 *  handled by a coroutine on the server's io_context, and the worker
 *  waits for the reply.
 */
class ApiHandler : public yahat::RequestHandler {
public:
    ApiHandler(boost::asio::io_context& ctx, RestApi& api)
        : ctx_{ctx}, api_{api} {}

    yahat::Response onReqest(const yahat::Request& req) override;

    static std::string_view toMethod(yahat::Request::Type type) noexcept;

private:
    boost::asio::io_context& ctx_;
    RestApi& api_;
};

} // ns
