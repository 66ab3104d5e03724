#pragma once

#include <exception>
#include <optional>
#include <string>
#include <string_view>
#include <type_traits>
#include <vector>

#include <boost/asio.hpp>

#include "ytassist.pb.h"
#include "ytassist/db.h"
#include "ytassist/logging.h"

namespace ytassist {

constexpr int32_t DEFAULT_WORKSPACE_ID = 1;

/*! Map the optional X-Workspace-Id header to a workspace id.
 *
 *  Anything that is not a positive 32 bit integer gives the default workspace.
 *  The caller must still verify that the workspace exists.
 */
int32_t resolveWorkspaceId(std::optional<std::string_view> header) noexcept;

/*! Run fn() inside a transaction on session.
 *
 *  Commits if fn() returns normally. Otherwise the transaction is
 *  rolled back and the exception from fn() propagates.
 */
template <typename FnT>
auto transaction(db::Session& session, FnT fn) -> decltype(fn())
{
    using result_t = typename decltype(fn())::value_type;

    co_await session.begin();
    std::exception_ptr failure;
    try {
        if constexpr (std::is_void_v<result_t>) {
            co_await fn();
            co_await session.commit();
            co_return;
        } else {
            auto result = co_await fn();
            co_await session.commit();
            co_return result;
        }
    } catch (...) {
        failure = std::current_exception();
    }

    try {
        co_await session.rollback();
    } catch (const std::exception& ex) {
        LOG_ERROR << logging::LogEvent::LE_DATABASE_ROLLBACK_FAILED
                  << "Failed to roll back transaction: " << ex.what();
    }

    std::rethrow_exception(failure);
}

namespace validate {

constexpr size_t max_workspace_name = 100;
constexpr size_t max_workspace_description = 500;
constexpr size_t max_project_name = 255;
constexpr size_t max_project_description = 2000;
constexpr size_t max_project_status = 50;
constexpr size_t max_video_title = 500;
constexpr size_t max_template_name = 100;
constexpr size_t max_template_content = 256;

/*! Number of characters (code points) in an utf-8 string */
size_t textLength(std::string_view text) noexcept;

/*! Trim and validate a required text value.
 *
 *  Throws server_err VALIDATION_FAILED naming field if the value is
 *  blank or longer than maxLength characters.
 */
std::string requiredText(std::string_view value, std::string_view field, size_t maxLength);

/*! Trim and validate an optional text value. Blank becomes an empty optional. */
std::optional<std::string> optionalText(std::string_view value, std::string_view field, size_t maxLength);

} // ns validate

google::protobuf::Timestamp now();

class Workspaces {
public:
    explicit Workspaces(db::Session& session)
        : db_{session} {}

    boost::asio::awaitable<pb::Workspace> create(const pb::WorkspaceReq& req);
    boost::asio::awaitable<std::vector<pb::Workspace>> list();
    boost::asio::awaitable<pb::Workspace> get(int32_t id);
    boost::asio::awaitable<pb::Workspace> update(int32_t id, const pb::WorkspaceReq& req);

    // Only empty, non-default workspaces can be deleted
    boost::asio::awaitable<void> remove(int32_t id);

private:
    boost::asio::awaitable<void> checkNameIsFree(std::string_view name, std::optional<int32_t> self);

    db::Session& db_;
};

class Projects {
public:
    explicit Projects(db::Session& session)
        : db_{session} {}

    boost::asio::awaitable<pb::Project> create(int32_t workspace, const pb::ProjectReq& req);
    boost::asio::awaitable<std::vector<pb::Project>> list(int32_t workspace);
    boost::asio::awaitable<pb::Project> get(int32_t workspace, int32_t id);
    boost::asio::awaitable<pb::Project> update(int32_t workspace, int32_t id, const pb::ProjectReq& req);
    boost::asio::awaitable<void> remove(int32_t workspace, int32_t id);

private:
    boost::asio::awaitable<void> checkNameIsFree(int32_t workspace, std::string_view name,
                                                std::optional<int32_t> self);

    db::Session& db_;
};

class Templates {
public:
    explicit Templates(db::Session& session)
        : db_{session} {}

    boost::asio::awaitable<pb::Template> create(int32_t workspace, const pb::TemplateReq& req);

    // An empty type lists all templates
    boost::asio::awaitable<std::vector<pb::Template>> list(int32_t workspace, std::string_view type);
    boost::asio::awaitable<pb::Template> get(int32_t workspace, int32_t id);
    boost::asio::awaitable<pb::Template> update(int32_t workspace, int32_t id, const pb::TemplateReq& req);
    boost::asio::awaitable<void> remove(int32_t workspace, int32_t id);

    /*! Fill in the template's placeholders and store the result as the project's video title */
    boost::asio::awaitable<pb::Project> apply(int32_t workspace, int32_t id, const pb::ApplyTemplateReq& req);

    static bool isValidType(std::string_view type) noexcept;

private:
    boost::asio::awaitable<void> checkContentIsFree(int32_t workspace, std::string_view type,
                                                    std::string_view content, std::optional<int32_t> self);

    db::Session& db_;
};

} // ns
