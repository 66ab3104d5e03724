#pragma     once

#include <memory>
#include <optional>
#include <string_view>
#include <vector>

#include <boost/asio.hpp>

#include "ytassist.pb.h"
#include "ytassist/config.h"
#include "ytassist/logging.h"

namespace ytassist::db {

/*! One unit of work against the persistent store.
 *
 *  A session is owned by one request. It holds a single database connection,
 *  so everything between begin() and commit() runs in the same transaction.
 *
 *  Lookups by name or content are case-insensitive.
 *  Inserts and updates that violate a unique constraint throw
 *  server_err with pb::Error::CONFLICT.
 */
class Session {
public:
    virtual ~Session() = default;

    virtual boost::asio::awaitable<void> begin() = 0;
    virtual boost::asio::awaitable<void> commit() = 0;
    virtual boost::asio::awaitable<void> rollback() = 0;

    // Workspaces
    virtual boost::asio::awaitable<std::vector<pb::Workspace>> listWorkspaces() = 0;
    virtual boost::asio::awaitable<std::optional<pb::Workspace>> getWorkspace(int32_t id) = 0;
    virtual boost::asio::awaitable<std::optional<int32_t>> findWorkspaceByName(std::string_view name) = 0;
    virtual boost::asio::awaitable<int32_t> insertWorkspace(const pb::Workspace& workspace) = 0;
    virtual boost::asio::awaitable<void> updateWorkspace(const pb::Workspace& workspace) = 0;
    virtual boost::asio::awaitable<bool> deleteWorkspace(int32_t id) = 0;

    // Projects
    virtual boost::asio::awaitable<std::vector<pb::Project>> listProjects(int32_t workspace) = 0;
    virtual boost::asio::awaitable<std::optional<pb::Project>> getProject(int32_t workspace, int32_t id) = 0;
    virtual boost::asio::awaitable<std::optional<int32_t>> findProjectByName(int32_t workspace, std::string_view name) = 0;
    virtual boost::asio::awaitable<int32_t> countProjects(int32_t workspace) = 0;
    virtual boost::asio::awaitable<int32_t> insertProject(const pb::Project& project) = 0;
    virtual boost::asio::awaitable<void> updateProject(const pb::Project& project) = 0;
    virtual boost::asio::awaitable<bool> deleteProject(int32_t workspace, int32_t id) = 0;

    // Templates
    // Newest first. An empty type matches all templates.
    virtual boost::asio::awaitable<std::vector<pb::Template>> listTemplates(int32_t workspace, std::string_view type) = 0;
    virtual boost::asio::awaitable<std::optional<pb::Template>> getTemplate(int32_t workspace, int32_t id) = 0;
    virtual boost::asio::awaitable<std::optional<int32_t>> findTemplateByContent(int32_t workspace,
                                                                                 std::string_view type,
                                                                                 std::string_view content) = 0;
    virtual boost::asio::awaitable<int32_t> insertTemplate(const pb::Template& tmpl) = 0;
    virtual boost::asio::awaitable<void> updateTemplate(const pb::Template& tmpl) = 0;
    virtual boost::asio::awaitable<bool> deleteTemplate(int32_t workspace, int32_t id) = 0;
};

/*! Hands out sessions */
class Database {
public:
    virtual ~Database() = default;

    [[nodiscard]] virtual boost::asio::awaitable<std::unique_ptr<Session>> session() = 0;
};

} // ns

namespace jgaa::mysqlpool {
class Mysqlpool;
}

namespace ytassist::db {

/*! The production store: MariaDB through a mysqlpool connection pool */
class MariaDb : public Database {
public:
    explicit MariaDb(jgaa::mysqlpool::Mysqlpool& pool)
        : pool_{pool} {}

    boost::asio::awaitable<std::unique_ptr<Session>> session() override;

private:
    jgaa::mysqlpool::Mysqlpool& pool_;
};

} // ns
