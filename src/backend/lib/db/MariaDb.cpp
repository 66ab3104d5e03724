#include <cassert>
#include <chrono>
#include <format>

#include <boost/mysql.hpp>
#include <google/protobuf/util/time_util.h>

#include "ytassist/db.h"
#include "ytassist/errors.h"
#include "ytassist/util.h"
#include "mysqlpool/mysqlpool.h"

using namespace std;
namespace asio = boost::asio;
using google::protobuf::util::TimeUtil;

namespace ytassist::db {

namespace {

// DATETIME(6) columns hold UTC with microsecond resolution
string toDbTime(const google::protobuf::Timestamp& ts) {
    using namespace std::chrono;
    const sys_time<microseconds> when{microseconds{TimeUtil::TimestampToMicroseconds(ts)}};
    return format("{:%F %T}", when);
}

void fromDbTime(const boost::mysql::field_view& field, google::protobuf::Timestamp& ts) {
    if (field.is_datetime()) {
        using namespace std::chrono;
        const auto when = field.as_datetime().as_time_point();
        ts = TimeUtil::MicrosecondsToTimestamp(duration_cast<microseconds>(when.time_since_epoch()).count());
    }
}

optional<string> optionalString(const boost::mysql::field_view& field) {
    if (field.is_string()) {
        return pb_adapt(field.as_string());
    }
    return {};
}

struct ToWorkspace {
    enum Cols {
        ID, NAME, DESCRIPTION, CREATED_AT, PROJECT_COUNT
    };

    static constexpr string_view selectCols = R"(w.id, w.name, w.description, w.created_at,
        (SELECT COUNT(*) FROM project p WHERE p.workspace_id = w.id) )";

    static void assign(const boost::mysql::row_view& row, pb::Workspace& ws) {
        ws.set_id(static_cast<int32_t>(row.at(ID).as_int64()));
        ws.set_name(pb_adapt(row.at(NAME).as_string()));
        if (auto descr = optionalString(row.at(DESCRIPTION))) {
            ws.set_description(*descr);
        }
        fromDbTime(row.at(CREATED_AT), *ws.mutable_created_at());
        ws.set_project_count(static_cast<int32_t>(row.at(PROJECT_COUNT).as_int64()));
    }
};

struct ToProject {
    enum Cols {
        ID, NAME, DESCRIPTION, STATUS, VIDEO_TITLE, WORKSPACE_ID, CREATED_AT, UPDATED_AT
    };

    static constexpr string_view selectCols = "id, name, description, status, video_title, workspace_id, created_at, updated_at ";

    static void assign(const boost::mysql::row_view& row, pb::Project& project) {
        project.set_id(static_cast<int32_t>(row.at(ID).as_int64()));
        project.set_name(pb_adapt(row.at(NAME).as_string()));
        if (auto descr = optionalString(row.at(DESCRIPTION))) {
            project.set_description(*descr);
        }
        project.set_status(pb_adapt(row.at(STATUS).as_string()));
        if (auto title = optionalString(row.at(VIDEO_TITLE))) {
            project.set_video_title(*title);
        }
        project.set_workspace_id(static_cast<int32_t>(row.at(WORKSPACE_ID).as_int64()));
        fromDbTime(row.at(CREATED_AT), *project.mutable_created_at());
        fromDbTime(row.at(UPDATED_AT), *project.mutable_updated_at());
    }
};

struct ToTemplate {
    enum Cols {
        ID, TYPE, NAME, CONTENT, WORKSPACE_ID, CREATED_AT, UPDATED_AT
    };

    static constexpr string_view selectCols = "id, type, name, content, workspace_id, created_at, updated_at ";

    static void assign(const boost::mysql::row_view& row, pb::Template& tmpl) {
        tmpl.set_id(static_cast<int32_t>(row.at(ID).as_int64()));
        tmpl.set_type(pb_adapt(row.at(TYPE).as_string()));
        tmpl.set_name(pb_adapt(row.at(NAME).as_string()));
        tmpl.set_content(pb_adapt(row.at(CONTENT).as_string()));
        tmpl.set_workspace_id(static_cast<int32_t>(row.at(WORKSPACE_ID).as_int64()));
        fromDbTime(row.at(CREATED_AT), *tmpl.mutable_created_at());
        fromDbTime(row.at(UPDATED_AT), *tmpl.mutable_updated_at());
    }
};

class MariaDbSession : public Session {
public:
    using handle_t = jgaa::mysqlpool::Mysqlpool::Handle;
    using trx_t = decltype(std::declval<handle_t&>().transaction())::value_type;

    explicit MariaDbSession(handle_t&& handle)
        : handle_{std::move(handle)} {}

    asio::awaitable<void> begin() override {
        assert(!trx_);
        trx_.emplace(co_await handle_.transaction());
    }

    asio::awaitable<void> commit() override {
        assert(trx_);
        co_await trx_->commit();
        trx_.reset();
    }

    asio::awaitable<void> rollback() override {
        if (trx_) {
            ScopedExit reset{[this] { trx_.reset(); }};
            co_await trx_->rollback();
        }
    }

    asio::awaitable<vector<pb::Workspace>> listWorkspaces() override {
        auto res = co_await handle_.exec(format("SELECT {} FROM workspace w ORDER BY w.id", ToWorkspace::selectCols));
        vector<pb::Workspace> workspaces;
        workspaces.reserve(res.rows().size());
        for(const auto& row : res.rows()) {
            ToWorkspace::assign(row, workspaces.emplace_back());
        }
        co_return workspaces;
    }

    asio::awaitable<optional<pb::Workspace>> getWorkspace(int32_t id) override {
        auto res = co_await handle_.exec(format("SELECT {} FROM workspace w WHERE w.id=?", ToWorkspace::selectCols), id);
        if (res.rows().empty()) {
            co_return nullopt;
        }
        pb::Workspace ws;
        ToWorkspace::assign(res.rows().front(), ws);
        co_return ws;
    }

    asio::awaitable<optional<int32_t>> findWorkspaceByName(string_view name) override {
        auto res = co_await handle_.exec("SELECT id FROM workspace WHERE LOWER(name)=LOWER(?)", name);
        co_return firstId(res);
    }

    asio::awaitable<int32_t> insertWorkspace(const pb::Workspace& ws) override {
        try {
            auto res = co_await handle_.exec(
                "INSERT INTO workspace (name, description, created_at) VALUES (?, ?, ?)",
                ws.name(),
                ws.has_description() ? optional<string>{ws.description()} : nullopt,
                toDbTime(ws.created_at()));
            co_return static_cast<int32_t>(res.last_insert_id());
        } catch (const jgaa::mysqlpool::db_err_exists& ex) {
            LOG_DEBUG_N << "Duplicate workspace: " << ex.what();
        }
        throw server_err{pb::Error::CONFLICT, format("A workspace named '{}' already exists", ws.name()), "name"};
    }

    asio::awaitable<void> updateWorkspace(const pb::Workspace& ws) override {
        try {
            co_await handle_.exec(
                "UPDATE workspace SET name=?, description=? WHERE id=?",
                ws.name(),
                ws.has_description() ? optional<string>{ws.description()} : nullopt,
                ws.id());
            co_return;
        } catch (const jgaa::mysqlpool::db_err_exists& ex) {
            LOG_DEBUG_N << "Duplicate workspace: " << ex.what();
        }
        throw server_err{pb::Error::CONFLICT, format("A workspace named '{}' already exists", ws.name()), "name"};
    }

    asio::awaitable<bool> deleteWorkspace(int32_t id) override {
        auto res = co_await handle_.exec("DELETE FROM workspace WHERE id=?", id);
        co_return res.affected_rows() == 1;
    }

    asio::awaitable<vector<pb::Project>> listProjects(int32_t workspace) override {
        auto res = co_await handle_.exec(
            format("SELECT {} FROM project WHERE workspace_id=? ORDER BY id", ToProject::selectCols), workspace);
        vector<pb::Project> projects;
        projects.reserve(res.rows().size());
        for(const auto& row : res.rows()) {
            ToProject::assign(row, projects.emplace_back());
        }
        co_return projects;
    }

    asio::awaitable<optional<pb::Project>> getProject(int32_t workspace, int32_t id) override {
        auto res = co_await handle_.exec(
            format("SELECT {} FROM project WHERE id=? AND workspace_id=?", ToProject::selectCols), id, workspace);
        if (res.rows().empty()) {
            co_return nullopt;
        }
        pb::Project project;
        ToProject::assign(res.rows().front(), project);
        co_return project;
    }

    asio::awaitable<optional<int32_t>> findProjectByName(int32_t workspace, string_view name) override {
        auto res = co_await handle_.exec(
            "SELECT id FROM project WHERE workspace_id=? AND LOWER(name)=LOWER(?)", workspace, name);
        co_return firstId(res);
    }

    asio::awaitable<int32_t> countProjects(int32_t workspace) override {
        auto res = co_await handle_.exec("SELECT COUNT(*) FROM project WHERE workspace_id=?", workspace);
        co_return static_cast<int32_t>(res.rows().front().front().as_int64());
    }

    asio::awaitable<int32_t> insertProject(const pb::Project& project) override {
        try {
            auto res = co_await handle_.exec(
                R"(INSERT INTO project (name, description, status, video_title, workspace_id, created_at, updated_at)
                   VALUES (?, ?, ?, ?, ?, ?, ?))",
                project.name(),
                project.has_description() ? optional<string>{project.description()} : nullopt,
                project.status(),
                project.has_video_title() ? optional<string>{project.video_title()} : nullopt,
                project.workspace_id(),
                toDbTime(project.created_at()),
                toDbTime(project.updated_at()));
            co_return static_cast<int32_t>(res.last_insert_id());
        } catch (const jgaa::mysqlpool::db_err_exists& ex) {
            LOG_DEBUG_N << "Duplicate project: " << ex.what();
        }
        throw server_err{pb::Error::CONFLICT,
                         format("A project named '{}' already exists in this workspace", project.name()), "name"};
    }

    asio::awaitable<void> updateProject(const pb::Project& project) override {
        try {
            co_await handle_.exec(
                R"(UPDATE project SET name=?, description=?, status=?, video_title=?, updated_at=?
                   WHERE id=? AND workspace_id=?)",
                project.name(),
                project.has_description() ? optional<string>{project.description()} : nullopt,
                project.status(),
                project.has_video_title() ? optional<string>{project.video_title()} : nullopt,
                toDbTime(project.updated_at()),
                project.id(),
                project.workspace_id());
            co_return;
        } catch (const jgaa::mysqlpool::db_err_exists& ex) {
            LOG_DEBUG_N << "Duplicate project: " << ex.what();
        }
        throw server_err{pb::Error::CONFLICT,
                         format("A project named '{}' already exists in this workspace", project.name()), "name"};
    }

    asio::awaitable<bool> deleteProject(int32_t workspace, int32_t id) override {
        auto res = co_await handle_.exec("DELETE FROM project WHERE id=? AND workspace_id=?", id, workspace);
        co_return res.affected_rows() == 1;
    }

    asio::awaitable<vector<pb::Template>> listTemplates(int32_t workspace, string_view type) override {
        boost::mysql::results res;
        if (type.empty()) {
            res = co_await handle_.exec(
                format("SELECT {} FROM template WHERE workspace_id=? ORDER BY created_at DESC, id DESC",
                       ToTemplate::selectCols), workspace);
        } else {
            res = co_await handle_.exec(
                format("SELECT {} FROM template WHERE workspace_id=? AND type=? ORDER BY created_at DESC, id DESC",
                       ToTemplate::selectCols), workspace, type);
        }

        vector<pb::Template> templates;
        templates.reserve(res.rows().size());
        for(const auto& row : res.rows()) {
            ToTemplate::assign(row, templates.emplace_back());
        }
        co_return templates;
    }

    asio::awaitable<optional<pb::Template>> getTemplate(int32_t workspace, int32_t id) override {
        auto res = co_await handle_.exec(
            format("SELECT {} FROM template WHERE id=? AND workspace_id=?", ToTemplate::selectCols), id, workspace);
        if (res.rows().empty()) {
            co_return nullopt;
        }
        pb::Template tmpl;
        ToTemplate::assign(res.rows().front(), tmpl);
        co_return tmpl;
    }

    asio::awaitable<optional<int32_t>> findTemplateByContent(int32_t workspace,
                                                             string_view type,
                                                             string_view content) override {
        auto res = co_await handle_.exec(
            "SELECT id FROM template WHERE workspace_id=? AND type=? AND LOWER(content)=LOWER(?)",
            workspace, type, content);
        co_return firstId(res);
    }

    asio::awaitable<int32_t> insertTemplate(const pb::Template& tmpl) override {
        try {
            auto res = co_await handle_.exec(
                R"(INSERT INTO template (type, name, content, workspace_id, created_at, updated_at)
                   VALUES (?, ?, ?, ?, ?, ?))",
                tmpl.type(),
                tmpl.name(),
                tmpl.content(),
                tmpl.workspace_id(),
                toDbTime(tmpl.created_at()),
                toDbTime(tmpl.updated_at()));
            co_return static_cast<int32_t>(res.last_insert_id());
        } catch (const jgaa::mysqlpool::db_err_exists& ex) {
            LOG_DEBUG_N << "Duplicate template: " << ex.what();
        }
        throw server_err{pb::Error::CONFLICT, "A template with the same content already exists", "content"};
    }

    asio::awaitable<void> updateTemplate(const pb::Template& tmpl) override {
        try {
            co_await handle_.exec(
                "UPDATE template SET type=?, name=?, content=?, updated_at=? WHERE id=? AND workspace_id=?",
                tmpl.type(),
                tmpl.name(),
                tmpl.content(),
                toDbTime(tmpl.updated_at()),
                tmpl.id(),
                tmpl.workspace_id());
            co_return;
        } catch (const jgaa::mysqlpool::db_err_exists& ex) {
            LOG_DEBUG_N << "Duplicate template: " << ex.what();
        }
        throw server_err{pb::Error::CONFLICT, "A template with the same content already exists", "content"};
    }

    asio::awaitable<bool> deleteTemplate(int32_t workspace, int32_t id) override {
        auto res = co_await handle_.exec("DELETE FROM template WHERE id=? AND workspace_id=?", id, workspace);
        co_return res.affected_rows() == 1;
    }

private:
    static optional<int32_t> firstId(const boost::mysql::results& res) {
        if (res.rows().empty()) {
            return {};
        }
        return static_cast<int32_t>(res.rows().front().front().as_int64());
    }

    handle_t handle_;
    optional<trx_t> trx_;
};

} // anon ns

asio::awaitable<unique_ptr<Session>> MariaDb::session()
{
    try {
        co_return make_unique<MariaDbSession>(co_await pool_.getConnection());
    } catch (const std::exception& ex) {
        LOG_ERROR << logging::LogEvent::LE_DATABASE_UNAVAILABLE
                  << "Failed to get a database connection: " << ex.what();
    }

    throw server_err{pb::Error::DATABASE_REQUEST_FAILED, "The database is unavailable"};
}

} // ns
