
#include <chrono>
#include <thread>

#include <google/protobuf/util/message_differencer.h>

#include "gtest/gtest.h"

#include "MemoryDb.h"
#include "ytassist/Services.h"
#include "ytassist/errors.h"
#include "ytassist/logging.h"

using namespace std;
using namespace ytassist;
using ytassist::test::run;
namespace asio = boost::asio;
using google::protobuf::util::MessageDifferencer;

namespace {

pb::WorkspaceReq workspaceReq(string name, optional<string> description = {}) {
    pb::WorkspaceReq req;
    req.set_name(std::move(name));
    if (description) {
        req.set_description(*description);
    }
    return req;
}

pb::ProjectReq projectReq(string name) {
    pb::ProjectReq req;
    req.set_name(std::move(name));
    return req;
}

pb::TemplateReq templateReq(string type, string name, string content) {
    pb::TemplateReq req;
    req.set_type(std::move(type));
    req.set_name(std::move(name));
    req.set_content(std::move(content));
    return req;
}

template <typename T>
pb::Error errorOf(asio::awaitable<T> aw) {
    try {
        run(std::move(aw));
    } catch (const server_err& ex) {
        return ex.error();
    }
    return pb::Error::OK;
}

class ServiceTest : public ::testing::Test {
protected:
    Workspaces workspaces() {
        return Workspaces{*session};
    }

    Projects projects() {
        return Projects{*session};
    }

    Templates templates() {
        return Templates{*session};
    }

    int32_t addWorkspace(string name) {
        return run(workspaces().create(workspaceReq(std::move(name)))).id();
    }

    int32_t addProject(int32_t ws, string name) {
        return run(projects().create(ws, projectReq(std::move(name)))).id();
    }

    test::MemoryDb store;
    unique_ptr<db::Session> session = run(store.session());
};

} // anon ns

TEST(WorkspaceResolver, missingHeaderGivesDefault) {
    EXPECT_EQ(resolveWorkspaceId(nullopt), DEFAULT_WORKSPACE_ID);
}

TEST(WorkspaceResolver, validId) {
    EXPECT_EQ(resolveWorkspaceId("7"), 7);
    EXPECT_EQ(resolveWorkspaceId(" 42 "), 42);
    EXPECT_EQ(resolveWorkspaceId("2147483647"), 2147483647);
}

TEST(WorkspaceResolver, invalidIdGivesDefault) {
    for(const auto value : {"", "abc", "0", "-3", "1.5", "12x", "2147483648", "99999999999999999999"}) {
        EXPECT_EQ(resolveWorkspaceId(string_view{value}), DEFAULT_WORKSPACE_ID) << "value: " << value;
    }
}

TEST(Validate, textLengthCountsCharacters) {
    EXPECT_EQ(validate::textLength(""), 0);
    EXPECT_EQ(validate::textLength("abc"), 3);
    EXPECT_EQ(validate::textLength("bl\xC3\xA5" "b\xC3\xA6r"), 6);
}

TEST(Validate, requiredTextTrims) {
    EXPECT_EQ(validate::requiredText("  hello \t", "name", 10), "hello");
}

TEST(Validate, requiredTextRejectsBlank) {
    try {
        validate::requiredText("   ", "name", 10);
        FAIL() << "Expected server_err";
    } catch (const server_err& ex) {
        EXPECT_EQ(ex.error(), pb::Error::VALIDATION_FAILED);
        ASSERT_TRUE(ex.field());
        EXPECT_EQ(*ex.field(), "name");
    }
}

TEST(Validate, optionalTextBlankIsEmpty) {
    EXPECT_FALSE(validate::optionalText("  ", "description", 10));
    EXPECT_EQ(validate::optionalText(" x ", "description", 10), "x");
    EXPECT_THROW(validate::optionalText(string(11, 'x'), "description", 10), server_err);
}

TEST_F(ServiceTest, defaultWorkspaceExists) {
    const auto ws = run(workspaces().get(DEFAULT_WORKSPACE_ID));
    EXPECT_EQ(ws.name(), "Default Workspace");
    EXPECT_EQ(ws.project_count(), 0);
}

TEST_F(ServiceTest, createAndGetWorkspace) {
    const auto created = run(workspaces().create(workspaceReq("  Gaming  ", " Videos about games ")));
    EXPECT_GT(created.id(), DEFAULT_WORKSPACE_ID);
    EXPECT_EQ(created.name(), "Gaming");
    EXPECT_EQ(created.description(), "Videos about games");

    const auto ws = run(workspaces().get(created.id()));
    EXPECT_EQ(ws.name(), "Gaming");
    EXPECT_EQ(ws.description(), "Videos about games");
    EXPECT_EQ(ws.created_at(), created.created_at());
    EXPECT_EQ(run(workspaces().list()).size(), 2);
}

TEST_F(ServiceTest, workspaceNameIsRequired) {
    EXPECT_EQ(errorOf(workspaces().create(pb::WorkspaceReq{})), pb::Error::VALIDATION_FAILED);
    EXPECT_EQ(errorOf(workspaces().create(workspaceReq("   "))), pb::Error::VALIDATION_FAILED);
}

TEST_F(ServiceTest, workspaceNameLength) {
    EXPECT_EQ(errorOf(workspaces().create(workspaceReq(string(101, 'w')))), pb::Error::VALIDATION_FAILED);
    EXPECT_EQ(errorOf(workspaces().create(workspaceReq(string(100, 'w')))), pb::Error::OK);
}

TEST_F(ServiceTest, duplicateWorkspaceNameInAnyCase) {
    addWorkspace("Tech Reviews");
    EXPECT_EQ(errorOf(workspaces().create(workspaceReq("tech reviews"))), pb::Error::CONFLICT);
    EXPECT_EQ(errorOf(workspaces().create(workspaceReq("DEFAULT WORKSPACE"))), pb::Error::CONFLICT);
}

TEST_F(ServiceTest, updateWorkspaceWithSameName) {
    const auto id = addWorkspace("Cooking");
    const auto ws = run(workspaces().update(id, workspaceReq("Cooking", "Recipes")));
    EXPECT_EQ(ws.name(), "Cooking");
    EXPECT_EQ(ws.description(), "Recipes");
}

TEST_F(ServiceTest, renameWorkspaceToExistingName) {
    addWorkspace("Alpha");
    const auto id = addWorkspace("Beta");
    EXPECT_EQ(errorOf(workspaces().update(id, workspaceReq("ALPHA"))), pb::Error::CONFLICT);
    EXPECT_EQ(run(workspaces().get(id)).name(), "Beta");
}

TEST_F(ServiceTest, defaultWorkspaceCannotBeRenamed) {
    EXPECT_EQ(errorOf(workspaces().update(DEFAULT_WORKSPACE_ID, workspaceReq("Other"))), pb::Error::FORBIDDEN);

    // Changing only the description is fine
    const auto ws = run(workspaces().update(DEFAULT_WORKSPACE_ID,
                                            workspaceReq("Default Workspace", "Everything else")));
    EXPECT_EQ(ws.description(), "Everything else");
}

TEST_F(ServiceTest, blankDescriptionClearsIt) {
    const auto id = run(workspaces().create(workspaceReq("Music", "Songs"))).id();
    pb::WorkspaceReq req;
    req.set_description("  ");
    const auto ws = run(workspaces().update(id, req));
    EXPECT_FALSE(ws.has_description());
    EXPECT_EQ(ws.name(), "Music");
}

TEST_F(ServiceTest, defaultWorkspaceCannotBeDeleted) {
    EXPECT_EQ(errorOf(workspaces().remove(DEFAULT_WORKSPACE_ID)), pb::Error::FORBIDDEN);
    EXPECT_EQ(run(workspaces().get(DEFAULT_WORKSPACE_ID)).id(), DEFAULT_WORKSPACE_ID);
}

TEST_F(ServiceTest, defaultWorkspaceWithProjectsCannotBeDeleted) {
    addProject(DEFAULT_WORKSPACE_ID, "Keeps it busy");
    EXPECT_EQ(errorOf(workspaces().remove(DEFAULT_WORKSPACE_ID)), pb::Error::FORBIDDEN);

    const auto ws = run(workspaces().get(DEFAULT_WORKSPACE_ID));
    EXPECT_EQ(ws.project_count(), 1);
    EXPECT_EQ(run(projects().list(DEFAULT_WORKSPACE_ID)).size(), 1);
}

TEST_F(ServiceTest, deleteEmptyWorkspace) {
    const auto id = addWorkspace("Temporary");
    run(workspaces().remove(id));
    EXPECT_EQ(errorOf(workspaces().get(id)), pb::Error::NOT_FOUND);
    EXPECT_EQ(errorOf(workspaces().remove(id)), pb::Error::NOT_FOUND);
}

TEST_F(ServiceTest, deleteWorkspaceWithProjects) {
    const auto id = addWorkspace("Busy");
    addProject(id, "Project A");
    EXPECT_EQ(errorOf(workspaces().remove(id)), pb::Error::CONFLICT);
    EXPECT_EQ(run(workspaces().get(id)).project_count(), 1);
}

TEST_F(ServiceTest, createAndGetProject) {
    const auto created = run(projects().create(DEFAULT_WORKSPACE_ID, projectReq("First Video")));
    EXPECT_EQ(created.status(), "planned");
    EXPECT_EQ(created.workspace_id(), DEFAULT_WORKSPACE_ID);
    EXPECT_FALSE(created.has_description());
    EXPECT_FALSE(created.has_video_title());
    EXPECT_EQ(created.created_at(), created.updated_at());

    const auto project = run(projects().get(DEFAULT_WORKSPACE_ID, created.id()));
    EXPECT_TRUE(MessageDifferencer::Equals(created, project))
        << "created: " << created.ShortDebugString() << "\nfetched: " << project.ShortDebugString();
}

TEST_F(ServiceTest, createAndGetProjectWithAllFields) {
    auto req = projectReq("  Full Video ");
    req.set_description(" Everything set ");
    req.set_status("recording");
    req.set_video_title("Best Tools Ever");

    const auto created = run(projects().create(DEFAULT_WORKSPACE_ID, req));
    EXPECT_EQ(created.name(), "Full Video");
    EXPECT_EQ(created.description(), "Everything set");
    EXPECT_EQ(created.status(), "recording");
    EXPECT_EQ(created.video_title(), "Best Tools Ever");

    const auto project = run(projects().get(DEFAULT_WORKSPACE_ID, created.id()));
    EXPECT_TRUE(MessageDifferencer::Equals(created, project))
        << "created: " << created.ShortDebugString() << "\nfetched: " << project.ShortDebugString();
}

TEST_F(ServiceTest, renameProjectChangingOnlyCase) {
    // "École" and "école"
    const auto id = addProject(DEFAULT_WORKSPACE_ID, "\xC3\x89" "cole");

    const auto project = run(projects().update(DEFAULT_WORKSPACE_ID, id, projectReq("\xC3\xA9" "cole")));
    EXPECT_EQ(project.id(), id);
    EXPECT_EQ(project.name(), "\xC3\xA9" "cole");

    const auto again = run(projects().update(DEFAULT_WORKSPACE_ID, id, projectReq("\xC3\xA9" "COLE")));
    EXPECT_EQ(again.name(), "\xC3\xA9" "COLE");

    EXPECT_EQ(errorOf(projects().create(DEFAULT_WORKSPACE_ID, projectReq("\xC3\x89" "cole"))), pb::Error::CONFLICT);
    EXPECT_EQ(run(projects().list(DEFAULT_WORKSPACE_ID)).size(), 1);
}

TEST_F(ServiceTest, projectUpdateRefreshesUpdatedAt) {
    const auto created = run(projects().create(DEFAULT_WORKSPACE_ID, projectReq("Timing")));
    this_thread::sleep_for(2ms);

    pb::ProjectReq req;
    req.set_status("editing");
    const auto updated = run(projects().update(DEFAULT_WORKSPACE_ID, created.id(), req));
    EXPECT_EQ(updated.created_at(), created.created_at());
    EXPECT_GT(updated.updated_at(), created.updated_at());
    EXPECT_GE(updated.updated_at(), updated.created_at());

    const auto stored = run(projects().get(DEFAULT_WORKSPACE_ID, created.id()));
    EXPECT_EQ(stored.updated_at(), updated.updated_at());
}

TEST_F(ServiceTest, projectInMissingWorkspace) {
    EXPECT_EQ(errorOf(projects().create(4711, projectReq("Lost"))), pb::Error::NOT_FOUND);
}

TEST_F(ServiceTest, projectDescriptionLength) {
    auto req = projectReq("Long");
    req.set_description(string(2001, 'd'));
    EXPECT_EQ(errorOf(projects().create(DEFAULT_WORKSPACE_ID, req)), pb::Error::VALIDATION_FAILED);

    // Characters, not bytes
    string text;
    for(auto i = 0; i < 2000; ++i) {
        text += "\xC3\xA6";
    }
    req.set_description(text);
    EXPECT_EQ(errorOf(projects().create(DEFAULT_WORKSPACE_ID, req)), pb::Error::OK);
}

TEST_F(ServiceTest, duplicateProjectNameInWorkspace) {
    addProject(DEFAULT_WORKSPACE_ID, "Unboxing");
    EXPECT_EQ(errorOf(projects().create(DEFAULT_WORKSPACE_ID, projectReq("UNBOXING"))), pb::Error::CONFLICT);

    // Other workspaces are independent
    const auto other = addWorkspace("Other");
    EXPECT_EQ(errorOf(projects().create(other, projectReq("Unboxing"))), pb::Error::OK);
}

TEST_F(ServiceTest, projectsAreScopedToWorkspace) {
    const auto other = addWorkspace("Other");
    const auto id = addProject(other, "Hidden");

    EXPECT_EQ(errorOf(projects().get(DEFAULT_WORKSPACE_ID, id)), pb::Error::NOT_FOUND);
    EXPECT_EQ(errorOf(projects().update(DEFAULT_WORKSPACE_ID, id, projectReq("Moved"))), pb::Error::NOT_FOUND);
    EXPECT_EQ(errorOf(projects().remove(DEFAULT_WORKSPACE_ID, id)), pb::Error::NOT_FOUND);
    EXPECT_TRUE(run(projects().list(DEFAULT_WORKSPACE_ID)).empty());
    EXPECT_EQ(run(projects().list(other)).size(), 1);
}

TEST_F(ServiceTest, updateProject) {
    const auto id = addProject(DEFAULT_WORKSPACE_ID, "Draft");

    pb::ProjectReq req;
    req.set_name("draft");
    req.set_status("recording");
    req.set_video_title("My Video");
    const auto project = run(projects().update(DEFAULT_WORKSPACE_ID, id, req));
    EXPECT_EQ(project.name(), "draft");
    EXPECT_EQ(project.status(), "recording");
    EXPECT_EQ(project.video_title(), "My Video");

    pb::ProjectReq blank_status;
    blank_status.set_status(" ");
    EXPECT_EQ(errorOf(projects().update(DEFAULT_WORKSPACE_ID, id, blank_status)), pb::Error::VALIDATION_FAILED);
}

TEST_F(ServiceTest, renameProjectToExistingName) {
    addProject(DEFAULT_WORKSPACE_ID, "One");
    const auto id = addProject(DEFAULT_WORKSPACE_ID, "Two");
    EXPECT_EQ(errorOf(projects().update(DEFAULT_WORKSPACE_ID, id, projectReq("one"))), pb::Error::CONFLICT);
}

TEST_F(ServiceTest, deleteProject) {
    const auto id = addProject(DEFAULT_WORKSPACE_ID, "Gone");
    run(projects().remove(DEFAULT_WORKSPACE_ID, id));
    EXPECT_EQ(errorOf(projects().get(DEFAULT_WORKSPACE_ID, id)), pb::Error::NOT_FOUND);
}

TEST_F(ServiceTest, createTemplate) {
    const auto tmpl = run(templates().create(DEFAULT_WORKSPACE_ID,
                                             templateReq("title", "Tools", "Best [technology] Tools for [year]")));
    EXPECT_EQ(tmpl.type(), "title");
    EXPECT_EQ(tmpl.workspace_id(), DEFAULT_WORKSPACE_ID);
    ASSERT_EQ(tmpl.placeholders_size(), 2);
    EXPECT_EQ(tmpl.placeholders(0), "technology");
    EXPECT_EQ(tmpl.placeholders(1), "year");

    const auto stored = run(templates().get(DEFAULT_WORKSPACE_ID, tmpl.id()));
    EXPECT_EQ(stored.content(), "Best [technology] Tools for [year]");
    EXPECT_EQ(stored.placeholders_size(), 2);
}

TEST_F(ServiceTest, templateValidation) {
    EXPECT_EQ(errorOf(templates().create(DEFAULT_WORKSPACE_ID, templateReq("thumbnail", "x", "y"))),
              pb::Error::VALIDATION_FAILED);
    EXPECT_EQ(errorOf(templates().create(DEFAULT_WORKSPACE_ID, templateReq("title", "x", string(257, 'c')))),
              pb::Error::VALIDATION_FAILED);
    EXPECT_EQ(errorOf(templates().create(DEFAULT_WORKSPACE_ID, templateReq("title", " ", "y"))),
              pb::Error::VALIDATION_FAILED);

    pb::TemplateReq no_content;
    no_content.set_type("title");
    no_content.set_name("x");
    EXPECT_EQ(errorOf(templates().create(DEFAULT_WORKSPACE_ID, no_content)), pb::Error::VALIDATION_FAILED);
}

TEST_F(ServiceTest, duplicateTemplateContent) {
    run(templates().create(DEFAULT_WORKSPACE_ID, templateReq("title", "A", "Top [n] Tips")));
    EXPECT_EQ(errorOf(templates().create(DEFAULT_WORKSPACE_ID, templateReq("title", "B", "top [n] tips"))),
              pb::Error::CONFLICT);

    // Same content as another type is fine
    EXPECT_EQ(errorOf(templates().create(DEFAULT_WORKSPACE_ID, templateReq("description", "C", "Top [n] Tips"))),
              pb::Error::OK);
}

TEST_F(ServiceTest, updateTemplateKeepsOwnContent) {
    const auto id = run(templates().create(DEFAULT_WORKSPACE_ID, templateReq("title", "A", "Hello [who]"))).id();

    pb::TemplateReq req;
    req.set_name("Renamed");
    req.set_content("Hello [who]");
    const auto tmpl = run(templates().update(DEFAULT_WORKSPACE_ID, id, req));
    EXPECT_EQ(tmpl.name(), "Renamed");

    const auto other = run(templates().create(DEFAULT_WORKSPACE_ID, templateReq("title", "B", "Bye [who]"))).id();
    pb::TemplateReq clash;
    clash.set_content("HELLO [who]");
    EXPECT_EQ(errorOf(templates().update(DEFAULT_WORKSPACE_ID, other, clash)), pb::Error::CONFLICT);
}

TEST_F(ServiceTest, listTemplatesByTypeNewestFirst) {
    const auto t1 = run(templates().create(DEFAULT_WORKSPACE_ID, templateReq("title", "1", "One"))).id();
    const auto d1 = run(templates().create(DEFAULT_WORKSPACE_ID, templateReq("description", "2", "Two"))).id();
    const auto t2 = run(templates().create(DEFAULT_WORKSPACE_ID, templateReq("title", "3", "Three"))).id();

    const auto titles = run(templates().list(DEFAULT_WORKSPACE_ID, "title"));
    ASSERT_EQ(titles.size(), 2);
    EXPECT_EQ(titles[0].id(), t2);
    EXPECT_EQ(titles[1].id(), t1);

    const auto descriptions = run(templates().list(DEFAULT_WORKSPACE_ID, "description"));
    ASSERT_EQ(descriptions.size(), 1);
    EXPECT_EQ(descriptions[0].id(), d1);

    const auto all = run(templates().list(DEFAULT_WORKSPACE_ID, ""));
    ASSERT_EQ(all.size(), 3);
    EXPECT_EQ(all[0].id(), t2);

    const auto other = addWorkspace("Other");
    EXPECT_TRUE(run(templates().list(other, "")).empty());
}

TEST_F(ServiceTest, deleteTemplate) {
    const auto id = run(templates().create(DEFAULT_WORKSPACE_ID, templateReq("title", "A", "x"))).id();
    run(templates().remove(DEFAULT_WORKSPACE_ID, id));
    EXPECT_EQ(errorOf(templates().get(DEFAULT_WORKSPACE_ID, id)), pb::Error::NOT_FOUND);
    EXPECT_EQ(errorOf(templates().remove(DEFAULT_WORKSPACE_ID, id)), pb::Error::NOT_FOUND);
}

TEST_F(ServiceTest, applyTemplateToProject) {
    const auto project_id = addProject(DEFAULT_WORKSPACE_ID, "Tools video");
    const auto tmpl_id = run(templates().create(DEFAULT_WORKSPACE_ID,
                                                templateReq("title", "Tools", "Best [technology] Tools for [year]"))).id();

    pb::ApplyTemplateReq req;
    req.set_project_id(project_id);
    (*req.mutable_values())["technology"] = "Python";
    (*req.mutable_values())["year"] = "2024";

    const auto project = run(templates().apply(DEFAULT_WORKSPACE_ID, tmpl_id, req));
    EXPECT_EQ(project.id(), project_id);
    EXPECT_EQ(project.video_title(), "Best Python Tools for 2024");
    EXPECT_EQ(run(projects().get(DEFAULT_WORKSPACE_ID, project_id)).video_title(), "Best Python Tools for 2024");

    // Missing values leave the placeholder in place
    req.mutable_values()->erase("year");
    EXPECT_EQ(run(templates().apply(DEFAULT_WORKSPACE_ID, tmpl_id, req)).video_title(),
              "Best Python Tools for [year]");
}

TEST_F(ServiceTest, applyTemplateRefreshesUpdatedAt) {
    const auto created = run(projects().create(DEFAULT_WORKSPACE_ID, projectReq("Applied")));
    const auto tmpl_id = run(templates().create(DEFAULT_WORKSPACE_ID, templateReq("title", "T", "Hi [who]"))).id();
    this_thread::sleep_for(2ms);

    pb::ApplyTemplateReq req;
    req.set_project_id(created.id());
    (*req.mutable_values())["who"] = "there";

    const auto project = run(templates().apply(DEFAULT_WORKSPACE_ID, tmpl_id, req));
    EXPECT_EQ(project.video_title(), "Hi there");
    EXPECT_EQ(project.created_at(), created.created_at());
    EXPECT_GT(project.updated_at(), created.updated_at());
    EXPECT_EQ(run(projects().get(DEFAULT_WORKSPACE_ID, created.id())).updated_at(), project.updated_at());
}

TEST_F(ServiceTest, applyTemplateErrors) {
    const auto project_id = addProject(DEFAULT_WORKSPACE_ID, "Video");
    const auto tmpl_id = run(templates().create(DEFAULT_WORKSPACE_ID, templateReq("title", "T", "[x]"))).id();

    pb::ApplyTemplateReq req;
    EXPECT_EQ(errorOf(templates().apply(DEFAULT_WORKSPACE_ID, tmpl_id, req)), pb::Error::VALIDATION_FAILED);

    req.set_project_id(9999);
    EXPECT_EQ(errorOf(templates().apply(DEFAULT_WORKSPACE_ID, tmpl_id, req)), pb::Error::NOT_FOUND);

    req.set_project_id(project_id);
    EXPECT_EQ(errorOf(templates().apply(DEFAULT_WORKSPACE_ID, 9999, req)), pb::Error::NOT_FOUND);

    const auto other = addWorkspace("Other");
    EXPECT_EQ(errorOf(templates().apply(other, tmpl_id, req)), pb::Error::NOT_FOUND);
}

TEST_F(ServiceTest, clientWorkScenario) {
    const auto ws = addWorkspace("Client Work");
    addProject(ws, "Intro Video");
    EXPECT_EQ(errorOf(projects().create(ws, projectReq("intro video"))), pb::Error::CONFLICT);
    EXPECT_EQ(run(projects().list(ws)).size(), 1);
}

TEST_F(ServiceTest, twoWorkspaceDeleteScenario) {
    const auto empty = addWorkspace("Empty");
    const auto used = addWorkspace("Used");
    addProject(used, "Keeps it alive");

    run(workspaces().remove(empty));
    EXPECT_EQ(errorOf(workspaces().remove(used)), pb::Error::CONFLICT);

    const auto list = run(workspaces().list());
    ASSERT_EQ(list.size(), 2);
    EXPECT_EQ(list[0].id(), DEFAULT_WORKSPACE_ID);
    EXPECT_EQ(list[1].id(), used);
}

TEST_F(ServiceTest, transactionCommits) {
    run(transaction(*session, [&]() -> asio::awaitable<void> {
        co_await workspaces().create(workspaceReq("Kept"));
    }));

    EXPECT_EQ(run(workspaces().list()).size(), 2);
}

TEST_F(ServiceTest, transactionReturnsValue) {
    const auto ws = run(transaction(*session, [&]() -> asio::awaitable<pb::Workspace> {
        co_return co_await workspaces().create(workspaceReq("Returned"));
    }));

    EXPECT_EQ(ws.name(), "Returned");
}

TEST_F(ServiceTest, failedTransactionRollsBack) {
    const auto before = store.state().workspaces.size();

    EXPECT_THROW(run(transaction(*session, [&]() -> asio::awaitable<void> {
        co_await workspaces().create(workspaceReq("Discarded"));
        co_await projects().create(DEFAULT_WORKSPACE_ID, projectReq("Discarded too"));
        throw server_err{pb::Error::CONFLICT, "Simulated failure"};
    })), server_err);

    EXPECT_EQ(store.state().workspaces.size(), before);
    EXPECT_TRUE(store.state().projects.empty());
    EXPECT_EQ(errorOf(workspaces().create(workspaceReq("Discarded"))), pb::Error::OK);
}

int main(int argc, char **argv) {
    ::testing::InitGoogleTest(&argc, argv);

    logfault::LogManager::Instance().AddHandler(
        make_unique<logfault::StreamHandler>(clog, logfault::LogLevel::TRACE));

    return RUN_ALL_TESTS();
}
