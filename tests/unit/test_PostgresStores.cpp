#include <gtest/gtest.h>
#include "config/Config.hpp"
#include "db/Schema.hpp"
#include "db/Transactions.hpp"
#include "db/query/sync/Asset.hpp"
#include "db/query/sync/Event.hpp"
#include "db/query/sync/Project.hpp"

#include <cstdlib>
#include <unistd.h>

using namespace sl::sync::model;

// Runs against a live PostgreSQL only when SITELINE_TEST_DB names the database to use.
// Connection settings follow the usual config fields: SITELINE_TEST_DB_HOST, SITELINE_TEST_DB_USER,
// and the password from SITELINE_DB_PASSWORD.
class PostgresStoresTest : public ::testing::Test {
protected:
    std::string suffix = std::to_string(::getpid());

    void SetUp() override {
        const char* name = std::getenv("SITELINE_TEST_DB");
        if (!name || !*name) GTEST_SKIP() << "SITELINE_TEST_DB not set";

        if (!sl::db::Transactions::isInitialized()) {
            sl::config::DatabaseConfig cfg;
            cfg.name = name;
            if (const char* host = std::getenv("SITELINE_TEST_DB_HOST")) cfg.host = host;
            if (const char* user = std::getenv("SITELINE_TEST_DB_USER")) cfg.user = user;
            cfg.pool_size = 2;
            sl::db::bootstrap(cfg);
        }
    }

    std::string id(const std::string& base) const { return base + "_" + suffix; }
};

TEST_F(PostgresStoresTest, ProjectHashIsOnlyChangedByCommit) {
    sl::db::query::sync::Project store;
    Project p;
    p.uid = id("proj");
    p.name = "Bridge inspection";
    p.content_hash = "h-remote";

    store.upsertProject(p);
    auto rec = store.getRecord(p.uid);
    ASSERT_TRUE(rec.has_value());
    EXPECT_EQ(rec->content_hash, "");

    store.commitHash(p.uid, "h1");
    store.upsertProject(p);
    rec = store.getRecord(p.uid);
    ASSERT_TRUE(rec.has_value());
    EXPECT_EQ(rec->content_hash, "h1");
    EXPECT_GT(rec->local_revision_ts, 0);
}

TEST_F(PostgresStoresTest, AssetOwnershipAndEviction) {
    sl::db::query::sync::Asset store;
    const auto a = id("projA"), b = id("projB");

    AssetNode node;
    node.node_id = id("node");
    node.remote_id = id("remote");
    node.name = "plan.pdf";
    node.tree_path = "/plan.pdf";
    store.upsert(node);

    store.addOwner(node.node_id, a);
    store.addOwner(node.node_id, a);
    store.addOwner(node.node_id, b);
    store.updateStatus(node.node_id, AssetNode::Status::Completed, std::filesystem::path("/tmp/plan.pdf"));

    const auto found = store.findByRemoteId(*node.remote_id);
    ASSERT_TRUE(found);
    EXPECT_EQ(found->owning_project_uids, (std::set<std::string>{a, b}));
    EXPECT_EQ(found->status, AssetNode::Status::Completed);
    EXPECT_EQ(store.listOwnedBy(a).size(), 1u);

    EXPECT_FALSE(store.releaseOwner(node.node_id, a).evicted);
    EXPECT_TRUE(store.findByNodeId(node.node_id));

    const auto last = store.releaseOwner(node.node_id, b);
    EXPECT_TRUE(last.evicted);
    ASSERT_TRUE(last.local_path.has_value());
    EXPECT_EQ(last.local_path->string(), "/tmp/plan.pdf");
    EXPECT_FALSE(store.findByNodeId(node.node_id));
}

TEST_F(PostgresStoresTest, EventSyncFlag) {
    sl::db::query::sync::Event store;
    const auto uid = id("event"), project = id("proj");

    EXPECT_FALSE(store.isSynced(uid));
    store.track(uid, project);
    EXPECT_EQ(store.listUnsynced(project), std::vector<std::string>{uid});

    store.markSynced(uid, project, "task_1", "digest");
    EXPECT_TRUE(store.isSynced(uid));
    EXPECT_TRUE(store.listUnsynced(project).empty());
}

TEST_F(PostgresStoresTest, DeleteProjectCascadesToDetailAndDefects) {
    sl::db::query::sync::Project store;
    Project p;
    p.uid = id("doomed");
    store.upsertProject(p);
    store.saveDetail(p.uid, R"({"history_defect_list": []})");

    Defect d;
    d.defect_no = "D-1";
    store.upsertDefects(p.uid, {d});

    store.deleteProject(p.uid);
    EXPECT_FALSE(store.getRecord(p.uid).has_value());

    const auto leftovers = sl::db::Transactions::exec("test::leftovers", [&](pqxx::work& txn) {
        return txn.exec("SELECT (SELECT count(*) FROM project_detail WHERE project_uid = $1) + "
                        "(SELECT count(*) FROM defect WHERE project_uid = $1)", pqxx::params{p.uid})
            .one_field().as<long>();
    });
    EXPECT_EQ(leftovers, 0);

    EXPECT_NO_THROW(store.deleteProject(p.uid));
}
