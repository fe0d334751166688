#include <gtest/gtest.h>
#include <atomic>
#include <thread>
#include "../src/sync/DecisionApplicator.h"
#include "../src/store/SqliteConfigStore.h"
#include "../src/core/Errors.h"
#include "../src/utils/Logger.h"

namespace {
    Proposal makeProposal(const std::string& tool, const std::string& conceptId, std::set<std::string> projects,
                          std::optional<SemanticRole> hint = std::nullopt, ChangeKind kind = ChangeKind::New) {
        Proposal p;
        p.tool = tool;
        p.rawConceptId = conceptId;
        p.rawLabel = conceptId;
        p.id = Proposal::makeId({tool, conceptId});
        p.affectedProjects = std::move(projects);
        p.candidateRole = hint;
        p.kind = kind;
        return p;
    }

    // Delegates to a real store; commits carrying a global record fail.
    class FailingGlobalStore : public ConfigStore {
    public:
        explicit FailingGlobalStore(ConfigStore& inner) : inner(inner) {}
        GlobalConfiguration loadGlobal() override { return inner.loadGlobal(); }
        std::optional<GlobalConfiguration> loadGlobalVersion(long long v) override { return inner.loadGlobalVersion(v); }
        std::vector<long long> globalVersions() override { return inner.globalVersions(); }
        ProjectConfiguration loadProject(const std::string& id) override { return inner.loadProject(id); }
        std::vector<std::string> listProjects() override { return inner.listProjects(); }
        CommitResult commit(const CommitRequest& request) override {
            if (request.global) {
                throw PersistenceError("disk full");
            }
            return inner.commit(request);
        }

    private:
        ConfigStore& inner;
    };

    // Another writer slips in a global commit right before our first commit.
    class RacingStore : public ConfigStore {
    public:
        explicit RacingStore(ConfigStore& inner) : inner(inner) {}
        GlobalConfiguration loadGlobal() override { return inner.loadGlobal(); }
        std::optional<GlobalConfiguration> loadGlobalVersion(long long v) override { return inner.loadGlobalVersion(v); }
        std::vector<long long> globalVersions() override { return inner.globalVersions(); }
        ProjectConfiguration loadProject(const std::string& id) override { return inner.loadProject(id); }
        std::vector<std::string> listProjects() override { return inner.listProjects(); }
        CommitResult commit(const CommitRequest& request) override {
            ++commits;
            if (!raced && request.global) {
                raced = true;
                GlobalConfiguration other = inner.loadGlobal();
                other.registry.registerEntity({"unrelated", SemanticRole::Label, ""});
                inner.commit(CommitRequest{other, {}});
            }
            return inner.commit(request);
        }

        int commits = 0;

    private:
        ConfigStore& inner;
        bool raced = false;
    };
}

class DecisionApplicatorTest : public ::testing::Test {
protected:
    SqliteConfigStore store{":memory:"};
    LockTable locks;

    void SetUp() override {
        Logger::getInstance().setConsoleEnabled(false);
        Logger::getInstance().setLogFile("");
    }

    void seed(const SemanticEntity& entity) {
        GlobalConfiguration g = store.loadGlobal();
        g.registry.registerEntity(entity);
        ASSERT_TRUE(store.commit(CommitRequest{g, {}}).ok());
    }
};

TEST_F(DecisionApplicatorTest, CreateNewRegistersAndMaps) {
    DecisionApplicator applicator(store, locks);
    Proposal p = makeProposal("taskwarrior", "+bug", {"demo"}, SemanticRole::Label);

    ApplyResult r = applicator.apply(p, Decision::createNew(p.id, {"bug", SemanticRole::Label, ""}));
    ASSERT_TRUE(r.ok) << r.message;
    EXPECT_EQ(r.committedGlobalVersion, 1);
    EXPECT_EQ(r.committedProjectVersions.at("demo"), 1);

    EXPECT_EQ(store.loadGlobal().registry.lookup("bug")->role, SemanticRole::Label);
    ProjectConfiguration demo = store.loadProject("demo");
    EXPECT_EQ(demo.overrideFor(p.key()), MappingTarget::entity("bug"));
    ASSERT_EQ(demo.decisions.size(), 1u);
    EXPECT_EQ(demo.decisions[0].tool, "taskwarrior");
    EXPECT_EQ(demo.decisions[0].rawConceptId, "+bug");
    EXPECT_GT(demo.decisions[0].decidedAt, 0);
    // Global defaults are untouched: the mapping is project-local.
    EXPECT_TRUE(store.loadGlobal().defaultMappings.empty());
}

TEST_F(DecisionApplicatorTest, AcceptRequiresKnownEntity) {
    DecisionApplicator applicator(store, locks);
    Proposal p = makeProposal("github", "bug", {"demo"});
    ApplyResult r = applicator.apply(p, Decision::accept(p.id, "bug"));
    EXPECT_FALSE(r.ok);
    EXPECT_EQ(r.error, ApplyError::UnknownEntity);
    EXPECT_EQ(store.loadProject("demo").version, 0);
}

TEST_F(DecisionApplicatorTest, AcceptWithIncompatibleRoleIsRoleConflict) {
    seed({"urgent", SemanticRole::Priority, ""});
    DecisionApplicator applicator(store, locks);
    Proposal p = makeProposal("github", "urgent", {"demo"}, SemanticRole::Label);

    ApplyResult r = applicator.apply(p, Decision::accept(p.id, "urgent"));
    EXPECT_EQ(r.error, ApplyError::RoleConflict);
    EXPECT_TRUE(store.loadProject("demo").overrides.empty());
}

TEST_F(DecisionApplicatorTest, AcceptMapsToExistingEntity) {
    seed({"bug", SemanticRole::Label, ""});
    DecisionApplicator applicator(store, locks);
    Proposal p = makeProposal("github", "type:bug", {"a", "b"}, SemanticRole::Label);

    ApplyResult r = applicator.apply(p, Decision::accept(p.id, "bug"));
    ASSERT_TRUE(r.ok);
    EXPECT_EQ(r.committedGlobalVersion, 0);
    EXPECT_EQ(store.loadProject("a").overrideFor(p.key()), MappingTarget::entity("bug"));
    EXPECT_EQ(store.loadProject("b").overrideFor(p.key()), MappingTarget::entity("bug"));
}

TEST_F(DecisionApplicatorTest, ScopedDecisionOnlyTouchesNamedProjects) {
    seed({"bug", SemanticRole::Label, ""});
    DecisionApplicator applicator(store, locks);
    Proposal p = makeProposal("github", "bug", {"a", "b"});

    Decision d = Decision::accept(p.id, "bug");
    d.projects = {"b"};
    ASSERT_TRUE(applicator.apply(p, d).ok);
    EXPECT_FALSE(store.loadProject("a").overrideFor(p.key()).has_value());
    EXPECT_TRUE(store.loadProject("b").overrideFor(p.key()).has_value());

    Decision outside = Decision::accept(p.id, "bug");
    outside.projects = {"zzz"};
    EXPECT_EQ(applicator.apply(p, outside).error, ApplyError::InvalidDecision);
}

TEST_F(DecisionApplicatorTest, CreateNewOfExistingIdFails) {
    seed({"bug", SemanticRole::Label, ""});
    DecisionApplicator applicator(store, locks);
    Proposal p = makeProposal("gh", "bug", {"demo"});

    EXPECT_EQ(applicator.apply(p, Decision::createNew(p.id, {"bug", SemanticRole::Label, ""})).error,
              ApplyError::ConfigConflict);
    EXPECT_EQ(applicator.apply(p, Decision::createNew(p.id, {"bug", SemanticRole::Status, ""})).error,
              ApplyError::RoleConflict);
    EXPECT_EQ(store.loadGlobal().registry.lookup("bug")->role, SemanticRole::Label);
    EXPECT_EQ(store.loadProject("demo").version, 0);
}

TEST_F(DecisionApplicatorTest, IgnoreWritesExplicitNone) {
    DecisionApplicator applicator(store, locks);
    Proposal p = makeProposal("redmine", "internal-only", {"demo"});
    ASSERT_TRUE(applicator.apply(p, Decision::ignore(p.id)).ok);
    EXPECT_TRUE(store.loadProject("demo").isExplicitNone(p.key()));
    EXPECT_TRUE(store.globalVersions().empty());
}

TEST_F(DecisionApplicatorTest, DeferOnlyRecordsTheDecision) {
    DecisionApplicator applicator(store, locks);
    Proposal p = makeProposal("redmine", "maybe", {"demo"});
    ASSERT_TRUE(applicator.apply(p, Decision::defer(p.id, "later")).ok);

    ProjectConfiguration demo = store.loadProject("demo");
    EXPECT_TRUE(demo.overrides.empty());
    auto last = demo.lastDecisionFor(p.key());
    ASSERT_TRUE(last.has_value());
    EXPECT_EQ(last->outcome, DecisionOutcome::Defer);
    EXPECT_EQ(last->note, "later");
}

TEST_F(DecisionApplicatorTest, NewProposalForDecidedProjectIsAlreadyDecided) {
    DecisionApplicator applicator(store, locks);
    Proposal p = makeProposal("gh", "wontfix", {"demo"});
    ASSERT_TRUE(applicator.apply(p, Decision::ignore(p.id)).ok);

    seed({"wontfix", SemanticRole::Status, ""});
    ApplyResult r = applicator.apply(p, Decision::accept(p.id, "wontfix"));
    EXPECT_EQ(r.error, ApplyError::AlreadyDecided);
    EXPECT_TRUE(store.loadProject("demo").isExplicitNone(p.key()));
}

TEST_F(DecisionApplicatorTest, ChangedProposalMayReplaceOverride) {
    seed({"home-status", SemanticRole::Status, ""});
    seed({"home", SemanticRole::Container, ""});
    DecisionApplicator applicator(store, locks);

    Proposal first = makeProposal("taskwarrior", "project:home", {"demo"});
    ASSERT_TRUE(applicator.apply(first, Decision::accept(first.id, "home-status")).ok);

    Proposal changed = makeProposal("taskwarrior", "project:home", {"demo"}, SemanticRole::Container,
                                    ChangeKind::Changed);
    changed.currentEntityId = "home-status";
    ASSERT_TRUE(applicator.apply(changed, Decision::accept(changed.id, "home")).ok);
    EXPECT_EQ(store.loadProject("demo").overrideFor(changed.key()), MappingTarget::entity("home"));
}

TEST_F(DecisionApplicatorTest, MismatchedProposalIdIsUnknownProposal) {
    DecisionApplicator applicator(store, locks);
    Proposal p = makeProposal("gh", "bug", {"demo"});
    EXPECT_EQ(applicator.apply(p, Decision::ignore("gh:other")).error, ApplyError::UnknownProposal);
}

TEST_F(DecisionApplicatorTest, ConcurrentCreateNewOnlyOneWins) {
    DecisionApplicator applicator(store, locks);
    Proposal forP1 = makeProposal("taskwarrior", "priority:H", {"p1"}, SemanticRole::Priority);
    Proposal forP2 = makeProposal("github", "prio/high", {"p2"}, SemanticRole::Priority);
    SemanticEntity high{"priority-high", SemanticRole::Priority, ""};

    std::atomic<bool> go{false};
    ApplyResult r1, r2;
    std::thread t1([&] {
        while (!go.load()) std::this_thread::yield();
        r1 = applicator.apply(forP1, Decision::createNew(forP1.id, high));
    });
    std::thread t2([&] {
        while (!go.load()) std::this_thread::yield();
        r2 = applicator.apply(forP2, Decision::createNew(forP2.id, high));
    });
    go.store(true);
    t1.join();
    t2.join();

    EXPECT_NE(r1.ok, r2.ok);
    const ApplyResult& loser = r1.ok ? r2 : r1;
    EXPECT_EQ(loser.error, ApplyError::ConfigConflict);

    std::string loserProject = r1.ok ? "p2" : "p1";
    std::string winnerProject = r1.ok ? "p1" : "p2";
    EXPECT_TRUE(store.loadProject(loserProject).overrides.empty());
    EXPECT_EQ(store.loadProject(winnerProject).overrides.size(), 1u);
    EXPECT_EQ(store.globalVersions().size(), 1u);
}

TEST_F(DecisionApplicatorTest, GlobalVersionRaceIsRetriedOnce) {
    RacingStore racing(store);
    DecisionApplicator applicator(racing, locks);
    Proposal p = makeProposal("gh", "bug", {"demo"});

    ApplyResult r = applicator.apply(p, Decision::createNew(p.id, {"bug", SemanticRole::Label, ""}));
    ASSERT_TRUE(r.ok) << r.message;
    EXPECT_EQ(racing.commits, 2);
    GlobalConfiguration g = store.loadGlobal();
    EXPECT_TRUE(g.registry.contains("bug"));
    EXPECT_TRUE(g.registry.contains("unrelated"));
    EXPECT_EQ(g.version, 2);
}

TEST_F(DecisionApplicatorTest, PersistenceFailureLeavesLastCommittedState) {
    seed({"bug", SemanticRole::Label, ""});
    FailingGlobalStore failing(store);
    DecisionApplicator applicator(failing, locks);
    Proposal p = makeProposal("gh", "feature", {"demo"});

    ApplyResult r = applicator.apply(p, Decision::createNew(p.id, {"feature", SemanticRole::Label, ""}));
    EXPECT_FALSE(r.ok);
    EXPECT_EQ(r.error, ApplyError::PersistenceError);
    EXPECT_TRUE(r.globalFailure);
    EXPECT_FALSE(store.loadGlobal().registry.contains("feature"));
    EXPECT_EQ(store.loadProject("demo").version, 0);

    // Project-only writes still go through.
    ApplyResult ok = applicator.apply(p, Decision::accept(p.id, "bug"));
    EXPECT_TRUE(ok.ok);
}

TEST_F(DecisionApplicatorTest, ClearOverrideRemovesExplicitNone) {
    DecisionApplicator applicator(store, locks);
    Proposal p = makeProposal("gh", "wontfix", {"P"});
    ASSERT_TRUE(applicator.apply(p, Decision::ignore(p.id)).ok);

    ASSERT_TRUE(applicator.clearOverride("P", p.key()).ok);
    EXPECT_FALSE(store.loadProject("P").overrideFor(p.key()).has_value());
    EXPECT_EQ(applicator.clearOverride("P", p.key()).error, ApplyError::InvalidDecision);
}

TEST_F(DecisionApplicatorTest, VocabularyImportIsAdditive) {
    seed({"bug", SemanticRole::Label, ""});
    DecisionApplicator applicator(store, locks);

    GlobalConfiguration vocab;
    vocab.registry.registerEntity({"bug", SemanticRole::Label, ""});
    vocab.registry.registerEntity({"done", SemanticRole::Status, ""});
    vocab.addDefaultMapping({"taskwarrior", "status:completed"}, "done");

    ApplyResult r = applicator.importVocabulary(vocab);
    ASSERT_TRUE(r.ok) << r.message;
    EXPECT_EQ(r.committedGlobalVersion, 2);

    // Importing the same vocabulary again changes nothing.
    ApplyResult again = applicator.importVocabulary(vocab);
    EXPECT_TRUE(again.ok);
    EXPECT_EQ(again.committedGlobalVersion, 0);
    EXPECT_EQ(store.globalVersions().size(), 2u);

    GlobalConfiguration retype;
    retype.registry.registerEntity({"bug", SemanticRole::Priority, ""});
    EXPECT_EQ(applicator.importVocabulary(retype).error, ApplyError::RoleConflict);

    GlobalConfiguration retarget;
    retarget.registry.registerEntity({"bug", SemanticRole::Label, ""});
    retarget.addDefaultMapping({"taskwarrior", "status:completed"}, "bug");
    EXPECT_EQ(applicator.importVocabulary(retarget).error, ApplyError::ConfigConflict);
    EXPECT_EQ(store.loadGlobal().defaultFor({"taskwarrior", "status:completed"}), std::optional<std::string>("done"));
}
