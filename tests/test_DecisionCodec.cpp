#include <gtest/gtest.h>
#include <filesystem>
#include <fstream>
#include "../src/decision/DecisionCodec.h"
#include "../src/core/Errors.h"

namespace fs = std::filesystem;

namespace {
    Proposal sample() {
        Proposal p;
        p.tool = "taskwarrior";
        p.rawConceptId = "+bug";
        p.rawLabel = "bug";
        p.id = Proposal::makeId(p.key());
        p.candidateRole = SemanticRole::Label;
        p.suggestedEntityId = "bug";
        p.affectedProjects = {"demo"};
        return p;
    }
}

TEST(DecisionCodecTest, SessionDocumentIsPrefilledWithDefer) {
    nlohmann::json doc = DecisionCodec::encode({sample()});
    ASSERT_EQ(doc["items"].size(), 1u);
    EXPECT_EQ(doc["items"][0]["proposal"]["id"], "taskwarrior:+bug");
    EXPECT_EQ(doc["items"][0]["decision"]["outcome"], "defer");

    auto decisions = DecisionCodec::decode(doc);
    ASSERT_EQ(decisions.size(), 1u);
    EXPECT_EQ(decisions[0].outcome, DecisionOutcome::Defer);
    EXPECT_EQ(decisions[0].proposalId, "taskwarrior:+bug");
}

TEST(DecisionCodecTest, EditedSessionDocument) {
    nlohmann::json doc = DecisionCodec::encode({sample()});
    doc["items"][0]["decision"]["outcome"] = "create_new";
    doc["items"][0]["decision"]["entity"] = {{"id", "bug"}, {"role", "label"}, {"description", "Defect"}};

    auto decisions = DecisionCodec::decode(doc);
    ASSERT_EQ(decisions.size(), 1u);
    EXPECT_EQ(decisions[0].outcome, DecisionOutcome::CreateNew);
    ASSERT_TRUE(decisions[0].newEntity.has_value());
    EXPECT_EQ(decisions[0].newEntity->role, SemanticRole::Label);
}

TEST(DecisionCodecTest, ScriptedForm) {
    nlohmann::json doc = {{"decisions", {
        {{"proposal_id", "gh:bug"}, {"outcome", "accept"}, {"entity_id", "bug"}, {"projects", {"a"}}},
        {{"proposal_id", "redmine:internal-only"}, {"outcome", "ignore"}}
    }}};
    auto decisions = DecisionCodec::decode(doc);
    ASSERT_EQ(decisions.size(), 2u);
    EXPECT_EQ(decisions[0].entityId, "bug");
    EXPECT_EQ(decisions[0].projects, std::vector<std::string>{"a"});
    EXPECT_EQ(decisions[1].outcome, DecisionOutcome::Ignore);
}

TEST(DecisionCodecTest, MalformedDocumentsAreRejected) {
    EXPECT_THROW(DecisionCodec::decode(nlohmann::json::array()), DecisionFormatError);
    EXPECT_THROW(DecisionCodec::decode({{"other", 1}}), DecisionFormatError);
    EXPECT_THROW(DecisionCodec::decode({{"decisions", {{{"outcome", "accept"}}}}}), DecisionFormatError);
    EXPECT_THROW(DecisionCodec::decode({{"decisions", {{{"proposal_id", "x"}, {"outcome", "accept"}}}}}),
                 DecisionFormatError);
    EXPECT_THROW(DecisionCodec::decode({{"decisions", {{{"proposal_id", "x"}, {"outcome", "maybe"}}}}}),
                 DecisionFormatError);
    EXPECT_THROW(DecisionCodec::decode({{"decisions", {{{"proposal_id", "x"}, {"outcome", "create_new"},
                                                         {"entity", {{"id", "e"}, {"role", "epic"}}}}}}}),
                 DecisionFormatError);
}

TEST(DecisionCodecTest, FileRoundTripAndUnreadableFile) {
    fs::path dir = fs::temp_directory_path() / "uts_codec_test";
    fs::remove_all(dir);
    std::string path = (dir / "session" / "decisions.json").string();

    DecisionCodec::writeFile(path, DecisionCodec::encode({sample()}));
    EXPECT_EQ(DecisionCodec::readFile(path).size(), 1u);

    { std::ofstream(path) << "{ not json"; }
    EXPECT_THROW(DecisionCodec::readFile(path), DecisionFormatError);
    EXPECT_THROW(DecisionCodec::readFile((dir / "missing.json").string()), DecisionFormatError);
    fs::remove_all(dir);
}
