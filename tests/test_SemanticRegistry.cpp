#include <gtest/gtest.h>
#include "../src/semantic/SemanticRegistry.h"
#include "../src/core/Errors.h"

TEST(SemanticRegistryTest, RegisterAndLookup) {
    SemanticRegistry reg;
    RegisterResult r = reg.registerEntity({"bug", SemanticRole::Label, "Defect report"});
    EXPECT_TRUE(r.ok);
    EXPECT_FALSE(r.alreadyPresent);

    auto found = reg.lookup("bug");
    ASSERT_TRUE(found.has_value());
    EXPECT_EQ(found->role, SemanticRole::Label);
    EXPECT_EQ(found->description, "Defect report");
    EXPECT_FALSE(reg.lookup("feature").has_value());
}

TEST(SemanticRegistryTest, SameRoleIsIdempotent) {
    SemanticRegistry reg;
    reg.registerEntity({"bug", SemanticRole::Label, ""});
    RegisterResult r = reg.registerEntity({"bug", SemanticRole::Label, "again"});
    EXPECT_TRUE(r.ok);
    EXPECT_TRUE(r.alreadyPresent);
    EXPECT_EQ(reg.size(), 1u);
    // First definition is kept.
    EXPECT_EQ(reg.lookup("bug")->description, "");
}

TEST(SemanticRegistryTest, DifferentRoleIsRoleConflict) {
    SemanticRegistry reg;
    reg.registerEntity({"urgent", SemanticRole::Priority, ""});
    RegisterResult r = reg.registerEntity({"urgent", SemanticRole::Label, ""});
    EXPECT_FALSE(r.ok);
    EXPECT_EQ(r.error, "RoleConflict");
    EXPECT_EQ(reg.lookup("urgent")->role, SemanticRole::Priority);
}

TEST(SemanticRegistryTest, AllRolesIsTheFixedFour) {
    auto roles = SemanticRegistry::allRoles();
    EXPECT_EQ(roles.size(), 4u);
    EXPECT_TRUE(roles.count(SemanticRole::Label));
    EXPECT_TRUE(roles.count(SemanticRole::Container));
    EXPECT_TRUE(roles.count(SemanticRole::Status));
    EXPECT_TRUE(roles.count(SemanticRole::Priority));
}

TEST(SemanticRegistryTest, SupersetRequiresSameRoles) {
    SemanticRegistry prior;
    prior.registerEntity({"bug", SemanticRole::Label, ""});

    SemanticRegistry grown = prior;
    grown.registerEntity({"done", SemanticRole::Status, ""});
    EXPECT_TRUE(grown.isSupersetOf(prior));
    EXPECT_FALSE(prior.isSupersetOf(grown));

    SemanticRegistry retyped;
    retyped.registerEntity({"bug", SemanticRole::Container, ""});
    EXPECT_FALSE(retyped.isSupersetOf(prior));
}

TEST(SemanticRegistryTest, JsonKeepsRoles) {
    SemanticRegistry reg;
    reg.registerEntity({"bug", SemanticRole::Label, "Defect"});
    reg.registerEntity({"home", SemanticRole::Container, ""});

    SemanticRegistry back = SemanticRegistry::fromJson(reg.toJson());
    EXPECT_EQ(back.size(), 2u);
    EXPECT_EQ(back.lookup("home")->role, SemanticRole::Container);
    EXPECT_TRUE(back.isSupersetOf(reg));
}

TEST(SemanticRegistryTest, UnknownRoleInJsonIsRejected) {
    nlohmann::json j = nlohmann::json::array({{{"id", "x"}, {"role", "epic"}}});
    EXPECT_THROW(SemanticRegistry::fromJson(j), UtsError);
}

TEST(SemanticRegistryTest, RoleNamesRoundTrip) {
    for (SemanticRole role : kAllRoles) {
        auto parsed = roleFromString(roleToString(role));
        ASSERT_TRUE(parsed.has_value());
        EXPECT_EQ(*parsed, role);
    }
    EXPECT_FALSE(roleFromString("unknown").has_value());
}
