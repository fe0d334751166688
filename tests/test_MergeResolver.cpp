#include <gtest/gtest.h>
#include "../src/config/MergeResolver.h"

class MergeResolverTest : public ::testing::Test {
protected:
    GlobalConfiguration global;
    std::map<std::string, ProjectConfiguration> projects;

    void SetUp() override {
        global.registry.registerEntity({"bug", SemanticRole::Label, ""});
        global.registry.registerEntity({"defect", SemanticRole::Label, ""});
        global.addDefaultMapping({"github", "bug"}, "bug");

        ProjectConfiguration demo;
        demo.projectId = "demo";
        demo.overrides[{"github", "bug"}] = MappingTarget::entity("defect");
        demo.overrides[{"github", "wontfix"}] = MappingTarget::none();
        projects["demo"] = demo;

        ProjectConfiguration other;
        other.projectId = "other";
        projects["other"] = other;
    }
};

TEST_F(MergeResolverTest, OverrideWinsOverDefault) {
    MergeResolver resolver(global, projects);
    Resolution r = resolver.resolve("demo", "github", "bug");
    EXPECT_TRUE(r.isEntity());
    EXPECT_EQ(r.entityId, "defect");
    EXPECT_EQ(r.source, Resolution::Source::ProjectOverride);
    EXPECT_EQ(r.projectId, "demo");
    EXPECT_EQ(r.describe(), "defect (override in project demo)");
}

TEST_F(MergeResolverTest, DefaultWhenNoOverride) {
    MergeResolver resolver(global, projects);
    Resolution r = resolver.resolve("other", "github", "bug");
    EXPECT_TRUE(r.isEntity());
    EXPECT_EQ(r.entityId, "bug");
    EXPECT_EQ(r.source, Resolution::Source::GlobalDefault);
}

TEST_F(MergeResolverTest, ExplicitNoneIsNotUnmapped) {
    MergeResolver resolver(global, projects);
    EXPECT_TRUE(resolver.resolve("demo", "github", "wontfix").isExplicitNone());
    EXPECT_TRUE(resolver.resolve("other", "github", "wontfix").isUnmapped());
}

TEST_F(MergeResolverTest, UnknownProjectFallsBackToDefaults) {
    MergeResolver resolver(global, projects);
    EXPECT_EQ(resolver.resolve("nobody", "github", "bug").entityId, "bug");
    EXPECT_TRUE(resolver.resolve("nobody", "github", "feature").isUnmapped());
}

TEST_F(MergeResolverTest, ResolveIsDeterministic) {
    MergeResolver resolver(global, projects);
    for (int i = 0; i < 3; ++i) {
        Resolution r = resolver.resolve("demo", "github", "bug");
        EXPECT_EQ(r.entityId, "defect");
    }
}

TEST_F(MergeResolverTest, ProjectsInheritingDefault) {
    MergeResolver resolver(global, projects);
    auto inheriting = resolver.projectsInheritingDefault({"github", "bug"});
    EXPECT_EQ(inheriting, std::set<std::string>{"other"});
    EXPECT_TRUE(resolver.projectsInheritingDefault({"github", "feature"}).empty());
}

TEST_F(MergeResolverTest, EffectiveMappingIsBoundToProject) {
    MergeResolver resolver(global, projects);
    EffectiveMapping mapping = resolver.forProject("demo");
    EXPECT_EQ(mapping.projectId(), "demo");
    EXPECT_EQ(mapping.resolve({"github", "bug"}).entityId, "defect");
    ASSERT_TRUE(mapping.entity("defect").has_value());
    EXPECT_EQ(mapping.entity("defect")->role, SemanticRole::Label);
}
