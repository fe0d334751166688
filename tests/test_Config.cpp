#include <gtest/gtest.h>
#include <filesystem>
#include <cstdlib>
#include <fstream>
#include <optional>
#include "../src/core/ConfigManager.h"

namespace fs = std::filesystem;

TEST(ConfigTest, DefaultsNeedNoFile) {
    Config cfg = Config::defaults();
    EXPECT_EQ(cfg.store.path, Paths::dataFile("state.db"));
    EXPECT_EQ(cfg.logging.file, Paths::dataFile("uts.log"));
    EXPECT_EQ(cfg.decisions.sessionDir, Paths::dataFile("session"));
    EXPECT_TRUE(cfg.decisions.interactive);
    EXPECT_EQ(cfg.decisions.defaultOutcome, DecisionOutcome::Defer);
    EXPECT_EQ(cfg.decisions.timeoutSeconds, 600);
    EXPECT_TRUE(cfg.plugins.empty());
}

TEST(ConfigTest, FullDocument) {
    nlohmann::json j = {
        {"store", {{"path", "/tmp/uts.db"}}},
        {"logging", {{"file", ""}, {"debug", true}}},
        {"decisions", {{"mode", "non_interactive"}, {"default_outcome", "ignore"},
                       {"timeout_seconds", 30}, {"editor", "nano"}, {"session_dir", "/tmp/s"}}},
        {"vocabulary", "vocab.json"},
        {"plugins", {
            {{"name", "tw-home"}, {"tool", "taskwarrior"}, {"project", "demo"}, {"target", "project:home"}},
            {{"tool", "redmine"}, {"type", "json"}, {"project", "demo"}, {"target", "dump.json"}}
        }}
    };
    Config cfg = Config::fromJson(j);
    EXPECT_EQ(cfg.store.path, "/tmp/uts.db");
    EXPECT_TRUE(cfg.logging.debug);
    EXPECT_FALSE(cfg.decisions.interactive);
    EXPECT_EQ(cfg.decisions.defaultOutcome, DecisionOutcome::Ignore);
    EXPECT_EQ(cfg.decisions.timeoutSeconds, 30);
    EXPECT_EQ(cfg.decisions.editor, "nano");
    EXPECT_EQ(cfg.vocabularyPath, "vocab.json");
    ASSERT_EQ(cfg.plugins.size(), 2u);
    EXPECT_EQ(cfg.plugins[0].effectiveType(), "taskwarrior");
    EXPECT_EQ(cfg.plugins[1].name, "redmine");
    EXPECT_EQ(cfg.plugins[1].effectiveType(), "json");
    EXPECT_EQ(cfg.projects(), std::set<std::string>{"demo"});
}

TEST(ConfigTest, DefaultOutcomeMayNotMapAnything) {
    for (const char* outcome : {"accept", "create_new", "whatever"}) {
        nlohmann::json j = {{"decisions", {{"default_outcome", outcome}}}};
        EXPECT_THROW(Config::fromJson(j), ConfigError) << outcome;
    }
}

TEST(ConfigTest, InvalidDocuments) {
    EXPECT_THROW(Config::fromJson({{"decisions", {{"mode", "auto"}}}}), ConfigError);
    EXPECT_THROW(Config::fromJson({{"decisions", {{"timeout_seconds", 0}}}}), ConfigError);
    EXPECT_THROW(Config::fromJson({{"plugins", {{{"tool", "taskwarrior"}}}}}), ConfigError);
    EXPECT_THROW(Config::fromJson({{"plugins", {{{"project", "demo"}}}}}), ConfigError);
    EXPECT_THROW(Config::fromJson({{"plugins", {
        {{"tool", "taskwarrior"}, {"project", "a"}},
        {{"tool", "taskwarrior"}, {"project", "b"}}
    }}}), ConfigError);
    EXPECT_THROW(Config::fromJson({{"store", {{"path", 5}}}}), ConfigError);
}

TEST(ConfigTest, LoadFromFile) {
    fs::path dir = fs::temp_directory_path() / "uts_config_test";
    fs::create_directories(dir);
    fs::path good = dir / "uts.json";
    fs::path bad = dir / "bad.json";
    std::ofstream(good) << R"({"store": {"path": ":memory:"}})";
    std::ofstream(bad) << "{ nope";

    EXPECT_EQ(Config::load(good.string()).store.path, ":memory:");
    EXPECT_THROW(Config::load(bad.string()), ConfigError);
    EXPECT_THROW(Config::load((dir / "missing.json").string()), ConfigError);
    fs::remove_all(dir);
}

namespace {
    // Sets an environment variable for the lifetime of the guard.
    class EnvGuard {
    public:
        EnvGuard(const char* name, const char* value) : name(name) {
            if (const char* old = std::getenv(name)) previous = std::string(old);
            if (value) setenv(name, value, 1);
            else unsetenv(name);
        }
        ~EnvGuard() {
            if (previous) setenv(name, previous->c_str(), 1);
            else unsetenv(name);
        }

    private:
        const char* name;
        std::optional<std::string> previous;
    };
}

TEST(ConfigTest, DefaultLocationsFollowXdg) {
    EnvGuard home("HOME", "/home/ada");
    {
        EnvGuard data("XDG_DATA_HOME", "/var/lib/ada");
        EnvGuard config("XDG_CONFIG_HOME", "/etc/ada");
        EXPECT_EQ(Paths::dataHome(), "/var/lib/ada/uts");
        EXPECT_EQ(Paths::userConfigFile(), "/etc/ada/uts/config.json");
        EXPECT_EQ(Config::defaults().store.path, "/var/lib/ada/uts/state.db");
    }
    {
        EnvGuard data("XDG_DATA_HOME", nullptr);
        EnvGuard config("XDG_CONFIG_HOME", "relative/dir");
        EXPECT_EQ(Paths::dataHome(), "/home/ada/.local/share/uts");
        EXPECT_EQ(Paths::configHome(), "/home/ada/.config/uts");
        EXPECT_EQ(Config::defaults().logging.file, "/home/ada/.local/share/uts/uts.log");
    }
}

TEST(ConfigTest, GetAndSetDottedKeys) {
    nlohmann::json doc = Config::defaults().toJson();
    EXPECT_EQ(Config::getValue(doc, "decisions.timeout_seconds"), 600);
    EXPECT_EQ(Config::getValue(doc, "decisions.mode"), "interactive");
    EXPECT_THROW(Config::getValue(doc, "decisions.nope"), ConfigError);

    nlohmann::json edited = Config::setValue(nlohmann::json::object(), "decisions.timeout_seconds", "30");
    EXPECT_EQ(edited["decisions"]["timeout_seconds"], 30);
    edited = Config::setValue(edited, "store.path", "/tmp/uts.db");
    EXPECT_EQ(edited["store"]["path"], "/tmp/uts.db");
    EXPECT_EQ(Config::fromJson(edited).decisions.timeoutSeconds, 30);

    // Edits that would make the file invalid are refused.
    EXPECT_THROW(Config::setValue(edited, "decisions.default_outcome", "accept"), ConfigError);
    EXPECT_THROW(Config::setValue(edited, "decisions.timeout_seconds", "-1"), ConfigError);
}
