#include <gtest/gtest.h>
#include "bootstrap_config.hpp"
#include "error_manager.hpp"
#include "resources.hpp"
#include "ai.hpp"
#include "test_fakes.hpp"

#include <nlohmann/json.hpp>
#include <fstream>

using nlohmann::json;
namespace fs = std::filesystem;

static json readJson(const fs::path& p) {
    std::ifstream in(p);
    return json::parse(in, nullptr, false);
}

// ------------------------------------------------------------
// mergeDefaults
// ------------------------------------------------------------
TEST(MergeDefaultsTest, FillsMissingKeysRecursively) {
    json cfg = { {"voice", { {"enabled", false} }} };
    json defs = { {"voice", { {"enabled", true}, {"speed", 1.0} }}, {"user_name", "User"} };

    int patched = 0;
    EXPECT_TRUE(bootstrap_config::mergeDefaults(cfg, defs, &patched));
    EXPECT_EQ(patched, 2);
    EXPECT_EQ(cfg["voice"]["enabled"], false);     // user value kept
    EXPECT_EQ(cfg["voice"]["speed"], 1.0);
    EXPECT_EQ(cfg["user_name"], "User");
}

TEST(MergeDefaultsTest, ReplacesMistypedValuesButAcceptsAnyNumber) {
    json cfg = { {"pacing", "fast"}, {"speed", 2}, {"timeout", 1.5} };
    json defs = { {"pacing", 300}, {"speed", 1.0}, {"timeout", 100} };

    EXPECT_TRUE(bootstrap_config::mergeDefaults(cfg, defs));
    EXPECT_EQ(cfg["pacing"], 300);
    EXPECT_EQ(cfg["speed"], 2);
    EXPECT_EQ(cfg["timeout"], 1.5);
}

TEST(MergeDefaultsTest, NothingToDo) {
    json defs = bootstrap_config::defaultConfig();
    json cfg = defs;
    EXPECT_FALSE(bootstrap_config::mergeDefaults(cfg, defs));
    EXPECT_EQ(cfg, defs);
}

// ------------------------------------------------------------
// loadConfig
// ------------------------------------------------------------
TEST(LoadConfigTest, CreatesMissingFileFromDefaults) {
    TempDir tmp;
    fs::path path = tmp.path / "conf" / "aria_config.json";
    json out;

    EXPECT_TRUE(bootstrap_config::loadConfig(path, bootstrap_config::defaultConfig(), out, "ARIA config"));
    EXPECT_TRUE(fs::exists(path));
    EXPECT_EQ(readJson(path), bootstrap_config::defaultConfig());
    EXPECT_EQ(out["session"]["pacing_ms"], 300);
}

TEST(LoadConfigTest, PatchesAndSavesPartialFile) {
    TempDir tmp;
    fs::path path = tmp.path / "aria_config.json";
    std::ofstream(path) << R"({"assistant_name": "Nova", "session": {"pacing_ms": 50}})";

    json out;
    EXPECT_TRUE(bootstrap_config::loadConfig(path, bootstrap_config::defaultConfig(), out, "ARIA config"));
    EXPECT_EQ(out["assistant_name"], "Nova");
    EXPECT_EQ(out["session"]["pacing_ms"], 50);
    EXPECT_EQ(out["session"]["mode"], "text");

    json saved = readJson(path);
    EXPECT_EQ(saved, out);
}

TEST(LoadConfigTest, UnparseableFileIsResetToDefaults) {
    TempDir tmp;
    fs::path path = tmp.path / "aria_config.json";
    std::ofstream(path) << "{ this is not json";

    json out;
    EXPECT_FALSE(bootstrap_config::loadConfig(path, bootstrap_config::defaultConfig(), out,
                                              "ARIA config", "ERR_CONFIG_INVALID"));
    EXPECT_EQ(out, bootstrap_config::defaultConfig());
    EXPECT_EQ(readJson(path), bootstrap_config::defaultConfig());
}

TEST(LoadConfigTest, NonObjectIsResetToo) {
    TempDir tmp;
    fs::path path = tmp.path / "aria_config.json";
    std::ofstream(path) << "[1, 2, 3]";

    json out;
    EXPECT_FALSE(bootstrap_config::loadConfig(path, bootstrap_config::defaultConfig(), out, "ARIA config"));
    EXPECT_TRUE(out.is_object());
}

TEST(DefaultConfigTest, CarriesEverySection) {
    json cfg = bootstrap_config::defaultConfig();
    for (const char* key : { "assistant_name", "user_name", "ai", "voice", "whisper",
                             "session", "paths", "logging", "system_commands" }) {
        EXPECT_TRUE(cfg.contains(key)) << key;
    }
    EXPECT_EQ(cfg["voice"]["poll_interval_ms"], 30);
    EXPECT_TRUE(cfg["system_commands"]["mute"].is_array());
}

// ------------------------------------------------------------
// Data paths
// ------------------------------------------------------------
TEST(DataPathTest, RelativeAndAbsolute) {
    json cfg = bootstrap_config::defaultConfig();
    EXPECT_EQ(dataFile(cfg, "transcript", "x.json"), fs::current_path() / "Data" / "ChatLog.json");

    cfg["paths"]["data_dir"] = "/var/lib/aria";
    EXPECT_EQ(dataFile(cfg, "reminders", "r.txt"), fs::path("/var/lib/aria/reminders.txt"));

    cfg["paths"]["reminders"] = "/tmp/r.txt";
    EXPECT_EQ(dataFile(cfg, "reminders", "r.txt"), fs::path("/tmp/r.txt"));

    EXPECT_EQ(dataFile(json::object(), "missing", "fallback.txt"),
              fs::current_path() / "Data" / "fallback.txt");
}

// ------------------------------------------------------------
// AI backend settings
// ------------------------------------------------------------
TEST(AiBackendConfigTest, ReadsTheAiSection) {
    json cfg = bootstrap_config::defaultConfig();
    cfg["assistant_name"] = "Nova";
    cfg["ai"]["backend"] = "ollama";
    cfg["ai"]["default_model"] = "llama3";
    cfg["ai"]["timeout_ms"] = 1234;

    auto c = AiBackendConfig::fromJson(cfg);
    EXPECT_EQ(c.assistantName, "Nova");
    EXPECT_EQ(c.backend, "ollama");
    EXPECT_EQ(c.model, "llama3");
    EXPECT_EQ(c.timeoutMs, 1234);
    EXPECT_EQ(c.ollamaUrl, "http://127.0.0.1:11434");
}

TEST(AiBackendConfigTest, ExplicitBackendIsNotProbed) {
    AiBackendConfig c;
    c.backend = "localai";
    EXPECT_EQ(resolveBackend(c), "localai");
}

TEST(AiBackendConfigTest, HostedBackendWithoutKeyFailsBeforeAnyRequest) {
    AiBackendConfig c;
    c.backend = "openai";
    c.apiKey.clear();
    EXPECT_THROW(callChatBackend(c, json::array()), ServiceError);

    c.backend = "carrier-pigeon";
    EXPECT_THROW(callChatBackend(c, json::array()), ServiceError);
}

// ------------------------------------------------------------
// Error catalog
// ------------------------------------------------------------
class ErrorManagerTest : public ::testing::Test {
protected:
    void TearDown() override { ErrorManager::load(ErrorManager::defaults()); }
};

TEST_F(ErrorManagerTest, ReportBuildsAFailedResult) {
    auto r = ErrorManager::report("ERR_APP_NO_ARGUMENT", "open");
    EXPECT_FALSE(r.success);
    EXPECT_EQ(r.errorCode, "ERR_APP_NO_ARGUMENT");
    EXPECT_EQ(r.message, ErrorManager::getUserMessage("ERR_APP_NO_ARGUMENT"));
    EXPECT_EQ(r.category, "error");
    EXPECT_TRUE(r.voice.empty());
}

TEST_F(ErrorManagerTest, UnknownCode) {
    EXPECT_NE(ErrorManager::getUserMessage("ERR_NOPE").find("ERR_NOPE"), std::string::npos);
}

TEST_F(ErrorManagerTest, WrappedCatalogIsUnwrapped) {
    ErrorManager::load(json{ {"errors", { {"ERR_X", { {"user", "custom"}, {"debug", "dbg"} }} }} });
    EXPECT_EQ(ErrorManager::getUserMessage("ERR_X"), "custom");
    EXPECT_EQ(ErrorManager::getDebugMessage("ERR_X"), "dbg");
}

TEST_F(ErrorManagerTest, LoadFileKeepsCatalogOnFailure) {
    TempDir tmp;
    fs::path bad = tmp.path / "errors.json";
    std::ofstream(bad) << "nope";

    std::string before = ErrorManager::getUserMessage("ERR_APP_NO_ARGUMENT");
    EXPECT_FALSE(ErrorManager::loadFile(bad.string()));
    EXPECT_FALSE(ErrorManager::loadFile((tmp.path / "missing.json").string()));
    EXPECT_EQ(ErrorManager::getUserMessage("ERR_APP_NO_ARGUMENT"), before);
}
