#include <string>
#include <gtest/gtest.h>
#include <nlohmann/json.hpp>
#include "routing/tool_router.hpp"

namespace {

using nlohmann::json;
using toolwire::routing::AgentProfile;
using toolwire::routing::ArgumentStyle;
using toolwire::routing::ArgumentFallback;
using toolwire::routing::extract_filename;
using toolwire::routing::extract_path_context;
using toolwire::routing::extract_query;
using toolwire::routing::route;
using toolwire::routing::RoutingDecision;
using toolwire::routing::ToolVariant;
using toolwire::routing::TriggerRule;

AgentProfile debater() {
    AgentProfile profile;
    profile.name = "debater";
    profile.permitted_tools = {"web_search"};
    profile.rules = {TriggerRule{"web_search", ArgumentStyle::Query, {"search", "look up"}}};
    return profile;
}

AgentProfile coder() {
    AgentProfile profile;
    profile.name = "coder";
    profile.permitted_tools = {"file_system"};
    profile.rules = {TriggerRule{"file_system", ArgumentStyle::Path, {"read", "open", "file"}}};
    return profile;
}

TEST(ToolRouterTest, SearchTriggerExtractsQuery) {
    const RoutingDecision decision = route("search for rust ownership", debater());
    EXPECT_EQ(decision.agent, "debater");
    ASSERT_TRUE(decision.has_tool());
    EXPECT_EQ(decision.selection->tool, "web_search");
    EXPECT_EQ(decision.selection->arguments, (json{{"query", "rust ownership"}}));
    EXPECT_FALSE(decision.selection->missing_argument.has_value());
}

TEST(ToolRouterTest, FileTriggerExtractsFilename) {
    const RoutingDecision decision = route("please read main.py for me", coder());
    EXPECT_EQ(decision.agent, "coder");
    ASSERT_TRUE(decision.has_tool());
    EXPECT_EQ(decision.selection->tool, "file_system");
    EXPECT_EQ(decision.selection->arguments, (json{{"path", "main.py"}}));
}

TEST(ToolRouterTest, NoTriggerMeansNoTool) {
    const RoutingDecision decision = route("what do you think about free will", debater());
    EXPECT_EQ(decision.agent, "debater");
    EXPECT_FALSE(decision.has_tool());
}

TEST(ToolRouterTest, TriggerWithoutFilenameReportsMissingPath) {
    const RoutingDecision decision = route("Open the thing we talked about", coder());
    ASSERT_TRUE(decision.has_tool());
    EXPECT_EQ(decision.selection->missing_argument, std::optional<std::string>("path"));
    EXPECT_EQ(decision.selection->arguments, json::object());
}

TEST(ToolRouterTest, TriggerWithNothingLeftReportsMissingQuery) {
    const RoutingDecision decision = route("Search!", debater());
    ASSERT_TRUE(decision.has_tool());
    EXPECT_EQ(decision.selection->missing_argument, std::optional<std::string>("query"));
}

TEST(ToolRouterTest, MatchingIsCaseInsensitive) {
    const RoutingDecision decision = route("LOOK   UP Borrow Checker?", debater());
    ASSERT_TRUE(decision.has_tool());
    EXPECT_EQ(decision.selection->arguments["query"], "Borrow Checker");
}

TEST(ToolRouterTest, RoutingIsDeterministic) {
    const auto first = route("please read src/app/main.cpp now", coder());
    for (int i = 0; i < 10; ++i) {
        EXPECT_EQ(route("please read src/app/main.cpp now", coder()), first);
    }
    EXPECT_EQ(first.selection->arguments["path"], "src/app/main.cpp");
}

TEST(ToolRouterTest, RulesForToolsTheAgentLacksAreSkipped) {
    AgentProfile profile = coder();
    profile.rules.insert(profile.rules.begin(),
                         TriggerRule{"web_search", ArgumentStyle::Query, {"read"}});
    const RoutingDecision decision = route("read notes.md", profile);
    ASSERT_TRUE(decision.has_tool());
    EXPECT_EQ(decision.selection->tool, "file_system");
}

TEST(ToolRouterTest, EarlierRuleWins) {
    AgentProfile profile;
    profile.name = "both";
    profile.permitted_tools = {"file_system", "web_search"};
    profile.rules = {TriggerRule{"file_system", ArgumentStyle::Path, {"read"}},
                     TriggerRule{"web_search", ArgumentStyle::Query, {"search"}}};
    const RoutingDecision decision = route("search and read todo.txt", profile);
    ASSERT_TRUE(decision.has_tool());
    EXPECT_EQ(decision.selection->tool, "file_system");
}

TEST(ToolRouterTest, ArgumentlessRuleSelectsToolOnly) {
    AgentProfile profile;
    profile.name = "planner";
    profile.permitted_tools = {"clock"};
    profile.rules = {TriggerRule{"clock", ArgumentStyle::None, {"what time"}}};
    const RoutingDecision decision = route("What time is it?", profile);
    ASSERT_TRUE(decision.has_tool());
    EXPECT_EQ(decision.selection->arguments, json::object());
    EXPECT_FALSE(decision.selection->missing_argument.has_value());
}

TEST(ToolRouterTest, FilenameExtractionStripsPunctuation) {
    EXPECT_EQ(extract_filename("can you open \"config.yaml\"?"), std::optional<std::string>("config.yaml"));
    EXPECT_EQ(extract_filename("look at (notes.md), thanks"), std::optional<std::string>("notes.md"));
    EXPECT_EQ(extract_filename("read main.py."), std::optional<std::string>("main.py"));
}

TEST(ToolRouterTest, FilenameExtractionAcceptsDotfiles) {
    EXPECT_EQ(extract_filename("show .gitignore"), std::optional<std::string>(".gitignore"));
    EXPECT_EQ(extract_filename("open config/.env please"), std::optional<std::string>("config/.env"));
}

TEST(ToolRouterTest, FilenameExtractionRejectsNonFiles) {
    EXPECT_FALSE(extract_filename("version 2.0 is out").has_value());
    EXPECT_FALSE(extract_filename("see https://example.com/index.html").has_value());
    EXPECT_FALSE(extract_filename("end of sentence.").has_value());
    EXPECT_EQ(extract_filename("build log.txt2 now"), std::optional<std::string>("log.txt2"));
}

TEST(ToolRouterTest, QueryExtractionRemovesWholeKeywordsOnly) {
    EXPECT_EQ(extract_query("research about searching", {"search"}), "research about searching");
    EXPECT_EQ(extract_query("what is a monad? search it", {"what is", "search"}), "a monad? it");
    EXPECT_EQ(extract_query("look up on me quantum dots", {"look up"}), "quantum dots");
}

TEST(ToolRouterTest, PathContextComesFromTheMessage) {
    EXPECT_EQ(extract_path_context("read config.py in the src folder"), std::optional<std::string>("src"));
    EXPECT_EQ(extract_path_context("open utils.py from lib directory"), std::optional<std::string>("lib"));
    EXPECT_EQ(extract_path_context("show main.py in app/"), std::optional<std::string>("app"));
    EXPECT_EQ(extract_path_context("read tests/unit/test_a.py"), std::optional<std::string>("tests/unit"));
    EXPECT_EQ(extract_path_context("open setup.py inside the backend"), std::optional<std::string>("backend"));
    EXPECT_EQ(extract_path_context("read index.ts under web"), std::optional<std::string>("web"));
    EXPECT_FALSE(extract_path_context("read config.py in this folder").has_value());
    EXPECT_FALSE(extract_path_context("please read main.py for me").has_value());
}

TEST(ToolRouterTest, FileSelectionCarriesPathContext) {
    const RoutingDecision decision = route("read config.py in the src folder", coder());
    ASSERT_TRUE(decision.has_tool());
    EXPECT_EQ(decision.selection->arguments, (json{{"path", "config.py"}}));
    EXPECT_EQ(decision.selection->path_context, std::optional<std::string>("src"));
}

TEST(ToolRouterTest, VariantKeywordSwapsTheTool) {
    AgentProfile profile = debater();
    profile.permitted_tools = {"web_search", "definitions", "how_to"};
    profile.rules[0].keywords.push_back("define");
    profile.rules[0].variants = {ToolVariant{"definitions", {"define", "definition"}},
                                 ToolVariant{"how_to", {"how to"}}};

    const auto defined = route("define entropy", profile);
    ASSERT_TRUE(defined.has_tool());
    EXPECT_EQ(defined.selection->tool, "definitions");
    EXPECT_EQ(defined.selection->arguments, (json{{"query", "entropy"}}));

    const auto how_to = route("look up how to tie a tie", profile);
    ASSERT_TRUE(how_to.has_tool());
    EXPECT_EQ(how_to.selection->tool, "how_to");
    EXPECT_EQ(how_to.selection->arguments, (json{{"query", "how to tie a tie"}}));

    const auto plain = route("search for rust ownership", profile);
    EXPECT_EQ(plain.selection->tool, "web_search");

    // A variant the agent may not use is skipped.
    profile.permitted_tools = {"web_search"};
    EXPECT_EQ(route("define entropy", profile).selection->tool, "web_search");
}

TEST(ToolRouterTest, FallbackReplacesMissingPath) {
    AgentProfile profile = coder();
    profile.permitted_tools.push_back("listing");
    profile.rules[0].keywords.push_back("directory");
    profile.rules[0].fallback = ArgumentFallback{"listing", {"list", "directory"}, json{{"path", "."}}};

    const auto listed = route("show me the directory", profile);
    ASSERT_TRUE(listed.has_tool());
    EXPECT_EQ(listed.selection->tool, "listing");
    EXPECT_EQ(listed.selection->arguments, (json{{"path", "."}}));
    EXPECT_FALSE(listed.selection->missing_argument.has_value());

    // A filename still wins over the fallback.
    const auto read = route("open the directory notes.md", profile);
    EXPECT_EQ(read.selection->tool, "file_system");
    EXPECT_EQ(read.selection->arguments, (json{{"path", "notes.md"}}));

    // Without a fallback keyword the path is still missing.
    const auto missing = route("open the thing", profile);
    EXPECT_EQ(missing.selection->missing_argument, std::optional<std::string>("path"));
}

}  // namespace
