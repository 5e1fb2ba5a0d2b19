#include "DefinitionLoader.hpp"
#include "PrecessionException.hpp"
#include "TestHeaders.hpp"

using namespace precession;
using Catch::Matchers::ContainsSubstring;

TEST_CASE("Parses a full session definition", "[DefinitionLoader]") {
  auto session = parseSessionDefinition(
      "name: dev\n"
      "root: ~/code/dev\n"
      "windows:\n"
      "  - name: edit\n"
      "    root: /srv/edit\n"
      "    cmd: vim\n"
      "  - name: run\n"
      "    layout: main-vertical\n"
      "    panes:\n"
      "      - npm start\n"
      "      -\n"
      "      - npm test\n");

  REQUIRE(session.name == "dev");
  REQUIRE(session.root == optional<string>("~/code/dev"));
  REQUIRE(session.windows.size() == 2);

  const auto& edit = session.windows[0];
  REQUIRE(edit.name == optional<string>("edit"));
  REQUIRE(edit.root == optional<string>("/srv/edit"));
  REQUIRE(edit.cmd == optional<string>("vim"));
  REQUIRE(edit.layout == Layout::EvenHorizontal);
  REQUIRE_FALSE(edit.panes.has_value());

  const auto& run = session.windows[1];
  REQUIRE(run.layout == Layout::MainVertical);
  REQUIRE_FALSE(run.cmd.has_value());
  REQUIRE(run.panes.has_value());
  REQUIRE(run.panes->size() == 3);
  REQUIRE((*run.panes)[0].command == optional<string>("npm start"));
  REQUIRE_FALSE((*run.panes)[1].command.has_value());
  REQUIRE((*run.panes)[2].command == optional<string>("npm test"));
}

TEST_CASE("Missing optional fields get defaults", "[DefinitionLoader]") {
  SECTION("No windows") {
    auto session = parseSessionDefinition("name: empty\n");
    REQUIRE(session.name == "empty");
    REQUIRE_FALSE(session.root.has_value());
    REQUIRE(session.windows.empty());
  }

  SECTION("Null windows") {
    auto session = parseSessionDefinition("name: empty\nwindows:\n");
    REQUIRE(session.windows.empty());
  }

  SECTION("Bare window") {
    auto session = parseSessionDefinition("name: s\nwindows:\n  - {}\n");
    REQUIRE(session.windows.size() == 1);
    REQUIRE_FALSE(session.windows[0].name.has_value());
    REQUIRE_FALSE(session.windows[0].cmd.has_value());
    REQUIRE_FALSE(session.windows[0].panes.has_value());
    REQUIRE(session.windows[0].layout == DEFAULT_LAYOUT);
  }

  SECTION("Configured default layout") {
    auto session = parseSessionDefinition(
        "name: s\nwindows:\n  - name: a\n  - name: b\n    layout: tiled\n",
        Layout::EvenVertical);
    REQUIRE(session.windows[0].layout == Layout::EvenVertical);
    REQUIRE(session.windows[1].layout == Layout::Tiled);
  }
}

TEST_CASE("Empty pane strings leave the pane idle", "[DefinitionLoader]") {
  auto session = parseSessionDefinition(
      "name: s\nwindows:\n  - panes:\n      - ''\n      - ~\n      - top\n");
  const auto& panes = *session.windows[0].panes;
  REQUIRE(panes.size() == 3);
  REQUIRE_FALSE(panes[0].command.has_value());
  REQUIRE_FALSE(panes[1].command.has_value());
  REQUIRE(panes[2].command == optional<string>("top"));
}

TEST_CASE("Empty cmd and panes count as unset", "[DefinitionLoader]") {
  SECTION("Empty cmd") {
    auto session = parseSessionDefinition(
        "name: s\nwindows:\n  - cmd: ''\n  - cmd: ~\n");
    REQUIRE_FALSE(session.windows[0].cmd.has_value());
    REQUIRE_FALSE(session.windows[1].cmd.has_value());
  }

  SECTION("Empty panes") {
    auto session =
        parseSessionDefinition("name: s\nwindows:\n  - panes: []\n");
    REQUIRE_FALSE(session.windows[0].panes.has_value());
  }

  SECTION("cmd with empty panes") {
    auto session = parseSessionDefinition(
        "name: s\nwindows:\n  - cmd: vim\n    panes: []\n");
    REQUIRE(session.windows[0].cmd == optional<string>("vim"));
    REQUIRE_FALSE(session.windows[0].panes.has_value());
  }

  SECTION("Empty cmd with panes") {
    auto session = parseSessionDefinition(
        "name: s\nwindows:\n  - cmd: ''\n    panes:\n      - top\n");
    REQUIRE_FALSE(session.windows[0].cmd.has_value());
    REQUIRE(session.windows[0].panes->size() == 1);
  }
}

TEST_CASE("Session names tmux would rewrite are rejected",
          "[DefinitionLoader]") {
  SECTION("Dot in the name") {
    REQUIRE_THROWS_AS(parseSessionDefinition("name: my.app\n"),
                      MalformedDefinition);
    REQUIRE_THROWS_WITH(parseSessionDefinition("name: my.app\n"),
                        ContainsSubstring("my.app") &&
                            ContainsSubstring("'.' or ':'"));
  }

  SECTION("Colon in the name") {
    REQUIRE_THROWS_AS(parseSessionDefinition("name: 'dev:1'\n"),
                      MalformedDefinition);
  }

  SECTION("Other punctuation is kept") {
    REQUIRE(parseSessionDefinition("name: my-app_2\n").name == "my-app_2");
  }
}

TEST_CASE("Aliases rename the session", "[DefinitionLoader]") {
  auto session = parseSessionDefinition("name: dev\n");

  SECTION("Valid alias") {
    applySessionAlias(&session, "dev-2");
    REQUIRE(session.name == "dev-2");
  }

  SECTION("Dot in the alias") {
    REQUIRE_THROWS_WITH(applySessionAlias(&session, "dev.2"),
                        ContainsSubstring("'.' or ':'"));
    REQUIRE(session.name == "dev");
  }

  SECTION("Colon in the alias") {
    REQUIRE_THROWS_AS(applySessionAlias(&session, "dev:2"),
                      MalformedDefinition);
    REQUIRE(session.name == "dev");
  }

  SECTION("Empty alias") {
    REQUIRE_THROWS_AS(applySessionAlias(&session, ""), MalformedDefinition);
  }
}

TEST_CASE("Unknown keys are ignored", "[DefinitionLoader]") {
  auto session = parseSessionDefinition(
      "name: s\nstartup: later\nwindows:\n  - name: a\n    color: red\n");
  REQUIRE(session.windows.size() == 1);
}

TEST_CASE("Rejects malformed definitions", "[DefinitionLoader]") {
  SECTION("Unknown layout") {
    REQUIRE_THROWS_WITH(
        parseSessionDefinition(
            "name: s\nwindows:\n  - name: a\n    layout: diagonal\n"),
        ContainsSubstring("window 1") && ContainsSubstring("diagonal"));
  }

  SECTION("Missing name") {
    REQUIRE_THROWS_AS(parseSessionDefinition("root: /tmp\n"),
                      MalformedDefinition);
  }

  SECTION("Empty name") {
    REQUIRE_THROWS_AS(parseSessionDefinition("name: ''\n"),
                      MalformedDefinition);
  }

  SECTION("Name is not a string") {
    REQUIRE_THROWS_AS(parseSessionDefinition("name: [a, b]\n"),
                      MalformedDefinition);
  }

  SECTION("Document is not a mapping") {
    REQUIRE_THROWS_AS(parseSessionDefinition("- dev\n"), MalformedDefinition);
    REQUIRE_THROWS_AS(parseSessionDefinition(""), MalformedDefinition);
  }

  SECTION("Invalid YAML") {
    REQUIRE_THROWS_AS(parseSessionDefinition("name: [unterminated\n"),
                      MalformedDefinition);
  }

  SECTION("Windows is not a list") {
    REQUIRE_THROWS_WITH(parseSessionDefinition("name: s\nwindows: edit\n"),
                        ContainsSubstring("'windows' must be a list"));
  }

  SECTION("Window is not a mapping") {
    REQUIRE_THROWS_AS(parseSessionDefinition("name: s\nwindows:\n  - edit\n"),
                      MalformedDefinition);
  }

  SECTION("Panes is not a list") {
    REQUIRE_THROWS_AS(
        parseSessionDefinition("name: s\nwindows:\n  - panes: top\n"),
        MalformedDefinition);
  }

  SECTION("Pane is not a command") {
    REQUIRE_THROWS_AS(
        parseSessionDefinition(
            "name: s\nwindows:\n  - panes:\n      - cmd: top\n"),
        MalformedDefinition);
  }

  SECTION("Window with both cmd and panes") {
    REQUIRE_THROWS_WITH(
        parseSessionDefinition("name: s\n"
                               "windows:\n"
                               "  - name: a\n"
                               "    cmd: vim\n"
                               "    panes:\n"
                               "      - top\n"),
        ContainsSubstring("'cmd' and 'panes'") &&
            ContainsSubstring("empty 'panes' list counts as unset"));
  }
}

TEST_CASE("Loads definitions from disk", "[DefinitionLoader]") {
  string tmpPath = GetTempDirectory() + string("precession_test_XXXXXXXX");
  const string dir = string(mkdtemp(&tmpPath[0]));
  const string path = dir + "/dev.yaml";

  SECTION("Existing file") {
    {
      std::ofstream out(path);
      out << "name: dev\nwindows:\n  - name: edit\n";
    }
    auto session = loadSessionDefinition(path);
    REQUIRE(session.name == "dev");
    REQUIRE(session.windows.size() == 1);
  }

  SECTION("Malformed file names the path") {
    {
      std::ofstream out(path);
      out << "windows: []\n";
    }
    REQUIRE_THROWS_WITH(loadSessionDefinition(path),
                        ContainsSubstring(path) &&
                            ContainsSubstring("'name' is required"));
  }

  SECTION("Missing file") {
    REQUIRE_THROWS_AS(loadSessionDefinition(dir + "/missing.yaml"),
                      DefinitionNotFound);
    REQUIRE_THROWS_WITH(loadSessionDefinition(dir + "/missing.yaml"),
                        ContainsSubstring("missing.yaml"));
  }

  fs::remove_all(dir);
}
