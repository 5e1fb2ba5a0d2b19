#include "Layout.hpp"
#include "PrecessionException.hpp"
#include "TestHeaders.hpp"

using namespace precession;
using Catch::Matchers::ContainsSubstring;

TEST_CASE("Layouts survive a trip through their tmux names", "[Layout]") {
  for (auto layout : {Layout::Tiled, Layout::EvenHorizontal,
                      Layout::EvenVertical, Layout::MainHorizontal,
                      Layout::MainVertical}) {
    INFO("Checking layout " << layoutToString(layout));
    REQUIRE(layoutFromString(layoutToString(layout)) == layout);
  }
}

TEST_CASE("Layouts use the tmux spelling", "[Layout]") {
  REQUIRE(layoutToString(Layout::Tiled) == "tiled");
  REQUIRE(layoutToString(Layout::EvenHorizontal) == "even-horizontal");
  REQUIRE(layoutToString(Layout::EvenVertical) == "even-vertical");
  REQUIRE(layoutToString(Layout::MainHorizontal) == "main-horizontal");
  REQUIRE(layoutToString(Layout::MainVertical) == "main-vertical");
}

TEST_CASE("main-vertical is not confused with main-horizontal", "[Layout]") {
  REQUIRE(layoutFromString("main-vertical") == Layout::MainVertical);
  REQUIRE(layoutFromString("main-horizontal") == Layout::MainHorizontal);
}

TEST_CASE("Unknown layouts are rejected", "[Layout]") {
  REQUIRE_THROWS_AS(layoutFromString("diagonal"), MalformedDefinition);
  REQUIRE_THROWS_WITH(layoutFromString("diagonal"),
                      ContainsSubstring("diagonal") &&
                          ContainsSubstring("main-vertical"));
  // Names are case sensitive, as in tmux
  REQUIRE_THROWS_AS(layoutFromString("Tiled"), MalformedDefinition);
  REQUIRE_THROWS_AS(layoutFromString(""), MalformedDefinition);
}
