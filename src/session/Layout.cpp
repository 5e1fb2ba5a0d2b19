#include "Layout.hpp"

#include "PrecessionException.hpp"

namespace precession {
namespace {
const vector<pair<Layout, string>> LAYOUT_NAMES = {
    {Layout::Tiled, "tiled"},
    {Layout::EvenHorizontal, "even-horizontal"},
    {Layout::EvenVertical, "even-vertical"},
    {Layout::MainHorizontal, "main-horizontal"},
    {Layout::MainVertical, "main-vertical"},
};
}  // namespace

string layoutToString(Layout layout) {
  for (const auto& it : LAYOUT_NAMES) {
    if (it.first == layout) {
      return it.second;
    }
  }
  throw std::logic_error("Unhandled layout value");
}

Layout layoutFromString(const string& name) {
  for (const auto& it : LAYOUT_NAMES) {
    if (it.second == name) {
      return it.first;
    }
  }
  vector<string> valid;
  for (const auto& it : LAYOUT_NAMES) {
    valid.push_back(it.second);
  }
  throw MalformedDefinition("Unknown layout '" + name +
                            "', expected one of: " + join(valid, ", "));
}

}  // namespace precession
