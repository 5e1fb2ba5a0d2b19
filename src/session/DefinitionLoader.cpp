#include "DefinitionLoader.hpp"

#include <yaml-cpp/yaml.h>

#include "PrecessionException.hpp"

namespace precession {
namespace {

bool isPresent(const YAML::Node& node) {
  return node.IsDefined() && !node.IsNull();
}

optional<string> optionalScalar(const YAML::Node& parent, const string& key,
                                const string& context) {
  const YAML::Node node = parent[key];
  if (!isPresent(node)) {
    return std::nullopt;
  }
  if (!node.IsScalar()) {
    throw MalformedDefinition(context + "'" + key + "' must be a string");
  }
  return node.as<string>();
}

PaneDefinition parsePane(const YAML::Node& node, const string& context) {
  PaneDefinition pane;
  if (!isPresent(node)) {
    return pane;
  }
  if (!node.IsScalar()) {
    throw MalformedDefinition(context + "a pane must be a command string");
  }
  string command = node.as<string>();
  if (!command.empty()) {
    pane.command = command;
  }
  return pane;
}

WindowDefinition parseWindow(const YAML::Node& node, int index,
                             Layout defaultLayout) {
  const string context = "window " + to_string(index + 1) + ": ";
  if (!node.IsMap()) {
    throw MalformedDefinition(context + "a window must be a mapping");
  }

  WindowDefinition window;
  window.name = optionalScalar(node, "name", context);
  window.root = optionalScalar(node, "root", context);
  window.cmd = optionalScalar(node, "cmd", context);
  if (window.cmd && window.cmd->empty()) {
    window.cmd = std::nullopt;
  }

  auto layout = optionalScalar(node, "layout", context);
  window.layout = layout ? layoutFromString(*layout) : defaultLayout;

  const YAML::Node panes = node["panes"];
  if (isPresent(panes)) {
    if (!panes.IsSequence()) {
      throw MalformedDefinition(context + "'panes' must be a list");
    }
    // An empty list leaves the window with its single idle pane
    if (panes.size() > 0) {
      window.panes = vector<PaneDefinition>();
      for (const auto& pane : panes) {
        window.panes->push_back(parsePane(pane, context));
      }
    }
  }

  if (window.cmd && window.panes) {
    throw MalformedDefinition(
        context + "'cmd' and 'panes' cannot both be set, move the command "
                  "into the first pane (an empty 'panes' list counts as "
                  "unset)");
  }
  return window;
}

}  // namespace

void validateSessionName(const string& name) {
  if (name.empty()) {
    throw MalformedDefinition("the session name must not be empty");
  }
  if (name.find_first_of(".:") != string::npos) {
    throw MalformedDefinition("session name '" + name +
                              "' must not contain '.' or ':'");
  }
}

void applySessionAlias(SessionDefinition* session, const string& alias) {
  validateSessionName(alias);
  LOG(INFO) << "Starting " << session->name << " as " << alias;
  session->name = alias;
}

SessionDefinition parseSessionDefinition(const string& text,
                                         Layout defaultLayout) {
  YAML::Node root;
  try {
    root = YAML::Load(text);
  } catch (const YAML::Exception& e) {
    throw MalformedDefinition(e.what());
  }

  if (!root.IsMap()) {
    throw MalformedDefinition("the document must be a mapping with a 'name'");
  }

  SessionDefinition session;
  auto name = optionalScalar(root, "name", "");
  if (!name || name->empty()) {
    throw MalformedDefinition("'name' is required");
  }
  validateSessionName(*name);
  session.name = *name;
  session.root = optionalScalar(root, "root", "");

  const YAML::Node windows = root["windows"];
  if (isPresent(windows)) {
    if (!windows.IsSequence()) {
      throw MalformedDefinition("'windows' must be a list");
    }
    int index = 0;
    for (const auto& window : windows) {
      session.windows.push_back(parseWindow(window, index++, defaultLayout));
    }
  }

  VLOG(1) << "Parsed session " << session.name << " with "
          << session.windows.size() << " windows";
  return session;
}

SessionDefinition loadSessionDefinition(const string& path,
                                        Layout defaultLayout) {
  std::ifstream input(path);
  if (!input.is_open()) {
    throw DefinitionNotFound(path + ": " + strerror(errno));
  }
  std::stringstream buffer;
  buffer << input.rdbuf();
  if (input.bad()) {
    throw DefinitionNotFound(path + ": read error");
  }
  LOG(INFO) << "Loading session definition from " << path;
  try {
    return parseSessionDefinition(buffer.str(), defaultLayout);
  } catch (const MalformedDefinition& md) {
    throw MalformedDefinition(path + ": " + md.detail());
  }
}

}  // namespace precession
