#ifndef __PRECESSION_DEFINITION_LOADER__
#define __PRECESSION_DEFINITION_LOADER__

#include "Definition.hpp"
#include "Headers.hpp"

namespace precession {

/**
 * @brief Decodes a YAML session definition.
 *
 * Absent `layout` fields get `defaultLayout`, absent `windows` an empty list.
 * Unknown keys are ignored.
 *
 * An empty `cmd` and an empty `panes` list are treated as absent.
 *
 * @throws MalformedDefinition when the text is not valid YAML, is not shaped
 * as session -> windows -> panes, lacks a valid session name, names an
 * unknown layout, or has a window with both `cmd` and `panes`.
 */
SessionDefinition parseSessionDefinition(const string& text,
                                         Layout defaultLayout = DEFAULT_LAYOUT);

/**
 * @brief Reads and decodes the definition stored at `path`.
 *
 * @throws DefinitionNotFound when the file cannot be opened or read.
 * @throws MalformedDefinition as parseSessionDefinition.
 */
SessionDefinition loadSessionDefinition(const string& path,
                                        Layout defaultLayout = DEFAULT_LAYOUT);

/**
 * @brief Checks that tmux would create a session under exactly `name`.
 *
 * tmux rewrites `.` and `:` in session names to `_`, after which the name no
 * longer addresses the session.
 *
 * @throws MalformedDefinition when `name` is empty or contains `.` or `:`.
 */
void validateSessionName(const string& name);

/**
 * @brief Renames `session` so it is started as `alias`.
 *
 * @throws MalformedDefinition when `alias` is not a valid session name; the
 * session is left unchanged.
 */
void applySessionAlias(SessionDefinition* session, const string& alias);

}  // namespace precession
#endif  // __PRECESSION_DEFINITION_LOADER__
