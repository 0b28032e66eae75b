#pragma once

namespace woodshed {

/**
 * @brief Identifier for a user marker within the loaded track
 *
 * Allocated from a counter held in AppState, so two markers never share an id
 * during a session even after deletions.
 */
using MarkerId = int;

constexpr MarkerId INVALID_MARKER_ID = -1;

}  // namespace woodshed
