#pragma once

// ============================================================================
// ToolType - Annotation tools available on the canvas
// ============================================================================

/**
 * @brief Tools selectable while labeling.
 *
 * The three shape tools create annotations; Select hit-tests existing
 * annotations so they can be deleted.
 */
enum class ToolType {
    Rectangle,  ///< Drag a box; stored as normalized corners
    Line,       ///< Drag a straight segment
    Freehand,   ///< Open polyline through every sampled pointer position
    Select      ///< Hover/click to pick an existing annotation
};
