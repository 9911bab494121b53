#ifndef FLEXGRID_CORE_CONFIG_H
#define FLEXGRID_CORE_CONFIG_H

namespace flexgrid::core::config {

// A grid needs at least one column to place anything.
inline constexpr int kMinColumns = 1;
inline constexpr int kDefaultColumns = kMinColumns;
inline constexpr float kDefaultSpacing = 0.0f;
inline constexpr float kDefaultPadding = 0.0f;

// Slack for comparing accumulated float geometry.
inline constexpr float kLayoutTolerance = 1e-3f;

inline constexpr const char kDiagnosticModule[] = "grid";

}  // namespace flexgrid::core::config

#endif  // FLEXGRID_CORE_CONFIG_H
