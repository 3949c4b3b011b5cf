// SPDX-FileCopyrightText: 2026 Samer Ali
// SPDX-License-Identifier: GPL-3.0-only

#pragma once

namespace Reader::Constants {

inline constexpr char APPLICATION_NAME[] = "MarkdownReader";
inline constexpr char APPLICATION_DISPLAY_NAME[] = "Markdown Reader";
inline constexpr char ORGANIZATION_NAME[] = "MarkdownReader";
inline constexpr char APPLICATION_VERSION[] = "1.0.0";

inline constexpr char MAIN_WINDOW_OBJECT_NAME[] = "MdReaderMainWindow";
inline constexpr char PREVIEW_OBJECT_NAME[] = "MdReaderPreview";

inline constexpr int WINDOW_STATE_SAVE_DELAY_MS = 500;
inline constexpr int SYSTEM_THEME_CACHE_MS = 2000;

// The tree pane never grows past this fraction of the splitter.
inline constexpr int TREE_MAX_WIDTH_DIVISOR = 3;

} // namespace Reader::Constants
