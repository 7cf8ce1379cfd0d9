/**
 * @file treemaprenderer.cpp
 * @brief Implementation of the cell-grid treemap renderer
 */

#include "treemaprenderer.hpp"

#include <algorithm>

#include <ftxui/screen/string.hpp>

#include "fnv1a.hpp"

namespace {

const std::vector<Rgb> DEPTH_PALETTE = {
    {70, 130, 180}, {60, 179, 113}, {218, 165, 32},  {205, 92, 92},
    {147, 112, 219}, {72, 209, 204}, {244, 164, 96}, {154, 205, 50}};

/**
 * @brief Splits a name into one string per terminal column
 *
 * Control characters become '?'. Full-width glyphs are followed by an
 * empty string for their second column, combining marks stay with the
 * glyph they modify (ftxui::Utf8ToGlyphs).
 */
std::vector<std::string> labelGlyphs(const std::string &name) {
  std::string printable = name;
  for (char &c : printable) {
    unsigned char byte = static_cast<unsigned char>(c);
    if (byte < 0x20 || byte == 0x7F)
      c = '?';
  }
  return ftxui::Utf8ToGlyphs(printable);
}

/**
 * @brief Keeps every row exactly frame.width columns wide
 *
 * A border or a later block may overwrite one half of a full-width
 * glyph. The orphaned continuation becomes a blank, a wide glyph without
 * its continuation becomes '?'.
 */
void repairWideGlyphs(TreemapFrame &frame) {
  for (int y = 0; y < frame.height; ++y) {
    for (int x = 0; x < frame.width; ++x) {
      FrameCell &cell = frame.at(x, y);
      if (cell.glyph.empty()) {
        cell.glyph = " ";
        continue;
      }
      if (ftxui::string_width(cell.glyph) < 2)
        continue;
      if (x + 1 < frame.width && frame.at(x + 1, y).glyph.empty()) {
        ++x;
        continue;
      }
      cell.glyph = "?";
    }
  }
}

/** @brief Rectangle clipped to the viewport, in frame coordinates */
Rect clipToFrame(const Rect &rect, const Rect &viewport) {
  int x0 = std::max(rect.x, viewport.x) - viewport.x;
  int y0 = std::max(rect.y, viewport.y) - viewport.y;
  int x1 = std::min(rect.x + rect.width, viewport.x + viewport.width) -
           viewport.x;
  int y1 = std::min(rect.y + rect.height, viewport.y + viewport.height) -
           viewport.y;
  return Rect{x0, y0, x1 - x0, y1 - y0};
}

void drawBorder(const Rect &r, Rgb colour, bool bold, TreemapFrame &frame) {
  int x1 = r.x + r.width;
  int y1 = r.y + r.height;

  for (int x = r.x; x < x1; ++x) {
    frame.at(x, r.y).glyph = "─";
    frame.at(x, y1 - 1).glyph = "─";
  }
  for (int y = r.y; y < y1; ++y) {
    frame.at(r.x, y).glyph = "│";
    frame.at(x1 - 1, y).glyph = "│";
  }
  frame.at(r.x, r.y).glyph = "┌";
  frame.at(x1 - 1, r.y).glyph = "┐";
  frame.at(r.x, y1 - 1).glyph = "└";
  frame.at(x1 - 1, y1 - 1).glyph = "┘";

  for (int y = r.y; y < y1; ++y) {
    for (int x = r.x; x < x1; ++x) {
      if (y == r.y || y == y1 - 1 || x == r.x || x == x1 - 1) {
        frame.at(x, y).foreground = colour;
        frame.at(x, y).bold = bold;
      }
    }
  }
}

/** @brief True for the glyphs drawBorder() writes and for blank cells */
bool isFrameGlyph(const std::string &glyph) {
  return glyph == " " || glyph == "─" || glyph == "│" || glyph == "┌" ||
         glyph == "┐" || glyph == "└" || glyph == "┘";
}

} // namespace

Rgb TreemapRenderer::darken(Rgb colour, double factor) {
  auto scale = [factor](uint8_t c) {
    double v = c * factor;
    return static_cast<uint8_t>(std::clamp(v, 0.0, 255.0));
  };
  return {scale(colour.r), scale(colour.g), scale(colour.b)};
}

Rgb TreemapRenderer::contrastText(Rgb background) {
  // ITU-R BT.601 luma
  int luma = (299 * background.r + 587 * background.g + 114 * background.b) /
             1000;
  return luma > 140 ? Rgb{0, 0, 0} : Rgb{255, 255, 255};
}

Rgb TreemapRenderer::colourFor(const NodeTree &tree, NodeId id) const {
  const TreeNode &node = tree.node(id);
  if (!node.accessible)
    return m_options.inaccessible;

  switch (m_options.color_mode) {
  case ColorMode::Depth:
    return DEPTH_PALETTE[static_cast<std::size_t>(node.depth) %
                         DEPTH_PALETTE.size()];

  case ColorMode::Kind:
    if (node.isDirectory())
      return {65, 105, 225}; // Blue: Directories
    if (node.size == 0)
      return {178, 34, 34}; // Red: 0-Byte Files
    return {200, 200, 200}; // Light grey: Normal

  case ColorMode::Path:
  default: {
    uint64_t h = FNV1A::hash(node.path);
    // Keep every channel in a mid range so borders and labels stay readable
    auto channel = [h](int shift) {
      return static_cast<uint8_t>(60 + ((h >> shift) & 0xFF) * 170 / 255);
    };
    return {channel(0), channel(16), channel(32)};
  }
  }
}

TreemapFrame TreemapRenderer::render(const NodeTree &tree,
                                     const LayoutResult &layout,
                                     NodeId selection) const {
  const Rect &viewport = layout.viewport;
  TreemapFrame frame(viewport.width, viewport.height);
  if (frame.cells.empty() || tree.empty())
    return frame;

  for (NodeId id : layout.blocks) {
    const Rect &rect = layout.rects[id];
    if (rect.empty())
      continue;
    paintBlock(tree, id, rect, viewport, frame);
  }

  // The selection is outlined on top, so an expanded directory frames the
  // blocks of its children
  if (tree.isShown(selection))
    paintSelection(layout.rectOf(selection), viewport, frame);

  repairWideGlyphs(frame);
  return frame;
}

void TreemapRenderer::paintSelection(const Rect &rect, const Rect &viewport,
                                     TreemapFrame &frame) const {
  Rect r = clipToFrame(rect, viewport);
  if (r.empty())
    return;

  for (int y = r.y; y < r.y + r.height; ++y) {
    for (int x = r.x; x < r.x + r.width; ++x) {
      frame.at(x, y).selected = true;
    }
  }

  if (r.width < 2 || r.height < 2) {
    for (int y = r.y; y < r.y + r.height; ++y) {
      for (int x = r.x; x < r.x + r.width; ++x) {
        frame.at(x, y).inverted = true;
      }
    }
    return;
  }

  // Labels on the top edge survive the outline, they are only recoloured
  std::vector<std::string> top;
  for (int x = r.x; x < r.x + r.width; ++x)
    top.push_back(frame.at(x, r.y).glyph);

  drawBorder(r, m_options.highlight, true, frame);

  for (int x = r.x + 1; x < r.x + r.width - 1; ++x) {
    const std::string &glyph = top[static_cast<std::size_t>(x - r.x)];
    if (!isFrameGlyph(glyph))
      frame.at(x, r.y).glyph = glyph;
  }
}

void TreemapRenderer::paintBlock(const NodeTree &tree, NodeId id,
                                 const Rect &rect, const Rect &viewport,
                                 TreemapFrame &frame) const {
  Rect r = clipToFrame(rect, viewport);
  if (r.empty())
    return;

  int x0 = r.x;
  int y0 = r.y;
  int x1 = r.x + r.width;
  int y1 = r.y + r.height;

  Rgb fill = colourFor(tree, id);
  Rgb text_colour = contrastText(fill);
  bool has_border = r.width >= 2 && r.height >= 2;

  for (int y = y0; y < y1; ++y) {
    for (int x = x0; x < x1; ++x) {
      FrameCell &cell = frame.at(x, y);
      cell = FrameCell{};
      cell.background = fill;
      cell.foreground = text_colour;
      cell.node = id;
    }
  }

  if (has_border)
    drawBorder(r, darken(fill, 0.55), false, frame);

  // Name on the top edge, between the corners when there is a border
  int label_x = has_border ? x0 + 1 : x0;
  int label_end = has_border ? x1 - 1 : x1;
  if (label_end - label_x < 1)
    return;

  std::vector<std::string> glyphs = labelGlyphs(tree.node(id).name);
  for (std::size_t i = 0;
       i < glyphs.size() && label_x + static_cast<int>(i) < label_end; ++i) {
    // A full-width glyph needs its continuation cell inside the label
    bool wide = i + 1 < glyphs.size() && glyphs[i + 1].empty();
    if (wide && label_x + static_cast<int>(i) + 1 >= label_end)
      break;
    FrameCell &cell = frame.at(label_x + static_cast<int>(i), y0);
    cell.glyph = glyphs[i];
    cell.foreground = text_colour;
  }
}
