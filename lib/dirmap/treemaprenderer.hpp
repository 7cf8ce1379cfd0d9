/**
 * @file treemaprenderer.hpp
 * @brief Converts a treemap layout into a grid of coloured cells
 *
 * The renderer is independent of any UI library: it produces a
 * TreemapFrame that a front-end paints cell by cell. Rendering never
 * modifies the tree.
 *
 * @see TreemapLayout
 * @see TreemapUI
 */

#ifndef DIRMAP_TREEMAPRENDERER_HPP
#define DIRMAP_TREEMAPRENDERER_HPP

#include <cstdint>
#include <string>
#include <vector>

#include "nodetree.hpp"
#include "treemaplayout.hpp"

struct Rgb {
  uint8_t r = 0;
  uint8_t g = 0;
  uint8_t b = 0;

  bool operator==(const Rgb &other) const {
    return r == other.r && g == other.g && b == other.b;
  }
  bool operator!=(const Rgb &other) const { return !(*this == other); }
};

/**
 * @enum ColorMode
 * @brief How block fill colours are chosen
 *
 * - Path: stable colour from the FNV-1a hash of the node path
 * - Depth: palette entry by tree depth
 * - Kind: directories blue, files light grey, zero-byte files red
 */
enum class ColorMode { Path, Depth, Kind };

/**
 * @struct FrameCell
 * @brief One terminal cell of a rendered treemap
 */
struct FrameCell {
  /**
   * @brief UTF-8 text of one column
   *
   * A full-width glyph occupies its cell and the next one; that second
   * cell holds an empty string.
   */
  std::string glyph = " ";
  Rgb foreground{255, 255, 255};
  Rgb background{0, 0, 0};

  /** @brief Block painted into this cell, kNoNode for uncovered cells */
  NodeId node = kNoNode;

  bool selected = false;
  bool bold = false;
  bool inverted = false;
};

/**
 * @struct TreemapFrame
 * @brief Row-major grid of cells covering the layout viewport
 */
struct TreemapFrame {
  int width = 0;
  int height = 0;
  std::vector<FrameCell> cells;

  TreemapFrame() = default;
  TreemapFrame(int w, int h)
      : width(w), height(h),
        cells(static_cast<std::size_t>(w > 0 && h > 0 ? w * h : 0)) {}

  FrameCell &at(int x, int y) {
    return cells.at(static_cast<std::size_t>(y * width + x));
  }
  const FrameCell &at(int x, int y) const {
    return cells.at(static_cast<std::size_t>(y * width + x));
  }
};

struct RendererOptions {
  ColorMode color_mode = ColorMode::Path;

  /** @brief Border colour of the selected block */
  Rgb highlight{255, 255, 255};

  /** @brief Fill colour of blocks the scanner could not read */
  Rgb inaccessible{90, 90, 90};
};

/**
 * @class TreemapRenderer
 * @brief Paints displayed blocks into a TreemapFrame
 *
 * Each block is filled with its colour. Blocks of at least 2x2 cells get a
 * box-drawing border in a darker shade of the fill and the node name on
 * the top edge. The selected node is outlined last in the highlight
 * colour, whether it is a block or an expanded directory; selections too
 * thin for a border are drawn inverted.
 */
class TreemapRenderer {
private:
  RendererOptions m_options;

  void paintBlock(const NodeTree &tree, NodeId id, const Rect &rect,
                  const Rect &viewport, TreemapFrame &frame) const;

  void paintSelection(const Rect &rect, const Rect &viewport,
                      TreemapFrame &frame) const;

public:
  explicit TreemapRenderer(RendererOptions options = {})
      : m_options(options) {}

  /**
   * @brief Renders the displayed blocks of a layout
   *
   * @param tree Tree the layout was computed from
   * @param layout Result of TreemapLayout::compute()
   * @param selection Selected node or kNoNode
   *
   * @return TreemapFrame Frame with the viewport's size; cell (0, 0) is the
   *         viewport's top-left corner
   */
  TreemapFrame render(const NodeTree &tree, const LayoutResult &layout,
                      NodeId selection) const;

  /**
   * @brief Fill colour of a node under the configured colour mode
   */
  Rgb colourFor(const NodeTree &tree, NodeId id) const;

  const RendererOptions &options() const { return m_options; }

  /** @brief Scales every channel by factor (0..1) */
  static Rgb darken(Rgb colour, double factor);

  /** @brief Black or white, whichever reads better on the background */
  static Rgb contrastText(Rgb background);
};

#endif // DIRMAP_TREEMAPRENDERER_HPP
