/**
 * @file test_viewsession.cpp
 * @brief Unit tests for the ViewSession interaction handler
 *
 * ## Test Coverage
 *
 * ### Selection
 * - Click hit and miss, Tab cycling, commands without selection
 *
 * ### Visual weight
 * - Grow/shrink change only the display weight, never the size
 * - Shrink stops at the minimum weight, weights persist across collapse
 *
 * ### Expand / collapse
 * - Expand one level, expand path, expand subtree
 * - Collapse (recursive), collapse parent, collapse all
 *
 * ### Status text
 *
 * @see ViewSession
 */

#include <gtest/gtest.h>
#include "viewsession.hpp"
#include "treemaprenderer.hpp"

#include <set>

/**
 * @class ViewSessionTest
 * @brief Fixture tree
 *
 * /project
 * ├── sub/
 * │   ├── b.txt   (300 bytes)
 * │   └── deep/
 * │       └── c.txt (50 bytes)
 * ├── empty/
 * └── a.txt       (100 bytes)
 */
class ViewSessionTest : public ::testing::Test {
protected:
    NodeTree tree;
    NodeId sub = kNoNode;
    NodeId b = kNoNode;
    NodeId deep = kNoNode;
    NodeId c = kNoNode;
    NodeId empty = kNoNode;
    NodeId a = kNoNode;

    TreemapLayout layout_engine;
    Rect viewport{0, 0, 90, 30};

    void SetUp() override {
        tree.addRoot("/project", NodeKind::Directory);
        sub = tree.addChild(0, "sub", "/project/sub", NodeKind::Directory);
        b = tree.addChild(sub, "b.txt", "/project/sub/b.txt", NodeKind::File, 300);
        deep = tree.addChild(sub, "deep", "/project/sub/deep", NodeKind::Directory);
        c = tree.addChild(deep, "c.txt", "/project/sub/deep/c.txt", NodeKind::File, 50);
        empty = tree.addChild(0, "empty", "/project/empty", NodeKind::Directory);
        a = tree.addChild(0, "a.txt", "/project/a.txt", NodeKind::File, 100);
        tree.computeDirectorySizes();
    }

    std::set<NodeId> blocks() const {
        std::vector<NodeId> list = tree.displayedBlocks();
        return std::set<NodeId>(list.begin(), list.end());
    }
};

TEST_F(ViewSessionTest, CommandsWithoutSelectionAreNoOps) {
    ViewSession session(tree);
    std::set<NodeId> before = blocks();

    EXPECT_FALSE(session.hasSelection());
    EXPECT_FALSE(session.growSelected());
    EXPECT_FALSE(session.shrinkSelected());
    EXPECT_FALSE(session.resetWeightSelected());
    EXPECT_FALSE(session.expandSelected());
    EXPECT_FALSE(session.expandPathToSelected());
    EXPECT_FALSE(session.expandSubtreeSelected());
    EXPECT_FALSE(session.collapseSelected());
    EXPECT_FALSE(session.collapseParentOfSelected());
    EXPECT_EQ(session.statusText(), "No selection");

    EXPECT_EQ(blocks(), before);
    for (NodeId id = 0; id < tree.size(); ++id)
        EXPECT_FALSE(tree.node(id).visual_weight.has_value());
}

TEST_F(ViewSessionTest, ClickSelectsBlock) {
    ViewSession session(tree);
    LayoutResult layout = layout_engine.compute(tree, viewport);

    Rect ra = layout.rects[a];
    EXPECT_TRUE(session.click(layout, ra.x, ra.y));
    EXPECT_EQ(session.selected(), a);

    // Same block again: no change
    EXPECT_FALSE(session.click(layout, ra.x, ra.y));

    EXPECT_FALSE(session.click(layout, 500, 500));
    EXPECT_EQ(session.selected(), a);
}

TEST_F(ViewSessionTest, TabCyclesThroughBlocks) {
    ViewSession session(tree);

    EXPECT_TRUE(session.selectNext());
    EXPECT_EQ(session.selected(), sub);
    EXPECT_TRUE(session.selectNext());
    EXPECT_EQ(session.selected(), empty);
    EXPECT_TRUE(session.selectNext());
    EXPECT_EQ(session.selected(), a);
    EXPECT_TRUE(session.selectNext());
    EXPECT_EQ(session.selected(), sub);

    EXPECT_TRUE(session.selectPrevious());
    EXPECT_EQ(session.selected(), a);

    session.clearSelection();
    EXPECT_TRUE(session.selectPrevious());
    EXPECT_EQ(session.selected(), a);
}

TEST_F(ViewSessionTest, SelectRejectsInvalidId) {
    ViewSession session(tree);
    EXPECT_FALSE(session.select(kNoNode));
    EXPECT_FALSE(session.select(999));
    EXPECT_TRUE(session.select(c));
    EXPECT_FALSE(session.select(c));
}

/**
 * @test GrowChangesWeightNotSize
 * @brief Up arrow enlarges a.txt on screen; the byte counts stay put
 */
TEST(ViewSessionProjectTest, GrowChangesWeightNotSize) {
    NodeTree tree;
    tree.addRoot("/project", NodeKind::Directory);
    NodeId sub = tree.addChild(0, "sub", "/project/sub", NodeKind::Directory);
    NodeId b = tree.addChild(sub, "b.txt", "/project/sub/b.txt", NodeKind::File, 300);
    NodeId a = tree.addChild(0, "a.txt", "/project/a.txt", NodeKind::File, 100);
    tree.computeDirectorySizes();

    TreemapLayout layout_engine;
    Rect viewport{0, 0, 100, 40};
    LayoutResult before = layout_engine.compute(tree, viewport);
    EXPECT_EQ(before.rects[sub].area(), 3 * before.rects[a].area());

    ViewSession session(tree);
    ASSERT_TRUE(session.select(a));
    EXPECT_TRUE(session.growSelected());

    EXPECT_EQ(tree.node(a).size, 100u);
    EXPECT_EQ(tree.node(b).size, 300u);
    EXPECT_EQ(tree.node(sub).size, 300u);
    EXPECT_EQ(tree.node(0).size, 400u);
    EXPECT_DOUBLE_EQ(*tree.node(a).visual_weight, 110.0);

    LayoutResult after = layout_engine.compute(tree, viewport);
    EXPECT_GT(after.rects[a].area(), before.rects[a].area());
    EXPECT_EQ(after.rects[sub].area() + after.rects[a].area(), viewport.area());
}

TEST_F(ViewSessionTest, ShrinkStopsAtMinimumWeight) {
    ViewSession session(tree);
    ASSERT_TRUE(session.select(a));

    EXPECT_TRUE(session.shrinkSelected());
    EXPECT_DOUBLE_EQ(*tree.node(a).visual_weight, 90.0);

    for (int i = 0; i < 200; ++i) {
        session.shrinkSelected();
        EXPECT_GE(tree.node(a).effectiveWeight(), kMinimumWeight);
    }
    EXPECT_FALSE(session.shrinkSelected());
    EXPECT_DOUBLE_EQ(tree.node(a).effectiveWeight(), kMinimumWeight);
    EXPECT_EQ(tree.node(a).size, 100u);

    // Still laid out as a visible block
    LayoutResult layout = layout_engine.compute(tree, viewport);
    EXPECT_EQ(layout.blocks.size(), 3u);
    for (NodeId id : layout.blocks)
        EXPECT_GT(tree.node(id).effectiveWeight(), 0.0);
}

TEST_F(ViewSessionTest, ZeroSizeBlockCannotShrink) {
    ViewSession session(tree);
    ASSERT_TRUE(session.select(empty));
    EXPECT_FALSE(session.shrinkSelected());
    EXPECT_GT(tree.node(empty).effectiveWeight(), 0.0);

    EXPECT_TRUE(session.growSelected());
    EXPECT_GT(tree.node(empty).effectiveWeight(), kMinimumShare);
}

TEST_F(ViewSessionTest, RootCannotBeResized) {
    ViewSession session(tree);
    ASSERT_TRUE(session.select(0));
    EXPECT_FALSE(session.growSelected());
    EXPECT_FALSE(session.shrinkSelected());
    EXPECT_FALSE(tree.node(0).visual_weight.has_value());
}

TEST_F(ViewSessionTest, ResetWeightRestoresSize) {
    ViewSession session(tree);
    ASSERT_TRUE(session.select(a));
    EXPECT_FALSE(session.resetWeightSelected());

    session.growSelected();
    EXPECT_TRUE(session.resetWeightSelected());
    EXPECT_FALSE(tree.node(a).visual_weight.has_value());
    EXPECT_DOUBLE_EQ(tree.node(a).effectiveWeight(), 100.0);
}

/**
 * @test ExpandRevealsChildren
 * @brief E replaces a collapsed directory block by its children
 */
TEST_F(ViewSessionTest, ExpandRevealsChildren) {
    ViewSession session(tree);
    ASSERT_TRUE(session.select(sub));

    EXPECT_TRUE(session.expandSelected());
    EXPECT_EQ(blocks(), (std::set<NodeId>{b, deep, empty, a}));

    EXPECT_FALSE(session.expandSelected());
}

TEST_F(ViewSessionTest, ExpandOnFileIsNoOp) {
    ViewSession session(tree);
    ASSERT_TRUE(session.select(a));
    EXPECT_FALSE(session.expandSelected());
    EXPECT_FALSE(session.collapseSelected());
    EXPECT_FALSE(tree.node(a).expanded);
}

TEST_F(ViewSessionTest, ExpandPathShowsSelection) {
    ViewSession session(tree);
    ASSERT_TRUE(session.select(c));
    EXPECT_FALSE(tree.isShown(c));

    EXPECT_TRUE(session.expandPathToSelected());
    EXPECT_TRUE(tree.node(sub).expanded);
    EXPECT_TRUE(tree.node(deep).expanded);
    EXPECT_TRUE(tree.isShown(c));
    EXPECT_TRUE(tree.isDisplayedBlock(c));

    EXPECT_FALSE(session.expandPathToSelected());
}

TEST_F(ViewSessionTest, ExpandSubtreeOpensEverything) {
    ViewSession session(tree);
    ASSERT_TRUE(session.select(sub));

    EXPECT_TRUE(session.expandSubtreeSelected());
    EXPECT_TRUE(tree.node(sub).expanded);
    EXPECT_TRUE(tree.node(deep).expanded);
    EXPECT_FALSE(tree.node(empty).expanded);
    EXPECT_EQ(blocks(), (std::set<NodeId>{b, c, empty, a}));

    EXPECT_FALSE(session.expandSubtreeSelected());
}

/**
 * @test CollapseThenExpandRestoresBlocks
 * @brief C followed by E shows the same immediate children again
 */
TEST_F(ViewSessionTest, CollapseThenExpandRestoresBlocks) {
    ViewSession session(tree);
    ASSERT_TRUE(session.select(sub));
    ASSERT_TRUE(session.expandSelected());
    std::set<NodeId> expanded = blocks();

    ASSERT_TRUE(session.select(deep));
    ASSERT_TRUE(session.expandSelected());

    ASSERT_TRUE(session.select(sub));
    EXPECT_TRUE(session.collapseSelected());
    EXPECT_FALSE(tree.node(sub).expanded);
    EXPECT_FALSE(tree.node(deep).expanded);
    EXPECT_EQ(blocks(), (std::set<NodeId>{sub, empty, a}));

    EXPECT_TRUE(session.expandSelected());
    EXPECT_EQ(blocks(), expanded);
}

TEST_F(ViewSessionTest, CollapseOnCollapsedIsNoOp) {
    ViewSession session(tree);
    ASSERT_TRUE(session.select(sub));
    EXPECT_FALSE(session.collapseSelected());
}

TEST_F(ViewSessionTest, CollapseKeepsSelectionShown) {
    ViewSession session(tree);
    ASSERT_TRUE(session.select(c));
    ASSERT_TRUE(session.expandPathToSelected());

    ASSERT_TRUE(session.select(sub));
    ASSERT_TRUE(session.collapseSelected());
    EXPECT_EQ(session.selected(), sub);
}

TEST_F(ViewSessionTest, CollapseParentSelectsParent) {
    ViewSession session(tree);
    ASSERT_TRUE(session.select(sub));
    ASSERT_TRUE(session.expandSelected());
    ASSERT_TRUE(session.select(b));

    EXPECT_TRUE(session.collapseParentOfSelected());
    EXPECT_EQ(session.selected(), sub);
    EXPECT_FALSE(tree.node(sub).expanded);

    // Top-level entries have no parent to fold into
    EXPECT_FALSE(session.collapseParentOfSelected());
    ASSERT_TRUE(session.select(0));
    EXPECT_FALSE(session.collapseParentOfSelected());
}

/**
 * @test CollapseAllShowsTopLevel
 * @brief X leaves exactly the root's children as blocks
 */
TEST_F(ViewSessionTest, CollapseAllShowsTopLevel) {
    ViewSession session(tree);
    ASSERT_TRUE(session.select(sub));
    ASSERT_TRUE(session.expandSubtreeSelected());
    ASSERT_TRUE(session.select(c));

    EXPECT_TRUE(session.collapseAll());
    EXPECT_EQ(blocks(), (std::set<NodeId>{sub, empty, a}));
    EXPECT_TRUE(tree.node(0).expanded);
    EXPECT_EQ(session.selected(), sub);

    EXPECT_FALSE(session.collapseAll());
}

TEST_F(ViewSessionTest, WeightsSurviveCollapse) {
    ViewSession session(tree);
    ASSERT_TRUE(session.select(sub));
    ASSERT_TRUE(session.expandSelected());
    ASSERT_TRUE(session.select(b));
    ASSERT_TRUE(session.growSelected());
    double grown = *tree.node(b).visual_weight;

    ASSERT_TRUE(session.select(sub));
    ASSERT_TRUE(session.collapseSelected());
    ASSERT_TRUE(session.expandSelected());

    ASSERT_TRUE(tree.node(b).visual_weight.has_value());
    EXPECT_DOUBLE_EQ(*tree.node(b).visual_weight, grown);
}

TEST_F(ViewSessionTest, StatusText) {
    ViewSession session(tree);
    ASSERT_TRUE(session.select(a));
    EXPECT_EQ(session.statusText(), "/project/a.txt (file)  100.0 B");

    session.growSelected();
    EXPECT_EQ(session.statusText(), "/project/a.txt (file)  100.0 B  view x1.10");

    ASSERT_TRUE(session.select(sub));
    EXPECT_EQ(session.statusText(), "/project/sub (folder)  350.0 B");

    tree.markInaccessible(deep, "Permission denied");
    ASSERT_TRUE(session.select(deep));
    EXPECT_EQ(session.statusText(),
              "/project/sub/deep (folder)  50.0 B  [inaccessible: Permission denied]");
}

/**
 * @test UnreadableDirectoryStaysInTheMap
 * @brief A directory the scanner could not list is still a selectable block
 *
 * Its siblings keep their space, the status line names the error and the
 * renderer greys it out.
 */
TEST_F(ViewSessionTest, UnreadableDirectoryStaysInTheMap) {
    tree.markInaccessible(empty, "Permission denied");
    LayoutResult layout = layout_engine.compute(tree, viewport);

    EXPECT_EQ(blocks(), (std::set<NodeId>{sub, empty, a}));
    long long area = 0;
    for (NodeId id : layout.blocks)
        area += layout.rects[id].area();
    EXPECT_EQ(area, viewport.area());

    ViewSession session(tree);
    ASSERT_TRUE(session.selectNext());
    ASSERT_TRUE(session.selectNext());
    ASSERT_EQ(session.selected(), empty);
    EXPECT_EQ(session.statusText(),
              "/project/empty (folder)  0 B  [inaccessible: Permission denied]");

    // Expanding an unreadable, childless directory shows nothing new
    session.expandSelected();
    EXPECT_EQ(blocks(), (std::set<NodeId>{sub, empty, a}));

    TreemapRenderer renderer;
    EXPECT_EQ(renderer.colourFor(tree, empty), renderer.options().inaccessible);
    EXPECT_TRUE(tree.node(sub).accessible);
    EXPECT_TRUE(tree.node(a).accessible);
}
