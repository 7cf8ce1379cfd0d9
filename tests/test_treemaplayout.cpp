/**
 * @file test_treemaplayout.cpp
 * @brief Unit tests for the slice-and-dice TreemapLayout
 *
 * ## Test Coverage
 *
 * - Area proportional to size (project example: sub is ~3x a.txt)
 * - Siblings exactly partition their parent
 * - Zero-byte entries and empty roots
 * - Collapsed directories are leaves
 * - Split axis and cell aspect
 * - Visual weights override sizes
 * - Hit testing with blockAt()
 *
 * @see TreemapLayout
 * @see LayoutResult
 */

#include <gtest/gtest.h>
#include "treemaplayout.hpp"

/**
 * @class TreemapLayoutTest
 * @brief Fixture: /project with a.txt (100 B) and sub/b.txt (300 B)
 */
class TreemapLayoutTest : public ::testing::Test {
protected:
    NodeTree tree;
    NodeId sub = kNoNode;
    NodeId b = kNoNode;
    NodeId a = kNoNode;

    TreemapLayout layout_engine;
    Rect viewport{0, 0, 100, 40};

    void SetUp() override {
        tree.addRoot("/project", NodeKind::Directory);
        sub = tree.addChild(0, "sub", "/project/sub", NodeKind::Directory);
        b = tree.addChild(sub, "b.txt", "/project/sub/b.txt", NodeKind::File, 300);
        a = tree.addChild(0, "a.txt", "/project/a.txt", NodeKind::File, 100);
        tree.computeDirectorySizes();
    }

    /** @brief Sum of the areas of the children of parent */
    static long long childArea(const NodeTree &tree, const LayoutResult &layout,
                               NodeId parent) {
        long long sum = 0;
        for (NodeId child : tree.node(parent).children)
            sum += layout.rects[child].area();
        return sum;
    }
};

/**
 * @test AreaProportionalToSize
 * @brief The sub block gets three times the area of a.txt
 */
TEST_F(TreemapLayoutTest, AreaProportionalToSize) {
    LayoutResult layout = layout_engine.compute(tree, viewport);

    EXPECT_EQ(layout.rects[0], viewport);
    EXPECT_EQ(layout.rects[sub], (Rect{0, 0, 75, 40}));
    EXPECT_EQ(layout.rects[a], (Rect{75, 0, 25, 40}));
    EXPECT_EQ(layout.rects[sub].area(), 3 * layout.rects[a].area());

    std::vector<NodeId> expected{sub, a};
    EXPECT_EQ(layout.blocks, expected);
}

TEST_F(TreemapLayoutTest, CollapsedDirectoryIsLeaf) {
    LayoutResult layout = layout_engine.compute(tree, viewport);

    EXPECT_TRUE(layout.rects[b].empty());
    EXPECT_EQ(layout.blockAt(10, 10), sub);
}

TEST_F(TreemapLayoutTest, ExpandedChildrenFillParent) {
    tree.setExpanded(sub, true);
    LayoutResult layout = layout_engine.compute(tree, viewport);

    EXPECT_EQ(layout.rects[b], layout.rects[sub]);
    EXPECT_EQ(layout.blockAt(10, 10), b);

    std::vector<NodeId> expected{b, a};
    EXPECT_EQ(layout.blocks, expected);
}

/**
 * @test SiblingsPartitionParent
 * @brief Children tile the parent without gaps or overlaps
 */
TEST(TreemapLayoutPartitionTest, SiblingsPartitionParent) {
    NodeTree tree;
    tree.addRoot("/data", NodeKind::Directory);
    std::uintmax_t sizes[] = {7, 13, 1, 29, 3, 0, 47};
    for (int i = 0; i < 7; ++i) {
        std::string name = "f" + std::to_string(i);
        tree.addChild(0, name, "/data/" + name, NodeKind::File, sizes[i]);
    }
    tree.computeDirectorySizes();

    TreemapLayout layout_engine;
    Rect viewport{3, 2, 97, 31};
    LayoutResult layout = layout_engine.compute(tree, viewport);

    int offset = viewport.x;
    for (NodeId child : tree.node(0).children) {
        const Rect &r = layout.rects[child];
        EXPECT_EQ(r.x, offset);
        EXPECT_EQ(r.y, viewport.y);
        EXPECT_EQ(r.height, viewport.height);
        EXPECT_GE(r.width, 0);
        offset += r.width;
    }
    EXPECT_EQ(offset, viewport.x + viewport.width);

    long long sum = 0;
    for (NodeId child : tree.node(0).children)
        sum += layout.rects[child].area();
    EXPECT_EQ(sum, viewport.area());
}

TEST_F(TreemapLayoutTest, NestedAreasAddUp) {
    tree.setExpanded(sub, true);
    LayoutResult layout = layout_engine.compute(tree, viewport);

    EXPECT_EQ(childArea(tree, layout, 0), layout.rects[0].area());
    EXPECT_EQ(childArea(tree, layout, sub), layout.rects[sub].area());
}

TEST(TreemapLayoutZeroTest, ZeroSizeChildrenShareSpace) {
    NodeTree tree;
    tree.addRoot("/zeros", NodeKind::Directory);
    for (int i = 0; i < 4; ++i) {
        std::string name = "z" + std::to_string(i);
        tree.addChild(0, name, "/zeros/" + name, NodeKind::File, 0);
    }
    tree.computeDirectorySizes();

    TreemapLayout layout_engine;
    LayoutResult layout = layout_engine.compute(tree, Rect{0, 0, 40, 10});

    int total = 0;
    for (NodeId child : tree.node(0).children) {
        EXPECT_GE(layout.rects[child].width, 9);
        EXPECT_EQ(layout.rects[child].height, 10);
        total += layout.rects[child].width;
    }
    EXPECT_EQ(total, 40);
}

TEST(TreemapLayoutZeroTest, EmptyRootFillsViewport) {
    NodeTree tree;
    tree.addRoot("/empty", NodeKind::Directory);
    tree.computeDirectorySizes();

    TreemapLayout layout_engine;
    Rect viewport{0, 0, 20, 5};
    LayoutResult layout = layout_engine.compute(tree, viewport);

    EXPECT_EQ(layout.rects[0], viewport);
    EXPECT_EQ(layout.blocks, std::vector<NodeId>{0});
    EXPECT_EQ(layout.blockAt(19, 4), 0u);
}

TEST(TreemapLayoutZeroTest, EmptyTreeHasNoBlocks) {
    NodeTree tree;
    TreemapLayout layout_engine;
    LayoutResult layout = layout_engine.compute(tree, Rect{0, 0, 20, 5});

    EXPECT_TRUE(layout.blocks.empty());
    EXPECT_EQ(layout.blockAt(0, 0), kNoNode);
}

TEST_F(TreemapLayoutTest, TallViewportStacksRows) {
    LayoutResult layout = layout_engine.compute(tree, Rect{0, 0, 10, 40});

    EXPECT_EQ(layout.rects[sub], (Rect{0, 0, 10, 30}));
    EXPECT_EQ(layout.rects[a], (Rect{0, 30, 10, 10}));
}

/**
 * @test CellAspectChangesSplitAxis
 * @brief Tall terminal cells turn a 60x40 grid into a tall area
 */
TEST_F(TreemapLayoutTest, CellAspectChangesSplitAxis) {
    Rect grid{0, 0, 60, 40};

    LayoutResult square = layout_engine.compute(tree, grid);
    EXPECT_EQ(square.rects[sub].height, 40);
    EXPECT_EQ(square.rects[sub].width, 45);

    TreemapLayout terminal_engine(LayoutOptions{2.0});
    LayoutResult tall = terminal_engine.compute(tree, grid);
    EXPECT_EQ(tall.rects[sub].width, 60);
    EXPECT_EQ(tall.rects[sub].height, 30);
}

TEST_F(TreemapLayoutTest, VisualWeightOverridesSize) {
    tree.setVisualWeight(a, 300.0);
    LayoutResult layout = layout_engine.compute(tree, viewport);

    EXPECT_EQ(layout.rects[sub].width, 50);
    EXPECT_EQ(layout.rects[a].width, 50);
    EXPECT_EQ(tree.node(a).size, 100u);
}

TEST_F(TreemapLayoutTest, BlockAtHitTesting) {
    LayoutResult layout = layout_engine.compute(tree, viewport);

    EXPECT_EQ(layout.blockAt(0, 0), sub);
    EXPECT_EQ(layout.blockAt(74, 39), sub);
    EXPECT_EQ(layout.blockAt(75, 0), a);
    EXPECT_EQ(layout.blockAt(99, 39), a);
    EXPECT_EQ(layout.blockAt(100, 0), kNoNode);
    EXPECT_EQ(layout.blockAt(-1, 5), kNoNode);
    EXPECT_EQ(layout.blockAt(5, 40), kNoNode);
}

TEST_F(TreemapLayoutTest, RectOfUnknownIdIsEmpty) {
    LayoutResult layout = layout_engine.compute(tree, viewport);
    EXPECT_TRUE(layout.rectOf(kNoNode).empty());
    EXPECT_TRUE(layout.rectOf(999).empty());
    EXPECT_EQ(layout.rectOf(a), layout.rects[a]);
}

TEST(RectTest, ContainsIsHalfOpen) {
    Rect r{2, 3, 4, 5};
    EXPECT_TRUE(r.contains(2, 3));
    EXPECT_TRUE(r.contains(5, 7));
    EXPECT_FALSE(r.contains(6, 3));
    EXPECT_FALSE(r.contains(2, 8));
    EXPECT_EQ(r.area(), 20);
    EXPECT_TRUE((Rect{0, 0, 0, 5}).empty());
    EXPECT_EQ((Rect{0, 0, -1, 5}).area(), 0);
}
