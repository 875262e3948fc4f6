


#include "trapezoidaltest.h"
#include <gtest/gtest.h>
#include <algorithm>
#include <cmath>
#include <random>




using namespace Trapezoidal;
using namespace TrapezoidalTest;




namespace
{

    const double AREA_EPSILON = 1e-6;


    // Quadrilateral with the bounding box (0,0)-(10,10) and no horizontal edge
    std::vector<std::vector<Vec2> > boxQuad()
    {
        return {{{0.0, 0.0}, {10.0, 1.0}, {10.0, 10.0}, {0.0, 9.0}}};
    }


    std::vector<std::vector<Vec2> > triangle()
    {
        return {{{0.0, 0.0}, {4.0, 1.0}, {1.0, 4.0}}};
    }


    // Same triangle reflected in the y axis
    std::vector<std::vector<Vec2> > mirroredTriangle()
    {
        return {{{0.0, 0.0}, {-4.0, 1.0}, {-1.0, 4.0}}};
    }


    void expectValidMap(const Triangulator& map)
    {
        EXPECT_TRUE(testLeafConsistency(map).empty());
        EXPECT_TRUE(testYNodeKeys(map).empty());
        EXPECT_TRUE(testLeftRightOrder(map).empty());
        EXPECT_TRUE(testAdjacencySymmetry(map).empty());
        EXPECT_TRUE(testNeighbourGeometry(map).empty());
        EXPECT_TRUE(testPointLocation(map).empty());
    }


    void expectAreasConserved(const Triangulator& map)
    {
        const Diagnostics diagnostics = map.computeDiagnostics();
        EXPECT_NEAR(diagnostics.areaDiff, 0.0, AREA_EPSILON * diagnostics.boxArea);
        EXPECT_NEAR(diagnostics.insideAreaDiff, 0.0, AREA_EPSILON * diagnostics.boxArea);
    }


    void expectLinks(const Trapezoid& t, const std::size_t& topA, const std::size_t& topB,
                     const std::size_t& botA, const std::size_t& botB)
    {
        EXPECT_EQ(t.topA(), topA);
        EXPECT_EQ(t.topB(), topB);
        EXPECT_EQ(t.botA(), botA);
        EXPECT_EQ(t.botB(), botB);
    }

}




TEST(Construction, SeedsSingleTrapezoidOverInflatedBox)
{
    Triangulator map(boxQuad());
    const std::vector<Vec2>& pts = map.points();
    ASSERT_EQ(pts.size(), 8u);
    EXPECT_EQ(map.segments().size(), 6u);
    EXPECT_EQ(pts[4], (Vec2{-1.0, -1.0}));
    EXPECT_EQ(pts[5], (Vec2{-1.0, 11.0}));
    EXPECT_EQ(pts[6], (Vec2{11.0, -1.0}));
    EXPECT_EQ(pts[7], (Vec2{11.0, 11.0}));

    ASSERT_EQ(map.trapezoids().size(), 1u);
    const Trapezoid& box = map.trapezoids()[0];
    EXPECT_EQ(box.yMin, -1.0);
    EXPECT_EQ(box.yMax, 11.0);
    EXPECT_EQ(box.left, 4u);
    EXPECT_EQ(box.right, 5u);
    expectLinks(box, TRAP_UNDEFINED_INDEX, TRAP_UNDEFINED_INDEX, TRAP_UNDEFINED_INDEX, TRAP_UNDEFINED_INDEX);

    ASSERT_EQ(map.nodes().size(), 1u);
    EXPECT_EQ(map.nodes()[map.root()].kind, LEAF_NODE);
    EXPECT_EQ(map.nodes()[map.root()].index, 0u);
    EXPECT_EQ(map.dumpNodes(), "#0 Leaf\n");
    expectValidMap(map);
}


TEST(Construction, SegmentsRunFromUpperToLowerPoint)
{
    Triangulator map(triangle());
    const std::vector<Segment>& segs = map.segments();
    EXPECT_EQ(segs[0].a, 1u);
    EXPECT_EQ(segs[0].b, 0u);
    EXPECT_EQ(segs[1].a, 2u);
    EXPECT_EQ(segs[1].b, 1u);
    EXPECT_EQ(segs[2].a, 2u);
    EXPECT_EQ(segs[2].b, 0u);
    EXPECT_DOUBLE_EQ(segs[0].slope, 4.0);
    EXPECT_DOUBLE_EQ(segs[1].slope, -1.0);
    EXPECT_DOUBLE_EQ(segs[1].getX(map.points(), 2.5), 2.5);
    EXPECT_DOUBLE_EQ(segs[1].getX(map.points(), -1.0), 6.0);    // Extrapolated past the lower point
    EXPECT_TRUE(segs[0].left(map.points(), {1.0, 0.5}));
    EXPECT_FALSE(segs[0].left(map.points(), {3.0, 0.5}));
}


TEST(Construction, RejectsHorizontalEdges)
{
    const std::vector<std::vector<Vec2> > square = {{{0.0, 0.0}, {10.0, 0.0}, {10.0, 10.0}, {0.0, 10.0}}};
    EXPECT_THROW(Triangulator map(square), HorizontalEdgeError);

    const std::vector<std::vector<Vec2> > flatTop = {{{0.0, 0.0}, {3.0, 5.0}, {-2.0, 5.0}}};
    try
    {
        Triangulator map(flatTop);
        FAIL() << "Horizontal edge was accepted";
    }
    catch (const HorizontalEdgeError& error)
    {
        EXPECT_NE(std::string(error.what()).find("Horizontal edge"), std::string::npos);
    }
}


TEST(Construction, RejectsDegenerateInput)
{
    const std::vector<std::vector<Vec2> > empty;
    EXPECT_THROW(Triangulator map(empty), InvalidInputError);
    const std::vector<std::vector<Vec2> > twoPoints = {{{0.0, 0.0}, {1.0, 1.0}}};
    EXPECT_THROW(Triangulator map(twoPoints), InvalidInputError);
}


TEST(Construction, OrderIsAPermutationOfPolygonSegments)
{
    int nextSeed = 0;
    Triangulator map({createStarPolygon2(11, nextSeed, 30)});
    std::vector<std::size_t> order = map.order();
    ASSERT_EQ(order.size(), 30u);
    std::sort(order.begin(), order.end());
    for (std::size_t i = 0; i < order.size(); i++) EXPECT_EQ(order[i], i);
}




TEST(PointInsertion, SplitsTrapezoidAtPoint)
{
    Triangulator map(boxQuad());
    EXPECT_EQ(map.insertPoint(0), 1u);
    ASSERT_EQ(map.trapezoids().size(), 2u);

    const Trapezoid& lower = map.trapezoids()[0];
    const Trapezoid& upper = map.trapezoids()[1];
    EXPECT_EQ(lower.yMin, -1.0);
    EXPECT_EQ(lower.yMax, 0.0);
    EXPECT_EQ(upper.yMin, 0.0);
    EXPECT_EQ(upper.yMax, 11.0);
    EXPECT_EQ(upper.left, lower.left);
    EXPECT_EQ(upper.right, lower.right);
    expectLinks(lower, 1u, TRAP_UNDEFINED_INDEX, TRAP_UNDEFINED_INDEX, TRAP_UNDEFINED_INDEX);
    expectLinks(upper, TRAP_UNDEFINED_INDEX, TRAP_UNDEFINED_INDEX, 0u, TRAP_UNDEFINED_INDEX);

    const Node& root = map.nodes()[map.root()];
    EXPECT_EQ(root.kind, Y_NODE);
    EXPECT_EQ(root.index, 0u);
    EXPECT_EQ(map.dumpNodes(), "#0 Y 0\n   #0 Leaf\n   #1 Leaf\n");

    EXPECT_EQ(map.locate({5.0, -0.5}), 0u);
    EXPECT_EQ(map.locate({5.0, 5.0}), 1u);
    expectValidMap(map);
}


TEST(PointInsertion, SecondInsertIsNoOp)
{
    Triangulator map(boxQuad());
    map.insertPoint(0);
    const std::string trapezoids = map.dumpTrapezoids();
    const std::string nodes = map.dumpNodes();
    EXPECT_TRUE(map.isDone(0));
    EXPECT_FALSE(map.isDone(1));

    EXPECT_EQ(map.insertPoint(0), TRAP_UNDEFINED_INDEX);
    EXPECT_EQ(map.trapezoids().size(), 2u);
    EXPECT_EQ(map.nodes().size(), 3u);
    EXPECT_EQ(map.dumpTrapezoids(), trapezoids);
    EXPECT_EQ(map.dumpNodes(), nodes);
}


TEST(PointInsertion, UpperNeighboursMoveToNewTrapezoid)
{
    Triangulator map(boxQuad());
    map.insertPoint(2);    // (10,10)
    map.insertPoint(0);    // (0,0) splits the trapezoid below (10,10)

    // Slot 0 is (-1..0), slot 1 is (10..11), slot 2 is (0..10)
    const std::vector<Trapezoid>& traps = map.trapezoids();
    ASSERT_EQ(traps.size(), 3u);
    EXPECT_EQ(traps[2].yMin, 0.0);
    EXPECT_EQ(traps[2].yMax, 10.0);
    expectLinks(traps[0], 2u, TRAP_UNDEFINED_INDEX, TRAP_UNDEFINED_INDEX, TRAP_UNDEFINED_INDEX);
    expectLinks(traps[1], TRAP_UNDEFINED_INDEX, TRAP_UNDEFINED_INDEX, 2u, TRAP_UNDEFINED_INDEX);
    expectLinks(traps[2], 1u, TRAP_UNDEFINED_INDEX, 0u, TRAP_UNDEFINED_INDEX);
    expectValidMap(map);
}




TEST(PointLocation, FindSliceResolvesTiesOnRequestedSide)
{
    Triangulator map(boxQuad());
    map.insertPoint(0);
    EXPECT_EQ(map.findSlice({5.0, 0.0}, true), 0u);
    EXPECT_EQ(map.findSlice({5.0, 0.0}, false), 1u);
    EXPECT_EQ(map.findSlice({5.0, 3.0}, true), 1u);

    // Plain location puts every point on the split line above it, whatever its x-coordinate
    EXPECT_EQ(map.locate({-0.5, 0.0}), 1u);
    EXPECT_EQ(map.locate({0.5, 0.0}), 1u);
    EXPECT_EQ(map.locate({0.0, 0.0}), 1u);
    EXPECT_EQ(map.locate({-0.5, -1e-12}), 0u);
}


TEST(PointLocation, SharedYVerticesStillGetTheirOwnLines)
{
    // (0,0), (2,0) and (4,0) share a Y, insertion keeps one split line per vertex while a query on y = 0
    // lands above all of them
    const std::vector<std::vector<Vec2> > comb = {{{0.0, 0.0}, {1.0, 5.0}, {2.0, 0.0}, {3.0, 5.0}, {4.0, 0.0},
                                                   {5.0, 9.0}, {-1.0, 10.0}}};
    Triangulator map(comb);
    map.process();
    std::size_t keys = 0;
    for (std::size_t i = 0; i < map.nodes().size(); i++) if (map.nodes()[i].kind == Y_NODE) keys++;
    EXPECT_EQ(keys, 7u);
    for (double x = -0.5; x < 5.0; x += 0.5)
    {
        const Trapezoid& t = map.trapezoids()[map.locate({x, 0.0})];
        EXPECT_EQ(t.yMin, 0.0);
        EXPECT_GT(t.yMax, 0.0);
    }
    expectValidMap(map);
}




TEST(SegmentInsertion, TriangleEdgeByEdge)
{
    Triangulator map(triangle());
    EXPECT_EQ(map.insertSegment(0), 1u);
    expectValidMap(map);
    EXPECT_EQ(map.insertSegment(1), 1u);
    expectValidMap(map);
    EXPECT_EQ(map.insertSegment(2), 2u);
    expectValidMap(map);

    const std::vector<Trapezoid>& traps = map.trapezoids();
    ASSERT_EQ(traps.size(), 8u);
    const std::size_t U = TRAP_UNDEFINED_INDEX;
    expectLinks(traps[0], 2u, 3u, U, U);
    expectLinks(traps[1], 4u, U, 2u, U);
    expectLinks(traps[2], 1u, U, 0u, U);
    expectLinks(traps[3], 5u, U, 0u, U);
    expectLinks(traps[4], U, U, 1u, 5u);
    expectLinks(traps[5], 4u, U, 3u, U);
    expectLinks(traps[6], U, U, 7u, U);
    expectLinks(traps[7], 6u, U, U, U);

    // The two trapezoids between the edges are the inside of the triangle
    EXPECT_EQ(traps[6].left, 2u);
    EXPECT_EQ(traps[6].right, 1u);
    EXPECT_EQ(traps[7].left, 2u);
    EXPECT_EQ(traps[7].right, 0u);
    for (std::size_t i = 0; i < traps.size(); i++) EXPECT_EQ(map.isInside(i), i == 6 || i == 7);
    EXPECT_EQ(map.locate({1.0, 0.5}), 7u);
    EXPECT_EQ(map.locate({1.5, 2.0}), 6u);
    EXPECT_EQ(map.locate({3.0, 3.0}), 5u);

    const std::string expected =
        "#1 Y 1\n"
        "   #0 Y 0\n"
        "      #0 Leaf\n"
        "      #0 X\n"
        "         #2 X\n"
        "            #2 Leaf\n"
        "            #7 Leaf\n"
        "         #3 Leaf\n"
        "   #2 Y 4\n"
        "      #1 X\n"
        "         #2 X\n"
        "            #1 Leaf\n"
        "            #6 Leaf\n"
        "         #5 Leaf\n"
        "      #4 Leaf\n";
    EXPECT_EQ(map.dumpNodes(), expected);
    EXPECT_EQ(map.dumpTrapezoids().substr(0, 64), "Trap#0 Y:-1 to 0 Left:3 Right:4 (-1,-1) (5,-1) (5,0) (-1,0)\nTrap");

    const Diagnostics diagnostics = map.computeDiagnostics();
    EXPECT_DOUBLE_EQ(diagnostics.boxArea, 36.0);
    EXPECT_NEAR(diagnostics.totalTrapezoidArea, 36.0, AREA_EPSILON);
    EXPECT_NEAR(diagnostics.polygonArea, 7.5, AREA_EPSILON);
    EXPECT_NEAR(diagnostics.insideTrapezoidArea, 7.5, AREA_EPSILON);
    EXPECT_EQ(diagnostics.numTrapezoids, 8u);
    EXPECT_EQ(diagnostics.numInsideTrapezoids, 2u);
    EXPECT_EQ(diagnostics.numNodes, 15u);
    EXPECT_EQ(diagnostics.maxDepth, 5u);
}


TEST(SegmentInsertion, SlicesEveryTrapezoidTheSegmentCrosses)
{
    Triangulator map(triangle());
    EXPECT_EQ(map.insertPoint(0), 1u);
    EXPECT_EQ(map.insertPoint(1), 2u);
    EXPECT_EQ(map.insertPoint(2), 3u);

    // The long edge from (1,4) down to (0,0) crosses the line through (4,1)
    EXPECT_EQ(map.insertSegment(2), 2u);
    expectValidMap(map);
    EXPECT_EQ(map.insertSegment(0), 1u);
    EXPECT_EQ(map.insertSegment(1), 1u);
    EXPECT_EQ(map.insertSegment(1), 0u);
    expectValidMap(map);

    const Diagnostics diagnostics = map.computeDiagnostics();
    EXPECT_EQ(diagnostics.numTrapezoids, 8u);
    EXPECT_EQ(diagnostics.numInsideTrapezoids, 2u);
    expectAreasConserved(map);
}


TEST(SegmentInsertion, SegmentEndingInTrapezoidCorner)
{
    // Every edge of this triangle ends on a point where another edge already hangs
    Triangulator map(triangle());
    map.insertSegment(2);
    map.insertSegment(1);

    // Only the right half touches the trapezoid above (1,4), the left half ends in a point there
    const std::size_t inside = map.locate({1.5, 2.0});
    const Trapezoid& t = map.trapezoids()[inside];
    EXPECT_EQ(t.topA(), TRAP_UNDEFINED_INDEX);
    EXPECT_EQ(t.topB(), TRAP_UNDEFINED_INDEX);
    expectValidMap(map);
}




// Old trapezoid below (4,1) has two upper neighbours split by the edge from (1,4) down to (4,1), and the new
// edge from (4,1) down to (0,0) starts exactly at their boundary: each neighbour keeps one half
TEST(Restitch, NeighboursMeetWhereSegmentStarts)
{
    Triangulator map(triangle());
    EXPECT_EQ(map.insertSegment(1), 1u);
    EXPECT_EQ(map.insertSegment(0), 1u);

    const std::vector<Trapezoid>& traps = map.trapezoids();
    ASSERT_EQ(traps.size(), 6u);
    const std::size_t U = TRAP_UNDEFINED_INDEX;
    expectLinks(traps[0], 4u, 5u, U, U);
    expectLinks(traps[1], U, U, 2u, 3u);
    expectLinks(traps[2], 1u, U, 4u, U);
    expectLinks(traps[3], 1u, U, 5u, U);
    expectLinks(traps[4], 2u, U, 0u, U);
    expectLinks(traps[5], 3u, U, 0u, U);
    expectValidMap(map);
}


// The long edge crosses the line through (4,1) to the left of the edge hanging there: the left neighbour
// above spans both halves and the right neighbour only the right half. At (1,4) the new left half narrows
// to a point and has nothing above it
TEST(Restitch, LeftNeighbourSpansBothHalves)
{
    Triangulator map(triangle());
    EXPECT_EQ(map.insertSegment(1), 1u);
    EXPECT_EQ(map.insertSegment(2), 2u);

    const std::vector<Trapezoid>& traps = map.trapezoids();
    ASSERT_EQ(traps.size(), 7u);
    const std::size_t U = TRAP_UNDEFINED_INDEX;
    expectLinks(traps[0], 4u, 6u, U, U);
    expectLinks(traps[1], U, U, 2u, 3u);
    expectLinks(traps[2], 1u, U, 4u, U);
    expectLinks(traps[3], 1u, U, 6u, U);
    expectLinks(traps[4], 2u, U, 0u, U);
    expectLinks(traps[5], U, U, 6u, U);
    expectLinks(traps[6], 5u, 3u, 0u, U);
    EXPECT_TRUE(map.isInside(5));
    expectValidMap(map);
}


// Mirror image of the case above: the right neighbour spans both halves, the left one only the left half,
// and the new right half narrows to a point under (-1,4)
TEST(Restitch, RightNeighbourSpansBothHalves)
{
    Triangulator map(mirroredTriangle());
    EXPECT_EQ(map.insertSegment(1), 1u);
    EXPECT_EQ(map.insertSegment(2), 2u);

    const std::vector<Trapezoid>& traps = map.trapezoids();
    ASSERT_EQ(traps.size(), 7u);
    const std::size_t U = TRAP_UNDEFINED_INDEX;
    expectLinks(traps[0], 4u, 6u, U, U);
    expectLinks(traps[1], U, U, 2u, 5u);
    expectLinks(traps[2], 1u, U, 4u, U);
    expectLinks(traps[3], U, U, 4u, U);
    expectLinks(traps[4], 2u, 3u, 0u, U);
    expectLinks(traps[5], 1u, U, 6u, U);
    expectLinks(traps[6], 5u, U, 0u, U);
    EXPECT_TRUE(map.isInside(3));
    EXPECT_FALSE(map.isInside(4));
    expectValidMap(map);
}


TEST(Restitch, CrossingEdgesAreReported)
{
    // The edges (0,0)-(4,4) and (4,1)-(0,5) cross at (2.5,2.5)
    const std::vector<std::vector<Vec2> > bowtie = {{{0.0, 0.0}, {4.0, 4.0}, {4.0, 1.0}, {0.0, 5.0}}};
    Triangulator map(bowtie);
    EXPECT_EQ(map.insertSegment(0), 1u);
    EXPECT_THROW(map.insertSegment(2), InternalError);
}




TEST(Process, StepsReportInsertionsAndSlices)
{
    Triangulator map(triangle());
    std::vector<std::string> messages;
    std::size_t steps = 0;
    while (map.processNext(&messages)) steps++;
    EXPECT_EQ(steps, 3u);
    EXPECT_FALSE(map.processNext(&messages));

    std::size_t starts = 0;
    std::size_t slices = 0;
    for (std::size_t i = 0; i < messages.size(); i++)
    {
        if (messages[i].find("Added start point") == 0 || messages[i].find("Added end point") == 0) starts++;
        if (messages[i].find("  Sliced ") == 0) slices++;
    }
    EXPECT_EQ(starts, 3u);
    EXPECT_EQ(slices, map.trapezoids().size() - 4);
    expectValidMap(map);
    expectAreasConserved(map);
}


TEST(Process, FixedSeedGivesIdenticalDumps)
{
    int nextSeed = 0;
    const std::vector<std::vector<Vec2> > contours = createPolygonWithHole(3, nextSeed, 24, 10);
    Triangulator first(contours, 17);
    Triangulator second(contours, 17);
    first.process();
    second.process();
    EXPECT_EQ(first.order(), second.order());
    EXPECT_EQ(first.dumpTrapezoids(), second.dumpTrapezoids());
    EXPECT_EQ(first.dumpNodes(), second.dumpNodes());
}


TEST(Process, GeneratorCanBeSwapped)
{
    int nextSeed = 0;
    const std::vector<std::vector<Vec2> > contours = {createStarPolygon2(5, nextSeed, 40)};
    Triangulator first(contours);
    Triangulator second(contours);
    std::minstd_rand random1(7);
    std::minstd_rand random2(7);
    first.shuffle(random1);
    second.shuffle(random2);
    EXPECT_EQ(first.order(), second.order());

    std::vector<std::size_t> order = first.order();
    std::sort(order.begin(), order.end());
    for (std::size_t i = 0; i < order.size(); i++) EXPECT_EQ(order[i], i);

    first.process();
    expectValidMap(first);
    expectAreasConserved(first);
    EXPECT_THROW(first.shuffle(random1), InternalError);
}


TEST(Process, RandomStarPolygons)
{
    int seed = 1;
    for (std::size_t n = 0; n < 25; n++)
    {
        const std::vector<Vec2> contour = createStarPolygon2(seed, seed, 8 + 8 * (n % 5));
        ASSERT_FALSE(contour.empty());
        Triangulator map({contour}, static_cast<std::uint32_t>(n));
        map.process();
        expectValidMap(map);
        expectAreasConserved(map);
        EXPECT_TRUE(testInsideClassification(map, {contour}).empty());
    }
}


TEST(Process, PolygonsWithHoles)
{
    int seed = 100;
    for (std::size_t n = 0; n < 10; n++)
    {
        const std::vector<std::vector<Vec2> > contours = createPolygonWithHole(seed, seed, 12 + n, 8);
        Triangulator map(contours, static_cast<std::uint32_t>(n));
        map.process();
        expectValidMap(map);
        expectAreasConserved(map);
        EXPECT_TRUE(testInsideClassification(map, contours).empty());

        // Area of the ring is the outer area minus the hole
        const Diagnostics diagnostics = map.computeDiagnostics();
        EXPECT_GT(diagnostics.polygonArea, 0.0);
        EXPECT_LT(diagnostics.polygonArea, M_PI * 100.0);
    }
}


TEST(Process, IslandInsideHole)
{
    int seed = 300;
    for (std::size_t n = 0; n < 5; n++)
    {
        std::vector<std::vector<Vec2> > contours = createPolygonWithHole(seed, seed, 16, 8);
        contours.push_back(createStarPolygon2(seed, seed, 8, 0.2, 0.5));
        Triangulator map(contours, static_cast<std::uint32_t>(n));
        map.process();
        expectValidMap(map);
        expectAreasConserved(map);
        EXPECT_TRUE(testInsideClassification(map, contours).empty());

        // The island sits at the centre, inside the hole, so it counts as polygon again
        EXPECT_TRUE(map.isInside(map.locate({0.0, 0.0})));
        EXPECT_FALSE(map.isInside(map.locate({0.0, 0.65})));
        EXPECT_TRUE(map.isInside(map.locate({0.0, 5.0})));
    }
}


TEST(Process, VerticesSharingY)
{
    const std::vector<std::vector<Vec2> > pentagon = {{{0.0, 0.0}, {5.0, 3.0}, {10.0, 0.0}, {7.0, 8.0}, {3.0, 9.0}}};
    const std::vector<std::vector<Vec2> > comb = {{{0.0, 0.0}, {1.0, 5.0}, {2.0, 0.0}, {3.0, 5.0}, {4.0, 0.0},
                                                   {5.0, 9.0}, {-1.0, 10.0}}};
    for (std::uint32_t seed = 0; seed < 30; seed++)
    {
        Triangulator first(pentagon, seed);
        first.process();
        expectValidMap(first);
        expectAreasConserved(first);
        EXPECT_NEAR(first.computeDiagnostics().polygonArea, 44.5, AREA_EPSILON);

        Triangulator second(comb, seed);
        second.process();
        expectValidMap(second);
        expectAreasConserved(second);
        EXPECT_NEAR(second.computeDiagnostics().polygonArea, 37.5, AREA_EPSILON);
    }
}


TEST(Process, DecomposeReturnsInsideTrapezoids)
{
    Diagnostics diagnostics;
    const std::vector<std::pair<std::size_t,Quad> > inside = decompose(triangle(), diagnostics);
    EXPECT_EQ(inside.size(), diagnostics.numInsideTrapezoids);
    EXPECT_NEAR(diagnostics.insideAreaDiff, 0.0, AREA_EPSILON);
    EXPECT_NEAR(diagnostics.areaDiff, 0.0, AREA_EPSILON);

    double area = 0.0;
    for (std::size_t i = 0; i < inside.size(); i++)
    {
        const Quad& q = inside[i].second;
        area += 0.5 * ((q[1][0] - q[0][0]) + (q[2][0] - q[3][0])) * (q[3][1] - q[0][1]);
    }
    EXPECT_NEAR(area, 7.5, AREA_EPSILON);

    EXPECT_THROW(decompose({{{0.0, 0.0}, {1.0, 0.0}, {0.0, 1.0}}}, diagnostics), HorizontalEdgeError);
}




TEST(Export, InsetOutlinesStayInsideTrapezoids)
{
    Triangulator map(triangle());
    map.process();
    const std::vector<std::pair<std::size_t,Quad> > quads = map.getTrapezoids(0.01);
    ASSERT_EQ(quads.size(), map.trapezoids().size());
    for (std::size_t i = 0; i < quads.size(); i++)
    {
        const Trapezoid& t = map.trapezoids()[quads[i].first];
        const Quad& q = quads[i].second;
        EXPECT_DOUBLE_EQ(q[0][1], t.yMin + 0.01);
        EXPECT_DOUBLE_EQ(q[2][1], t.yMax - 0.01);
        EXPECT_DOUBLE_EQ(q[0][0], map.segments()[t.left].getX(map.points(), t.yMin + 0.01) + 0.01);
    }
}


TEST(Export, DumpsAndImagesReachDisk)
{
    int nextSeed = 0;
    const std::vector<std::vector<Vec2> > contours = createPolygonWithHole(42, nextSeed, 16, 6);
    Triangulator map(contours);
    map.process();

    const QString textPath = QDir::temp().filePath("trapezoidal_nodes.txt");
    const std::string dump = map.dumpNodes();
    ASSERT_EQ(exportTextToFile(dump, textPath), 0);
    EXPECT_EQ(importTextFromFile(textPath), dump);

    const QString imagePath = QDir::temp().filePath("trapezoidal_map.png");
    EXPECT_NE(exportTrapezoidsToImage(map, imagePath, 400, 0.02), 0);
    EXPECT_TRUE(QFileInfo(imagePath).exists());

    const QString contourPath = QDir::temp().filePath("trapezoidal_contours.png");
    EXPECT_NE(exportContoursToImage(contours, contourPath, 400), 0);
    EXPECT_TRUE(QFileInfo(contourPath).exists());

    QFile::remove(textPath);
    QFile::remove(imagePath);
    QFile::remove(contourPath);
}
