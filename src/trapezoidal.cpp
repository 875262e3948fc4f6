


#include "trapezoidal.h"
#include <algorithm>
#include <cmath>
#include <sstream>
#include <iomanip>




using namespace Trapezoidal;




// Rounded to 6 decimals so that dumps compare equal across runs, -0 is folded into 0
static std::string formatNumber(const double& value)
{
    double rounded = std::round(value * 1e6) / 1e6;
    if (rounded == 0.0) rounded = 0.0;
    std::ostringstream stream;
    stream << std::setprecision(12) << rounded;
    return stream.str();
}


static std::string formatPoint(const Vec2& p)
{
    return "(" + formatNumber(p[0]) + "," + formatNumber(p[1]) + ")";
}


// Edge from point a to point b, flipped so that a is the upper point
static Segment makeSegment(const std::vector<Vec2>& pts, std::size_t a, std::size_t b)
{
    if (pts[a][1] == pts[b][1])
    {
        throw HorizontalEdgeError("Horizontal edge from " + formatPoint(pts[a]) + " to " + formatPoint(pts[b]) +
                                  " is not supported");
    }
    if (pts[a][1] < pts[b][1]) std::swap(a, b);
    Segment seg;
    seg.a = a;
    seg.b = b;
    seg.slope = (pts[a][0] - pts[b][0]) / (pts[a][1] - pts[b][1]);
    return seg;
}




Triangulator::Triangulator(const std::vector<std::vector<Vec2> >& contours, const std::uint32_t& seed)
    : rootNode(TRAP_UNDEFINED_INDEX), nodeID(0), numPts(0), nextSeg(0)
{
    if (contours.empty()) throw InvalidInputError("No contours to decompose");
    std::size_t max = 0;
    for (std::size_t i = 0; i < contours.size(); i++)
    {
        if (contours[i].size() < 3) throw InvalidInputError("Contour " + std::to_string(i) + " has fewer than three vertices");
        max += contours[i].size();
    }

    // Copy every contour into one flat point table and compute the overall bounding box
    numPts = max;
    pts.reserve(max + 4);
    segs.reserve(max + 2);
    done.assign(max, false);
    segDone.assign(max, false);
    segOrder.resize(max);
    Vec2 lower = contours[0][0];
    Vec2 upper = contours[0][0];
    for (std::size_t i = 0; i < contours.size(); i++)
    {
        loopStart.push_back(pts.size());
        for (std::size_t j = 0; j < contours[i].size(); j++)
        {
            const Vec2& p = contours[i][j];
            pts.push_back(p);
            lower[0] = std::min(lower[0], p[0]);
            lower[1] = std::min(lower[1], p[1]);
            upper[0] = std::max(upper[0], p[0]);
            upper[1] = std::max(upper[1], p[1]);
        }
    }
    loopStart.push_back(pts.size());

    // One segment per edge, including the closing edge of each loop
    for (std::size_t i = 0; i < contours.size(); i++)
    {
        const std::size_t n = loopStart[i];
        const std::size_t count = contours[i].size();
        for (std::size_t j = 0; j < count; j++)
        {
            segs.push_back(makeSegment(pts, n + j, n + (j + 1) % count));
        }
    }

    // Each edge knows which of its sides is polygon interior: the loop's own interior when the loop sits at an
    // even nesting depth, the outside of the loop otherwise. A counter-clockwise loop has its interior on the
    // left of every edge, so a downward edge has it on the +x side
    loopDepth = loopNesting();
    insideRight.assign(max + 2, false);
    for (std::size_t i = 0; i < contours.size(); i++)
    {
        double area = 0.0;
        for (std::size_t j = loopStart[i]; j < loopStart[i+1]; j++)
        {
            const Vec2& p = pts[j];
            const Vec2& q = pts[(j + 1 < loopStart[i+1] ? j + 1 : loopStart[i])];
            area += p[0] * q[1] - p[1] * q[0];
        }
        const bool evenDepth = (loopDepth[i] % 2 == 0);
        for (std::size_t j = loopStart[i]; j < loopStart[i+1]; j++)
        {
            const bool down = (segs[j].a == j);
            const bool insideLoop = ((area > 0.0) == down);
            insideRight[j] = (insideLoop == evenDepth);
        }
    }

    // Inflate the box and add its corners plus the two vertical boundary segments
    lower[0] -= TRAP_BOX_MARGIN;
    lower[1] -= TRAP_BOX_MARGIN;
    upper[0] += TRAP_BOX_MARGIN;
    upper[1] += TRAP_BOX_MARGIN;
    pts.push_back({lower[0], lower[1]});
    pts.push_back({lower[0], upper[1]});
    pts.push_back({upper[0], lower[1]});
    pts.push_back({upper[0], upper[1]});
    segs.push_back(makeSegment(pts, max, max + 1));
    segs.push_back(makeSegment(pts, max + 2, max + 3));

    // Seed the map with a single trapezoid covering the box
    rootNode = addNode(LEAF_NODE, 0);
    Trapezoid box;
    box.yMin = lower[1];
    box.yMax = upper[1];
    box.lo = max;
    box.hi = max + 1;
    box.left = max;
    box.right = max + 1;
    box.node = rootNode;
    box.top = {TRAP_UNDEFINED_INDEX, TRAP_UNDEFINED_INDEX};
    box.bot = {TRAP_UNDEFINED_INDEX, TRAP_UNDEFINED_INDEX};
    traps.push_back(box);

    std::mt19937 random(seed);
    shuffle(random);
}




void Triangulator::check(const bool& condition, const char* what) const
{
    if (!condition) throw InternalError(what);
}




std::size_t Triangulator::addNode(const NodeKind& kind, const std::size_t& index)
{
    Node node;
    node.kind = kind;
    node.index = index;
    node.first = TRAP_UNDEFINED_INDEX;
    node.second = TRAP_UNDEFINED_INDEX;
    node.id = ++nodeID;
    tree.push_back(node);
    return tree.size() - 1;
}




void Triangulator::process()
{
    while (processNext()) {}
}




bool Triangulator::processNext(std::vector<std::string>* messages)
{
    if (nextSeg >= segOrder.size()) return false;
    const std::size_t nSeg = segOrder[nextSeg];
    nextSeg++;
    insertSegment(nSeg, messages);
    return true;
}




// Points sharing a Y are ordered by X, as if the plane were sheared by an infinitesimal amount. Insertion needs
// this so that every vertex gets its own split line
std::size_t Triangulator::insertionLeaf(const Vec2& p) const
{
    std::size_t node = rootNode;
    for (;;)
    {
        const Node& nd = tree[node];
        if (nd.kind == LEAF_NODE) return node;
        if (nd.kind == Y_NODE) node = (isBelow(p, pts[nd.index]) ? nd.first : nd.second);
        else node = (segs[nd.index].left(pts, p) ? nd.first : nd.second);
    }
}




std::size_t Triangulator::locate(const Vec2& p) const
{
    return findSlice(p, false);
}




std::size_t Triangulator::findSlice(const Vec2& p, const bool& below) const
{
    std::size_t node = rootNode;
    for (;;)
    {
        const Node& nd = tree[node];
        if (nd.kind == LEAF_NODE) return nd.index;
        if (nd.kind == Y_NODE)
        {
            const double ySplit = pts[nd.index][1];
            if (p[1] == ySplit) node = (below ? nd.first : nd.second);
            else node = (p[1] < ySplit ? nd.first : nd.second);
        }
        else {
            node = (segs[nd.index].left(pts, p) ? nd.first : nd.second);
        }
    }
}




// The probe is the top endpoint moved an infinitesimal step toward the bottom endpoint, so a Y node on the
// top endpoint itself sends it below, and an X node whose segment passes through the top endpoint is decided
// by the side the bottom endpoint is on
std::size_t Triangulator::locateSegmentStart(const std::size_t& nSeg) const
{
    const Segment& seg = segs[nSeg];
    const Vec2& pa = pts[seg.a];
    const Vec2& pb = pts[seg.b];
    std::size_t node = rootNode;
    for (;;)
    {
        const Node& nd = tree[node];
        if (nd.kind == LEAF_NODE) return nd.index;
        if (nd.kind == Y_NODE)
        {
            const Vec2& split = pts[nd.index];
            const bool below = (pa == split || isBelow(pa, split));
            node = (below ? nd.first : nd.second);
        }
        else {
            const Segment& other = segs[nd.index];
            double side = other.cross(pts, pa);
            if (side == 0.0) side = other.cross(pts, pb);
            node = (side > 0.0 ? nd.first : nd.second);
        }
    }
}




std::size_t Triangulator::insertPoint(const std::size_t& n)
{
    check(n < numPts, "Only polygon points can be inserted");
    if (done[n]) return TRAP_UNDEFINED_INDEX;
    done[n] = true;

    // Fetch the leaf pointing to the trapezoid that currently contains this point
    const Vec2 pt = pts[n];
    const std::size_t leaf = insertionLeaf(pt);
    const std::size_t t0 = tree[leaf].index;
    check(pt[1] >= traps[t0].yMin && pt[1] <= traps[t0].yMax, "Point lies outside the Y range of its trapezoid");

    // Split t0 along the Y of the point: t0 is recycled as the lower half and t1 is the new upper half
    const std::size_t t1 = traps.size();
    const std::size_t n0 = addNode(LEAF_NODE, t0);
    const std::size_t n1 = addNode(LEAF_NODE, t1);
    Trapezoid upper = traps[t0];
    upper.yMin = pt[1];
    upper.lo = n;
    upper.node = n1;
    upper.bot = {t0, TRAP_UNDEFINED_INDEX};
    traps.push_back(upper);

    Trapezoid& lower = traps[t0];
    lower.yMax = pt[1];
    lower.hi = n;
    lower.node = n0;
    lower.top = {t1, TRAP_UNDEFINED_INDEX};

    // The old upper neighbours now sit on top of t1
    for (std::size_t k = 0; k < 2; k++)
    {
        const std::size_t above = traps[t1].top[k];
        if (above == TRAP_UNDEFINED_INDEX) continue;
        std::array<std::size_t,2>& bot = traps[above].bot;
        if (bot[0] == t0) bot[0] = t1;
        else if (bot[1] == t0) bot[1] = t1;
        else check(false, "Upper neighbour does not link back to the split trapezoid");
    }

    // The leaf becomes a Y node keyed on the point
    Node& node = tree[leaf];
    node.kind = Y_NODE;
    node.index = n;
    node.first = n0;
    node.second = n1;
    return t1;
}




std::size_t Triangulator::insertSegment(const std::size_t& nSeg, std::vector<std::string>* messages)
{
    check(nSeg < numPts, "Only polygon segments can be inserted");
    if (segDone[nSeg]) return 0;
    segDone[nSeg] = true;

    const Segment seg = segs[nSeg];
    const std::string name = "segment " + std::to_string(nSeg);
    if (insertPoint(seg.a) != TRAP_UNDEFINED_INDEX && messages)
    {
        messages->push_back("Added start point " + formatPoint(pts[seg.a]) + " of " + name);
    }
    if (insertPoint(seg.b) != TRAP_UNDEFINED_INDEX && messages)
    {
        messages->push_back("Added end point " + formatPoint(pts[seg.b]) + " of " + name);
    }

    const std::size_t t0 = locateSegmentStart(nSeg);
    check(pts[traps[t0].hi] == pts[seg.a], "First trapezoid of a segment does not start at its top point");
    const std::vector<std::size_t> chain = gatherChain(t0, nSeg);
    return slice(chain, nSeg, messages);
}




// Walk down from t0 through the trapezoids the segment crosses, until the one whose bottom line passes
// through the lower endpoint. A trapezoid with two lower neighbours has them separated by a segment hanging
// from its bottom point, so the side of that point decides which one the new segment enters
std::vector<std::size_t> Triangulator::gatherChain(const std::size_t& t0, const std::size_t& nSeg) const
{
    const Segment& seg = segs[nSeg];
    const Vec2& pb = pts[seg.b];
    std::vector<std::size_t> chain;
    std::size_t t = t0;
    chain.push_back(t);
    while (isBelow(pb, pts[traps[t].lo]))
    {
        const Trapezoid& trap = traps[t];
        std::size_t next = trap.bot[0];
        if (trap.bot[1] != TRAP_UNDEFINED_INDEX && seg.left(pts, pts[trap.lo])) next = trap.bot[1];
        check(next != TRAP_UNDEFINED_INDEX, "Segment chain ends before the lower point");
        check(chain.size() < traps.size(), "Segment chain does not terminate");
        t = next;
        chain.push_back(t);
    }
    check(pts[traps[t].lo] == pb, "Segment chain passes the lower point");
    return chain;
}




std::size_t Triangulator::slice(const std::vector<std::size_t>& chain, const std::size_t& nSeg,
                                std::vector<std::string>* messages)
{
    const Segment& seg = segs[nSeg];
    const std::size_t count = chain.size();
    std::vector<Trapezoid> before(count);
    std::vector<std::size_t> rights(count);
    for (std::size_t i = 0; i < count; i++) before[i] = traps[chain[i]];

    // First divide each trapezoid of the chain in two and wire up the leaf nodes. t0 is recycled as the left
    // half (new right segment) and t1 is appended as the right half
    for (std::size_t i = 0; i < count; i++)
    {
        const std::size_t t0 = chain[i];
        const std::size_t leaf = traps[t0].node;
        const Trapezoid& trap = traps[t0];
        const double yMid = 0.5 * (trap.yMin + trap.yMax);
        const double xL = segs[trap.left].getX(pts, yMid);
        const double xR = segs[trap.right].getX(pts, yMid);
        const double x = seg.getX(pts, yMid);
        check(x > xL - TRAP_FINE && x < xR + TRAP_FINE, "Segment does not pass through the trapezoid it slices");
        check(tree[leaf].kind == LEAF_NODE && tree[leaf].index == t0, "Sliced trapezoid is not held by a leaf");

        const std::size_t t1 = traps.size();
        const std::size_t n0 = addNode(LEAF_NODE, t0);
        const std::size_t n1 = addNode(LEAF_NODE, t1);
        Trapezoid right = before[i];
        right.left = nSeg;
        right.node = n1;
        right.top = {TRAP_UNDEFINED_INDEX, TRAP_UNDEFINED_INDEX};
        right.bot = {TRAP_UNDEFINED_INDEX, TRAP_UNDEFINED_INDEX};
        traps.push_back(right);

        Trapezoid& left = traps[t0];
        left.right = nSeg;
        left.node = n0;
        left.top = {TRAP_UNDEFINED_INDEX, TRAP_UNDEFINED_INDEX};
        left.bot = {TRAP_UNDEFINED_INDEX, TRAP_UNDEFINED_INDEX};

        // The leaf becomes an X node split by the segment
        Node& node = tree[leaf];
        node.kind = X_NODE;
        node.index = nSeg;
        node.first = n0;
        node.second = n1;
        rights[i] = t1;
        if (messages) messages->push_back("  Sliced " + std::to_string(t0) + " -> " + std::to_string(t1));
    }

    // Then reconnect the neighbours above and below every slice
    for (std::size_t i = 0; i < count; i++)
    {
        restitch(chain, rights, before, i, nSeg, true);
        restitch(chain, rights, before, i, nSeg, false);
    }
    return count;
}




// Reconnect one side (upper or lower) of the i-th sliced trapezoid. Three situations arise when the old
// trapezoid had two neighbours on that side (the new segment is marked with *):
//
//              |                    |                       |
//     A. -------------     B. -------------        C. -------------
//              *                       *                *
//
// A: each neighbour touches one half, B: the left neighbour touches the left half only and the right one
// touches both, C: the mirror of B. With one neighbour it touches both halves, except a half whose edge has
// shrunk to a point because the segment ends in a corner. All of this reduces to checking which side of the
// segment the neighbour's shared edge extends to. A neighbour that is itself in the chain was cut by the same
// segment, so left halves join left halves and right halves join right halves.
void Triangulator::restitch(const std::vector<std::size_t>& chain, const std::vector<std::size_t>& rights,
                            const std::vector<Trapezoid>& before, const std::size_t& i,
                            const std::size_t& nSeg, const bool& upper)
{
    const Trapezoid& old = before[i];
    const double y = (upper ? old.yMax : old.yMin);
    const double xl = segs[old.left].getX(pts, y);
    const double xr = segs[old.right].getX(pts, y);
    const double xs = segs[nSeg].getX(pts, y);
    const std::size_t adjacent = (upper ? (i > 0 ? chain[i-1] : TRAP_UNDEFINED_INDEX)
                                        : (i + 1 < chain.size() ? chain[i+1] : TRAP_UNDEFINED_INDEX));
    std::vector<std::size_t> leftLinks;
    std::vector<std::size_t> rightLinks;
    const std::array<std::size_t,2>& links = old.links(upper);
    for (std::size_t k = 0; k < 2; k++)
    {
        const std::size_t nb = links[k];
        if (nb == TRAP_UNDEFINED_INDEX) continue;
        if (nb == adjacent)
        {
            const std::size_t j = (upper ? i - 1 : i + 1);
            leftLinks.push_back(chain[j]);
            rightLinks.push_back(rights[j]);
            continue;
        }

        // Overlap of the neighbour's edge with the old trapezoid's edge on the shared line
        Trapezoid& other = traps[nb];
        const double ol = std::max(xl, segs[other.left].getX(pts, y));
        const double orr = std::min(xr, segs[other.right].getX(pts, y));
        const bool toLeft = (ol < xs - TRAP_FINE);
        const bool toRight = (orr > xs + TRAP_FINE);
        check(toLeft || toRight, "Neighbour touches neither half of a sliced trapezoid");
        if (toLeft) leftLinks.push_back(nb);
        if (toRight) rightLinks.push_back(nb);

        // Rewrite the neighbour's links back to the old trapezoid
        std::array<std::size_t,2>& back = other.links(!upper);
        std::vector<std::size_t> replaced;
        for (std::size_t m = 0; m < 2; m++)
        {
            if (back[m] == TRAP_UNDEFINED_INDEX) continue;
            if (back[m] != chain[i])
            {
                replaced.push_back(back[m]);
                continue;
            }
            if (toLeft) replaced.push_back(chain[i]);
            if (toRight) replaced.push_back(rights[i]);
        }
        check(assignLinks(back, replaced), "Neighbour would get more than two links on one side");
    }
    check(assignLinks(traps[chain[i]].links(upper), leftLinks), "Left half would get more than two neighbours");
    check(assignLinks(traps[rights[i]].links(upper), rightLinks), "Right half would get more than two neighbours");
}




std::vector<std::pair<std::size_t,Quad> > Triangulator::getTrapezoids(const double& inset) const
{
    std::vector<std::pair<std::size_t,Quad> > output;
    output.reserve(traps.size());
    for (std::size_t i = 0; i < traps.size(); i++)
    {
        const Trapezoid& t = traps[i];
        const Segment& a = segs[t.left];
        const Segment& b = segs[t.right];
        const double y0 = t.yMin + inset;
        const double y1 = t.yMax - inset;
        Quad quad;
        quad[0] = {a.getX(pts, y0) + inset, y0};
        quad[1] = {b.getX(pts, y0) - inset, y0};
        quad[2] = {b.getX(pts, y1) - inset, y1};
        quad[3] = {a.getX(pts, y1) + inset, y1};
        output.push_back(std::make_pair(i, quad));
    }
    return output;
}




std::string Triangulator::dumpTrapezoids() const
{
    const std::vector<std::pair<std::size_t,Quad> > quads = getTrapezoids();
    std::string out;
    for (std::size_t i = 0; i < traps.size(); i++)
    {
        const Trapezoid& t = traps[i];
        out += "Trap#" + std::to_string(i) + " Y:" + formatNumber(t.yMin) + " to " + formatNumber(t.yMax) +
               " Left:" + std::to_string(t.left) + " Right:" + std::to_string(t.right);
        for (std::size_t j = 0; j < 4; j++) out += " " + formatPoint(quads[i].second[j]);
        out += "\n";
    }
    return out;
}




std::string Triangulator::dumpNodes() const
{
    std::string out;
    dumpNode(rootNode, 0, out);
    return out;
}


void Triangulator::dumpNode(const std::size_t& node, const std::size_t& level, std::string& out) const
{
    const Node& nd = tree[node];
    out += std::string(level * 3, ' ') + "#" + std::to_string(nd.index);
    if (nd.kind == Y_NODE) out += " Y " + formatNumber(pts[nd.index][1]);
    else if (nd.kind == X_NODE) out += " X";
    else out += " Leaf";
    out += "\n";
    if (nd.first != TRAP_UNDEFINED_INDEX) dumpNode(nd.first, level + 1, out);
    if (nd.second != TRAP_UNDEFINED_INDEX) dumpNode(nd.second, level + 1, out);
}




std::size_t Triangulator::depth(const std::size_t& node) const
{
    const Node& nd = tree[node];
    if (nd.kind == LEAF_NODE) return 1;
    return 1 + std::max(depth(nd.first), depth(nd.second));
}




// Even-odd test against a single loop, using the half-open rule on each edge
bool Triangulator::pointInLoop(const Vec2& p, const std::size_t& loop) const
{
    bool inside = false;
    for (std::size_t i = loopStart[loop]; i < loopStart[loop+1]; i++)
    {
        const Segment& seg = segs[i];
        if (pts[seg.b][1] <= p[1] && p[1] < pts[seg.a][1] && seg.getX(pts, p[1]) > p[0]) inside = !inside;
    }
    return inside;
}




std::vector<std::size_t> Triangulator::loopNesting() const
{
    const std::size_t numLoops = loopStart.size() - 1;
    std::vector<std::size_t> nesting(numLoops, 0);
    for (std::size_t i = 0; i < numLoops; i++)
    {
        for (std::size_t j = 0; j < numLoops; j++)
        {
            if (j != i && pointInLoop(pts[loopStart[i]], j)) nesting[i]++;
        }
    }
    return nesting;
}




// The left side of a trapezoid is the nearest edge to its left, so that edge alone decides the even-odd rule
bool Triangulator::isInside(const std::size_t& trap) const
{
    return insideRight[traps[trap].left];
}




Diagnostics Triangulator::computeDiagnostics() const
{
    Diagnostics diagnostics;
    const Vec2& lower = pts[numPts];
    const Vec2& upper = pts[numPts + 3];
    diagnostics.boxArea = (upper[0] - lower[0]) * (upper[1] - lower[1]);

    // Loops nested at an even depth add their area, loops at an odd depth (holes) subtract it
    const std::size_t numLoops = loopStart.size() - 1;
    diagnostics.polygonArea = 0.0;
    for (std::size_t i = 0; i < numLoops; i++)
    {
        double area = 0.0;
        const std::size_t first = loopStart[i];
        const std::size_t last = loopStart[i+1];
        for (std::size_t j = first; j < last; j++)
        {
            const Vec2& p = pts[j];
            const Vec2& q = pts[(j + 1 < last ? j + 1 : first)];
            area += p[0] * q[1] - p[1] * q[0];
        }
        diagnostics.polygonArea += (loopDepth[i] % 2 == 0 ? 0.5 : -0.5) * std::abs(area);
    }

    diagnostics.totalTrapezoidArea = 0.0;
    diagnostics.insideTrapezoidArea = 0.0;
    diagnostics.numInsideTrapezoids = 0;
    for (std::size_t i = 0; i < traps.size(); i++)
    {
        const Trapezoid& t = traps[i];
        const Segment& a = segs[t.left];
        const Segment& b = segs[t.right];
        const double bottomWidth = b.getX(pts, t.yMin) - a.getX(pts, t.yMin);
        const double topWidth = b.getX(pts, t.yMax) - a.getX(pts, t.yMax);
        const double area = 0.5 * (bottomWidth + topWidth) * (t.yMax - t.yMin);
        diagnostics.totalTrapezoidArea += area;
        if (isInside(i))
        {
            diagnostics.insideTrapezoidArea += area;
            diagnostics.numInsideTrapezoids++;
        }
    }
    diagnostics.areaDiff = diagnostics.totalTrapezoidArea - diagnostics.boxArea;
    diagnostics.insideAreaDiff = diagnostics.insideTrapezoidArea - diagnostics.polygonArea;
    diagnostics.numTrapezoids = traps.size();
    diagnostics.numNodes = tree.size();
    diagnostics.maxDepth = depth(rootNode);
    return diagnostics;
}




std::vector<std::pair<std::size_t,Quad> >
Trapezoidal::decompose(const std::vector<std::vector<Vec2> >& contours,
                       Diagnostics& diagnostics,
                       const std::uint32_t& seed)
{
    Triangulator map(contours, seed);
    map.process();
    diagnostics = map.computeDiagnostics();

    const std::vector<std::pair<std::size_t,Quad> > all = map.getTrapezoids();
    std::vector<std::pair<std::size_t,Quad> > inside;
    for (std::size_t i = 0; i < all.size(); i++)
    {
        const Trapezoid& t = map.trapezoids()[i];
        if (t.yMax - t.yMin <= TRAP_FINE) continue;    // Zero height, from two vertices sharing a Y
        if (map.isInside(i)) inside.push_back(all[i]);
    }
    return inside;
}
