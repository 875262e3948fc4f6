#ifndef TRAPEZOIDAL_H
#define TRAPEZOIDAL_H




#include <array>
#include <vector>
#include <string>
#include <random>
#include <stdexcept>
#include <cstdint>
#include <limits>
#include <utility>




namespace Trapezoidal
{

// Constants


    const double        TRAP_FINE            = 1e-9;    // Tolerance for boundary alignment tests
    const double        TRAP_BOX_MARGIN      = 1.0;     // Bounding box is inflated by this much on every side
    const std::uint32_t TRAP_DEFAULT_SEED    = 4;
    const std::size_t   TRAP_UNDEFINED_INDEX = std::numeric_limits<std::size_t>::max();


    typedef  std::array<double,2>  Vec2;
    typedef  std::array<Vec2,4>    Quad;    // Bottom-left, bottom-right, top-right, top-left




// Errors


    class Error : public std::runtime_error
    {
    public:
        explicit Error(const std::string& what) : std::runtime_error(what) {}
    };


    // A polygon edge whose endpoints share a Y coordinate (not supported)
    class HorizontalEdgeError : public Error
    {
    public:
        explicit HorizontalEdgeError(const std::string& what) : Error(what) {}
    };


    // Empty input or a loop with fewer than three vertices
    class InvalidInputError : public Error
    {
    public:
        explicit InvalidInputError(const std::string& what) : Error(what) {}
    };


    // A consistency check failed, which means there is a logic error in the decomposition
    class InternalError : public Error
    {
    public:
        explicit InternalError(const std::string& what) : Error(what) {}
    };




// Public API


    // Diagnostic output from the decomposition, user can check if the trapezoidal map is incorrect
    struct Diagnostics
    {
        double boxArea;
        double totalTrapezoidArea;
        double areaDiff;               // totalTrapezoidArea - boxArea, if abs(areaDiff) > EPS, then something is wrong
        double polygonArea;
        double insideTrapezoidArea;
        double insideAreaDiff;         // insideTrapezoidArea - polygonArea, same idea as areaDiff
        std::size_t numTrapezoids;
        std::size_t numInsideTrapezoids;
        std::size_t numNodes;
        std::size_t maxDepth;          // Longest root-to-leaf path in the search structure, counted in nodes
    };


    // Decompose a set of polygon contours (outer contours and holes, any nesting) into trapezoids
    // Note: only the trapezoids inside the polygon are returned, each paired with its slot in the map
    std::vector<std::pair<std::size_t,Quad> >
    decompose(const std::vector<std::vector<Vec2> >& contours,
              Diagnostics& diagnostics,
              const std::uint32_t& seed = TRAP_DEFAULT_SEED);




// Map structures


    // Each segment runs from top to bottom
    struct Segment
    {
        std::size_t a;    // Upper point
        std::size_t b;    // Lower point
        double slope;     // dx/dy

        // X value of the supporting line at a given Y (not clamped to the segment)
        double getX(const std::vector<Vec2>& pts, const double& y) const
        {
            return pts[this->b][0] + this->slope * (y - pts[this->b][1]);
        }

        // Positive if p is to the left of the segment, negative if right, zero if on the line
        double cross(const std::vector<Vec2>& pts, const Vec2& p) const
        {
            const Vec2& pa = pts[this->a];
            const Vec2& pb = pts[this->b];
            return (pa[0] - pb[0]) * (p[1] - pb[1]) - (pa[1] - pb[1]) * (p[0] - pb[0]);
        }

        bool left(const std::vector<Vec2>& pts, const Vec2& p) const { return this->cross(pts, p) > 0.0; }
    };


    struct Trapezoid
    {
        double yMin;
        double yMax;
        std::size_t lo;                  // Point whose horizontal line is the bottom boundary
        std::size_t hi;                  // Point whose horizontal line is the top boundary
        std::size_t left;                // Segment
        std::size_t right;               // Segment
        std::size_t node;                // Leaf node in the search structure
        std::array<std::size_t,2> top;   // Upper neighbours, [0] is the left one (A), [1] the right one (B)
        std::array<std::size_t,2> bot;   // Lower neighbours, same order

        std::array<std::size_t,2>& links(const bool& upper) { return (upper ? this->top : this->bot); }
        const std::array<std::size_t,2>& links(const bool& upper) const { return (upper ? this->top : this->bot); }

        std::size_t topA() const { return this->top[0]; }
        std::size_t topB() const { return this->top[1]; }
        std::size_t botA() const { return this->bot[0]; }
        std::size_t botB() const { return this->bot[1]; }
    };


    enum NodeKind
    {
        Y_NODE    = 0,    // Split on a point, first = below, second = at/above
        X_NODE    = 1,    // Split on a segment, first = left, second = right
        LEAF_NODE = 2,    // References a trapezoid
    };


    struct Node
    {
        NodeKind kind;
        std::size_t index;     // Point (Y_NODE), segment (X_NODE) or trapezoid (LEAF_NODE)
        std::size_t first;
        std::size_t second;
        std::size_t id;        // Diagnostic only
    };


    // Sweep order is by y-coordinate, with ties decided by x-coordinate
    static bool isBelow(const Vec2& a, const Vec2& b)
    {
        if (a[1] < b[1]) return true;
        if (a[1] > b[1]) return false;
        if (a[0] < b[0]) return true;
        return false;
    }


    // Replace a neighbour list with the given trapezoids, left to right (at most two fit)
    static bool assignLinks(std::array<std::size_t,2>& links, const std::vector<std::size_t>& traps)
    {
        if (traps.size() > 2) return false;
        links[0] = (traps.size() > 0 ? traps[0] : TRAP_UNDEFINED_INDEX);
        links[1] = (traps.size() > 1 ? traps[1] : TRAP_UNDEFINED_INDEX);
        return true;
    }




// Trapezoidal map with its point-location structure, built by randomized incremental construction


    class Triangulator
    {
    public:

        // Builds the point and segment tables and the single root trapezoid, no edge is processed yet
        explicit Triangulator(const std::vector<std::vector<Vec2> >& contours,
                              const std::uint32_t& seed = TRAP_DEFAULT_SEED);

        // Reorder the unprocessed segments with the given random number generator (Fisher-Yates)
        template <typename URNG>
        void shuffle(URNG& random)
        {
            this->check(this->nextSeg == 0, "Segment order cannot change once processing has started");
            for (std::size_t i = 0; i < this->segOrder.size(); i++) this->segOrder[i] = i;
            for (std::size_t i = this->segOrder.size(); i > 1; i--)
            {
                std::uniform_int_distribution<std::size_t> pick(0, i - 1);
                std::swap(this->segOrder[i-1], this->segOrder[pick(random)]);
            }
        }

        // Process all segments in the shuffled order
        void process();

        // Process the next segment in the shuffled order, returns false once all segments are done
        bool processNext(std::vector<std::string>* messages = nullptr);

        // Split the trapezoid containing point n horizontally, returns the new upper trapezoid
        // (TRAP_UNDEFINED_INDEX if the point was already inserted)
        std::size_t insertPoint(const std::size_t& n);

        // Insert both endpoints of a polygon edge and slice every trapezoid it crosses, returns the number sliced
        std::size_t insertSegment(const std::size_t& nSeg,
                                  std::vector<std::string>* messages = nullptr);

        // Point location, a query on a split line belongs to the trapezoid above it
        std::size_t locate(const Vec2& p) const;
        std::size_t findSlice(const Vec2& p, const bool& below) const;

        // Diagnostic extraction
        std::vector<std::pair<std::size_t,Quad> > getTrapezoids(const double& inset = 0.0) const;
        std::string dumpTrapezoids() const;
        std::string dumpNodes() const;
        bool isInside(const std::size_t& trap) const;    // Meaningful once every segment is processed
        Diagnostics computeDiagnostics() const;

        const std::vector<Vec2>& points() const { return this->pts; }
        const std::vector<Segment>& segments() const { return this->segs; }
        const std::vector<Trapezoid>& trapezoids() const { return this->traps; }
        const std::vector<Node>& nodes() const { return this->tree; }
        const std::vector<std::size_t>& order() const { return this->segOrder; }
        std::size_t root() const { return this->rootNode; }
        std::size_t numPolygonPoints() const { return this->numPts; }
        bool isDone(const std::size_t& n) const { return this->done[n]; }

    private:

        std::size_t addNode(const NodeKind& kind, const std::size_t& index);
        std::size_t insertionLeaf(const Vec2& p) const;
        std::size_t locateSegmentStart(const std::size_t& nSeg) const;
        std::vector<std::size_t> gatherChain(const std::size_t& t0, const std::size_t& nSeg) const;
        std::size_t slice(const std::vector<std::size_t>& chain, const std::size_t& nSeg,
                          std::vector<std::string>* messages);
        void restitch(const std::vector<std::size_t>& chain, const std::vector<std::size_t>& rights,
                      const std::vector<Trapezoid>& before, const std::size_t& i,
                      const std::size_t& nSeg, const bool& upper);
        bool pointInLoop(const Vec2& p, const std::size_t& loop) const;
        std::vector<std::size_t> loopNesting() const;
        std::size_t depth(const std::size_t& node) const;
        void dumpNode(const std::size_t& node, const std::size_t& level, std::string& out) const;
        void check(const bool& condition, const char* what) const;

        std::vector<Vec2> pts;
        std::vector<bool> done;
        std::vector<Segment> segs;
        std::vector<bool> segDone;
        std::vector<std::size_t> segOrder;
        std::vector<std::size_t> loopStart;    // First point of each loop, plus one past the last
        std::vector<std::size_t> loopDepth;    // Number of other loops enclosing each loop
        std::vector<bool> insideRight;         // Polygon interior lies on the +x side of the segment
        std::vector<Trapezoid> traps;
        std::vector<Node> tree;
        std::size_t rootNode;
        std::size_t nodeID;
        std::size_t numPts;
        std::size_t nextSeg;
    };

}




#endif // TRAPEZOIDAL_H
