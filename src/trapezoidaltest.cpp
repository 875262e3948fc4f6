


#include "trapezoidaltest.h"
#include <algorithm>
#include <cmath>
#include <limits>




using namespace Trapezoidal;
using namespace TrapezoidalTest;




int TrapezoidalTest::exportContoursToImage(const std::vector<std::vector<Vec2> >& contours,
                                           const QString& imageFilePath,
                                           const int& imageWidth)
{
    // Set some image parameters
    const int IMAGE_WIDTH      = imageWidth;
    const int LINE_WIDTH       = 3;
    const double GROWTH_FACTOR = 1.01;

    // Compute the bounding box for all contours
    Vec2 lower = contours[0][0];
    Vec2 upper = contours[0][0];
    for (std::size_t i = 0; i < contours.size(); i++)
    {
        for (std::size_t j = 0; j < contours[i].size(); j++)
        {
            lower[0] = std::min(lower[0], contours[i][j][0]);
            lower[1] = std::min(lower[1], contours[i][j][1]);
            upper[0] = std::max(upper[0], contours[i][j][0]);
            upper[1] = std::max(upper[1], contours[i][j][1]);
        }
    }
    const Vec2 center = {0.5 * (lower[0] + upper[0]), 0.5 * (lower[1] + upper[1])};
    const double paddedWidth = GROWTH_FACTOR * std::max( upper[0] - lower[0], upper[1] - lower[1] );
    const double scaleFactor = double(IMAGE_WIDTH) / paddedWidth;
    const double imageHalfWidth = 0.5 * double(IMAGE_WIDTH);

    // Initialize the image and painter
    QImage image(IMAGE_WIDTH, IMAGE_WIDTH, QImage::Format::Format_RGB32);
    image.fill(0);
    QPainter painter;
    painter.begin(&image);
    painter.setPen( QPen(Qt::white, LINE_WIDTH, Qt::SolidLine) );
    std::array<QColor,6> palette = {Qt::red, Qt::green, Qt::blue,
                                    Qt::cyan, Qt::magenta, Qt::yellow};

    // Draw contours, one colour per contour
    for (std::size_t i = 0; i < contours.size(); i++)
    {
        const std::vector<Vec2>& contour = contours[i];
        painter.setBrush( QBrush(palette[i % 6], Qt::BrushStyle::SolidPattern) );
        for (std::size_t j = 0; j < contour.size(); j++)
        {
            QPointF points[2];
            points[0].setX( imageHalfWidth + scaleFactor * (contour[j][0] - center[0]) );
            points[0].setY( imageHalfWidth - scaleFactor * (contour[j][1] - center[1]) );
            const std::size_t k = (j+1)%contour.size();
            points[1].setX( imageHalfWidth + scaleFactor * (contour[k][0] - center[0]) );
            points[1].setY( imageHalfWidth - scaleFactor * (contour[k][1] - center[1]) );
            painter.drawLine(points[0], points[1]);
            painter.drawEllipse(points[0], 5, 5);
        }
    }

    // Finalize painter and save image
    painter.end();
    int result = image.save(imageFilePath);
    return result;
}




int TrapezoidalTest::exportTrapezoidsToImage(const Triangulator& map,
                                             const QString& imageFilePath,
                                             const int& imageWidth,
                                             const double& inset)
{
    // Set some image parameters
    const int IMAGE_WIDTH      = imageWidth;
    const int LINE_WIDTH       = 1;
    const double GROWTH_FACTOR = 1.01;

    // The last four points are the corners of the inflated bounding box
    const std::vector<Vec2>& pts = map.points();
    const Vec2& lower = pts[map.numPolygonPoints()];
    const Vec2& upper = pts[map.numPolygonPoints() + 3];
    const Vec2 center = {0.5 * (lower[0] + upper[0]), 0.5 * (lower[1] + upper[1])};
    const double paddedWidth = GROWTH_FACTOR * std::max( upper[0] - lower[0], upper[1] - lower[1] );
    const double scaleFactor = double(IMAGE_WIDTH) / paddedWidth;
    const double imageHalfWidth = 0.5 * double(IMAGE_WIDTH);

    // Initialize the image and painter
    QImage image(IMAGE_WIDTH, IMAGE_WIDTH, QImage::Format::Format_RGB32);
    image.fill(0);
    QPainter painter;
    painter.begin(&image);
    painter.setPen( QPen(Qt::white, LINE_WIDTH, Qt::SolidLine) );
    std::array<QColor,12> palette = {Qt::red, Qt::green, Qt::blue,
                                     Qt::cyan, Qt::magenta, Qt::yellow,
                                     Qt::darkRed, Qt::darkGreen, Qt::darkBlue,
                                     Qt::darkCyan, Qt::darkMagenta, Qt::darkYellow};

    // Draw trapezoids
    const std::vector<std::pair<std::size_t,Quad> > quads = map.getTrapezoids(inset);
    for (std::size_t i = 0; i < quads.size(); i++)
    {
        const QColor color = (map.isInside(quads[i].first) ? palette[i % 12] : QColor(Qt::darkGray));
        painter.setBrush( QBrush(color, Qt::BrushStyle::SolidPattern) );
        QPointF points[4];
        for (std::size_t j = 0; j < 4; j++)
        {
            points[j].setX( imageHalfWidth + scaleFactor * (quads[i].second[j][0] - center[0]) );
            points[j].setY( imageHalfWidth - scaleFactor * (quads[i].second[j][1] - center[1]) );
        }
        painter.drawPolygon(points, 4, Qt::WindingFill);
    }

    // Finalize painter and save image
    painter.end();
    int result = image.save(imageFilePath);
    return result;
}




int TrapezoidalTest::exportTextToFile(const std::string& text, const QString& filePath)
{
    QFile file(filePath);
    if (!file.open(QIODevice::WriteOnly | QIODevice::Text))
    {
        std::cerr << "Text output file could not be opened in WriteOnly mode\n";
        std::cerr << file.errorString().toStdString() <<"\n";
        return -1;
    }
    QTextStream stream(&file);
    stream << QString::fromStdString(text);
    stream.flush();
    file.close();
    return 0;
}




std::string TrapezoidalTest::importTextFromFile(const QString& filePath)
{
    QFile file(filePath);
    if (!file.open(QIODevice::ReadOnly | QIODevice::Text))
    {
        std::cerr << "Text input file could not be opened in ReadOnly mode\n";
        std::cerr << file.errorString().toStdString() <<"\n";
        return std::string();
    }
    QTextStream stream(&file);
    const QString text = stream.readAll();
    file.close();
    return text.toStdString();
}




std::vector<std::size_t>
TrapezoidalTest::testLeafConsistency(const Triangulator& map)
{
    const std::vector<Trapezoid>& traps = map.trapezoids();
    const std::vector<Node>& nodes = map.nodes();
    std::vector<std::size_t> brokenList;
    for (std::size_t i = 0; i < traps.size(); i++)
    {
        const std::size_t node = traps[i].node;
        if (node >= nodes.size() || nodes[node].kind != LEAF_NODE || nodes[node].index != i) brokenList.push_back(i);
    }
    for (std::size_t i = 0; i < nodes.size(); i++)
    {
        if (nodes[i].kind != LEAF_NODE) continue;
        const std::size_t trap = nodes[i].index;
        if (trap >= traps.size() || traps[trap].node != i) brokenList.push_back(trap);
    }
    return brokenList;
}




std::vector<std::size_t>
TrapezoidalTest::testYNodeKeys(const Triangulator& map)
{
    const std::vector<Node>& nodes = map.nodes();
    std::vector<std::size_t> keyCount(map.numPolygonPoints(), 0);
    std::vector<std::size_t> brokenList;
    for (std::size_t i = 0; i < nodes.size(); i++)
    {
        if (nodes[i].kind != Y_NODE) continue;
        if (nodes[i].index >= keyCount.size()) brokenList.push_back(nodes[i].index);
        else keyCount[nodes[i].index]++;
    }
    for (std::size_t n = 0; n < keyCount.size(); n++)
    {
        if (keyCount[n] != (map.isDone(n) ? 1u : 0u)) brokenList.push_back(n);
    }
    return brokenList;
}




std::vector<std::size_t>
TrapezoidalTest::testLeftRightOrder(const Triangulator& map)
{
    const std::vector<Vec2>& pts = map.points();
    const std::vector<Segment>& segs = map.segments();
    const std::vector<Trapezoid>& traps = map.trapezoids();
    std::vector<std::size_t> brokenList;
    for (std::size_t i = 0; i < traps.size(); i++)
    {
        const Trapezoid& t = traps[i];
        const Segment& a = segs[t.left];
        const Segment& b = segs[t.right];
        // Both sides are straight, so checking the two ends covers the whole Y range
        if (t.yMin > t.yMax ||
            a.getX(pts, t.yMin) > b.getX(pts, t.yMin) + TRAP_FINE ||
            a.getX(pts, t.yMax) > b.getX(pts, t.yMax) + TRAP_FINE)
        {
            brokenList.push_back(i);
        }
    }
    return brokenList;
}




std::vector<std::size_t>
TrapezoidalTest::testAdjacencySymmetry(const Triangulator& map)
{
    const std::vector<Trapezoid>& traps = map.trapezoids();
    std::vector<std::size_t> brokenList;
    for (std::size_t i = 0; i < traps.size(); i++)
    {
        bool broken = false;
        for (std::size_t side = 0; side < 2; side++)
        {
            const bool upper = (side == 0);
            const std::array<std::size_t,2>& links = traps[i].links(upper);
            if (links[0] != TRAP_UNDEFINED_INDEX && links[0] == links[1]) broken = true;
            if (links[0] == TRAP_UNDEFINED_INDEX && links[1] != TRAP_UNDEFINED_INDEX) broken = true;
            for (std::size_t k = 0; k < 2; k++)
            {
                if (links[k] == TRAP_UNDEFINED_INDEX) continue;
                if (links[k] >= traps.size())
                {
                    broken = true;
                    continue;
                }
                const std::array<std::size_t,2>& back = traps[links[k]].links(!upper);
                if (back[0] != i && back[1] != i) broken = true;
            }
        }
        if (broken) brokenList.push_back(i);
    }
    return brokenList;
}




std::vector<std::size_t>
TrapezoidalTest::testNeighbourGeometry(const Triangulator& map)
{
    const std::vector<Vec2>& pts = map.points();
    const std::vector<Segment>& segs = map.segments();
    const std::vector<Trapezoid>& traps = map.trapezoids();
    std::vector<std::size_t> brokenList;
    for (std::size_t i = 0; i < traps.size(); i++)
    {
        const Trapezoid& t = traps[i];
        bool broken = false;
        double previousRight = -std::numeric_limits<double>::max();
        for (std::size_t k = 0; k < 2 && !broken; k++)
        {
            const std::size_t nb = t.top[k];
            if (nb == TRAP_UNDEFINED_INDEX) continue;
            if (nb >= traps.size())
            {
                broken = true;
                continue;
            }

            // Same split line: the top point of this one is the bottom point of the upper neighbour
            const Trapezoid& above = traps[nb];
            if (above.lo != t.hi || above.yMin != t.yMax) broken = true;

            // Both spans evaluated on that line must overlap, and the left link must come first
            const double y = t.yMax;
            const double overlapLeft = std::max(segs[t.left].getX(pts, y), segs[above.left].getX(pts, y));
            const double overlapRight = std::min(segs[t.right].getX(pts, y), segs[above.right].getX(pts, y));
            if (overlapRight < overlapLeft - TRAP_FINE) broken = true;
            if (overlapLeft < previousRight - TRAP_FINE) broken = true;
            previousRight = overlapRight;
        }
        if (broken) brokenList.push_back(i);
    }
    return brokenList;
}




std::vector<std::size_t>
TrapezoidalTest::testInsideClassification(const Triangulator& map,
                                          const std::vector<std::vector<Vec2> >& contours)
{
    const std::vector<Vec2>& pts = map.points();
    const std::vector<Segment>& segs = map.segments();
    const std::vector<Trapezoid>& traps = map.trapezoids();
    std::vector<std::size_t> brokenList;
    for (std::size_t i = 0; i < traps.size(); i++)
    {
        const Trapezoid& t = traps[i];
        if (t.yMax - t.yMin <= TRAP_FINE) continue;
        const double yMid = 0.5 * (t.yMin + t.yMax);
        const double xMid = 0.5 * (segs[t.left].getX(pts, yMid) + segs[t.right].getX(pts, yMid));

        // Count edge crossings of a ray towards +x, half-open in Y so shared vertices are counted once
        bool inside = false;
        for (std::size_t c = 0; c < contours.size(); c++)
        {
            const std::vector<Vec2>& contour = contours[c];
            for (std::size_t j = 0; j < contour.size(); j++)
            {
                const Vec2& p = contour[j];
                const Vec2& q = contour[(j+1)%contour.size()];
                if ((p[1] <= yMid) == (q[1] <= yMid)) continue;
                const double x = p[0] + (q[0] - p[0]) * (yMid - p[1]) / (q[1] - p[1]);
                if (x > xMid) inside = !inside;
            }
        }
        if (inside != map.isInside(i)) brokenList.push_back(i);
    }
    return brokenList;
}




std::vector<std::size_t>
TrapezoidalTest::testPointLocation(const Triangulator& map)
{
    const std::vector<Vec2>& pts = map.points();
    const std::vector<Segment>& segs = map.segments();
    const std::vector<Trapezoid>& traps = map.trapezoids();
    std::vector<std::size_t> brokenList;
    for (std::size_t i = 0; i < traps.size(); i++)
    {
        const Trapezoid& t = traps[i];
        if (t.yMax - t.yMin <= TRAP_FINE) continue;    // Zero height, its centre lies on a split line
        const double yMid = 0.5 * (t.yMin + t.yMax);
        const Vec2 center = {0.5 * (segs[t.left].getX(pts, yMid) + segs[t.right].getX(pts, yMid)), yMid};
        if (map.locate(center) != i) brokenList.push_back(i);
    }
    return brokenList;
}




std::vector<Vec2>
TrapezoidalTest::createStarPolygon(const int& seed,
                                   bool& success,
                                   const std::size_t& numVertices,
                                   const double& minRadius,
                                   const double& maxRadius,
                                   const Vec2& center)
{
    const double MIN_DY = 1e-6;    // Anything flatter than this counts as a horizontal edge
    const double JITTER = 0.8;     // Fraction of the angular step an angle may drift forward

    // Angles strictly increase around the centre, so the contour cannot cross itself
    success = false;
    std::vector<Vec2> contour;
    contour.reserve(numVertices);
    srand(seed);
    const double step = 2.0 * M_PI / double(numVertices);
    for (std::size_t i = 0; i < numVertices; i++)
    {
        const double angle = step * (double(i) + JITTER * double(rand() % 100000) / double(100000));
        const double radius = minRadius + (maxRadius - minRadius) * double(rand() % 100000) / double(100000);
        contour.push_back({center[0] + radius * cos(angle), center[1] + radius * sin(angle)});
    }

    for (std::size_t i = 0; i < contour.size(); i++)
    {
        const std::size_t j = (i+1)%contour.size();
        if (std::abs(contour[j][1] - contour[i][1]) < MIN_DY) return contour;
    }
    success = true;
    return contour;
}




std::vector<Vec2>
TrapezoidalTest::createStarPolygon2(const int& startingSeed,
                                    int& nextSeed,
                                    const std::size_t& numVertices,
                                    const double& minRadius,
                                    const double& maxRadius,
                                    const int& timeout)
{
    const int firstSeed = startingSeed;    // startingSeed may alias nextSeed
    int seed = firstSeed;
    bool success = false;
    while (!success && seed - firstSeed < timeout)
    {
        std::vector<Vec2> contour = createStarPolygon(seed, success, numVertices, minRadius, maxRadius);
        seed++;
        if (success)
        {
            nextSeed = seed;
            return contour;
        }
    }
    nextSeed = seed;
    return std::vector<Vec2>();
}




std::vector<std::vector<Vec2> >
TrapezoidalTest::createPolygonWithHole(const int& startingSeed,
                                       int& nextSeed,
                                       const std::size_t& numOuterVertices,
                                       const std::size_t& numHoleVertices)
{
    // Outer radii from 6 to 10 keep a disc of radius 4.5 clear for 8 or more vertices, the hole stays within 4
    std::vector<std::vector<Vec2> > contours;
    contours.push_back( createStarPolygon2(startingSeed, nextSeed, numOuterVertices, 6.0, 10.0) );
    std::vector<Vec2> hole = createStarPolygon2(nextSeed, nextSeed, numHoleVertices, 1.0, 4.0);
    std::reverse(hole.begin(), hole.end());    // Holes run clockwise
    contours.push_back(hole);
    return contours;
}
