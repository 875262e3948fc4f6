#ifndef TRAPEZOIDALTEST_H
#define TRAPEZOIDALTEST_H




#include "trapezoidal.h"
#include <iostream>
#include <stdlib.h>
#include <QImage>
#include <QPainter>
#include <QFile>
#include <QFileInfo>
#include <QDir>
#include <QTextStream>




using namespace Trapezoidal;




namespace TrapezoidalTest
{

    int exportContoursToImage(const std::vector<std::vector<Vec2> >& contours,
                              const QString& imageFilePath,
                              const int& imageWidth = 1000);


    // Inside trapezoids are filled from a palette, outside ones are left dark, all are outlined
    int exportTrapezoidsToImage(const Triangulator& map,
                                const QString& imageFilePath,
                                const int& imageWidth = 1000,
                                const double& inset = 0.0);


    int exportTextToFile(const std::string& text,
                         const QString& filePath);


    std::string importTextFromFile(const QString& filePath);


    // Each checker returns the trapezoid slots that break the property (empty means all good)

    // Leaf node of every trapezoid points back at it, and every leaf's trapezoid points at that leaf
    std::vector<std::size_t>
    testLeafConsistency(const Triangulator& map);


    // Every inserted point keys exactly one Y node, and no point that is not done keys any (returns point indices)
    std::vector<std::size_t>
    testYNodeKeys(const Triangulator& map);


    // yMin <= yMax and the left side never crosses the right side
    std::vector<std::size_t>
    testLeftRightOrder(const Triangulator& map);


    // Every upper neighbour lists the trapezoid as a lower neighbour and vice versa
    std::vector<std::size_t>
    testAdjacencySymmetry(const Triangulator& map);


    // Linked trapezoids share a split line and their spans overlap on it, left link before right link
    std::vector<std::size_t>
    testNeighbourGeometry(const Triangulator& map);


    // Locating the centre of a (non-degenerate) trapezoid returns that trapezoid
    std::vector<std::size_t>
    testPointLocation(const Triangulator& map);


    // Inside flags agree with an even-odd ray cast from each (non-degenerate) trapezoid's centre
    std::vector<std::size_t>
    testInsideClassification(const Triangulator& map,
                             const std::vector<std::vector<Vec2> >& contours);


    std::vector<Vec2>
    createStarPolygon(const int& seed,
                      bool& success,
                      const std::size_t& numVertices,
                      const double& minRadius,
                      const double& maxRadius,
                      const Vec2& center = {0.0, 0.0});


    // Retries successive seeds until a polygon without horizontal edges comes out
    std::vector<Vec2>
    createStarPolygon2(const int& startingSeed,
                       int& nextSeed,
                       const std::size_t& numVertices,
                       const double& minRadius = 6.0,
                       const double& maxRadius = 10.0,
                       const int& timeout = 100000);


    // Outer contour plus one hole that stays inside the outer contour's kernel
    std::vector<std::vector<Vec2> >
    createPolygonWithHole(const int& startingSeed,
                          int& nextSeed,
                          const std::size_t& numOuterVertices,
                          const std::size_t& numHoleVertices);

}




#endif // TRAPEZOIDALTEST_H
