#pragma once

#include <opencv2/core.hpp>
#include <vector>

namespace refnum {

/**
 * @brief Geometry helpers for detection boxes
 */
class Geometry {
public:
    /**
     * @brief Axis-aligned bounding rectangle from min/max x and y
     */
    static cv::Rect2f boundingRect(const std::vector<cv::Point2f>& polygon);

    /**
     * @brief Unsigned polygon area, 0 for fewer than 3 points
     */
    static float polygonArea(const std::vector<cv::Point2f>& polygon);

    /**
     * @brief IoU of two rectangles
     */
    static float calculateIoU(const cv::Rect2f& rect1, const cv::Rect2f& rect2);

    /**
     * @brief IoU of the convex hulls of two polygons
     *
     * Exact for convex quads; concave input is measured on its hull.
     */
    static float calculatePolygonIoU(const std::vector<cv::Point2f>& poly1,
                                     const std::vector<cv::Point2f>& poly2);
};

} // namespace refnum
