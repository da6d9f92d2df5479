#include "common/geometry.h"
#include <opencv2/imgproc.hpp>
#include <algorithm>
#include <cmath>

namespace refnum {

cv::Rect2f Geometry::boundingRect(const std::vector<cv::Point2f>& polygon) {
    if (polygon.empty()) {
        return cv::Rect2f();
    }

    float min_x = polygon[0].x, max_x = polygon[0].x;
    float min_y = polygon[0].y, max_y = polygon[0].y;

    for (size_t i = 1; i < polygon.size(); i++) {
        min_x = std::min(min_x, polygon[i].x);
        max_x = std::max(max_x, polygon[i].x);
        min_y = std::min(min_y, polygon[i].y);
        max_y = std::max(max_y, polygon[i].y);
    }

    return cv::Rect2f(min_x, min_y, max_x - min_x, max_y - min_y);
}

float Geometry::polygonArea(const std::vector<cv::Point2f>& polygon) {
    if (polygon.size() < 3) {
        return 0.0f;
    }
    return static_cast<float>(cv::contourArea(polygon));
}

float Geometry::calculateIoU(const cv::Rect2f& rect1, const cv::Rect2f& rect2) {
    cv::Rect2f intersection = rect1 & rect2;
    float inter_area = intersection.area();

    float union_area = rect1.area() + rect2.area() - inter_area;

    if (union_area <= 0.0f) {
        return 0.0f;
    }

    return inter_area / union_area;
}

float Geometry::calculatePolygonIoU(const std::vector<cv::Point2f>& poly1,
                                    const std::vector<cv::Point2f>& poly2) {
    if (poly1.size() < 3 || poly2.size() < 3) {
        return 0.0f;
    }

    std::vector<cv::Point2f> hull1, hull2;
    cv::convexHull(poly1, hull1);
    cv::convexHull(poly2, hull2);

    float area1 = polygonArea(hull1);
    float area2 = polygonArea(hull2);
    if (area1 <= 0.0f || area2 <= 0.0f) {
        return 0.0f;
    }

    std::vector<cv::Point2f> inter_poly;
    float inter_area = cv::intersectConvexConvex(hull1, hull2, inter_poly, true);
    if (inter_area <= 0.0f) {
        return 0.0f;
    }

    float union_area = area1 + area2 - inter_area;
    if (union_area <= 0.0f) {
        return 0.0f;
    }

    return inter_area / union_area;
}

} // namespace refnum
