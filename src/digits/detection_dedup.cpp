#include "digits/detection_dedup.h"
#include "common/geometry.h"
#include "common/logger.hpp"
#include <algorithm>

namespace refnum {

DetectionDeduplicator::DetectionDeduplicator(float overlapThreshold, OverlapMode mode)
    : overlapThreshold_(overlapThreshold), mode_(mode) {
}

float DetectionDeduplicator::overlap(const std::vector<cv::Point2f>& box1,
                                     const std::vector<cv::Point2f>& box2) const {
    if (mode_ == OverlapMode::Polygon) {
        return Geometry::calculatePolygonIoU(box1, box2);
    }
    return Geometry::calculateIoU(Geometry::boundingRect(box1), Geometry::boundingRect(box2));
}

std::vector<ValidatedNumber> DetectionDeduplicator::dedup(const std::vector<ValidatedNumber>& numbers) const {
    std::vector<ValidatedNumber> sorted(numbers);
    std::stable_sort(sorted.begin(), sorted.end(),
                     [](const ValidatedNumber& a, const ValidatedNumber& b) {
                         return a.confidence > b.confidence;
                     });

    std::vector<ValidatedNumber> kept;
    for (auto& candidate : sorted) {
        bool duplicate = false;
        for (const auto& accepted : kept) {
            float iou = overlap(candidate.box, accepted.box);
            if (iou > overlapThreshold_) {
                LOG_DEBUG("Dropping '{}' (IoU {:.2f} with '{}')",
                          candidate.originalText, iou, accepted.originalText);
                duplicate = true;
                break;
            }
        }
        if (!duplicate) {
            kept.push_back(std::move(candidate));
        }
    }

    return kept;
}

} // namespace refnum
