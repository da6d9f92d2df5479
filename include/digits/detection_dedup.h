#pragma once

#include "common/config.h"
#include "common/types.hpp"
#include <vector>

namespace refnum {

/**
 * @brief Drops detections that cover the same glyphs as a more confident one
 */
class DetectionDeduplicator {
public:
    explicit DetectionDeduplicator(float overlapThreshold = 0.5f,
                                   OverlapMode mode = OverlapMode::BoundingBox);

    /**
     * @brief Greedy suppression in descending confidence order
     *
     * Equal confidences keep input order. A number is rejected when its
     * overlap with an already accepted one is above the threshold.
     */
    std::vector<ValidatedNumber> dedup(const std::vector<ValidatedNumber>& numbers) const;

    /**
     * @brief IoU of two boxes under the configured mode
     */
    float overlap(const std::vector<cv::Point2f>& box1,
                  const std::vector<cv::Point2f>& box2) const;

private:
    float overlapThreshold_;
    OverlapMode mode_;
};

} // namespace refnum
