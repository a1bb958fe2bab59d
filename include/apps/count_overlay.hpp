#pragma once

#include <string>
#include <vector>

#include <opencv2/core.hpp>

#include "core/config.hpp"
#include "core/count_snapshot.hpp"
#include "core/counter_definitions.hpp"

namespace occ {

// Draws zones, lines, active tracks and their counts onto a BGR frame
class CountOverlay {
public:
  explicit CountOverlay(VisualizationConfig cfg);

  void draw(cv::Mat& bgr,
            const std::vector<LineDefinition>& lines,
            const std::vector<ZoneDefinition>& zones,
            const CountSnapshot& snapshot) const;

  // Stable per-class color, BGR
  static cv::Scalar ClassColor(int class_id);

private:
  void draw_zones(cv::Mat& bgr, const std::vector<ZoneDefinition>& zones, const CountSnapshot& snapshot) const;
  void draw_lines(cv::Mat& bgr, const std::vector<LineDefinition>& lines, const CountSnapshot& snapshot) const;
  void draw_tracks(cv::Mat& bgr, const CountSnapshot& snapshot) const;

  // Label with dark background and colored border, centered on 'anchor'
  static void DrawLabel(cv::Mat& bgr, const std::string& text, cv::Point anchor, const cv::Scalar& color);

  VisualizationConfig cfg_;
};

} // namespace occ
