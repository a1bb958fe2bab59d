#include "apps/count_overlay.hpp"

#include <opencv2/imgproc.hpp>

#include <algorithm>
#include <cmath>
#include <sstream>
#include <utility>

#include "core/labels/general_labels.hpp"

namespace occ {

static const cv::Scalar kLineColor(0, 165, 255);   // Orange
static const cv::Scalar kZoneColor(255, 0, 255);   // Magenta
static constexpr double kZoneFillAlpha = 0.3;

static cv::Point ToCv(const Point2f& p) {
  return cv::Point(static_cast<int>(std::lround(p.x)), static_cast<int>(std::lround(p.y)));
}

CountOverlay::CountOverlay(VisualizationConfig cfg) : cfg_(std::move(cfg)) {}

cv::Scalar CountOverlay::ClassColor(int class_id) {
  const int c = std::abs(class_id);
  const int r = ((c * 123) % 200) + 55;
  const int g = ((c * 456) % 200) + 55;
  const int b = ((c * 789) % 200) + 55;
  return cv::Scalar(b, g, r);
}

void CountOverlay::DrawLabel(cv::Mat& bgr, const std::string& text, cv::Point anchor, const cv::Scalar& color) {
  const int font = cv::FONT_HERSHEY_SIMPLEX;
  const double scale = 0.6;
  const int thickness = 2;

  int baseline = 0;
  const cv::Size ts = cv::getTextSize(text, font, scale, thickness, &baseline);

  int x = std::max(0, std::min(anchor.x - ts.width / 2, bgr.cols - ts.width - 5));
  int y = std::max(ts.height + 5, anchor.y);

  const cv::Rect box(x - 4, y - ts.height - 7, ts.width + 8, ts.height + 14);
  cv::rectangle(bgr, box, cv::Scalar(30, 30, 30), cv::FILLED);
  cv::rectangle(bgr, box, color, 2);
  cv::putText(bgr, text, cv::Point(x, y), font, scale, cv::Scalar(255, 255, 255), thickness, cv::LINE_AA);
}

void CountOverlay::draw(cv::Mat& bgr,
                        const std::vector<LineDefinition>& lines,
                        const std::vector<ZoneDefinition>& zones,
                        const CountSnapshot& snapshot) const {
  if (bgr.empty()) return;
  draw_zones(bgr, zones, snapshot);
  draw_lines(bgr, lines, snapshot);
  draw_tracks(bgr, snapshot);
}

void CountOverlay::draw_zones(cv::Mat& bgr, const std::vector<ZoneDefinition>& zones, const CountSnapshot& snapshot) const {
  for (const auto& z : zones) {
    std::vector<cv::Point> pts;
    pts.reserve(z.points.size());
    for (const auto& p : z.points) pts.push_back(ToCv(p));
    if (pts.size() < 3) continue;

    cv::Mat fill = bgr.clone();
    cv::fillPoly(fill, std::vector<std::vector<cv::Point>>{pts}, kZoneColor);
    cv::addWeighted(fill, kZoneFillAlpha, bgr, 1.0 - kZoneFillAlpha, 0.0, bgr);
    cv::polylines(bgr, std::vector<std::vector<cv::Point>>{pts}, true, kZoneColor, 2);

    if (!cfg_.show_labels) continue;

    double cx = 0.0, cy = 0.0;
    for (const auto& p : z.points) {
      cx += p.x;
      cy += p.y;
    }
    cx /= static_cast<double>(z.points.size());
    cy /= static_cast<double>(z.points.size());

    std::ostringstream label;
    label << (z.name.empty() ? z.id : z.name);
    if (const ZoneCounts* zc = snapshot.zone(z.id)) label << ": " << zc->total().currently_inside;
    DrawLabel(bgr, label.str(), cv::Point(static_cast<int>(cx), static_cast<int>(cy)), kZoneColor);
  }
}

void CountOverlay::draw_lines(cv::Mat& bgr, const std::vector<LineDefinition>& lines, const CountSnapshot& snapshot) const {
  for (const auto& l : lines) {
    const cv::Point a = ToCv(l.start);
    const cv::Point b = ToCv(l.end);

    cv::line(bgr, a, b, kLineColor, 3, cv::LINE_AA);
    cv::circle(bgr, a, 6, kLineColor, cv::FILLED);
    cv::circle(bgr, b, 6, kLineColor, cv::FILLED);

    if (!cfg_.show_labels) continue;

    std::ostringstream label;
    label << (l.name.empty() ? l.id : l.name);
    if (const LineCounts* lc = snapshot.line(l.id)) {
      const LineCount t = lc->total();
      label << " In:" << t.in << " Out:" << t.out;
    }
    DrawLabel(bgr, label.str(), cv::Point((a.x + b.x) / 2, (a.y + b.y) / 2 - 15), kLineColor);
  }
}

void CountOverlay::draw_tracks(cv::Mat& bgr, const CountSnapshot& snapshot) const {
  for (const auto& t : snapshot.tracks) {
    const cv::Scalar color = ClassColor(t.class_id);
    const cv::Point tl(static_cast<int>(t.bbox.x1), static_cast<int>(t.bbox.y1));
    const cv::Point br(static_cast<int>(t.bbox.x2), static_cast<int>(t.bbox.y2));

    cv::rectangle(bgr, tl, br, color, 2);
    cv::circle(bgr, ToCv(t.center), 4, color, cv::FILLED);

    if (!cfg_.show_track_ids) continue;

    std::ostringstream label;
    label << "#" << t.id << " " << GeneralClassName(t.class_id);
    cv::putText(bgr, label.str(), cv::Point(tl.x + 2, std::max(12, tl.y - 5)),
                cv::FONT_HERSHEY_SIMPLEX, 0.5, color, 1, cv::LINE_AA);
  }
}

} // namespace occ
