#include <opencv2/core.hpp>

#include "apps/count_overlay.hpp"

#include "check.hpp"

static void TestDrawsGeometry() {
  occ::VisualizationConfig cfg;
  cfg.show_labels = false;
  cfg.show_track_ids = false;
  occ::CountOverlay overlay(cfg);

  occ::ZoneDefinition zone;
  zone.id = "z";
  zone.points = {{10.f, 10.f}, {90.f, 10.f}, {90.f, 90.f}, {10.f, 90.f}};

  occ::LineDefinition line;
  line.id = "l";
  line.start = {0.f, 150.f};
  line.end = {200.f, 150.f};

  occ::CountSnapshot snap;
  occ::TrackView t;
  t.id = 1;
  t.class_id = 0;
  t.bbox = occ::BBox{120.f, 20.f, 180.f, 80.f};
  t.center = {150.f, 50.f};
  snap.tracks.push_back(t);

  cv::Mat canvas = cv::Mat::zeros(200, 200, CV_8UC3);
  overlay.draw(canvas, {line}, {zone}, snap);

  // Zone interior is tinted magenta, outside stays black
  const cv::Vec3b inside = canvas.at<cv::Vec3b>(50, 50);
  OCC_CHECK(inside[0] > 0 && inside[2] > 0 && inside[1] == 0);
  const cv::Vec3b outside = canvas.at<cv::Vec3b>(190, 100);
  OCC_CHECK(outside[0] == 0 && outside[1] == 0 && outside[2] == 0);

  // Line pixels are orange
  const cv::Vec3b on_line = canvas.at<cv::Vec3b>(150, 100);
  OCC_CHECK(on_line[2] > 200 && on_line[1] > 100 && on_line[0] < 50);

  // Track box outline in the class color
  const cv::Scalar color = occ::CountOverlay::ClassColor(0);
  const cv::Vec3b edge = canvas.at<cv::Vec3b>(50, 120);
  OCC_CHECK(edge[0] == static_cast<int>(color[0]) && edge[1] == static_cast<int>(color[1]) &&
            edge[2] == static_cast<int>(color[2]));
}

static void TestEmptyCanvas() {
  occ::CountOverlay overlay(occ::VisualizationConfig{});
  cv::Mat empty;
  overlay.draw(empty, {}, {}, occ::CountSnapshot{});
  OCC_CHECK(empty.empty());
}

int main() {
  TestDrawsGeometry();
  TestEmptyCanvas();
  return occ::test::Finish("count_overlay_test");
}
