#include "markers.hpp"

#include <sys/stat.h>
#include <iomanip>
#include <sstream>

using namespace std;
using namespace cv;

Markers::Markers(const Config& c, const Mat& preparedMarker, Diagnostics d)
  : config(c), marker(preparedMarker.clone()), diagnostics(d), localizer(c, d) {
}

Markers::Status Markers::loadMarker(const Config& config, Mat& marker) {
  const string path = config.markerPath();
  struct stat st;
  if (stat(path.c_str(), &st) != 0) {
    LOG(ERROR) << "Marker not found at path provided in template: " << path;
    return Status::MARKER_NOT_FOUND_ERR;
  }
  Mat raw = imread(path, IMREAD_GRAYSCALE);
  if (raw.empty()) {
    LOG(ERROR) << "Marker at " << path << " is not a readable image.";
    return Status::MARKER_READ_ERR;
  }
  marker = prepareMarker(raw, config);
  if (marker.empty()) {
    LOG(ERROR) << "Marker at " << path << " resized to processing_width "
	       << config.processing_width << " / sheetToMarkerWidthRatio "
	       << config.sheet_to_marker_width_ratio << " = "
	       << (config.sheet_to_marker_width_ratio > 0 ?
		   config.processing_width / config.sheet_to_marker_width_ratio : 0)
	       << " pixels wide, nothing left to match.";
    return Status::MARKER_READ_ERR;
  }
  LOG(INFO) << "Loaded marker " << path << " " << raw.size() << " -> " << marker.size();
  return Status::OK;
}

vector<string> Markers::excludeFiles(const Config& config) {
  return vector<string>(1, config.markerPath());
}

Mat Markers::prepareMarker(const Mat& raw, const Config& config) {
  if (raw.empty()) {
    return Mat();
  }
  Mat m = toGray(raw);
  if (config.sheet_to_marker_width_ratio > 0) {
    m = resizeToWidth(m, config.processing_width / config.sheet_to_marker_width_ratio);
    if (m.empty()) {
      return Mat();
    }
  }
  Mat blurred;
  GaussianBlur(m, blurred, MARKER_BLUR_KERNEL, MARKER_BLUR_SIGMA);
  Mat prepared = normalizeImage(blurred);
  if (config.apply_erode_subtract) {
    prepared = erodeSubtract(prepared);
  }
  return prepared;
}

Markers::Status Markers::getCroppedImage(const Mat& img, Mat& imgProj, const string& name) {
  MarkerSet found;
  return getCroppedImage(img, imgProj, found, name);
}

Markers::Status Markers::getCroppedImage(const Mat& img, Mat& imgProj, MarkerSet& found,
					 const string& name) {
  imgProj = Mat();
  if (img.empty()) {
    LOG(ERROR) << name << ": empty image.";
    return Status::EMPTY_IMAGE_ERR;
  }
  if (marker.empty()) {
    LOG(ERROR) << name << ": no marker loaded.";
    return Status::MARKER_READ_ERR;
  }

  Deadline deadline(config.image_deadline_ms);
  try {
    Mat work = preprocessSheet(img, config.apply_erode_subtract);
    Status status = locate(work, found, name, deadline);
    if (status != Status::OK) {
      return status;
    }

    imgProj = fourPointTransform(img, found.centers());
    if (imgProj.empty()) {
      LOG(ERROR) << name << ": perspective transform failed.";
      return Status::DEGENERATE_QUAD_ERR;
    }

    {
      std::lock_guard<std::mutex> lock(scores_mutex);
      match_scores.push_back(found.averageScore());
    }
    drawMarkers(img, work, imgProj, found, name);
    VLOG(1) << name << ": cropped to " << imgProj.size() << " in " << deadline.elapsedMs() << "ms";
  } catch (const cv::Exception& e) {
    LOG(ERROR) << name << ": OpenCV error while cropping on markers: " << e.what();
    imgProj = Mat();
    return Status::ERR;
  }
  return Status::OK;
}

Markers::Status Markers::locate(const Mat& work, MarkerSet& found, const string& name,
				const Deadline& deadline) {
  ScaleMatch scale = getBestScale(work, marker, config, deadline);
  if (scale.expired) {
    LOG(ERROR) << name << ": deadline of " << config.image_deadline_ms
	       << "ms exceeded during scale search.";
    return Status::DEADLINE_EXCEEDED_ERR;
  }
  if (!scale.found) {
    LOG(WARNING) << name << ": no marker scale above min_matching_threshold "
		 << config.min_matching_threshold << " (best " << scale.best_seen << ")";
    diagnostics.show("Quads", work, 1);
    return Status::SCALE_NO_MATCH_ERR;
  }

  Mat optimalMarker = rescaleMarker(marker, scale.scale);
  Localizer::Status status = localizer.locate(work, optimalMarker, scale.score, found,
					      name, deadline);
  switch(status) {
  case Localizer::Status::OK:
    break;
  case Localizer::Status::QUADRANT_MATCH_ERR:
    return Status::QUADRANT_MATCH_ERR;
  case Localizer::Status::TOO_FEW_CANDIDATES_ERR:
    return Status::GLOBAL_TOO_FEW_CANDIDATES_ERR;
  case Localizer::Status::DEGENERATE_ERR:
    return Status::DEGENERATE_QUAD_ERR;
  case Localizer::Status::DEADLINE_ERR:
    return Status::DEADLINE_EXCEEDED_ERR;
  }

  if (!found.valid(config.min_matching_threshold)) {
    LOG(ERROR) << name << ": accepted markers are degenerate.";
    return Status::DEGENERATE_QUAD_ERR;
  }
  LOG(INFO) << name << ": Optimal Scale: " << scale.scale
	    << ", average match " << found.averageScore();
  return Status::OK;
}

void Markers::drawMarkers(const Mat& img, const Mat& work, const Mat& imgProj,
			  const MarkerSet& found, const string& name) const {
  if (!diagnostics.enabled(1)) {
    return;
  }
  Mat original = toGray(img);
  Mat working = work.clone();
  if (config.search_mode != SEARCH_GLOBAL) {
    int midh = working.rows / QUADRANT_HEIGHT_FACTOR;
    int midw = working.cols / QUADRANT_WIDTH_FACTOR;
    working(Rect(midw, 0, std::min(2, working.cols - midw), working.rows)).setTo(Scalar(255));
    working(Rect(0, midh, working.cols, std::min(2, working.rows - midh))).setTo(Scalar(255));
  }
  vector<Rect> rects = found.rects();
  for (size_t i=0; i<rects.size(); i++) {
    rectangle(original, rects[i], MARKER_RECTANGLE_COLOR, DEFAULT_LINE_WIDTH);
    rectangle(working, rects[i],
	      config.apply_erode_subtract ? ERODE_RECT_COLOR : NORMAL_RECT_COLOR, 4);
  }
  std::ostringstream text;
  text << "avg match " << std::setprecision(3) << found.averageScore();
  drawText(original, text.str());
  diagnostics.show("Markers: " + name, original, 1);

  int level = diagnostics.level();
  if (level >= 2 && level < 4) {
    Mat projGray = toGray(imgProj);
    Mat side = resizeToHeight(working, projGray.rows);
    if (side.empty()) {
      return;
    }
    int border = std::min(DEFAULT_BORDER_REMOVE, side.cols);
    side(Rect(side.cols - border, 0, border, side.rows)).setTo(Scalar(0));
    Mat stacked;
    hconcat(side, projGray, stacked);
    Mat shown = resizeToWidth(stacked, (int)(config.display_width * 1.6));
    diagnostics.show("Warped: " + name, shown.empty() ? stacked : shown, 2);
  }
}

vector<double> Markers::getMatchScores() const {
  std::lock_guard<std::mutex> lock(scores_mutex);
  return match_scores;
}

string Markers::getError(Markers::Status status) {
  string error = "None";
  switch(status) {
  case Markers::Status::OK:
    break;
  case Markers::Status::ERR:
    error = "Unknown Marker error.";
    break;
  case Markers::Status::EMPTY_IMAGE_ERR:
    error = "Input image is empty. Skipping.";
    break;
  case Markers::Status::MARKER_NOT_FOUND_ERR:
    error = "Marker file not found.";
    break;
  case Markers::Status::MARKER_READ_ERR:
    error = "Marker file is not a readable image.";
    break;
  case Markers::Status::SCALE_NO_MATCH_ERR:
    error = "No marker scale cleared min_matching_threshold. Skipping.";
    break;
  case Markers::Status::QUADRANT_MATCH_ERR:
    error = "No marker found in a quadrant. Skipping.";
    break;
  case Markers::Status::GLOBAL_TOO_FEW_CANDIDATES_ERR:
    error = "Not enough markers found in global search. Skipping.";
    break;
  case Markers::Status::DEGENERATE_QUAD_ERR:
    error = "Markers do not form a quadrilateral. Skipping.";
    break;
  case Markers::Status::DEADLINE_EXCEEDED_ERR:
    error = "Marker search exceeded the image deadline. Skipping.";
    break;
  }
  return error;
}
