#include "matcher.hpp"

vector<int> scaleSchedule(int low, int high, int steps) {
  vector<int> percents;
  int descent = steps > 0 ? (high - low) / steps : (high - low);
  if (descent < 1) {
    descent = 1;
  }
  for (int r=high; r>low; r-=descent) {
    if (r > 0) {
      percents.push_back(r);
    }
  }
  if (percents.empty() && high > 0) {
    percents.push_back(high);
  }
  return percents;
}

ScaleMatch selectBestScale(const vector<ScaleResponse>& responses, float minThreshold) {
  ScaleMatch match;
  bool hasScale = false;
  float bestScale = 0;
  double best = 0;
  for (size_t i=0; i<responses.size(); i++) {
    if (responses[i].score > best) {
      best = responses[i].score;
      bestScale = responses[i].scale;
      hasScale = true;
    }
  }
  match.evaluated = responses.size();
  match.best_seen = best;
  if (hasScale && best >= minThreshold) {
    match.found = true;
    match.scale = bestScale;
    match.score = best;
  }
  return match;
}

Mat rescaleMarker(const Mat& marker, float scale) {
  return resizeToHeight(marker, (int)(marker.rows * scale));
}

double matchMax(const Mat& img, const Mat& templ, Point* loc, Mat* res) {
  if (templ.empty() || img.empty() ||
      templ.cols > img.cols || templ.rows > img.rows) {
    return -1;
  }
  Mat result;
  matchTemplate(img, templ, result, TM_CCOEFF_NORMED);
  double maxVal;
  Point maxLoc;
  minMaxLoc(result, 0, &maxVal, 0, &maxLoc);
  if (loc) {
    *loc = maxLoc;
  }
  if (res) {
    *res = result;
  }
  return maxVal;
}

ScaleMatch getBestScale(const Mat& prepared, const Mat& marker, const Config& config,
			const Deadline& deadline) {
  vector<int> schedule = scaleSchedule(config.marker_rescale_low,
				       config.marker_rescale_high,
				       config.marker_rescale_steps);
  vector<ScaleResponse> responses;
  for (size_t i=0; i<schedule.size(); i++) {
    if (deadline.expired()) {
      ScaleMatch match = selectBestScale(responses, config.min_matching_threshold);
      match.found = false;
      match.expired = true;
      return match;
    }
    float s = schedule[i] / 100.0f;
    Mat rescaled = rescaleMarker(marker, s);
    double maxT = matchMax(prepared, rescaled);
    if (maxT < 0) {
      VLOG(2) << "Scale " << s << " skipped, marker " << rescaled.size() << " vs image " << prepared.size();
      continue;
    }
    VLOG(2) << "Scale: " << s << ", Marker Match: " << maxT;
    ScaleResponse r = {s, maxT};
    responses.push_back(r);
  }

  ScaleMatch match = selectBestScale(responses, config.min_matching_threshold);
  if (!match.found) {
    LOG(WARNING) << "Template matching too low! best " << match.best_seen
		 << " < min_matching_threshold " << config.min_matching_threshold
		 << " for scaleRange (" << config.marker_rescale_low << ", "
		 << config.marker_rescale_high << ")."
		 << " Consider rechecking the preprocessing of the sheet.";
  }
  return match;
}
