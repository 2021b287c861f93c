#include <opencv2/opencv.hpp>
#include "util.hpp"
#include "config.hpp"

#ifndef MATCHER
#define MATCHER

using namespace cv;
using namespace std;

/** Max correlation observed for one tested marker scale. */
struct ScaleResponse {
  float scale;
  double score;
};

struct ScaleMatch {
  bool found = false;
  float scale = 0;
  double score = 0;
  /** Best response seen even when nothing cleared the threshold. */
  double best_seen = 0;
  int evaluated = 0;
  bool expired = false;
};

/**
 * Percent scales from high down to low (exclusive) in steps of
 * max(1, (high - low) / steps). Yields exactly {high} when the range is empty.
 */
vector<int> scaleSchedule(int low, int high, int steps);

/**
 * Picks the scale with the highest score in scan order. Later scales only win on a
 * strictly greater score, so ties go to the first scale tested.
 */
ScaleMatch selectBestScale(const vector<ScaleResponse>& responses, float minThreshold);

/** Marker resized to int(rows * scale) rows, aspect preserved. */
Mat rescaleMarker(const Mat& marker, float scale);

/**
 * TM_CCOEFF_NORMED of templ over img. Returns the max response and its location, or
 * -1 when templ does not fit inside img.
 */
double matchMax(const Mat& img, const Mat& templ, Point* loc=0, Mat* res=0);

ScaleMatch getBestScale(const Mat& prepared, const Mat& marker, const Config& config,
			const Deadline& deadline=Deadline());

#endif
