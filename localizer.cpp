#include "localizer.hpp"

#include <algorithm>
#include <cmath>
#include <iomanip>
#include <sstream>

const int Localizer::MAX_CANDIDATES;
const int Localizer::TOP_CANDIDATES;

vector<Point2f> MarkerSet::centers() const {
  vector<Point2f> c;
  for (size_t i=0; i<markers.size(); i++) {
    c.push_back(markers[i].center());
  }
  return c;
}

vector<Rect> MarkerSet::rects() const {
  vector<Rect> r;
  for (size_t i=0; i<markers.size(); i++) {
    r.push_back(markers[i].rect());
  }
  return r;
}

double MarkerSet::averageScore() const {
  if (markers.empty()) {
    return 0.0;
  }
  double sum = 0;
  for (size_t i=0; i<markers.size(); i++) {
    sum += markers[i].score;
  }
  return sum / markers.size();
}

bool MarkerSet::valid(float minThreshold) const {
  if (markers.size() != 4) {
    return false;
  }
  for (size_t i=0; i<markers.size(); i++) {
    if (markers[i].score < minThreshold) {
      return false;
    }
  }
  return quadArea(centers()) > 0;
}

Localizer::Localizer(const Config& c, Diagnostics d) : config(c), diagnostics(d) {
}

Localizer::Status Localizer::locate(const Mat& work, const Mat& marker, double allMaxT,
				    MarkerSet& out, const string& name,
				    const Deadline& deadline) const {
  if (config.search_mode == SEARCH_GLOBAL) {
    return locateGlobal(work, marker, out, name, deadline);
  }

  int failedQuadrant = -1;
  Status status = locateQuadrants(work, marker, allMaxT, out, failedQuadrant, name);
  if (status == QUADRANT_MATCH_ERR && config.search_mode == SEARCH_AUTO) {
    LOG(INFO) << name << ": quadrant " << failedQuadrant + 1
	      << " out of tolerance, falling back to global search.";
    out = MarkerSet();
    return locateGlobal(work, marker, out, name, deadline);
  }
  return status;
}

vector<Rect> Localizer::quadrants(Size size) {
  int midh = size.height / QUADRANT_HEIGHT_FACTOR;
  int midw = size.width / QUADRANT_WIDTH_FACTOR;
  vector<Rect> q;
  q.push_back(Rect(0, 0, midw, midh));
  q.push_back(Rect(midw, 0, size.width - midw, midh));
  q.push_back(Rect(0, midh, midw, size.height - midh));
  q.push_back(Rect(midw, midh, size.width - midw, size.height - midh));
  return q;
}

MatchCandidate Localizer::matchQuadrant(const Mat& work, const Mat& marker, int k, Mat* res) const {
  Rect quad = quadrants(work.size())[k];
  Point loc;
  double maxT = matchMax(work(quad), marker, &loc, res);
  if (maxT < 0) {
    return MatchCandidate(-1, quad.tl(), marker.size());
  }
  return MatchCandidate(maxT, loc + quad.tl(), marker.size());
}

Localizer::Status Localizer::locateQuadrants(const Mat& work, const Mat& marker, double allMaxT,
					     MarkerSet& out, int& failedQuadrant,
					     const string& name) const {
  std::ostringstream quarterLog;
  quarterLog << "Matching Marker:  ";
  out.markers.clear();
  for (int k=0; k<4; k++) {
    Mat res;
    MatchCandidate c = matchQuadrant(work, marker, k, &res);
    quarterLog << "Quarter" << k + 1 << ": " << std::setprecision(3) << c.score << "\t";
    if (c.score < config.min_matching_threshold ||
	std::fabs(allMaxT - c.score) >= config.max_matching_variation) {
      failedQuadrant = k;
      out.markers.clear();
      if (config.search_mode == SEARCH_AUTO) {
	return QUADRANT_MATCH_ERR;
      }
      LOG(ERROR) << name << ": No marker found in Quad " << k + 1
		 << "\n\t min_matching_threshold " << config.min_matching_threshold
		 << "\t max_matching_variation " << config.max_matching_variation
		 << "\t max_t " << c.score
		 << "\t all_max_t " << allMaxT;
      if (diagnostics.enabled(1)) {
	diagnostics.show("No markers: " + name, work, 1);
	std::ostringstream label;
	label << "res_Q" << k + 1 << " (" << c.score << ")";
	diagnostics.show(label.str(), res, 1);
      }
      return QUADRANT_MATCH_ERR;
    }
    out.markers.push_back(c);
  }
  LOG(INFO) << name << ": " << quarterLog.str();
  return OK;
}

vector<MatchCandidate> Localizer::suppressCandidates(const Mat& res, Size markerSize,
						     float minThreshold, int maxCandidates) {
  Mat work = res.clone();
  vector<MatchCandidate> candidates;
  int suppressX = std::max(1, (int)(markerSize.width * 0.9));
  int suppressY = std::max(1, (int)(markerSize.height * 0.9));
  for (int i=0; i<maxCandidates; i++) {
    double maxVal;
    Point maxLoc;
    minMaxLoc(work, 0, &maxVal, 0, &maxLoc);
    if (maxVal < minThreshold) {
      break;
    }
    candidates.push_back(MatchCandidate(maxVal, maxLoc, markerSize));
    int x0 = std::max(0, maxLoc.x - suppressX);
    int y0 = std::max(0, maxLoc.y - suppressY);
    int x1 = std::min(work.cols - 1, maxLoc.x + suppressX);
    int y1 = std::min(work.rows - 1, maxLoc.y + suppressY);
    work(Rect(x0, y0, x1 - x0 + 1, y1 - y0 + 1)).setTo(Scalar(0));
  }
  return candidates;
}

Localizer::Status Localizer::selectBestQuad(const vector<MatchCandidate>& candidates,
					    MarkerSet& out, const Deadline& deadline,
					    int topK) {
  if (candidates.size() < 4) {
    return TOO_FEW_CANDIDATES_ERR;
  }
  int n = std::min((int)candidates.size(), topK);
  vector<Point2f> c(n);
  for (int i=0; i<n; i++) {
    c[i] = candidates[i].center();
  }

  bool found = false;
  double bestArea = 0, bestScore = 0;
  int best[4] = {0, 0, 0, 0};
  int evaluated = 0;
  for (int a=0; a<n; a++) {
    for (int b=a+1; b<n; b++) {
      for (int d=b+1; d<n; d++) {
	for (int e=d+1; e<n; e++) {
	  if ((++evaluated & 31) == 0 && deadline.expired()) {
	    return DEADLINE_ERR;
	  }
	  const int idx[4] = {a, b, d, e};
	  float minX = c[a].x, maxX = c[a].x, minY = c[a].y, maxY = c[a].y;
	  double score = 0;
	  for (int i=0; i<4; i++) {
	    const Point2f& p = c[idx[i]];
	    minX = std::min(minX, p.x);
	    maxX = std::max(maxX, p.x);
	    minY = std::min(minY, p.y);
	    maxY = std::max(maxY, p.y);
	    score += candidates[idx[i]].score;
	  }
	  double area = (double)(maxX - minX) * (maxY - minY);
	  if (!found || area > bestArea || (area == bestArea && score > bestScore)) {
	    found = true;
	    bestArea = area;
	    bestScore = score;
	    std::copy(idx, idx + 4, best);
	  }
	}
      }
    }
  }
  VLOG(1) << "Evaluated " << evaluated << " quads of " << n << " candidates, best area " << bestArea;

  out.markers.clear();
  for (int i=0; i<4; i++) {
    out.markers.push_back(candidates[best[i]]);
  }
  if (bestArea <= 0 || quadArea(out.centers()) <= 0) {
    return DEGENERATE_ERR;
  }
  return OK;
}

Localizer::Status Localizer::locateGlobal(const Mat& work, const Mat& marker, MarkerSet& out,
					  const string& name, const Deadline& deadline) const {
  out.markers.clear();
  Mat res;
  if (matchMax(work, marker, 0, &res) < 0) {
    LOG(ERROR) << name << ": marker " << marker.size() << " larger than image " << work.size();
    return TOO_FEW_CANDIDATES_ERR;
  }
  vector<MatchCandidate> candidates = suppressCandidates(res, marker.size(),
							 config.min_matching_threshold);
  for (size_t i=0; i<candidates.size(); i++) {
    VLOG(1) << name << ": candidate " << i << " at " << candidates[i].loc
	    << " score " << candidates[i].score;
  }

  if (candidates.size() < 4) {
    LOG(ERROR) << name << ": Not enough markers found in global search, "
	       << candidates.size() << " candidates above min_matching_threshold "
	       << config.min_matching_threshold;
    if (diagnostics.enabled(1)) {
      diagnostics.show("Marker search: " + name, work, 1);
      diagnostics.show("matchTemplate res", res, 1);
    }
    return TOO_FEW_CANDIDATES_ERR;
  }

  Status status = selectBestQuad(candidates, out, deadline);
  if (status == DEGENERATE_ERR) {
    LOG(ERROR) << name << ": global search markers do not span an area.";
  } else if (status == DEADLINE_ERR) {
    LOG(ERROR) << name << ": deadline exceeded while selecting markers.";
  }
  return status;
}

string Localizer::getError(Localizer::Status status) {
  string error = "None";
  switch(status) {
  case Localizer::Status::OK:
    break;
  case Localizer::Status::QUADRANT_MATCH_ERR:
    error = "Marker match in a quadrant out of tolerance.";
    break;
  case Localizer::Status::TOO_FEW_CANDIDATES_ERR:
    error = "Fewer than 4 marker candidates in global search.";
    break;
  case Localizer::Status::DEGENERATE_ERR:
    error = "Marker centers do not form a quadrilateral.";
    break;
  case Localizer::Status::DEADLINE_ERR:
    error = "Deadline exceeded during marker search.";
    break;
  }
  return error;
}
