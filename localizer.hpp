#include <opencv2/opencv.hpp>
#include "util.hpp"
#include "config.hpp"
#include "diagnostics.hpp"

#ifndef LOCALIZER
#define LOCALIZER

using namespace cv;
using namespace std;

struct MatchCandidate {
  double score = 0;
  Point loc;
  Size size;

  MatchCandidate() {}
  MatchCandidate(double s, Point l, Size sz) : score(s), loc(l), size(sz) {}

  Point2f center() const {
    return Point2f(loc.x + size.width / 2.0f, loc.y + size.height / 2.0f);
  }

  Rect rect() const { return Rect(loc, size); }
};

/** The four accepted markers, in detection order. */
struct MarkerSet {
  vector<MatchCandidate> markers;

  vector<Point2f> centers() const;

  vector<Rect> rects() const;

  double averageScore() const;

  /** Four markers, each at least minThreshold, spanning a positive area. */
  bool valid(float minThreshold) const;
};

class Localizer {
  public:
    enum Status {
      OK = 0,
      QUADRANT_MATCH_ERR = 101,
      TOO_FEW_CANDIDATES_ERR = 102,
      DEGENERATE_ERR = 103,
      DEADLINE_ERR = 200,
    };

    /** Global search never records more peaks than this. */
    static const int MAX_CANDIDATES = 20;

    /** Only the best candidates take part in the quad enumeration. */
    static const int TOP_CANDIDATES = 12;

    explicit Localizer(const Config& config, Diagnostics diagnostics=Diagnostics());

    /**
     * Finds the four markers in the prepared sheet with the best-scale marker.
     * allMaxT is the whole-image score found by the scale search.
     */
    Status locate(const Mat& work, const Mat& marker, double allMaxT, MarkerSet& out,
		  const string& name="", const Deadline& deadline=Deadline()) const;

    /** One marker per quadrant. Fails on the first quadrant out of tolerance. */
    Status locateQuadrants(const Mat& work, const Mat& marker, double allMaxT,
			   MarkerSet& out, int& failedQuadrant, const string& name="") const;

    Status locateGlobal(const Mat& work, const Mat& marker, MarkerSet& out,
			const string& name="", const Deadline& deadline=Deadline()) const;

    /**
     * Best match inside quadrant k (0 TL, 1 TR, 2 BL, 3 BR) in full image
     * coordinates. Score is -1 when the marker does not fit the quadrant.
     */
    MatchCandidate matchQuadrant(const Mat& work, const Mat& marker, int k, Mat* res=0) const;

    /** Quadrant rectangles split at rows / 2, cols / 2. */
    static vector<Rect> quadrants(Size size);

    /**
     * Non-maximum suppression over a matchTemplate response. Repeatedly takes the
     * max and zeroes a window of 0.9 marker size around it, until the max falls
     * below minThreshold or maxCandidates were taken. Returned by descending score.
     */
    static vector<MatchCandidate> suppressCandidates(const Mat& res, Size markerSize,
						     float minThreshold,
						     int maxCandidates=MAX_CANDIDATES);

    /**
     * Among the first topK candidates, picks the 4-combination whose centers span
     * the largest bounding box. Ties go to the higher summed score, then to the
     * combination enumerated first.
     */
    static Status selectBestQuad(const vector<MatchCandidate>& candidates, MarkerSet& out,
				 const Deadline& deadline=Deadline(),
				 int topK=TOP_CANDIDATES);

    static string getError(Status status);

  private:
    Config config;

    Diagnostics diagnostics;
};

#endif
