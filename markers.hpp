#include <opencv2/opencv.hpp>
#include <mutex>
#include "util.hpp"
#include "config.hpp"
#include "diagnostics.hpp"
#include "matcher.hpp"
#include "localizer.hpp"

#ifndef MARKERS
#define MARKERS

using namespace cv;

class Markers {
  public:
    enum Status {
      OK = 0,
      ERR = 1,
      EMPTY_IMAGE_ERR = 2,
      MARKER_NOT_FOUND_ERR = 10,
      MARKER_READ_ERR = 11,
      SCALE_NO_MATCH_ERR = 100,
      QUADRANT_MATCH_ERR = 101,
      GLOBAL_TOO_FEW_CANDIDATES_ERR = 102,
      DEGENERATE_QUAD_ERR = 103,
      DEADLINE_EXCEEDED_ERR = 200,
    };

    /**
     * preparedMarker: output of prepareMarker/loadMarker. It is only read from here
     * on, so one Markers can serve several workers.
     */
    Markers(const Config& config, const Mat& preparedMarker,
	    Diagnostics diagnostics=Diagnostics());

    /**
     * Reads config.markerPath() as grayscale and prepares it. MARKER_READ_ERR
     * when the file is not an image or preparation leaves nothing.
     */
    static Status loadMarker(const Config& config, Mat& marker);

    /** Files that are part of the template and never sheets. */
    static vector<string> excludeFiles(const Config& config);

    /**
     * Optional resize to processing_width / sheetToMarkerWidthRatio, blur,
     * normalize and optional erode-subtract. Returns a new buffer, empty when
     * the ratio leaves a marker narrower than one pixel.
     */
    static Mat prepareMarker(const Mat& raw, const Config& config);

    /** Finds the four markers in img and warps img onto them. */
    Status getCroppedImage(const Mat& img, Mat& imgProj, const string& name="");

    Status getCroppedImage(const Mat& img, Mat& imgProj, MarkerSet& found,
			   const string& name);

    /** Average marker score of every image cropped so far. */
    vector<double> getMatchScores() const;

    static string getError(Status status);

  private:
    Config config;

    Mat marker;

    Diagnostics diagnostics;

    Localizer localizer;

    mutable std::mutex scores_mutex;

    vector<double> match_scores;

    Status locate(const Mat& work, MarkerSet& found, const string& name,
		  const Deadline& deadline);

    void drawMarkers(const Mat& img, const Mat& work, const Mat& imgProj,
		     const MarkerSet& found, const string& name) const;
};

#endif
