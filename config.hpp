#include <opencv2/opencv.hpp>
#include <glog/logging.h>

#ifndef CONFIG
#define CONFIG

using namespace cv;
using namespace std;

enum SearchMode {
  SEARCH_QUADRANTS = 0,
  SEARCH_GLOBAL = 1,
  SEARCH_AUTO = 2,
};

/**
 * Maps a searchMode string to SearchMode. "global", "full" and "all" select the
 * global search, "auto" and "fallback" the quadrant search with global fallback.
 * Anything else is quadrant search.
 */
SearchMode parseSearchMode(const string& mode);

string searchModeName(SearchMode mode);

class Config {
  public:
    /** Defaults only, nothing is read. */
    Config();

    /** Reads keys present in filename over the defaults. */
    Config(const string filename);

    bool loaded() const { return is_loaded; }

    /** Marker path with relative_path resolved against the config file directory. */
    string markerPath() const;

    void save(const string filename) const;

    string config_file;

    string relative_path = "omr_marker.jpg";

    float min_matching_threshold = 0.3;

    float max_matching_variation = 0.41;

    int marker_rescale_low = 35;

    int marker_rescale_high = 100;

    int marker_rescale_steps = 10;

    bool apply_erode_subtract = true;

    SearchMode search_mode = SEARCH_QUADRANTS;

    // 0 when not set.
    int sheet_to_marker_width_ratio = 0;

    int processing_width = 666;

    int display_width = 1640;

    int show_image_level = 0;

    int image_deadline_ms = 0;

    int workers = 1;

  private:
    bool is_loaded = false;

    float getFloat(string name, FileStorage &fs, float value);

    int getInt(string name, FileStorage &fs, int value);

    bool getBool(string name, FileStorage &fs, bool value);

    string getString(string name, FileStorage &fs, string value);
};

#endif
