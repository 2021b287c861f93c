#include <opencv2/opencv.hpp>
#include <functional>
#include <mutex>
#include "util.hpp"

#ifndef DIAGNOSTICS
#define DIAGNOSTICS

using namespace cv;
using namespace std;

/** Receives debug images: label, image, verbosity level requested by the caller. */
typedef std::function<void(const string&, const Mat&, int)> DebugSink;

class Diagnostics {
  public:
    Diagnostics(int showImageLevel=0, DebugSink sink=DebugSink());

    /** True when images of this level would reach the sink. */
    bool enabled(int level) const;

    void show(const string& label, const Mat& img, int level) const;

    int level() const { return show_image_level; }

  private:
    int show_image_level;

    DebugSink sink;
};

/**
 * highgui window per label, blocks on waitKey until a key is pressed. Only usable
 * from the thread that owns the GUI.
 */
DebugSink windowSink(int displayWidth);

/** Writes <dir>/<sequence>_<label>.png. Safe to share between workers. */
DebugSink fileSink(const string& dir);

#endif
