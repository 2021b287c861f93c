#ifndef __UTIL_H_INCLUDED__
#define __UTIL_H_INCLUDED__

#include <opencv2/opencv.hpp>
#include <time.h>
#include <sys/time.h>
#include <glog/logging.h>

using namespace std;
using namespace cv;

// Preprocessing constants shared by the sheet and the marker template.
const Size MARKER_BLUR_KERNEL(5, 5);
const double MARKER_BLUR_SIGMA = 0;
const Size EROSION_KERNEL(5, 5);
const int EROSION_ITERATIONS = 5;
const int QUADRANT_HEIGHT_FACTOR = 2;
const int QUADRANT_WIDTH_FACTOR = 2;

const Scalar MARKER_RECTANGLE_COLOR(100, 100, 100);
const Scalar ERODE_RECT_COLOR(50, 50, 50);
const Scalar NORMAL_RECT_COLOR(155, 155, 155);
const int DEFAULT_LINE_WIDTH = 2;
const int DEFAULT_BORDER_REMOVE = 5;

Mat toGray(const Mat& img);

// Min-max stretch to [0, 255].
Mat normalizeImage(const Mat& img);

// img - erode(img). Leaves edges and ring structures.
Mat erodeSubtract(const Mat& img, Size kernelSize=EROSION_KERNEL,
		  int iterations=EROSION_ITERATIONS);

Mat imscale(int width, Mat img);
Mat resizeToWidth(const Mat& img, int width);
Mat resizeToHeight(const Mat& img, int height);

// Sheet preparation: grayscale, optional erode-subtract, normalize.
Mat preprocessSheet(const Mat& img, bool applyErodeSubtract);

/**
 * orderPoints: returns TL, TR, BR, BL. TL has the smallest x+y, BR the largest,
 * TR the smallest y-x and BL the largest y-x.
 */
vector<Point2f> orderPoints(const vector<Point2f>& pts);

/**
 * fourPointTransform: warps the quadrilateral spanned by pts (any order) onto an
 * upright rectangle. Width is the longer of the top and bottom edges, height the
 * longer of the left and right edges. Returns an empty Mat when pts does not hold
 * four points or the destination collapses.
 */
Mat fourPointTransform(const Mat& img, const vector<Point2f>& pts);

double quadArea(const vector<Point2f>& pts);

double getTime();
void drawText(Mat img, string text, int bottom=0);

class Deadline {
  public:
    /** budgetMs <= 0 never expires. */
    Deadline(double budgetMs=0);

    bool expired() const;

    double elapsedMs() const;
  private:
    double start;
    double end;
};

#endif
