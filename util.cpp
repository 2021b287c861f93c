#include "util.hpp"

#include <algorithm>
#include <cmath>

Mat toGray(const Mat& img) {
  Mat gray;
  if (img.channels() == 3) {
    cvtColor(img, gray, COLOR_BGR2GRAY);
  } else if (img.channels() == 4) {
    cvtColor(img, gray, COLOR_BGRA2GRAY);
  } else {
    gray = img.clone();
  }
  if (gray.depth() != CV_8U) {
    gray.convertTo(gray, CV_8U);
  }
  return gray;
}

Mat normalizeImage(const Mat& img) {
  Mat out;
  normalize(img, out, 0, 255, NORM_MINMAX);
  return out;
}

Mat erodeSubtract(const Mat& img, Size kernelSize, int iterations) {
  Mat eroded, out;
  erode(img, eroded, Mat::ones(kernelSize, CV_8U), Point(-1, -1), iterations);
  subtract(img, eroded, out);
  return out;
}

Mat imscale(int width, Mat img) {
  Mat imgScale;
  float scale = (float)width / (float)img.cols;
  resize(img, imgScale, Size(), scale, scale, INTER_LINEAR);
  return imgScale;
}

Mat resizeToWidth(const Mat& img, int width) {
  int height = (int)(img.rows * (double)width / img.cols);
  Mat out;
  if (width <= 0 || height <= 0) {
    return out;
  }
  resize(img, out, Size(width, height));
  return out;
}

Mat resizeToHeight(const Mat& img, int height) {
  int width = (int)(img.cols * (double)height / img.rows);
  Mat out;
  if (width <= 0 || height <= 0) {
    return out;
  }
  resize(img, out, Size(width, height));
  return out;
}

Mat preprocessSheet(const Mat& img, bool applyErodeSubtract) {
  Mat gray = toGray(img);
  if (applyErodeSubtract) {
    return normalizeImage(erodeSubtract(gray));
  }
  return normalizeImage(gray);
}

vector<Point2f> orderPoints(const vector<Point2f>& pts) {
  vector<Point2f> rect(4);
  int tl = 0, br = 0, tr = 0, bl = 0;
  for (size_t i=1; i<pts.size(); i++) {
    float s = pts[i].x + pts[i].y;
    float d = pts[i].y - pts[i].x;
    if (s < pts[tl].x + pts[tl].y) tl = i;
    if (s > pts[br].x + pts[br].y) br = i;
    if (d < pts[tr].y - pts[tr].x) tr = i;
    if (d > pts[bl].y - pts[bl].x) bl = i;
  }
  rect[0] = pts[tl];
  rect[1] = pts[tr];
  rect[2] = pts[br];
  rect[3] = pts[bl];
  return rect;
}

Mat fourPointTransform(const Mat& img, const vector<Point2f>& pts) {
  Mat warped;
  if (pts.size() != 4) {
    LOG(ERROR) << "fourPointTransform needs 4 points, got " << pts.size();
    return warped;
  }
  vector<Point2f> rect = orderPoints(pts);
  const Point2f& tl = rect[0];
  const Point2f& tr = rect[1];
  const Point2f& br = rect[2];
  const Point2f& bl = rect[3];

  double widthA = norm(br - bl);
  double widthB = norm(tr - tl);
  int maxWidth = (int)std::max(widthA, widthB);

  double heightA = norm(tr - br);
  double heightB = norm(tl - bl);
  int maxHeight = (int)std::max(heightA, heightB);

  if (maxWidth <= 0 || maxHeight <= 0) {
    LOG(ERROR) << "fourPointTransform: degenerate destination " << maxWidth << "x" << maxHeight;
    return warped;
  }

  Point2f srcQuad[4] = {tl, tr, br, bl};
  Point2f dstQuad[4];
  dstQuad[0] = Point2f(0, 0);
  dstQuad[1] = Point2f(maxWidth - 1, 0);
  dstQuad[2] = Point2f(maxWidth - 1, maxHeight - 1);
  dstQuad[3] = Point2f(0, maxHeight - 1);
  Mat pmat = getPerspectiveTransform(srcQuad, dstQuad);
  warpPerspective(img, warped, pmat, Size(maxWidth, maxHeight));
  return warped;
}

double quadArea(const vector<Point2f>& pts) {
  if (pts.size() != 4) {
    return 0.0;
  }
  vector<Point2f> rect = orderPoints(pts);
  double a = 0;
  for (int i=0; i<4; i++) {
    int j = (i + 1) % 4;
    a += rect[i].x * rect[j].y - rect[j].x * rect[i].y;
  }
  return std::fabs(a) * 0.5;
}

double getTime(){
  struct timeval time;
  if (gettimeofday(&time,NULL)){
    return 0;
  }
  return (double)time.tv_sec + (double)time.tv_usec * .000001;
}

void drawText(Mat img, string text, int bottom) {
  int fontFace = FONT_HERSHEY_SIMPLEX;
  double fontScale = 0.5 * img.cols / 600; // compensate for rescaling for UI.
  int thickness = std::max(1, 2 * img.cols / 800);

  int baseline = 0;
  Size textSize = getTextSize(text, fontFace,
			      fontScale, thickness, &baseline);

  // Center the text at bottom with vertical offset.
  Point textOrg((img.cols - textSize.width)/2,
		(img.rows - (textSize.height*bottom*2)-20));
  putText(img, text, textOrg, fontFace, fontScale,
	  Scalar(0, 0, 0), thickness, 8);
}

Deadline::Deadline(double budgetMs) {
  start = getTime();
  end = budgetMs > 0 ? start + budgetMs / 1000.0 : 0;
}

bool Deadline::expired() const {
  return end > 0 && getTime() > end;
}

double Deadline::elapsedMs() const {
  return (getTime() - start) * 1000.0;
}
