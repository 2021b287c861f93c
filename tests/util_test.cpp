#include <gtest/gtest.h>
#include "util.hpp"

TEST(OrderPoints, IndependentOfInputOrder) {
  vector<Point2f> pts;
  pts.push_back(Point2f(900, 1300));
  pts.push_back(Point2f(10, 20));
  pts.push_back(Point2f(15, 1290));
  pts.push_back(Point2f(890, 5));

  vector<Point2f> ordered = orderPoints(pts);
  EXPECT_EQ(Point2f(10, 20), ordered[0]);
  EXPECT_EQ(Point2f(890, 5), ordered[1]);
  EXPECT_EQ(Point2f(900, 1300), ordered[2]);
  EXPECT_EQ(Point2f(15, 1290), ordered[3]);

  std::reverse(pts.begin(), pts.end());
  EXPECT_EQ(ordered, orderPoints(pts));
}

TEST(FourPointTransform, SizeFollowsLongestEdges) {
  Mat img(600, 800, CV_8UC1, Scalar(128));
  vector<Point2f> pts;
  // Top edge 600, bottom edge 640, left edge 400, right edge ~410.
  pts.push_back(Point2f(700, 50));
  pts.push_back(Point2f(100, 50));
  pts.push_back(Point2f(80, 450));
  pts.push_back(Point2f(720, 460));

  Mat out = fourPointTransform(img, pts);
  double top = norm(pts[0] - pts[1]);
  double bottom = norm(pts[3] - pts[2]);
  double left = norm(pts[2] - pts[1]);
  double right = norm(pts[3] - pts[0]);
  EXPECT_NEAR(std::max(top, bottom), out.cols, 1.0);
  EXPECT_NEAR(std::max(left, right), out.rows, 1.0);
}

TEST(FourPointTransform, MapsCornersOntoOutputCorners) {
  Mat img(400, 400, CV_8UC1, Scalar(0));
  rectangle(img, Rect(100, 100, 201, 101), Scalar(255), FILLED);
  vector<Point2f> pts;
  pts.push_back(Point2f(300, 200));
  pts.push_back(Point2f(100, 100));
  pts.push_back(Point2f(300, 100));
  pts.push_back(Point2f(100, 200));

  Mat out = fourPointTransform(img, pts);
  ASSERT_EQ(200, out.cols);
  ASSERT_EQ(100, out.rows);
  EXPECT_GT(mean(out)[0], 250);
}

TEST(FourPointTransform, RejectsWrongPointCount) {
  Mat img(100, 100, CV_8UC1, Scalar(0));
  vector<Point2f> pts(3, Point2f(10, 10));
  EXPECT_TRUE(fourPointTransform(img, pts).empty());
}

TEST(FourPointTransform, OutputDoesNotAliasInput) {
  Mat img(100, 100, CV_8UC1, Scalar(50));
  vector<Point2f> pts;
  pts.push_back(Point2f(0, 0));
  pts.push_back(Point2f(99, 0));
  pts.push_back(Point2f(99, 99));
  pts.push_back(Point2f(0, 99));
  Mat out = fourPointTransform(img, pts);
  out.setTo(Scalar(0));
  EXPECT_EQ(50, img.at<uchar>(50, 50));
}

TEST(ErodeSubtract, FlatImageBecomesBlack) {
  Mat flat(60, 60, CV_8UC1, Scalar(200));
  EXPECT_EQ(0, countNonZero(erodeSubtract(flat)));
}

TEST(ErodeSubtract, KeepsBrightPixelsNextToDark) {
  Mat img(60, 60, CV_8UC1, Scalar(255));
  rectangle(img, Rect(20, 20, 20, 20), Scalar(0), FILLED);
  Mat out = erodeSubtract(img);
  EXPECT_EQ(255, out.at<uchar>(18, 30));
  EXPECT_EQ(0, out.at<uchar>(30, 30));
}

TEST(Normalize, StretchesToFullRange) {
  Mat img(10, 10, CV_8UC1, Scalar(100));
  img.at<uchar>(0, 0) = 50;
  img.at<uchar>(9, 9) = 150;
  double lo, hi;
  minMaxLoc(normalizeImage(img), &lo, &hi);
  EXPECT_EQ(0, lo);
  EXPECT_EQ(255, hi);
}

TEST(Resize, PreservesAspect) {
  Mat img(200, 100, CV_8UC1, Scalar(0));
  Mat h = resizeToHeight(img, 100);
  EXPECT_EQ(100, h.rows);
  EXPECT_EQ(50, h.cols);
  Mat w = resizeToWidth(img, 50);
  EXPECT_EQ(50, w.cols);
  EXPECT_EQ(100, w.rows);
  EXPECT_TRUE(resizeToHeight(img, 0).empty());
}

TEST(QuadArea, ZeroForCollinearPoints) {
  vector<Point2f> pts;
  for (int i=0; i<4; i++) {
    pts.push_back(Point2f(i * 10, i * 10));
  }
  EXPECT_EQ(0, quadArea(pts));
  pts[1] = Point2f(100, 0);
  pts[2] = Point2f(0, 100);
  pts[3] = Point2f(100, 100);
  pts[0] = Point2f(0, 0);
  EXPECT_NEAR(10000, quadArea(pts), 1e-6);
}
