#include <gtest/gtest.h>
#include <chrono>
#include <thread>
#include "localizer.hpp"
#include "markers.hpp"
#include "synthetic.hpp"

namespace {

MatchCandidate candidate(double score, int x, int y) {
  return MatchCandidate(score, Point(x, y), Size(50, 50));
}

bool hasCenter(const MarkerSet& set, Point2f c, float tol=0.5f) {
  vector<Point2f> centers = set.centers();
  for (size_t i=0; i<centers.size(); i++) {
    if (std::fabs(centers[i].x - c.x) <= tol && std::fabs(centers[i].y - c.y) <= tol) {
      return true;
    }
  }
  return false;
}

}

TEST(SuppressCandidates, NoSecondPeakInsideWindow) {
  Mat res(300, 300, CV_32FC1, Scalar(0));
  res.at<float>(50, 50) = 0.9f;
  res.at<float>(55, 60) = 0.8f;   // inside the 45 px window of the first peak
  res.at<float>(150, 150) = 0.7f;
  res.at<float>(50, 120) = 0.6f;  // 70 px away in x
  res.at<float>(180, 10) = 0.2f;  // below threshold

  vector<MatchCandidate> c = Localizer::suppressCandidates(res, Size(50, 50), 0.3f);
  ASSERT_EQ(3u, c.size());
  EXPECT_EQ(Point(50, 50), c[0].loc);
  EXPECT_EQ(Point(150, 150), c[1].loc);
  EXPECT_EQ(Point(120, 50), c[2].loc);
  for (size_t i=0; i<c.size(); i++) {
    for (size_t j=i+1; j<c.size(); j++) {
      bool inside = std::abs(c[i].loc.x - c[j].loc.x) <= 45 &&
	std::abs(c[i].loc.y - c[j].loc.y) <= 45;
      EXPECT_FALSE(inside);
    }
  }
}

TEST(SuppressCandidates, StopsAtMaxCandidates) {
  Mat res(1000, 1000, CV_32FC1, Scalar(0));
  for (int i=0; i<30; i++) {
    res.at<float>((i / 6) * 150 + 10, (i % 6) * 150 + 10) = 0.9f - i * 0.01f;
  }
  vector<MatchCandidate> c = Localizer::suppressCandidates(res, Size(50, 50), 0.3f);
  EXPECT_EQ(Localizer::MAX_CANDIDATES, (int)c.size());
  for (size_t i=1; i<c.size(); i++) {
    EXPECT_GE(c[i-1].score, c[i].score);
  }
}

TEST(SelectBestQuad, FewerThanFourFails) {
  vector<MatchCandidate> c;
  c.push_back(candidate(0.9, 0, 0));
  c.push_back(candidate(0.9, 500, 0));
  c.push_back(candidate(0.9, 0, 500));
  MarkerSet out;
  EXPECT_EQ(Localizer::TOO_FEW_CANDIDATES_ERR, Localizer::selectBestQuad(c, out));
  EXPECT_TRUE(out.markers.empty());
  // Same answer every time.
  EXPECT_EQ(Localizer::TOO_FEW_CANDIDATES_ERR, Localizer::selectBestQuad(c, out));
}

TEST(SelectBestQuad, PrefersSpreadOverClusteredHighScores) {
  vector<MatchCandidate> c;
  c.push_back(candidate(0.99, 100, 100));
  c.push_back(candidate(0.98, 160, 100));
  c.push_back(candidate(0.97, 100, 160));
  c.push_back(candidate(0.90, 0, 0));
  c.push_back(candidate(0.85, 800, 0));
  c.push_back(candidate(0.80, 0, 1200));
  c.push_back(candidate(0.75, 800, 1200));
  MarkerSet out;
  ASSERT_EQ(Localizer::OK, Localizer::selectBestQuad(c, out));
  EXPECT_TRUE(hasCenter(out, Point2f(25, 25)));
  EXPECT_TRUE(hasCenter(out, Point2f(825, 25)));
  EXPECT_TRUE(hasCenter(out, Point2f(25, 1225)));
  EXPECT_TRUE(hasCenter(out, Point2f(825, 1225)));
  EXPECT_NEAR(0.825, out.averageScore(), 1e-9);
}

TEST(SelectBestQuad, EqualAreaGoesToHigherScore) {
  vector<MatchCandidate> c;
  c.push_back(candidate(0.9, 0, 0));
  c.push_back(candidate(0.9, 500, 0));
  c.push_back(candidate(0.9, 0, 500));
  c.push_back(candidate(0.5, 500, 500));
  c.push_back(candidate(0.8, 500, 500));
  MarkerSet out;
  ASSERT_EQ(Localizer::OK, Localizer::selectBestQuad(c, out));
  double sum = 0;
  for (size_t i=0; i<out.markers.size(); i++) {
    sum += out.markers[i].score;
  }
  EXPECT_NEAR(3.5, sum, 1e-9);
}

TEST(SelectBestQuad, OnlyTopTwelveTakePart) {
  vector<MatchCandidate> c;
  for (int i=0; i<12; i++) {
    c.push_back(candidate(0.9 - i * 0.01, (i % 4) * 100, (i / 4) * 100));
  }
  c.push_back(candidate(0.5, 2000, 2000));
  MarkerSet out;
  ASSERT_EQ(Localizer::OK, Localizer::selectBestQuad(c, out));
  EXPECT_FALSE(hasCenter(out, Point2f(2025, 2025)));
}

TEST(SelectBestQuad, CollinearCentersAreDegenerate) {
  vector<MatchCandidate> c;
  for (int i=0; i<5; i++) {
    c.push_back(candidate(0.9, i * 100, 300));
  }
  MarkerSet out;
  EXPECT_EQ(Localizer::DEGENERATE_ERR, Localizer::selectBestQuad(c, out));
}

TEST(SelectBestQuad, HonoursDeadline) {
  vector<MatchCandidate> c;
  for (int i=0; i<12; i++) {
    c.push_back(candidate(0.9, (i % 4) * 100, (i / 4) * 100));
  }
  Deadline deadline(0.001);
  std::this_thread::sleep_for(std::chrono::milliseconds(5));
  MarkerSet out;
  EXPECT_EQ(Localizer::DEADLINE_ERR, Localizer::selectBestQuad(c, out, deadline));
}

class QuadrantTest : public ::testing::Test {
  protected:
  void SetUp() {
    Size canvas(600, 800);
    topLefts = cornerTopLefts(canvas, 50, 30);
    marker = Markers::prepareMarker(makeMarker(), config);
    work = preprocessSheet(makeSheet(canvas, topLefts, makeMarker()), config.apply_erode_subtract);
  }

  Config config;
  vector<Point> topLefts;
  Mat marker;
  Mat work;
};

TEST_F(QuadrantTest, QuadrantsCoverImageWithoutOverlap) {
  vector<Rect> q = Localizer::quadrants(Size(601, 801));
  ASSERT_EQ(4u, q.size());
  int area = 0;
  for (size_t i=0; i<q.size(); i++) {
    area += q[i].area();
    for (size_t j=i+1; j<q.size(); j++) {
      EXPECT_EQ(0, (q[i] & q[j]).area());
    }
  }
  EXPECT_EQ(601 * 801, area);
}

TEST_F(QuadrantTest, TranslatedLocationsDoNotDependOnOrder) {
  Localizer localizer(config);
  vector<Point> forward(4), backward(4);
  for (int k=0; k<4; k++) {
    forward[k] = localizer.matchQuadrant(work, marker, k).loc;
  }
  for (int k=3; k>=0; k--) {
    backward[k] = localizer.matchQuadrant(work, marker, k).loc;
  }
  EXPECT_EQ(forward, backward);
  for (int k=0; k<4; k++) {
    EXPECT_EQ(topLefts[k], forward[k]);
  }
}

TEST_F(QuadrantTest, LocatesOneMarkerPerQuadrant) {
  Localizer localizer(config);
  double allMaxT = matchMax(work, marker);
  MarkerSet out;
  int failed = -1;
  ASSERT_EQ(Localizer::OK, localizer.locateQuadrants(work, marker, allMaxT, out, failed));
  ASSERT_EQ(4u, out.markers.size());
  for (int k=0; k<4; k++) {
    EXPECT_EQ(topLefts[k], out.markers[k].loc);
  }
  EXPECT_TRUE(out.valid(config.min_matching_threshold));
}

TEST_F(QuadrantTest, ScoreDriftBeyondVariationFails) {
  config.max_matching_variation = 0.05;
  Localizer localizer(config);
  MarkerSet out;
  int failed = -1;
  // Pretend the whole-image search scored far higher than any quadrant can.
  EXPECT_EQ(Localizer::QUADRANT_MATCH_ERR,
	    localizer.locateQuadrants(work, marker, 5.0, out, failed));
  EXPECT_EQ(0, failed);
  EXPECT_TRUE(out.markers.empty());
}

TEST_F(QuadrantTest, GlobalSearchFindsSameMarkers) {
  Localizer localizer(config);
  MarkerSet out;
  ASSERT_EQ(Localizer::OK, localizer.locateGlobal(work, marker, out));
  for (int k=0; k<4; k++) {
    EXPECT_TRUE(hasCenter(out, Point2f(topLefts[k].x + 25, topLefts[k].y + 25)));
  }
}

TEST_F(QuadrantTest, GlobalSearchNeedsFourMarkers) {
  Mat sheet = makeSheet(Size(600, 800), vector<Point>(topLefts.begin(), topLefts.begin() + 3),
			makeMarker(), false);
  Mat threeMarkers = preprocessSheet(sheet, config.apply_erode_subtract);
  config.min_matching_threshold = 0.6;
  Localizer localizer(config);
  MarkerSet out;
  EXPECT_EQ(Localizer::TOO_FEW_CANDIDATES_ERR, localizer.locateGlobal(threeMarkers, marker, out));
}
