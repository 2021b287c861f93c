#include <gtest/gtest.h>
#include "batch.hpp"
#include "synthetic.hpp"

class BatchTest : public ::testing::Test {
  protected:
  void SetUp() {
    Size canvas(600, 800);
    raw = makeMarker(50);
    good = makeSheet(canvas, cornerTopLefts(canvas, 50, 25), raw);
    blank = Mat(canvas, CV_8UC3, Scalar(255, 255, 255));
  }

  Mat raw;
  Mat good;
  Mat blank;
};

TEST_F(BatchTest, KeepsGoingPastFailedSheets) {
  Config config;
  Markers markers(config, Markers::prepareMarker(raw, config));
  vector<Mat> imgs;
  imgs.push_back(good);
  imgs.push_back(blank);
  imgs.push_back(good.clone());
  imgs.push_back(Mat());
  imgs.push_back(good.clone());
  ImageSource source(imgs, "sheet");

  vector<string> handled;
  int withImage = 0;
  BatchRunner runner(markers, 2);
  vector<BatchResult> results = runner.run(source, [&](const BatchResult& r) {
    handled.push_back(r.name);
    if (!r.image.empty()) {
      withImage++;
    }
  });

  ASSERT_EQ(5u, results.size());
  EXPECT_EQ(Markers::Status::OK, results[0].status);
  EXPECT_EQ(Markers::Status::SCALE_NO_MATCH_ERR, results[1].status);
  EXPECT_EQ(Markers::Status::OK, results[2].status);
  EXPECT_EQ(Markers::Status::EMPTY_IMAGE_ERR, results[3].status);
  EXPECT_EQ(Markers::Status::OK, results[4].status);
  for (size_t i=0; i<results.size(); i++) {
    EXPECT_EQ("sheet-" + to_string(i) + ".png", results[i].name);
    EXPECT_EQ(results[i].name, handled[i]);
    EXPECT_TRUE(results[i].image.empty());
  }
  EXPECT_EQ(3, withImage);
  EXPECT_EQ(3u, markers.getMatchScores().size());
}

TEST_F(BatchTest, ConcurrentResultsMatchSequential) {
  Config config;
  config.search_mode = SEARCH_GLOBAL;
  Markers markers(config, Markers::prepareMarker(raw, config));

  vector<Mat> imgs(6, good);
  ImageSource sequential(imgs);
  ImageSource parallel(imgs);

  vector<Size> one, four;
  BatchRunner(markers, 1).run(sequential, [&](const BatchResult& r) {
    one.push_back(r.image.size());
  });
  BatchRunner(markers, 4).run(parallel, [&](const BatchResult& r) {
    four.push_back(r.image.size());
  });
  ASSERT_EQ(6u, one.size());
  EXPECT_EQ(one, four);
  EXPECT_EQ(Size(500, 700), one[0]);
}

TEST_F(BatchTest, DeadlineFailsTheSheetOnly) {
  // 65 scales over a 3000 x 4000 scan take several seconds, a 600 x 800 sheet far less.
  Config config;
  config.image_deadline_ms = 2000;
  config.marker_rescale_steps = 65;
  Markers markers(config, Markers::prepareMarker(raw, config));
  Mat big = makeSheet(Size(3000, 4000), cornerTopLefts(Size(3000, 4000), 50, 25), raw);
  vector<Mat> imgs;
  imgs.push_back(big);
  imgs.push_back(good);
  imgs.push_back(big);
  ImageSource source(imgs);
  vector<BatchResult> results = BatchRunner(markers, 2).run(source);
  ASSERT_EQ(3u, results.size());
  EXPECT_EQ(Markers::Status::DEADLINE_EXCEEDED_ERR, results[0].status);
  EXPECT_EQ(Markers::Status::OK, results[1].status);
  EXPECT_EQ(Markers::Status::DEADLINE_EXCEEDED_ERR, results[2].status);
  EXPECT_EQ(1u, markers.getMatchScores().size());
}
