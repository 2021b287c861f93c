#include <opencv2/opencv.hpp>
#include <functional>
#include "markers.hpp"
#include "source.hpp"

#ifndef BATCH
#define BATCH

using namespace cv;
using namespace std;

struct BatchResult {
  string name;
  Markers::Status status = Markers::Status::ERR;
  Mat image;
  double elapsed_ms = 0;
};

typedef std::function<void(const BatchResult&)> ResultHandler;

/**
 * Crops every sheet of a Source with up to `workers` sheets in flight. Sheets are
 * read on the calling thread; the handler also runs there, in source order.
 * A failed sheet never stops the batch.
 */
class BatchRunner {
  public:
    BatchRunner(Markers& markers, int workers=1);

    /** Results in source order. Images are released once the handler returned. */
    vector<BatchResult> run(Source& source, ResultHandler handler=ResultHandler());

  private:
    Markers& markers;

    int workers;

    BatchResult process(const Mat& img, const string& name);
};

#endif
