#include "batch.hpp"

#include <future>

BatchRunner::BatchRunner(Markers& m, int w) : markers(m), workers(w < 1 ? 1 : w) {
}

BatchResult BatchRunner::process(const Mat& img, const string& name) {
  BatchResult result;
  result.name = name;
  double start = getTime();
  result.status = markers.getCroppedImage(img, result.image, name);
  result.elapsed_ms = (getTime() - start) * 1000.0;
  if (result.status != Markers::Status::OK) {
    LOG(ERROR) << name << ": " << Markers::getError(result.status);
    result.image = Mat();
  }
  return result;
}

vector<BatchResult> BatchRunner::run(Source& source, ResultHandler handler) {
  vector<BatchResult> results;
  while (!source.done()) {
    vector<std::future<BatchResult> > wave;
    while ((int)wave.size() < workers && !source.done()) {
      Mat img;
      string name;
      if (!source.read(img, name)) {
	break;
      }
      wave.push_back(std::async(std::launch::async, &BatchRunner::process, this, img, name));
    }
    if (wave.empty()) {
      break;
    }
    for (size_t i=0; i<wave.size(); i++) {
      BatchResult result = wave[i].get();
      if (handler) {
	handler(result);
      }
      result.image = Mat();
      results.push_back(result);
    }
  }
  return results;
}
