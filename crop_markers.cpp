#include <opencv2/opencv.hpp>
#include <glog/logging.h>
#include <sys/stat.h>
#include <sys/types.h>
#include <errno.h>
#include <string.h>

#include "util.hpp"
#include "config.hpp"
#include "diagnostics.hpp"
#include "markers.hpp"
#include "source.hpp"
#include "batch.hpp"

using namespace std;
using namespace cv;

const int EXIT_MARKER_MISSING = 31;

void usage(const char* prog) {
  cerr << "Usage: " << prog << " [--debug-dir=<dir>] [--save-config=<file>] <config> <output-dir> <image|dir>..." << endl
       << "  Crops scanned sheets on their four corner markers." << endl
       << "  config: OpenCV FileStorage file (xml/yml/json) with the marker options." << endl;
}

bool makeDirectory(const string& dir) {
  if (mkdir(dir.c_str(), 0755) == 0 || errno == EEXIST) {
    return true;
  }
  LOG(ERROR) << "Could not create " << dir << ": " << strerror(errno);
  return false;
}

int main(int argc, char** argv) {
  google::InitGoogleLogging(argv[0]);
  FLAGS_logtostderr = 1;

  string debugDir;
  string saveConfig;
  vector<string> args;
  for (int i=1; i<argc; i++) {
    string arg = argv[i];
    if (arg.compare(0, 12, "--debug-dir=") == 0) {
      debugDir = arg.substr(12);
    } else if (arg.compare(0, 14, "--save-config=") == 0) {
      saveConfig = arg.substr(14);
    } else if (arg == "-h" || arg == "--help") {
      usage(argv[0]);
      return 0;
    } else {
      args.push_back(arg);
    }
  }
  if (args.size() < 3) {
    usage(argv[0]);
    return 2;
  }

  Config config(args[0]);
  const string outputDir = args[1];
  vector<string> inputs(args.begin() + 2, args.end());
  if (!saveConfig.empty()) {
    // Effective options, defaults filled in.
    config.save(saveConfig);
  }

  Mat marker;
  Markers::Status markerStatus = Markers::loadMarker(config, marker);
  if (markerStatus != Markers::Status::OK) {
    LOG(ERROR) << Markers::getError(markerStatus) << " (" << config.markerPath() << ")";
    return EXIT_MARKER_MISSING;
  }

  DebugSink sink;
  if (config.show_image_level > 0) {
    if (!debugDir.empty()) {
      if (!makeDirectory(debugDir)) {
	return 2;
      }
      sink = fileSink(debugDir);
    } else {
      // highgui windows belong to this thread.
      sink = windowSink(config.display_width);
      config.workers = 1;
    }
  }

  if (!makeDirectory(outputDir)) {
    return 2;
  }

  Markers markers(config, marker, Diagnostics(config.show_image_level, sink));
  FileSource source(inputs, Markers::excludeFiles(config));
  LOG(INFO) << "Cropping " << source.size() << " sheets with " << config.workers
	    << " workers, searchMode " << searchModeName(config.search_mode);

  int written = 0;
  BatchRunner runner(markers, config.workers);
  vector<BatchResult> results = runner.run(source, [&](const BatchResult& result) {
    if (result.status != Markers::Status::OK) {
      return;
    }
    string path = outputDir + "/" + result.name;
    if (imwrite(path, result.image)) {
      written++;
      LOG(INFO) << result.name << ": " << result.image.cols << " x " << result.image.rows
		<< " in " << result.elapsed_ms << "ms -> " << path;
    } else {
      LOG(ERROR) << "Failed to write " << path;
    }
  });

  int failed = 0;
  for (size_t i=0; i<results.size(); i++) {
    if (results[i].status != Markers::Status::OK) {
      failed++;
      LOG(WARNING) << "Skipped " << results[i].name << ": " << Markers::getError(results[i].status);
    }
  }

  vector<double> scores = markers.getMatchScores();
  double mean = 0;
  for (size_t i=0; i<scores.size(); i++) {
    mean += scores[i];
  }
  if (!scores.empty()) {
    mean /= scores.size();
  }
  LOG(INFO) << "Processed " << results.size() << " sheets, cropped " << written
	    << ", failed " << failed << ", mean marker match " << mean;

  return (failed == 0 && written == (int)results.size()) ? 0 : 1;
}
