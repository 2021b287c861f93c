#include "diagnostics.hpp"

#include <sstream>
#include <iomanip>
#include <memory>
#include <cctype>

Diagnostics::Diagnostics(int showImageLevel, DebugSink s) {
  show_image_level = showImageLevel;
  sink = s;
}

bool Diagnostics::enabled(int level) const {
  return sink && show_image_level >= level;
}

void Diagnostics::show(const string& label, const Mat& img, int level) const {
  if (!enabled(level) || img.empty()) {
    return;
  }
  sink(label, img, level);
}

DebugSink windowSink(int displayWidth) {
  return [displayWidth](const string& label, const Mat& img, int level) {
    Mat shown = img;
    if (displayWidth > 0 && img.cols > displayWidth) {
      shown = imscale(displayWidth, img);
    }
    namedWindow(label, WINDOW_AUTOSIZE);
    moveWindow(label, 20, 20);
    imshow(label, shown);
    VLOG(1) << "Showing \"" << label << "\" (level " << level << "), press a key.";
    waitKey(0);
    destroyWindow(label);
  };
}

namespace {

string sanitize(const string& label) {
  string out;
  for (size_t i=0; i<label.size(); i++) {
    char c = label[i];
    if (isalnum((unsigned char)c) || c == '-' || c == '_' || c == '.') {
      out += c;
    } else {
      out += '_';
    }
  }
  return out;
}

}

DebugSink fileSink(const string& dir) {
  std::shared_ptr<std::mutex> lock = std::make_shared<std::mutex>();
  std::shared_ptr<int> sequence = std::make_shared<int>(0);
  return [dir, lock, sequence](const string& label, const Mat& img, int level) {
    int n;
    {
      std::lock_guard<std::mutex> guard(*lock);
      n = ++(*sequence);
    }
    std::ostringstream name;
    name << dir << "/" << std::setw(4) << std::setfill('0') << n << "_" << sanitize(label) << ".png";
    Mat out = img;
    if (img.depth() != CV_8U) {
      // matchTemplate responses are float in [-1, 1].
      img.convertTo(out, CV_8U, 127.5, 127.5);
    }
    if (!imwrite(name.str(), out)) {
      LOG(ERROR) << "Failed to write debug image " << name.str();
    } else {
      VLOG(1) << "Wrote debug image " << name.str() << " (level " << level << ")";
    }
  };
}
