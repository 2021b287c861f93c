#include "config.hpp"
#include <cctype>

using namespace std;
using namespace cv;

SearchMode parseSearchMode(const string& mode) {
  string m = mode;
  for (size_t i=0; i<m.size(); i++) {
    m[i] = tolower(m[i]);
  }
  if (m == "global" || m == "full" || m == "all") {
    return SEARCH_GLOBAL;
  }
  if (m == "auto" || m == "fallback") {
    return SEARCH_AUTO;
  }
  return SEARCH_QUADRANTS;
}

string searchModeName(SearchMode mode) {
  switch(mode) {
  case SEARCH_GLOBAL:
    return "global";
  case SEARCH_AUTO:
    return "auto";
  case SEARCH_QUADRANTS:
  default:
    return "quadrants";
  }
}

Config::Config() {
}

Config::Config(const string filename) {
  FileStorage fs;
  config_file = filename;
  try {
    fs.open(filename, FileStorage::READ);
  } catch (const cv::Exception& e) {
    LOG(ERROR) << "Failed to parse config file " << filename << ": " << e.what();
    return;
  }

  if (fs.isOpened()) {
    relative_path = getString("relativePath", fs, relative_path);
    min_matching_threshold = getFloat("min_matching_threshold", fs, min_matching_threshold);
    max_matching_variation = getFloat("max_matching_variation", fs, max_matching_variation);

    FileNode range = fs["marker_rescale_range"];
    if (!range.isNone() && !range.empty()) {
      if (range.isSeq() && range.size() == 2) {
	marker_rescale_low = (int)range[0];
	marker_rescale_high = (int)range[1];
	LOG(INFO) << "marker_rescale_range: " << marker_rescale_low << ", " << marker_rescale_high;
      } else {
	LOG(ERROR) << "node \"marker_rescale_range\" is not a pair.";
      }
    }
    marker_rescale_steps = getInt("marker_rescale_steps", fs, marker_rescale_steps);
    apply_erode_subtract = getBool("apply_erode_subtract", fs, apply_erode_subtract);

    // Legacy boolean only decides the default of searchMode.
    bool global_search = getBool("globalSearch", fs, false);
    string mode = getString("searchMode", fs, global_search ? "global" : "quadrants");
    search_mode = parseSearchMode(mode);

    sheet_to_marker_width_ratio = getInt("sheetToMarkerWidthRatio", fs, sheet_to_marker_width_ratio);
    processing_width = getInt("processing_width", fs, processing_width);
    display_width = getInt("display_width", fs, display_width);
    show_image_level = getInt("show_image_level", fs, show_image_level);
    image_deadline_ms = getInt("image_deadline_ms", fs, image_deadline_ms);
    workers = getInt("workers", fs, workers);

    if (marker_rescale_steps < 1) {
      LOG(ERROR) << "marker_rescale_steps must be positive, using 1.";
      marker_rescale_steps = 1;
    }
    if (workers < 1) {
      workers = 1;
    }
    is_loaded = true;
    fs.release();
  } else {
    LOG(ERROR) << "Failed to load config file " << filename << ", using defaults.";
  }
}

string Config::markerPath() const {
  if (relative_path.empty() || relative_path[0] == '/') {
    return relative_path;
  }
  size_t slash = config_file.find_last_of('/');
  if (slash == string::npos) {
    return relative_path;
  }
  return config_file.substr(0, slash + 1) + relative_path;
}

void Config::save(const string filename) const {
  FileStorage fs(filename, FileStorage::WRITE);
  if (fs.isOpened()) {
    fs << "relativePath" << relative_path;
    fs << "min_matching_threshold" << min_matching_threshold;
    fs << "max_matching_variation" << max_matching_variation;
    fs << "marker_rescale_range" << "[" << marker_rescale_low << marker_rescale_high << "]";
    fs << "marker_rescale_steps" << marker_rescale_steps;
    fs << "apply_erode_subtract" << (int)apply_erode_subtract;
    fs << "searchMode" << searchModeName(search_mode);
    if (sheet_to_marker_width_ratio > 0) {
      fs << "sheetToMarkerWidthRatio" << sheet_to_marker_width_ratio;
    }
    fs << "processing_width" << processing_width;
    fs << "display_width" << display_width;
    fs << "show_image_level" << show_image_level;
    fs << "image_deadline_ms" << image_deadline_ms;
    fs << "workers" << workers;
    fs.release();
  } else {
    LOG(ERROR) << "Failed to write config file " << filename;
  }
}

float Config::getFloat(string name, FileStorage &fs, float value) {
  FileNode node = fs[name];
  if (node.isNone() || node.empty()) {
    VLOG(1) << "node \"" << name << "\" does not exist, default " << value;
  } else if (!node.isReal() && !node.isInt()) {
    LOG(ERROR) << "node \"" << name << "\" type is not FLOAT.";
  } else {
    value = (float)(double)node;
    LOG(INFO) << name << ": " << value;
  }
  return value;
}

int Config::getInt(string name, FileStorage &fs, int value) {
  FileNode node = fs[name];
  if (node.isNone() || node.empty()) {
    VLOG(1) << "node \"" << name << "\" does not exist, default " << value;
  } else if (!node.isInt()) {
    LOG(ERROR) << "node \"" << name << "\" type is not INT.";
  } else {
    node >> value;
    LOG(INFO) << name << ": " << value;
  }
  return value;
}

// FileStorage has no boolean node; accepts 0/1 and "true"/"false".
bool Config::getBool(string name, FileStorage &fs, bool value) {
  FileNode node = fs[name];
  if (node.isNone() || node.empty()) {
    VLOG(1) << "node \"" << name << "\" does not exist, default " << value;
  } else if (node.isInt()) {
    value = (int)node != 0;
    LOG(INFO) << name << ": " << value;
  } else if (node.isString()) {
    string s = (string)node;
    if (s == "true" || s == "True" || s == "1") {
      value = true;
    } else if (s == "false" || s == "False" || s == "0") {
      value = false;
    } else {
      LOG(ERROR) << "node \"" << name << "\" is not a boolean: " << s;
      return value;
    }
    LOG(INFO) << name << ": " << value;
  } else {
    LOG(ERROR) << "node \"" << name << "\" type is not BOOL.";
  }
  return value;
}

string Config::getString(string name, FileStorage &fs, string value) {
  FileNode node = fs[name];
  if (node.isNone() || node.empty()) {
    VLOG(1) << "node \"" << name << "\" does not exist, default " << value;
  } else if (!node.isString()) {
    LOG(ERROR) << "node \"" << name << "\" type is not STRING.";
  } else {
    node >> value;
    LOG(INFO) << name << ": " << value;
  }
  return value;
}
