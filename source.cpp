#include "source.hpp"

#include <sys/stat.h>
#include <limits.h>
#include <stdlib.h>
#include <algorithm>
#include <cctype>

bool Source::done() {
  return false;
};

Markers::Status Source::nextImage(Markers& markers, Mat& imgProj, string& name) {
  Mat img;
  if (!read(img, name)) {
    return Markers::Status::ERR;
  }
  Markers::Status status = markers.getCroppedImage(img, imgProj, name);
  if (status == Markers::Status::OK && imgProj.cols == 0) {
    status = Markers::Status::ERR;
  }
  return status;
}


ImageSource::ImageSource(vector<Mat> i, string p) {
  imgs = i;
  prefix = p;
}

bool ImageSource::read(Mat& img, string& name) {
  if (imgs.empty()) {
    return false;
  }
  img = imgs.front();
  imgs.erase(imgs.begin());
  name = prefix + "-" + to_string(sequence++) + ".png";
  return true;
}

bool ImageSource::done() {
  return (imgs.size()==0);
}


namespace {

bool isDirectory(const string& path) {
  struct stat st;
  return stat(path.c_str(), &st) == 0 && S_ISDIR(st.st_mode);
}

bool hasImageExtension(const string& path) {
  size_t dot = path.find_last_of('.');
  if (dot == string::npos) {
    return false;
  }
  string ext = path.substr(dot + 1);
  std::transform(ext.begin(), ext.end(), ext.begin(), ::tolower);
  return ext == "png" || ext == "jpg" || ext == "jpeg";
}

string resolvePath(const string& path) {
  char buf[PATH_MAX];
  if (realpath(path.c_str(), buf) == 0) {
    return path;
  }
  return string(buf);
}

bool isExcluded(const string& path, const vector<string>& resolvedExcludes) {
  return std::find(resolvedExcludes.begin(), resolvedExcludes.end(),
		   resolvePath(path)) != resolvedExcludes.end();
}

}

FileSource::FileSource(const vector<string>& paths, const vector<string>& excludes) {
  files = collect(paths, excludes);
}

vector<string> FileSource::collect(const vector<string>& paths, const vector<string>& excludes) {
  vector<string> resolved;
  for (size_t i=0; i<excludes.size(); i++) {
    resolved.push_back(resolvePath(excludes[i]));
  }
  vector<string> out;
  for (size_t i=0; i<paths.size(); i++) {
    vector<String> found;
    bool dir = isDirectory(paths[i]);
    if (dir) {
      glob(paths[i] + "/*", found, false);
      std::sort(found.begin(), found.end());
    } else {
      found.push_back(paths[i]);
    }
    for (size_t j=0; j<found.size(); j++) {
      if (dir && !hasImageExtension(found[j])) {
	continue;
      }
      if (isExcluded(found[j], resolved)) {
	VLOG(1) << "Excluding " << found[j];
	continue;
      }
      out.push_back(found[j]);
    }
  }
  return out;
}

bool FileSource::read(Mat& img, string& name) {
  if (next >= files.size()) {
    return false;
  }
  const string& path = files[next++];
  size_t slash = path.find_last_of('/');
  name = slash == string::npos ? path : path.substr(slash + 1);
  if (seen.count(name)) {
    size_t dot = name.find_last_of('.');
    string stem = dot == string::npos ? name : name.substr(0, dot);
    string ext = dot == string::npos ? "" : name.substr(dot);
    string unique = name;
    for (int k=1; seen.count(unique); k++) {
      unique = stem + "_" + to_string(k) + ext;
    }
    LOG(WARNING) << path << ": name " << name << " already used, naming it " << unique;
    name = unique;
  }
  seen.insert(name);
  img = imread(path, IMREAD_COLOR);
  if (img.empty()) {
    LOG(ERROR) << "Bad file: " << path;
  }
  return true;
}

bool FileSource::done() {
  return next >= files.size();
}
