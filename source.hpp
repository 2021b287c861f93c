#include <opencv2/opencv.hpp>
#include <set>
#include "markers.hpp"

#ifndef SOURCE
#define SOURCE

using namespace cv;
using namespace std;

class Source {
  public:
  /** Next sheet and a name for it. img is empty when the sheet could not be read. */
  virtual bool read(Mat& img, string& name) = 0;
  virtual bool done();
  virtual ~Source(){}

  /** read() followed by Markers::getCroppedImage(). */
  Markers::Status nextImage(Markers& markers, Mat& imgProj, string& name);
};

/** Sheets already decoded in memory. */
class ImageSource: public Source {
  public:
  ImageSource(vector<Mat> i, string prefix="image");
  virtual bool read(Mat& img, string& name);
  virtual bool done();

  private:
  vector<Mat> imgs;
  string prefix;
  int sequence = 0;
};

/**
 * Image files; directories are expanded to their png/jpg/jpeg files. Paths in
 * excludes (the marker image) are dropped whichever way they were spelled.
 * Sheets sharing a basename get a "_N" suffix so their names stay unique.
 */
class FileSource: public Source {
  public:
  FileSource(const vector<string>& paths, const vector<string>& excludes=vector<string>());
  virtual bool read(Mat& img, string& name);
  virtual bool done();

  size_t size() const { return files.size(); }

  static vector<string> collect(const vector<string>& paths,
				const vector<string>& excludes=vector<string>());

  private:
  vector<string> files;
  size_t next = 0;
  std::set<string> seen;
};

#endif
