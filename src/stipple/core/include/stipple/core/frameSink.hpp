#pragma once

#include <opencv2/core/mat.hpp>
#include <opencv2/videoio.hpp>

#include <filesystem>
#include <string_view>

namespace stippler::stipple::core {

//! Receives visual debug output of a stippling run.
class FrameSink {
public:
	virtual ~FrameSink() = default;

	//! False if output is discarded. Lets callers skip rendering frames nobody looks at.
	virtual bool enabled() const = 0;

	virtual void snapshot(std::string_view name, const cv::Mat& image) = 0; //!< Named stage image (e.g. "initial_points").
	virtual void frame(int iteration, const cv::Mat& image)            = 0; //!< One relaxation iteration.
	virtual void finish()                                               = 0; //!< No more frames follow.
};

//! Discards all frames.
class NullFrameSink : public FrameSink {
public:
	bool enabled() const override {
		return false;
	}
	void snapshot(std::string_view, const cv::Mat&) override {
	}
	void frame(int, const cv::Mat&) override {
	}
	void finish() override {
	}
};

/*! Writes debug images into a directory.
 *  - snapshots:  <directory>/<name>.png
 *  - iterations: <directory>/iterations/relaxedNNNNNN.png and <directory>/relaxation.mp4 at FPS frames per second.
 */
class DirectoryFrameSink : public FrameSink {
public:
	static constexpr double FPS = 10.0;

	//! \throws ExportError if the iteration directory cannot be created.
	explicit DirectoryFrameSink(std::filesystem::path directory);
	~DirectoryFrameSink() override;

	bool enabled() const override {
		return true;
	}
	void snapshot(std::string_view name, const cv::Mat& image) override;
	void frame(int iteration, const cv::Mat& image) override;
	void finish() override;

	const std::filesystem::path& directory() const {
		return m_directory;
	}

	static std::string frameFileName(int iteration); //!< "relaxed" + six digit zero padded iteration + ".png"

private:
	std::filesystem::path m_directory;
	cv::VideoWriter m_video{};
	cv::Size m_videoSize{};
};

//! Remove a directory with all content and create it again empty.
//! \throws ExportError on filesystem failure.
void resetDirectory(const std::filesystem::path& directory);

//! cv::imwrite with error reporting.
//! \throws ExportError if the image could not be written.
void writeImage(const std::filesystem::path& path, const cv::Mat& image);

} // namespace stippler::stipple::core
