#include "stipple/core/frameSink.hpp"

#include "stipple/core/errors.hpp"
#include "stipple/core/visualization.hpp"

#include <iomanip>
#include <sstream>
#include <system_error>

#include <opencv2/imgcodecs.hpp>

namespace stippler::stipple::core {

static const std::filesystem::path ITERATION_DIR = "iterations";
static const std::filesystem::path VIDEO_FILE    = "relaxation.mp4";

void resetDirectory(const std::filesystem::path& directory) {
	std::error_code ec;
	std::filesystem::remove_all(directory, ec);
	if (ec) {
		throw ExportError("Could not clear directory " + directory.string() + ": " + ec.message());
	}
	std::filesystem::create_directories(directory, ec);
	if (ec) {
		throw ExportError("Could not create directory " + directory.string() + ": " + ec.message());
	}
}

void writeImage(const std::filesystem::path& path, const cv::Mat& image) {
	// Write next to the target and rename on success so a failed write leaves no partial file.
	std::filesystem::path partial = path;
	partial.replace_filename(path.stem().string() + ".partial" + path.extension().string());

	std::error_code ec;
	bool written = false;
	try {
		written = cv::imwrite(partial.string(), image);
	} catch (const cv::Exception& e) {
		std::filesystem::remove(partial, ec);
		throw ExportError("Could not write " + path.string() + ": " + e.what());
	}
	if (!written) {
		std::filesystem::remove(partial, ec);
		throw ExportError("Could not write " + path.string());
	}

	std::filesystem::rename(partial, path, ec);
	if (ec) {
		const std::string reason = ec.message();
		std::filesystem::remove(partial, ec);
		throw ExportError("Could not move " + partial.string() + " to " + path.string() + ": " + reason);
	}
}

DirectoryFrameSink::DirectoryFrameSink(std::filesystem::path directory) : m_directory{std::move(directory)} {
	std::error_code ec;
	std::filesystem::create_directories(m_directory / ITERATION_DIR, ec);
	if (ec) {
		throw ExportError("Could not create directory " + (m_directory / ITERATION_DIR).string() + ": " + ec.message());
	}
}

DirectoryFrameSink::~DirectoryFrameSink() {
	if (m_video.isOpened()) {
		m_video.release();
	}
}

std::string DirectoryFrameSink::frameFileName(const int iteration) {
	std::ostringstream name;
	name << "relaxed" << std::setw(6) << std::setfill('0') << iteration << ".png";
	return name.str();
}

void DirectoryFrameSink::snapshot(const std::string_view name, const cv::Mat& image) {
	writeImage(m_directory / (std::string(name) + ".png"), image);
}

void DirectoryFrameSink::frame(const int iteration, const cv::Mat& image) {
	const cv::Mat bgr = toBgr(image);
	writeImage(m_directory / ITERATION_DIR / frameFileName(iteration), bgr);

	if (!m_video.isOpened() && m_videoSize.empty()) {
		m_videoSize = bgr.size();
		// Missing codecs are not fatal. The iteration images are still written.
		m_video.open((m_directory / VIDEO_FILE).string(), cv::VideoWriter::fourcc('m', 'p', '4', 'v'), FPS, m_videoSize, true);
	}
	if (m_video.isOpened() && bgr.size() == m_videoSize) {
		m_video.write(bgr);
	}
}

void DirectoryFrameSink::finish() {
	if (m_video.isOpened()) {
		m_video.release();
	}
}

} // namespace stippler::stipple::core
