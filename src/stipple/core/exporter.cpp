#include "stipple/core/exporter.hpp"

#include "stipple/core/errors.hpp"
#include "stipple/core/frameSink.hpp"
#include "stipple/core/visualization.hpp"

#include <algorithm>
#include <fstream>
#include <iterator>
#include <system_error>

#include <fmt/format.h>

namespace stippler::stipple::core {

StippleSet sortForDrawing(const StippleSet& stipples) {
	StippleSet sorted = stipples;
	std::stable_sort(sorted.begin(), sorted.end(), [](const Stipple& a, const Stipple& b) { return a.position.dot(a.position) < b.position.dot(b.position); });
	return sorted;
}

std::string toSvg(const StippleSet& stipples, const cv::Size size, const SvgStyle& style) {
	fmt::memory_buffer out;
	fmt::format_to(std::back_inserter(out), R"(<?xml version="1.0" encoding="UTF-8"?>)"
	                                        "\n");
	fmt::format_to(std::back_inserter(out), R"(<svg xmlns="http://www.w3.org/2000/svg" width="{0}" height="{1}" viewBox="0 0 {0} {1}">)"
	                                        "\n",
	               size.width, size.height);

	for (const auto& s: sortForDrawing(stipples)) {
		fmt::format_to(std::back_inserter(out), R"(  <circle cx="{}" cy="{}" r="{}" fill="{}" stroke="{}" stroke-width="{}"/>)"
		                                        "\n",
		               s.position.x, s.position.y, std::max(0.0, s.radius), style.fill, style.stroke, style.strokeWidth);
	}

	fmt::format_to(std::back_inserter(out), "</svg>\n");
	return fmt::to_string(out);
}

void writeSvg(const std::filesystem::path& path, const StippleSet& stipples, const cv::Size size, const SvgStyle& style) {
	const std::string document = toSvg(stipples, size, style);

	std::filesystem::path partial = path;
	partial += ".partial";

	{
		std::ofstream file(partial, std::ios::out | std::ios::trunc);
		if (!file.is_open()) {
			throw ExportError("Could not open " + partial.string() + " for writing");
		}
		file << document;
		file.flush();
		if (!file) {
			file.close();
			std::error_code ec;
			std::filesystem::remove(partial, ec);
			throw ExportError("Could not write " + path.string());
		}
	}

	std::error_code ec;
	std::filesystem::rename(partial, path, ec);
	if (ec) {
		const std::string reason = ec.message();
		std::filesystem::remove(partial, ec);
		throw ExportError("Could not move " + partial.string() + " to " + path.string() + ": " + reason);
	}
}

cv::Mat renderPreview(const StippleSet& stipples, const cv::Size size) {
	cv::Mat canvas = whiteCanvas(size);
	drawStipples(canvas, sortForDrawing(stipples), cv::Scalar(0, 0, 0));
	return canvas;
}

void writePng(const std::filesystem::path& path, const StippleSet& stipples, const cv::Size size) {
	writeImage(path, renderPreview(stipples, size));
}

} // namespace stippler::stipple::core
