#pragma once

#include "stipple/core/geometry.hpp"

#include <opencv2/core/mat.hpp>

#include <filesystem>
#include <string>

namespace stippler::stipple::core {

//! Stroke applied to every exported circle.
struct SvgStyle {
	std::string fill{"black"};
	std::string stroke{"black"};
	double strokeWidth{0.0};
};

//! Stable sort by squared distance from the image origin. Gives a reproducible draw order.
StippleSet sortForDrawing(const StippleSet& stipples);

/*! SVG document with one circle per stipple, in sortForDrawing order.
 *  The root element matches the image: width, height and viewBox in pixels. Circles use cx = column, cy = row.
 */
std::string toSvg(const StippleSet& stipples, cv::Size size, const SvgStyle& style = SvgStyle{});

//! Write toSvg() to a file. Nothing is left at `path` if writing fails.
//! \throws ExportError on I/O failure.
void writeSvg(const std::filesystem::path& path, const StippleSet& stipples, cv::Size size, const SvgStyle& style = SvgStyle{});

//! Raster preview: filled black discs on a white 8-bit BGR canvas of the image size.
cv::Mat renderPreview(const StippleSet& stipples, cv::Size size);

//! Write renderPreview() to an image file (format from the extension).
//! \throws ExportError on I/O failure.
void writePng(const std::filesystem::path& path, const StippleSet& stipples, cv::Size size);

} // namespace stippler::stipple::core
